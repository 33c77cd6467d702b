#pragma once
#include <string>

/**
 * A single Ataxx move: a pass, an extend (distance 1) or a jump (distance 2).
 *
 * Squares are named by column 'a'..'g' and row '1'..'7'. A Move may name
 * squares outside that range; such moves are simply never legal.
 */
class Move {
public:
    /// Number of playable squares on a side.
    static constexpr int SIDE = 7;
    /// Side of the backing grid, including a two-square blocked border.
    static constexpr int EXTENDED_SIDE = SIDE + 4;

    /// Creates a pass.
    Move();
    /// Returns the pass move.
    static Move pass();
    /// Returns the move C0R0-C1R1.
    static Move move(char c0, char r0, char c1, char r1);
    /// Parses "-" or "c0r0-c1r1"; throws IllegalMove on malformed text.
    static Move parse(const std::string& text);

    /// Linearized index of square COL ROW in the bordered grid.
    static int index(char col, char row);

    bool isPass() const { return pass_; }
    /// True iff the destination is at Chebyshev distance 1 from the source.
    bool isExtend() const;
    /// True iff the destination is at Chebyshev distance 2 from the source.
    bool isJump() const;

    char col0() const { return col0_; }
    char row0() const { return row0_; }
    char col1() const { return col1_; }
    char row1() const { return row1_; }

    /// Bordered-grid index of the source square.
    int fromIndex() const;
    /// Bordered-grid index of the destination square.
    int toIndex() const;

    /// Returns "-" for a pass, otherwise "c0r0-c1r1".
    std::string toString() const;

    bool operator==(const Move& other) const;
    bool operator!=(const Move& other) const { return !(*this == other); }

private:
    Move(char c0, char r0, char c1, char r1);
    int distance() const;

    bool pass_;
    char col0_;
    char row0_;
    char col1_;
    char row1_;
};
