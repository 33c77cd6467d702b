#pragma once
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/Move.hpp"
#include "core/PieceColor.hpp"

/**
 * An Ataxx board: grid contents, side to move, undo history and result.
 *
 * Squares are stored in an 11x11 grid whose outer two rings are permanently
 * BLOCKED, so any square within two rows and columns of a playable square is
 * a valid index and never looks empty. Square (col, row) lives at
 * Move::index(col, row).
 *
 * The board is only mutated through makeMove, pass, undo, setBlock and clear.
 * Every successful change is announced to the registered notifier.
 */
class Board {
public:
    static constexpr int SIDE = Move::SIDE;
    static constexpr int EXTENDED_SIDE = Move::EXTENDED_SIDE;
    /// Number of playable squares.
    static constexpr int AREA = SIDE * SIDE;
    /// Consecutive jumps without an extend that end the game.
    static constexpr int JUMP_LIMIT = 25;

    using Notifier = std::function<void(const Board&)>;

    /// Creates a board in the starting position with a no-op notifier.
    Board();
    /// Creates a board in the starting position announcing to NOTIFIER.
    explicit Board(Notifier notifier);
    /// Forks OTHER: same contents and side to move, empty history, no-op notifier.
    /// A fork of a game in progress still refuses blocks.
    Board(const Board& other);
    Board& operator=(const Board&) = delete;

    /// Linearized index of square COL ROW.
    static int index(char col, char row) { return Move::index(col, row); }
    /// Index of the square DC columns and DR rows away from SQ.
    static int neighbor(int sq, int dc, int dr) { return sq + dc + dr * EXTENDED_SIDE; }
    /// True iff COL ROW is one of the 49 playable squares.
    static bool onBoard(char col, char row);

    /// Resets to the starting position: no blocks, Red to move, empty history.
    void clear();

    /// Contents of COL ROW, where border squares read as BLOCKED.
    PieceColor get(char col, char row) const { return board_[index(col, row)]; }
    /// Contents of the square with linearized index SQ.
    PieceColor get(int sq) const { return board_[sq]; }

    PieceColor whoseMove() const { return whoseMove_; }
    /// Number of playable squares holding COLOR (EMPTY and BLOCKED included).
    int numPieces(PieceColor color) const { return numPieces_[static_cast<int>(color)]; }
    int redPieces() const { return numPieces(PieceColor::RED); }
    int bluePieces() const { return numPieces(PieceColor::BLUE); }
    /// Number of unblocked playable squares.
    int totalOpen() const { return AREA - numPieces(PieceColor::BLOCKED); }
    /// Moves and passes since the last clear (or since this board was forked).
    int numMoves() const { return static_cast<int>(allMoves_.size()); }
    /// Consecutive jumps since the last extend.
    int numJumps() const { return numJumps_; }
    /// Winner once the game is over: RED, BLUE or EMPTY for a draw. Unset otherwise.
    const std::optional<PieceColor>& winner() const { return winner_; }
    const std::vector<Move>& allMoves() const { return allMoves_; }

    /// True iff MOVE may be played by the side to move.
    bool legal(const Move& move) const;
    /// True iff C0R0-C1R1 may be played by the side to move.
    bool legal(char c0, char r0, char c1, char r1) const;
    /// True iff some square held by WHO has an empty square within distance 2.
    bool canMove(PieceColor who) const;

    /// Plays MOVE; throws IllegalMove if it is not legal.
    void makeMove(const Move& move);
    /// Plays the move written as "-" or "c0r0-c1r1".
    void makeMove(const std::string& text);
    /// Passes for the side to move; throws IllegalMove if it has a move.
    void pass();
    /// Takes back the last move or pass; throws GameError if there is none.
    void undo();

    /// True iff no move has been played in this game and COL ROW and its
    /// reflections are all empty.
    bool legalBlock(char col, char row) const;
    /// legalBlock for a square written as "c3".
    bool legalBlock(const std::string& square) const;
    /// Blocks COL ROW and its mirror squares; throws IllegalBlock if not legal.
    void setBlock(char col, char row);
    /// setBlock for a square written as "c3".
    void setBlock(const std::string& square);

    /// Rows 7 to 1, one glyph per square, with row/column labels iff LEGEND.
    std::string toString(bool legend = false) const;

    /// Replaces the notifier and announces the current state to it.
    void setNotifier(Notifier notifier);

    /// Compares grid contents only.
    bool operator==(const Board& other) const { return board_ == other.board_; }
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    struct UndoEntry {
        int square;
        PieceColor previous;
    };

    // Everything one move changed, restored by undo.
    struct UndoGroup {
        Move move;
        int jumps;
        std::optional<PieceColor> winner;
        std::vector<UndoEntry> changes;
    };

    void set(int sq, PieceColor value);
    void assign(int sq, PieceColor value);
    void updateWinner();
    PieceColor majority() const;
    std::vector<int> blockSquares(char col, char row) const;
    void announce();

    std::array<PieceColor, EXTENDED_SIDE * EXTENDED_SIDE> board_;
    std::array<int, 4> numPieces_{};
    PieceColor whoseMove_ = PieceColor::RED;
    int numJumps_ = 0;
    std::optional<PieceColor> winner_;
    // Moves played before this board was forked; blocks stay illegal after them.
    int forkedMoves_ = 0;
    std::vector<Move> allMoves_;
    std::vector<UndoGroup> undoLog_;
    Notifier notifier_;
};
