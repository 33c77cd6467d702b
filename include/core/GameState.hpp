#pragma once
#include <optional>
#include <vector>

#include "core/Board.hpp"
#include "core/Move.hpp"

/**
 * Snapshot of a game position handed to strategies.
 *
 * Owns a forked copy of the board, so later changes to the live game board
 * do not affect it.
 */
class GameState {
private:
    Board Position;
public:
    /// Creates a snapshot of the start position.
    GameState();
    /// Forks the given board.
    explicit GameState(const Board& b);
    /// Copy-constructs a game state.
    GameState(const GameState& other);
    /// Returns the forked board.
    const Board& GetBoard() const;
    /// Returns the side to move.
    PieceColor WhoseMove() const;
    /// Returns the legal non-pass moves for the side to move.
    std::vector<Move> GetAvailableMoves() const;
    /// Returns true if the game is over.
    bool IsTerminal() const;
    /// Returns the winner (EMPTY for a draw), or nothing while the game goes on.
    std::optional<PieceColor> Winner() const;

    /// Enumerates legal non-pass moves on B, source squares a1..g7 column-major.
    static std::vector<Move> LegalMoves(const Board& b);
};
