#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "core/Board.hpp"
#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"

struct GameOutcome {
    PieceColor winner{PieceColor::EMPTY}; // EMPTY for a draw
    int redPieces{0};
    int bluePieces{0};
    std::vector<Move> moves;
};

class GameRunner {
public:
    GameRunner(IMoveStrategy& redStrategy, IMoveStrategy& blueStrategy);

    // Plays one full game from startingBoard (or the start position) and returns its result
    GameOutcome playOne(const Board* startingBoard = nullptr);

    // Places up to count random symmetric block groups on a board with no moves yet
    static int placeRandomBlocks(Board& board, int count, std::mt19937_64& rng);

private:
    IMoveStrategy& red;
    IMoveStrategy& blue;
};
