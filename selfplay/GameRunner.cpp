#include "GameRunner.hpp"

// Runs a single game between two provided strategies
GameRunner::GameRunner(IMoveStrategy& redStrategy, IMoveStrategy& blueStrategy)
    : red(redStrategy), blue(blueStrategy) {}

GameOutcome GameRunner::playOne(const Board* startingBoard) {
    Board board = startingBoard ? Board(*startingBoard) : Board();
    GameOutcome outcome;

    while (!board.winner()) {
        GameState state(board);
        IMoveStrategy& strat = (board.whoseMove() == PieceColor::RED) ? red : blue;
        Move move = strat.select(state);
        board.makeMove(move);
        outcome.moves.push_back(move);
    }

    outcome.winner = *board.winner();
    outcome.redPieces = board.redPieces();
    outcome.bluePieces = board.bluePieces();
    return outcome;
}

int GameRunner::placeRandomBlocks(Board& board, int count, std::mt19937_64& rng) {
    std::uniform_int_distribution<int> side(0, Board::SIDE - 1);
    int placed = 0;
    // Bounded retries: most squares are legal, occupied corners are not
    for (int attempt = 0; placed < count && attempt < count * 20; ++attempt) {
        const char col = static_cast<char>('a' + side(rng));
        const char row = static_cast<char>('1' + side(rng));
        if (board.legalBlock(col, row)) {
            board.setBlock(col, row);
            placed++;
        }
    }
    return placed;
}
