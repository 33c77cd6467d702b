#include <gtest/gtest.h>

#include <random>

#include "GameRunner.hpp"
#include "core/GameError.hpp"

namespace {

Board replay(const GameOutcome& outcome, const Board* start = nullptr) {
    Board board = start ? Board(*start) : Board();
    for (const Move& move : outcome.moves) {
        board.makeMove(move);
    }
    return board;
}

} // namespace

TEST(GameRunnerTest, PlaysGameToCompletion) {
    MinimaxStrategy red(1);
    red.setLogUsage(false);
    RandomStrategy blue(7);
    GameRunner runner(red, blue);

    const GameOutcome outcome = runner.playOne();
    ASSERT_FALSE(outcome.moves.empty());

    const Board board = replay(outcome);
    ASSERT_TRUE(board.winner().has_value());
    EXPECT_EQ(*board.winner(), outcome.winner);
    EXPECT_EQ(board.redPieces(), outcome.redPieces);
    EXPECT_EQ(board.bluePieces(), outcome.bluePieces);
}

TEST(GameRunnerTest, SameSeedsGiveSameGame) {
    RandomStrategy redA(1), blueA(2);
    RandomStrategy redB(1), blueB(2);
    const GameOutcome a = GameRunner(redA, blueA).playOne();
    const GameOutcome b = GameRunner(redB, blueB).playOne();
    EXPECT_EQ(a.moves, b.moves);
    EXPECT_EQ(a.winner, b.winner);
}

TEST(GameRunnerTest, StartsFromBlockedBoard) {
    std::mt19937_64 rng(5);
    Board start;
    const int placed = GameRunner::placeRandomBlocks(start, 3, rng);
    EXPECT_GT(placed, 0);
    EXPECT_LE(placed, 3);
    EXPECT_GE(start.numPieces(PieceColor::BLOCKED), placed);

    RandomStrategy red(3), blue(4);
    const GameOutcome outcome = GameRunner(red, blue).playOne(&start);
    EXPECT_EQ(start.numMoves(), 0);

    const Board board = replay(outcome, &start);
    EXPECT_EQ(board.numPieces(PieceColor::BLOCKED), start.numPieces(PieceColor::BLOCKED));
    ASSERT_TRUE(board.winner().has_value());
    EXPECT_EQ(*board.winner(), outcome.winner);
}

TEST(GameRunnerTest, NoBlocksOnceGameHasStarted) {
    std::mt19937_64 rng(9);
    Board board;
    board.makeMove("a1-a2");
    EXPECT_EQ(GameRunner::placeRandomBlocks(board, 2, rng), 0);
    EXPECT_EQ(board.numPieces(PieceColor::BLOCKED), 0);
}
