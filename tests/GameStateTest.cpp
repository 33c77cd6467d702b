#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "TestBoards.hpp"
#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"
#include "core/Player.hpp"

TEST(GameStateTest, ListsStartMovesInSquareOrder) {
    GameState state;
    EXPECT_EQ(state.WhoseMove(), PieceColor::RED);
    EXPECT_FALSE(state.IsTerminal());
    EXPECT_FALSE(state.Winner().has_value());

    const std::vector<Move> moves = state.GetAvailableMoves();
    ASSERT_EQ(moves.size(), 16u);
    EXPECT_EQ(moves[0].toString(), "a1-a2");
    EXPECT_EQ(moves[1].toString(), "a1-a3");
    for (const Move& move : moves) {
        EXPECT_TRUE(state.GetBoard().legal(move)) << move.toString();
        EXPECT_FALSE(move.isPass());
    }
}

TEST(GameStateTest, SnapshotIsIndependentOfLiveBoard) {
    Board board;
    board.makeMove("a1-a2");
    GameState state(board);
    EXPECT_EQ(state.WhoseMove(), PieceColor::BLUE);
    EXPECT_EQ(state.GetBoard().numMoves(), 0);

    board.makeMove("a7-a6");
    EXPECT_EQ(state.WhoseMove(), PieceColor::BLUE);
    EXPECT_EQ(state.GetBoard().get('a', '6'), PieceColor::EMPTY);

    GameState copy(state);
    EXPECT_EQ(copy.GetBoard(), state.GetBoard());
}

TEST(GameStateTest, SideWithoutMovesHasEmptyList) {
    Board board;
    openEdgeColumnsOnly(board);
    playAll(board, {"a1-a3", "a7-a5", "a3-a4", "g1-g3", "g7-g5", "g3-g2", "g5-g4", "g2-g1", "a3-a2"});
    GameState state(board);
    EXPECT_EQ(state.WhoseMove(), PieceColor::BLUE);
    EXPECT_TRUE(state.GetAvailableMoves().empty());
    EXPECT_FALSE(state.IsTerminal());
}

TEST(GameStateTest, ReportsFinishedGame) {
    Board board;
    openCornerPairsOnly(board);
    playAll(board, {"a1-a2", "a7-a6", "g7-g6", "g1-g2"});
    GameState state(board);
    EXPECT_TRUE(state.IsTerminal());
    ASSERT_TRUE(state.Winner().has_value());
    EXPECT_EQ(*state.Winner(), PieceColor::EMPTY);
}

TEST(GameStateTest, AIPlayerDelegatesToStrategy) {
    AIPlayer player(PieceColor::BLUE, std::make_unique<RandomStrategy>(3));
    EXPECT_EQ(player.Id(), PieceColor::BLUE);

    Board board;
    board.makeMove("a1-a2");
    const Move move = player.ChooseMove(GameState(board));
    EXPECT_TRUE(board.legal(move));

    EXPECT_THROW({ AIPlayer empty(PieceColor::RED, nullptr); }, std::invalid_argument);
}
