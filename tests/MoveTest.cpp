#include <gtest/gtest.h>

#include "core/GameError.hpp"
#include "core/Move.hpp"

TEST(MoveTest, ParsesExtendJumpAndPass) {
    Move extend = Move::parse("a1-b2");
    EXPECT_FALSE(extend.isPass());
    EXPECT_TRUE(extend.isExtend());
    EXPECT_FALSE(extend.isJump());
    EXPECT_EQ(extend.col0(), 'a');
    EXPECT_EQ(extend.row0(), '1');
    EXPECT_EQ(extend.col1(), 'b');
    EXPECT_EQ(extend.row1(), '2');

    Move jump = Move::parse("c3-e1");
    EXPECT_TRUE(jump.isJump());
    EXPECT_FALSE(jump.isExtend());

    Move pass = Move::parse("-");
    EXPECT_TRUE(pass.isPass());
    EXPECT_FALSE(pass.isExtend());
    EXPECT_FALSE(pass.isJump());
    EXPECT_EQ(pass, Move::pass());
}

TEST(MoveTest, FormatsAsText) {
    EXPECT_EQ(Move::move('a', '1', 'a', '2').toString(), "a1-a2");
    EXPECT_EQ(Move::pass().toString(), "-");
    EXPECT_EQ(Move::parse("g7-e5").toString(), "g7-e5");
}

TEST(MoveTest, RejectsMalformedText) {
    EXPECT_THROW(Move::parse(""), IllegalMove);
    EXPECT_THROW(Move::parse("a1a2"), IllegalMove);
    EXPECT_THROW(Move::parse("a1-a"), IllegalMove);
    EXPECT_THROW(Move::parse("11-a2"), IllegalMove);
    EXPECT_THROW(Move::parse("A1-A2"), IllegalMove);
    EXPECT_THROW(Move::parse("a1-a2 "), IllegalMove);
}

TEST(MoveTest, DistanceThreeIsNeitherExtendNorJump) {
    Move far = Move::parse("a1-a4");
    EXPECT_FALSE(far.isPass());
    EXPECT_FALSE(far.isExtend());
    EXPECT_FALSE(far.isJump());
}

TEST(MoveTest, IndexesIntoBorderedGrid) {
    EXPECT_EQ(Move::index('a', '1'), 2 * Move::EXTENDED_SIDE + 2);
    EXPECT_EQ(Move::index('g', '7'), 8 * Move::EXTENDED_SIDE + 8);
    Move move = Move::parse("b1-c3");
    EXPECT_EQ(move.fromIndex(), Move::index('b', '1'));
    EXPECT_EQ(move.toIndex(), Move::index('c', '3'));
}

TEST(MoveTest, EqualityComparesSquares) {
    EXPECT_EQ(Move::parse("a1-a2"), Move::move('a', '1', 'a', '2'));
    EXPECT_NE(Move::parse("a1-a2"), Move::parse("a1-a3"));
    EXPECT_NE(Move::parse("a1-a2"), Move::pass());
}
