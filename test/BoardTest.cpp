#include <gtest/gtest.h>

#include "Board.h"

using namespace naval;

TEST(BoardTest, NewBoardIsEmptyWater) {
    Board board(15);
    EXPECT_EQ(board.getSize(), 15);
    EXPECT_EQ(board.countState(CellState::EMPTY), 15 * 15);
    EXPECT_FALSE(board.getCell(7, 7).shipId.has_value());
}

TEST(BoardTest, InBoundsCoversExactlyTheGrid) {
    Board board(4);
    EXPECT_TRUE(board.inBounds(0, 0));
    EXPECT_TRUE(board.inBounds(3, 3));
    EXPECT_FALSE(board.inBounds(-1, 0));
    EXPECT_FALSE(board.inBounds(0, 4));
    EXPECT_FALSE(board.inBounds(4, 0));
}

TEST(BoardTest, ResolvedCellsAreTerminal) {
    Board board(5);
    ASSERT_TRUE(board.setCell(1, 1, CellState::SHIP, 3));
    ASSERT_TRUE(board.setCell(1, 1, CellState::HIT, 3));

    EXPECT_FALSE(board.setCell(1, 1, CellState::MISS));
    EXPECT_FALSE(board.setCell(1, 1, CellState::EMPTY));
    EXPECT_FALSE(board.setCell(1, 1, CellState::SHIP, 3));
    EXPECT_EQ(board.getCell(1, 1).state, CellState::HIT);
    ASSERT_TRUE(board.getCell(1, 1).shipId.has_value());
    EXPECT_EQ(*board.getCell(1, 1).shipId, 3);

    ASSERT_TRUE(board.setCell(2, 2, CellState::MISS));
    EXPECT_FALSE(board.setCell(2, 2, CellState::HIT));
    EXPECT_EQ(board.getCell(2, 2).state, CellState::MISS);
}

TEST(BoardTest, SetCellOutsideBoardIsRefused) {
    Board board(3);
    EXPECT_FALSE(board.setCell(3, 0, CellState::SHIP, 1));
    EXPECT_FALSE(board.isResolved(-1, 2));
}

TEST(BoardTest, CellsOfFindsShipAndHitCells) {
    Board board(5);
    board.setCell(0, 1, CellState::SHIP, 2);
    board.setCell(0, 2, CellState::SHIP, 2);
    board.setCell(0, 2, CellState::HIT, 2);
    board.setCell(4, 4, CellState::SHIP, 7);

    auto cells = board.cellsOf(2);
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[0], (common::Coord{0, 1}));
    EXPECT_EQ(cells[1], (common::Coord{0, 2}));
    EXPECT_TRUE(board.cellsOf(9).empty());
}
