#include "Board.h"

using namespace naval;

//------------------------------------------------------------------------------
// Constructors
//------------------------------------------------------------------------------
Board::Board()
  : size_(0), grid()
{}

Board::Board(int size)
  : size_(size < 0 ? 0 : size),
    grid(size_, std::vector<Cell>(size_))
{}

//------------------------------------------------------------------------------
// Accessors
//------------------------------------------------------------------------------
int Board::getSize() const { return size_; }

bool Board::inBounds(int row, int col) const {
    return row >= 0 && row < size_ && col >= 0 && col < size_;
}

const std::vector<std::vector<Cell>>& Board::getGrid() const {
    return grid;
}

const Cell& Board::getCell(int row, int col) const {
    return grid[row][col];
}

//------------------------------------------------------------------------------
// setCell: refuses to touch a resolved cell
//------------------------------------------------------------------------------
bool Board::setCell(int row, int col, CellState state, std::optional<int> shipId) {
    if (!inBounds(row, col) || isResolved(row, col)) {
        return false;
    }
    Cell& cell = grid[row][col];
    cell.state  = state;
    cell.shipId = shipId;
    return true;
}

bool Board::isResolved(int row, int col) const {
    if (!inBounds(row, col)) return false;
    const CellState s = grid[row][col].state;
    return s == CellState::HIT || s == CellState::MISS;
}

//------------------------------------------------------------------------------
// Scans
//------------------------------------------------------------------------------
int Board::countState(CellState state) const {
    int n = 0;
    for (const auto& row : grid) {
        for (const auto& cell : row) {
            if (cell.state == state) ++n;
        }
    }
    return n;
}

std::vector<common::Coord> Board::cellsOf(int shipId) const {
    std::vector<common::Coord> out;
    for (int r = 0; r < size_; ++r) {
        for (int c = 0; c < size_; ++c) {
            const Cell& cell = grid[r][c];
            if (cell.shipId && *cell.shipId == shipId) {
                out.push_back({r, c});
            }
        }
    }
    return out;
}
