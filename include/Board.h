#pragma once

#include <vector>
#include <optional>
#include <cstddef>

#include "common/Coord.h"

namespace naval {

// -----------------------------------------------------------------------------
// Each grid cell is open water, part of a ship, or the result of a shot.
// HIT and MISS are terminal: once a cell holds one of them it never changes.
// shipId is set on SHIP cells and kept when such a cell becomes HIT.
// -----------------------------------------------------------------------------
enum class CellState {
    EMPTY,
    SHIP,
    HIT,
    MISS
};

struct Cell {
    CellState          state;
    std::optional<int> shipId;

    Cell()
      : state(CellState::EMPTY), shipId()
    {}
};

class Board {
public:
    Board();
    explicit Board(int size);

    int  getSize() const;
    bool inBounds(int row, int col) const;

    // Return const reference to the entire grid (for rendering).
    const std::vector<std::vector<Cell>>& getGrid() const;

    const Cell& getCell(int row, int col) const;

    // Write a cell. Refused (returns false, nothing changes) when the cell is
    // out of bounds or already HIT/MISS.
    bool setCell(int row, int col, CellState state,
                 std::optional<int> shipId = std::nullopt);

    // True for HIT and MISS cells.
    bool isResolved(int row, int col) const;

    int countState(CellState state) const;

    // Every cell (SHIP or HIT) that belongs to the given ship, row-major.
    std::vector<common::Coord> cellsOf(int shipId) const;

private:
    int size_;
    std::vector<std::vector<Cell>> grid;
};

} // namespace naval
