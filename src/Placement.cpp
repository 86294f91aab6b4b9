#include "Placement.h"
#include "utils.h"

#include <algorithm>
#include <limits>
#include <sstream>

using namespace naval;
using common::Coord;

namespace {

// Footprint extent in rows/cols for the given orientation.
void footprintExtent(int width, int length, Orientation o,
                     int& rows, int& cols)
{
    if (o == Orientation::HORIZONTAL) {
        rows = width;
        cols = length;
    } else {
        rows = length;
        cols = width;
    }
}

} // namespace

const char* naval::orientationName(Orientation o) {
    return o == Orientation::HORIZONTAL ? "horizontal" : "vertical";
}

//------------------------------------------------------------------------------
// Validator
//------------------------------------------------------------------------------
bool naval::canPlace(const Board& board, int row, int col,
                     int width, int length, Orientation orientation)
{
    if (width <= 0 || length <= 0) return false;

    int rows = 0, cols = 0;
    footprintExtent(width, length, orientation, rows, cols);

    // Written without row + rows so huge origins cannot overflow.
    const int n = board.getSize();
    if (row < 0 || col < 0 || rows > n || cols > n
        || row > n - rows || col > n - cols)
    {
        return false;
    }

    // The footprint grown by one cell on every side, clipped to the board.
    // Covers both the overlap and the no-touching rule.
    const int r0 = std::max(row - 1, 0);
    const int c0 = std::max(col - 1, 0);
    const int r1 = std::min(row + rows, n - 1);
    const int c1 = std::min(col + cols, n - 1);
    for (int r = r0; r <= r1; ++r) {
        for (int c = c0; c <= c1; ++c) {
            if (board.getCell(r, c).state == CellState::SHIP) {
                return false;
            }
        }
    }
    return true;
}

Board naval::place(const Board& board, int row, int col,
                   int width, int length, Orientation orientation, int shipId)
{
    Board out = board;
    for (const Coord& c : footprint(row, col, width, length, orientation)) {
        out.setCell(c.row, c.col, CellState::SHIP, shipId);
    }
    return out;
}

std::vector<Coord> naval::footprint(int row, int col,
                                    int width, int length,
                                    Orientation orientation)
{
    int rows = 0, cols = 0;
    footprintExtent(width, length, orientation, rows, cols);

    std::vector<Coord> cells;
    if (rows <= 0 || cols <= 0) return cells;
    // No representable footprint past INT_MAX.
    if (row > std::numeric_limits<int>::max() - rows
        || col > std::numeric_limits<int>::max() - cols)
    {
        return cells;
    }
    cells.reserve(static_cast<std::size_t>(rows) * cols);
    for (int r = row; r < row + rows; ++r) {
        for (int c = col; c < col + cols; ++c) {
            cells.push_back({r, c});
        }
    }
    return cells;
}

//------------------------------------------------------------------------------
// Orientation resolver
//------------------------------------------------------------------------------
std::optional<Placement> naval::derivePlacement(const Board& board, int shipId) {
    const std::vector<Coord> cells = board.cellsOf(shipId);
    if (cells.empty()) return std::nullopt;

    int minRow = std::numeric_limits<int>::max(), maxRow = -1;
    int minCol = std::numeric_limits<int>::max(), maxCol = -1;
    for (const Coord& c : cells) {
        minRow = std::min(minRow, c.row);
        maxRow = std::max(maxRow, c.row);
        minCol = std::min(minCol, c.col);
        maxCol = std::max(maxCol, c.col);
    }
    const int rowSpan = maxRow - minRow + 1;
    const int colSpan = maxCol - minCol + 1;

    Placement p;
    p.shipId      = shipId;
    p.startRow    = minRow;
    p.startCol    = minCol;
    p.orientation = colSpan > rowSpan ? Orientation::HORIZONTAL
                                      : Orientation::VERTICAL;
    return p;
}

std::vector<Placement> naval::derivePlacements(const Board& board, const Fleet& fleet) {
    std::vector<Placement> out;
    for (const Ship& ship : fleet.ships()) {
        if (auto p = derivePlacement(board, ship.getId())) {
            out.push_back(*p);
        }
    }
    return out;
}

//------------------------------------------------------------------------------
// Auto-placement
//------------------------------------------------------------------------------
std::optional<Board> naval::tryAutoPlace(const Board& start,
                                         const std::vector<ShipSpec>& ships,
                                         std::mt19937& rng,
                                         int maxAttemptsPerShip)
{
    const int n = start.getSize();
    if (n <= 0) return std::nullopt;

    std::uniform_int_distribution<int> coord(0, n - 1);
    std::bernoulli_distribution        horizontal(0.5);

    Board board = start;
    for (const ShipSpec& ship : ships) {
        bool placed = false;
        for (int attempt = 0; attempt < maxAttemptsPerShip && !placed; ++attempt) {
            const Orientation o = horizontal(rng) ? Orientation::HORIZONTAL
                                                  : Orientation::VERTICAL;
            const int row = coord(rng);
            const int col = coord(rng);
            if (canPlace(board, row, col, ship.width, ship.length, o)) {
                board  = place(board, row, col, ship.width, ship.length, o, ship.id);
                placed = true;
            }
        }
        if (!placed) {
            logDebug("PLACE", "gave up on " + ship.name + " after "
                              + std::to_string(maxAttemptsPerShip) + " attempts");
            return std::nullopt;
        }
    }
    return board;
}

Board naval::autoPlace(const Board& start,
                       const std::vector<ShipSpec>& ships,
                       std::mt19937& rng,
                       int maxAttemptsPerShip,
                       int maxRounds)
{
    for (int round = 0; round < maxRounds; ++round) {
        if (auto board = tryAutoPlace(start, ships, rng, maxAttemptsPerShip)) {
            if (round > 0) {
                logDebug("PLACE", "fleet placed after " + std::to_string(round + 1) + " rounds");
            }
            return *board;
        }
    }

    std::ostringstream oss;
    oss << "could not place " << ships.size() << " ships on a "
        << start.getSize() << "x" << start.getSize() << " board after "
        << maxRounds << " rounds";
    throw PlacementError(oss.str());
}
