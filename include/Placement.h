#pragma once

#include <optional>
#include <random>
#include <stdexcept>
#include <vector>

#include "Board.h"
#include "Fleet.h"
#include "Ship.h"
#include "common/Coord.h"

namespace naval {

enum class Orientation {
    HORIZONTAL,
    VERTICAL
};

/// Where a ship sits, rebuilt from board occupancy. Not authoritative.
struct Placement {
    int         shipId;
    int         startRow;
    int         startCol;
    Orientation orientation;
};

/// Thrown by autoPlace() when no round managed to place the whole roster.
class PlacementError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* orientationName(Orientation o);

/*
  Horizontal ships span `length` columns and `width` rows from (row, col);
  vertical ships span `length` rows and `width` columns. A placement is legal
  when the whole footprint is on the board, no footprint cell is a ship, and
  no ship lies in the one-cell ring around it (diagonals included).
*/
bool canPlace(const Board& board, int row, int col,
              int width, int length, Orientation orientation);

/// Copy of `board` with the footprint marked SHIP/shipId. Does not validate.
Board place(const Board& board, int row, int col,
            int width, int length, Orientation orientation, int shipId);

/// Footprint cells, row-major. May lie partly off the board; empty when it
/// would run past INT_MAX.
std::vector<common::Coord> footprint(int row, int col,
                                     int width, int length,
                                     Orientation orientation);

/*
  Rebuild a ship's placement from the cells carrying its id. The ship is
  horizontal when its bounding box is wider than tall, vertical otherwise;
  a 2-wide horizontal ship spans two rows, so counting distinct rows would
  misclassify it.
*/
std::optional<Placement> derivePlacement(const Board& board, int shipId);

/// Placements of every placed ship of `fleet`, in fleet order.
std::vector<Placement> derivePlacements(const Board& board, const Fleet& fleet);

/*
  One round of random placement on top of `start`: up to maxAttemptsPerShip
  random (row, col, orientation) draws per ship. nullopt when some ship ran
  out of attempts; the partial board is thrown away.
*/
std::optional<Board> tryAutoPlace(const Board& start,
                                  const std::vector<ShipSpec>& ships,
                                  std::mt19937& rng,
                                  int maxAttemptsPerShip);

/// Repeats tryAutoPlace() from `start` up to maxRounds times.
/// Throws PlacementError when every round fails.
Board autoPlace(const Board& start,
                const std::vector<ShipSpec>& ships,
                std::mt19937& rng,
                int maxAttemptsPerShip,
                int maxRounds);

} // namespace naval
