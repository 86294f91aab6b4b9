#pragma once

#include <optional>

#include "Board.h"
#include "Fleet.h"

namespace naval {

enum class AttackOutcome {
    HIT,
    MISS,
    ALREADY_RESOLVED,
    OUT_OF_BOUNDS
};

/*
  Result of one shot. board/fleet are the post-shot copies; on a rejected
  shot they equal the inputs. shipId is set on a hit, sunk is true when that
  hit finished the ship, fleetDestroyed when every ship of the fleet is sunk.
*/
struct AttackResult {
    Board              board;
    Fleet              fleet;
    AttackOutcome      outcome;
    std::optional<int> shipId;
    bool               sunk;
    bool               fleetDestroyed;
};

/*
  Fire at (row, col). A SHIP cell becomes HIT and its ship takes a hit; an
  EMPTY cell becomes MISS. HIT/MISS cells are never rewritten: such a shot
  is rejected with ALREADY_RESOLVED and nothing changes. The inputs are
  never modified.
*/
AttackResult resolveAttack(const Board& board, const Fleet& fleet, int row, int col);

// ALREADY_RESOLVED and OUT_OF_BOUNDS
bool isRejected(AttackOutcome outcome);

const char* outcomeToString(AttackOutcome outcome);

} // namespace naval
