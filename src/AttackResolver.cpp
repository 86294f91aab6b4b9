#include "AttackResolver.h"
#include "utils.h"

#include <sstream>

using namespace naval;

AttackResult naval::resolveAttack(const Board& board, const Fleet& fleet, int row, int col) {
    AttackResult result{board, fleet, AttackOutcome::MISS, std::nullopt, false, fleet.allSunk()};

    if (!board.inBounds(row, col)) {
        result.outcome = AttackOutcome::OUT_OF_BOUNDS;
        return result;
    }

    const Cell cell = board.getCell(row, col);
    switch (cell.state) {
    case CellState::SHIP: {
        result.board.setCell(row, col, CellState::HIT, cell.shipId);
        result.outcome = AttackOutcome::HIT;
        result.shipId  = cell.shipId;
        if (cell.shipId) {
            if (Ship* ship = result.fleet.findShip(*cell.shipId)) {
                result.sunk = ship->registerHit();
            }
        }
        break;
    }
    case CellState::EMPTY:
        result.board.setCell(row, col, CellState::MISS);
        result.outcome = AttackOutcome::MISS;
        break;
    case CellState::HIT:
    case CellState::MISS:
        result.outcome = AttackOutcome::ALREADY_RESOLVED;
        return result;
    }

    result.fleetDestroyed = result.fleet.allSunk();

    if (isVerbose()) {
        std::ostringstream oss;
        oss << "(" << row << "," << col << ") " << outcomeToString(result.outcome);
        if (result.shipId) oss << " ship=" << *result.shipId;
        if (result.sunk) oss << " SUNK";
        if (result.fleetDestroyed) oss << " fleet destroyed";
        logDebug("ATTACK", oss.str());
    }
    return result;
}

bool naval::isRejected(AttackOutcome outcome) {
    return outcome == AttackOutcome::ALREADY_RESOLVED
        || outcome == AttackOutcome::OUT_OF_BOUNDS;
}

const char* naval::outcomeToString(AttackOutcome outcome) {
    switch (outcome) {
        case AttackOutcome::HIT:              return "hit";
        case AttackOutcome::MISS:             return "miss";
        case AttackOutcome::ALREADY_RESOLVED: return "already-resolved";
        case AttackOutcome::OUT_OF_BOUNDS:    return "out-of-bounds";
    }
    return "unknown";
}
