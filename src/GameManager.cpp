#include "GameManager.h"
#include "utils.h"

#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

using namespace naval;

namespace {

// Own board shows ships; the enemy board only shows shot results, with the
// hits on a sunk ship drawn as '#'.
char cellGlyph(const Cell& cell, bool revealShips, const Fleet& fleet) {
    switch (cell.state) {
        case CellState::EMPTY: return '.';
        case CellState::SHIP:  return revealShips ? 'S' : '.';
        case CellState::MISS:  return 'o';
        case CellState::HIT: {
            if (cell.shipId) {
                const Ship* ship = fleet.findShip(*cell.shipId);
                if (ship && ship->isSunk()) return '#';
            }
            return 'X';
        }
    }
    return '?';
}

void printGrid(std::ostream& out, const std::string& title,
               const Board& board, const Fleet& fleet, bool revealShips)
{
    const int n = board.getSize();
    out << "=== " << title << " ===\n";
    out << "    ";
    for (int c = 0; c < n; ++c) out << (c % 10);
    out << "\n";
    for (int r = 0; r < n; ++r) {
        out << (r < 10 ? "  " : " ") << r << " ";
        for (int c = 0; c < n; ++c) {
            out << cellGlyph(board.getCell(r, c), revealShips, fleet);
        }
        out << "\n";
    }
}

bool parseOrientation(const std::string& word, Orientation& out) {
    if (word == "h" || word == "H") { out = Orientation::HORIZONTAL; return true; }
    if (word == "v" || word == "V") { out = Orientation::VERTICAL;   return true; }
    return false;
}

} // namespace

int GameManager::run(std::istream& in, std::ostream& out) {
    out << "=== NAVAL STRIKE ===\n";
    printStatus(out);

    std::string line;
    while (out << "> " << std::flush, std::getline(in, line)) {
        if (!handleCommand(line, out)) break;
    }
    return 0;
}

bool GameManager::handleCommand(const std::string& line, std::ostream& out) {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) return true;

    if (cmd == "quit" || cmd == "exit") {
        return false;
    }
    if (cmd == "help") {
        printHelp(out);
    } else if (cmd == "show") {
        printBoards(out);
    } else if (cmd == "status") {
        printStatus(out);
    } else if (cmd == "rotate") {
        game_state_.toggleOrientation();
        out << "Orientation: " << orientationName(game_state_.getOrientation()) << "\n";
    } else if (cmd == "reset") {
        game_state_.reset();
        printStatus(out);
    } else if (cmd == "auto") {
        try {
            if (!game_state_.autoPlaceRemaining()) {
                out << "Cannot auto-deploy now.\n";
            }
        } catch (const PlacementError& e) {
            out << "Enemy fleet could not deploy: " << e.what() << "\n";
        }
        printStatus(out);
    } else if (cmd == "select") {
        std::string name;
        if (!(iss >> name)) {
            out << "usage: select <ship>\n";
            return true;
        }
        const ShipSpec* match = nullptr;
        for (const ShipSpec& spec : game_state_.getConfig().roster) {
            if (toUpper(spec.name) == toUpper(name)) match = &spec;
        }
        if (!match) {
            out << "No ship named \"" << name << "\".\n";
        } else if (!game_state_.selectShip(match->id)) {
            out << "Cannot select " << match->name << " now.\n";
        }
        printStatus(out);
    } else if (cmd == "place") {
        int row = 0, col = 0;
        std::string word;
        if (!(iss >> row >> col)) {
            out << "usage: place <row> <col> [h|v]\n";
            return true;
        }
        Orientation o = game_state_.getOrientation();
        if (iss >> word && !parseOrientation(word, o)) {
            out << "orientation must be h or v\n";
            return true;
        }
        try {
            if (!game_state_.attemptPlacement(row, col, o)) {
                out << "Cannot place there.\n";
            }
        } catch (const PlacementError& e) {
            out << "Enemy fleet could not deploy: " << e.what() << "\n";
        }
        printStatus(out);
    } else if (cmd == "fire") {
        int row = 0, col = 0;
        if (!(iss >> row >> col)) {
            out << "usage: fire <row> <col>\n";
            return true;
        }
        const ShotRequest req = game_state_.attemptAttack(row, col);
        if (req != ShotRequest::ACCEPTED) {
            out << "Shot ignored (" << shotRequestName(req) << ").\n";
            return true;
        }
        drainShots(out);
        printBoards(out);
        printStatus(out);
    } else {
        out << "Unknown command \"" << cmd << "\". Type help.\n";
    }
    return true;
}

//------------------------------------------------------------------------------
// Land every in-flight shot, the computer's follow-ups included, pausing
// ShotDelayMs before each one.
//------------------------------------------------------------------------------
void GameManager::drainShots(std::ostream& out) {
    const int delay = game_state_.getConfig().shotDelayMs;
    while (game_state_.isInFlight()) {
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        std::optional<ShotReport> report = game_state_.resolvePendingShot();
        if (!report) break;

        out << (report->shooter == Side::PLAYER ? "You" : "Enemy")
            << " fired at (" << report->shot.target.row << ","
            << report->shot.target.col << "): "
            << game_state_.getMessage() << "\n";
    }
}

void GameManager::printBoards(std::ostream& out) const {
    printGrid(out, "YOUR FLEET", game_state_.getPlayerBoard(),
              game_state_.getPlayerFleet(), true);
    if (game_state_.getPhase() != GamePhase::PLACEMENT) {
        printGrid(out, "ENEMY WATERS", game_state_.getComputerBoard(),
                  game_state_.getComputerFleet(),
                  game_state_.getPhase() == GamePhase::GAME_OVER);
    }
}

void GameManager::printStatus(std::ostream& out) const {
    out << "[" << phaseName(game_state_.getPhase()) << "] "
        << game_state_.getMessage() << "\n";

    if (game_state_.getPhase() == GamePhase::PLACEMENT) {
        out << "Orientation: " << orientationName(game_state_.getOrientation()) << "\n";
        out << "Unplaced:";
        for (const ShipSpec& spec : game_state_.getConfig().roster) {
            if (!game_state_.isShipPlaced(spec.id)) out << " " << spec.name;
        }
        out << "\n";
        return;
    }

    auto fleetLine = [&out](const char* label, const Fleet& fleet) {
        out << label << ":";
        for (const Ship& s : fleet.ships()) {
            out << " " << s.getName() << " " << s.getHits() << "/" << s.getSize()
                << (s.isSunk() ? " (sunk)" : "") << ";";
        }
        out << "\n";
    };
    fleetLine("Your fleet", game_state_.getPlayerFleet());
    fleetLine("Enemy fleet", game_state_.getComputerFleet());

    if (auto winner = game_state_.getWinner()) {
        out << "Winner: " << sideName(*winner) << "\n";
    }
}

void GameManager::printHelp(std::ostream& out) const {
    out << "Commands:\n"
        << "  place <row> <col> [h|v]   deploy the next ship\n"
        << "  select <ship>             choose which ship to deploy next\n"
        << "  rotate                    toggle placement orientation\n"
        << "  auto                      deploy the remaining ships at random\n"
        << "  fire <row> <col>          shoot at the enemy board\n"
        << "  show                      print both boards\n"
        << "  status                    print phase, message and fleets\n"
        << "  reset                     start over\n"
        << "  quit                      leave\n";
}
