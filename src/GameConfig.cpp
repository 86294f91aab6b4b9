#include "GameConfig.h"
#include "utils.h"

#include <fstream>
#include <set>
#include <utility>

using namespace naval;

std::vector<ShipSpec> naval::defaultRoster() {
    return {
        { 1, "Carrier",    2, 7 },
        { 2, "Battleship", 1, 7 },
        { 3, "Cruiser",    1, 5 },
        { 4, "Destroyer",  1, 4 },
        { 5, "Submarine",  1, 5 },
        { 6, "Rescue",     1, 4 },
        { 7, "Patrol",     1, 2 },
    };
}

bool GameConfig::validate(std::string& error) const {
    if (boardSize < 1) {
        error = "BoardSize must be at least 1";
        return false;
    }
    if (boardSize > kMaxBoardSize) {
        error = "BoardSize must be at most " + std::to_string(kMaxBoardSize);
        return false;
    }
    if (roster.empty()) {
        error = "roster has no ships";
        return false;
    }
    if (maxPlacementAttempts < 1 || maxPlacementRounds < 1) {
        error = "placement attempt limits must be positive";
        return false;
    }
    if (shotDelayMs < 0) {
        error = "ShotDelayMs must not be negative";
        return false;
    }

    std::set<std::string> names;
    std::set<int>         ids;
    for (const auto& ship : roster) {
        if (ship.name.empty()) {
            error = "ship with empty name";
            return false;
        }
        if (ship.width < 1 || ship.length < 1) {
            error = "ship " + ship.name + " has a non-positive dimension";
            return false;
        }
        if (ship.width > ship.length) {
            error = "ship " + ship.name + " is wider than it is long";
            return false;
        }
        if (ship.length > boardSize) {
            error = "ship " + ship.name + " does not fit on the board";
            return false;
        }
        if (!names.insert(ship.name).second) {
            error = "duplicate ship name: " + ship.name;
            return false;
        }
        if (!ids.insert(ship.id).second) {
            error = "duplicate ship id for " + ship.name;
            return false;
        }
    }
    return true;
}

namespace {

bool parseShip(const std::string& value, int id, ShipSpec& out, std::string& error) {
    std::vector<std::string> parts = splitList(value);
    int width = 0, length = 0;
    if (parts.size() != 3 || parts[0].empty()
        || !parseInt(parts[1], width) || !parseInt(parts[2], length))
    {
        error = "expected \"Ship = <name>, <width>, <length>\", got \"" + value + "\"";
        return false;
    }
    if (width > length) std::swap(width, length);
    out = ShipSpec{ id, parts[0], width, length };
    return true;
}

} // namespace

bool naval::parseConfig(std::istream& in, GameConfig& out, std::string& error) {
    GameConfig cfg = out;
    std::vector<ShipSpec> ships;
    std::string line;
    int lineNo = 0;
    error.clear();

    while (std::getline(in, line)) {
        ++lineNo;
        const std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;

        std::string key, value;
        if (!parseKeyValue(t, key, value)) {
            error = "line " + std::to_string(lineNo) + ": expected Key = Value";
            return false;
        }

        int n = 0;
        bool ok = true;
        if (key == "Ship") {
            ShipSpec spec;
            ok = parseShip(value, static_cast<int>(ships.size()) + 1, spec, error);
            if (ok) ships.push_back(spec);
        } else if (key == "BoardSize") {
            ok = parseInt(value, n);
            if (ok) cfg.boardSize = n;
        } else if (key == "Seed") {
            ok = parseInt(value, n) && n >= 0;
            if (ok) cfg.seed = static_cast<unsigned>(n);
        } else if (key == "MaxPlacementAttempts") {
            ok = parseInt(value, n);
            if (ok) cfg.maxPlacementAttempts = n;
        } else if (key == "MaxPlacementRounds") {
            ok = parseInt(value, n);
            if (ok) cfg.maxPlacementRounds = n;
        } else if (key == "ShotDelayMs") {
            ok = parseInt(value, n);
            if (ok) cfg.shotDelayMs = n;
        } else if (key == "Verbose") {
            ok = parseInt(value, n) && (n == 0 || n == 1);
            if (ok) cfg.verbose = (n == 1);
        } else if (key == "SinkPolicy") {
            if (value == "prune") {
                cfg.sinkPolicy = SinkPolicy::PRUNE_SUNK_SHIP;
            } else if (value == "clear") {
                cfg.sinkPolicy = SinkPolicy::CLEAR_ALL;
            } else {
                ok = false;
            }
        } else {
            error = "line " + std::to_string(lineNo) + ": unknown key \"" + key + "\"";
            return false;
        }

        if (!ok) {
            if (error.empty()) {
                error = "invalid value for " + key + ": \"" + value + "\"";
            }
            error = "line " + std::to_string(lineNo) + ": " + error;
            return false;
        }
    }

    if (!ships.empty()) cfg.roster = ships;
    if (!cfg.validate(error)) return false;

    out = cfg;
    logDebug("CONFIG", "board " + std::to_string(out.boardSize) + ", "
                       + std::to_string(out.roster.size()) + " ships");
    return true;
}

bool naval::loadConfig(const std::string& path, GameConfig& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open config file: " + path;
        return false;
    }
    return parseConfig(in, out, error);
}
