#pragma once

#include <istream>
#include <string>
#include <vector>

#include "Ship.h"
#include "HuntTargetAlgorithm.h"

namespace naval {

// Largest BoardSize validate() accepts.
constexpr int kMaxBoardSize = 1000;

/// The seven ships of the standard game: Carrier 2x7 down to Patrol 1x2.
std::vector<ShipSpec> defaultRoster();

/*
  Product parameters. Board size and roster are injected here rather than
  baked into the rules. seed == 0 draws a seed from std::random_device.
*/
struct GameConfig {
    int                   boardSize            = 15;
    std::vector<ShipSpec> roster               = defaultRoster();
    unsigned              seed                 = 0;
    int                   maxPlacementAttempts = 1000;
    int                   maxPlacementRounds   = 100;
    SinkPolicy            sinkPolicy           = SinkPolicy::PRUNE_SUNK_SHIP;
    int                   shotDelayMs          = 600;
    bool                  verbose              = false;

    // False (and a reason in `error`) when the values cannot make a game.
    bool validate(std::string& error) const;
};

/*
  Read "Key = Value" lines into `out`. Blank lines and lines starting with
  '#' are skipped. Keys: BoardSize, Seed, MaxPlacementAttempts,
  MaxPlacementRounds, SinkPolicy (prune|clear), ShotDelayMs, Verbose, and
  repeated "Ship = <name>, <width>, <length>" lines; the first Ship line
  replaces the default roster. The result is validated.
*/
bool parseConfig(std::istream& in, GameConfig& out, std::string& error);

bool loadConfig(const std::string& path, GameConfig& out, std::string& error);

} // namespace naval
