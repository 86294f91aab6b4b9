#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <utility>

#include "GameState.h"

namespace naval {

/*
  Text-mode front end. Reads one command per line, forwards it to the
  GameState and prints the boards. It owns no rules; shot pacing is the only
  thing it adds (ShotDelayMs between accepting and landing each shot).
*/
class GameManager {
public:
    /// Construct with a concrete factory; template allows passing by value
    template<typename TF>
    GameManager(const GameConfig& config, TF tFac)
        : game_state_(config, std::make_unique<TF>(std::move(tFac)))
    {}

    ~GameManager() = default;

    /// Command loop until "quit" or end of input. Returns the exit code.
    int run(std::istream& in, std::ostream& out);

    /// Handle one command line. False when the shell should stop.
    bool handleCommand(const std::string& line, std::ostream& out);

    void printBoards(std::ostream& out) const;
    void printStatus(std::ostream& out) const;

    const GameState& getState() const { return game_state_; }

private:
    void drainShots(std::ostream& out);
    void printHelp(std::ostream& out) const;

    GameState game_state_;
};

} // namespace naval
