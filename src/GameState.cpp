#include "GameState.h"
#include "MyBoardView.h"
#include "utils.h"

#include <cstddef>
#include <sstream>
#include <stdexcept>

using namespace naval;
using common::Coord;
using common::ShotInfo;

namespace {

Side opponentOf(Side side) {
    return side == Side::PLAYER ? Side::COMPUTER : Side::PLAYER;
}

unsigned initialSeed(unsigned configured) {
    if (configured != 0) return configured;
    std::random_device rd;
    return rd();
}

std::string coordText(const Coord& c) {
    std::ostringstream oss;
    oss << "(" << c.row << "," << c.col << ")";
    return oss.str();
}

} // namespace

//------------------------------------------------------------------------------
const char* naval::sideName(Side side) {
    return side == Side::PLAYER ? "player" : "computer";
}

const char* naval::phaseName(GamePhase phase) {
    switch (phase) {
        case GamePhase::PLACEMENT: return "placement";
        case GamePhase::BATTLE:    return "battle";
        case GamePhase::GAME_OVER: return "game-over";
    }
    return "unknown";
}

const char* naval::shotRequestName(ShotRequest request) {
    switch (request) {
        case ShotRequest::ACCEPTED:         return "accepted";
        case ShotRequest::WRONG_PHASE:      return "wrong phase";
        case ShotRequest::NOT_YOUR_TURN:    return "not your turn";
        case ShotRequest::IN_FLIGHT:        return "shot in flight";
        case ShotRequest::OUT_OF_BOUNDS:    return "out of bounds";
        case ShotRequest::ALREADY_RESOLVED: return "already resolved";
    }
    return "unknown";
}

//------------------------------------------------------------------------------
GameState::GameState(const GameConfig& config,
                     std::unique_ptr<common::TargetingAlgorithmFactory> aiFactory)
  : config_(config),
    ai_factory_(std::move(aiFactory)),
    rng_(initialSeed(config.seed))
{
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("invalid game config: " + error);
    }
    if (!ai_factory_) {
        throw std::invalid_argument("GameState needs a targeting algorithm factory");
    }
    reset();
}

GameState::~GameState() = default;

//------------------------------------------------------------------------------
void GameState::reset() {
    const int n = config_.boardSize;
    player_board_   = Board(n);
    computer_board_ = Board(n);
    player_fleet_   = Fleet(config_.roster);
    computer_fleet_ = Fleet(config_.roster);

    phase_  = GamePhase::PLACEMENT;
    turn_   = Side::PLAYER;
    winner_.reset();

    in_flight_       = false;
    pending_.reset();
    pending_shooter_ = Side::PLAYER;

    placed_.assign(config_.roster.size(), false);
    selected_.reset();
    orientation_ = Orientation::HORIZONTAL;

    ai_ = ai_factory_->create(static_cast<unsigned>(rng_()));

    promptNextShip();
    logDebug("TURN", "new game on a " + std::to_string(n) + "x" + std::to_string(n) + " board");
}

void GameState::promptNextShip() {
    if (const ShipSpec* ship = nextShipToPlace()) {
        message_ = "DEPLOY " + toUpper(ship->name) + " - "
                 + std::to_string(ship->size()) + " grid units";
    }
}

//------------------------------------------------------------------------------
// Placement
//------------------------------------------------------------------------------
bool GameState::attemptPlacement(int row, int col, Orientation orientation) {
    const ShipSpec* ship = nextShipToPlace();
    if (!ship) return false;
    return attemptPlacement(ship->id, row, col, orientation);
}

bool GameState::attemptPlacement(int row, int col) {
    return attemptPlacement(row, col, orientation_);
}

bool GameState::attemptPlacement(int shipId, int row, int col, Orientation orientation) {
    if (phase_ != GamePhase::PLACEMENT) return false;
    const std::optional<std::size_t> index = rosterIndexOf(shipId);
    if (!index || placed_[*index]) return false;
    const ShipSpec& ship = config_.roster[*index];

    if (!canPlace(player_board_, row, col, ship.width, ship.length, orientation)) {
        logDebug("PLACE", "rejected " + ship.name + " at " + coordText({row, col})
                          + " " + orientationName(orientation));
        return false;
    }

    Board next = place(player_board_, row, col, ship.width, ship.length,
                       orientation, ship.id);
    logDebug("PLACE", ship.name + " at " + coordText({row, col})
                      + " " + orientationName(orientation));
    commitPlayerBoard(next, {*index});
    return true;
}

bool GameState::selectShip(int shipId) {
    if (phase_ != GamePhase::PLACEMENT) return false;
    const std::optional<std::size_t> index = rosterIndexOf(shipId);
    if (!index || placed_[*index]) return false;
    selected_ = index;
    promptNextShip();
    return true;
}

bool GameState::isShipPlaced(int shipId) const {
    const std::optional<std::size_t> index = rosterIndexOf(shipId);
    return index && placed_[*index];
}

bool GameState::autoPlaceRemaining() {
    if (phase_ != GamePhase::PLACEMENT || !nextShipToPlace()) return false;

    std::vector<ShipSpec>    rest;
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < config_.roster.size(); ++i) {
        if (!placed_[i]) {
            rest.push_back(config_.roster[i]);
            indices.push_back(i);
        }
    }

    Board filled;
    try {
        filled = autoPlace(player_board_, rest, rng_,
                           config_.maxPlacementAttempts, config_.maxPlacementRounds);
    } catch (const PlacementError& e) {
        logDebug("PLACE", e.what());
        message_ = "NO ROOM LEFT TO DEPLOY THE REMAINING SHIPS";
        return false;
    }

    commitPlayerBoard(filled, indices);
    return true;
}

// The computer fleet is placed before anything is committed, so a
// PlacementError leaves the game exactly as it was.
void GameState::commitPlayerBoard(const Board& board,
                                  const std::vector<std::size_t>& newlyPlaced)
{
    if (placedCount() + newlyPlaced.size() >= config_.roster.size()) {
        Board computer = autoPlace(Board(config_.boardSize), config_.roster, rng_,
                                   config_.maxPlacementAttempts,
                                   config_.maxPlacementRounds);
        player_board_ = board;
        for (std::size_t i : newlyPlaced) placed_[i] = true;
        selected_.reset();
        beginBattle(computer);
        return;
    }
    player_board_ = board;
    for (std::size_t i : newlyPlaced) placed_[i] = true;
    selected_.reset();
    promptNextShip();
}

std::optional<std::size_t> GameState::rosterIndexOf(int shipId) const {
    for (std::size_t i = 0; i < config_.roster.size(); ++i) {
        if (config_.roster[i].id == shipId) return i;
    }
    return std::nullopt;
}

void GameState::beginBattle(const Board& computerBoard) {
    computer_board_ = computerBoard;
    phase_          = GamePhase::BATTLE;
    turn_           = Side::PLAYER;
    in_flight_      = false;
    pending_.reset();
    message_ = "BATTLE STATIONS! Select enemy coordinates to fire!";
    logDebug("TURN", "battle begins, player to fire");
}

void GameState::toggleOrientation() {
    orientation_ = orientation_ == Orientation::HORIZONTAL ? Orientation::VERTICAL
                                                           : Orientation::HORIZONTAL;
}

void GameState::setOrientation(Orientation orientation) { orientation_ = orientation; }
Orientation GameState::getOrientation() const { return orientation_; }

std::vector<Coord> GameState::previewPlacement(int row, int col) const {
    const ShipSpec* ship = nextShipToPlace();
    if (phase_ != GamePhase::PLACEMENT || !ship) return {};
    if (!canPlace(player_board_, row, col, ship->width, ship->length, orientation_)) {
        return {};
    }
    return footprint(row, col, ship->width, ship->length, orientation_);
}

//------------------------------------------------------------------------------
// Battle
//------------------------------------------------------------------------------
ShotRequest GameState::attemptAttack(int row, int col) {
    if (phase_ != GamePhase::BATTLE)              return ShotRequest::WRONG_PHASE;
    if (in_flight_)                               return ShotRequest::IN_FLIGHT;
    if (turn_ != Side::PLAYER)                    return ShotRequest::NOT_YOUR_TURN;
    if (!computer_board_.inBounds(row, col))      return ShotRequest::OUT_OF_BOUNDS;
    if (computer_board_.isResolved(row, col))     return ShotRequest::ALREADY_RESOLVED;

    pending_         = Coord{row, col};
    pending_shooter_ = Side::PLAYER;
    in_flight_       = true;
    logDebug("TURN", "player fires at " + coordText({row, col}));
    return ShotRequest::ACCEPTED;
}

std::optional<ShotReport> GameState::resolvePendingShot() {
    if (!in_flight_ || !pending_) return std::nullopt;

    const Coord target = *pending_;
    if (pending_shooter_ == Side::PLAYER) {
        return landPlayerShot(target);
    }
    return landComputerShot(target);
}

std::optional<ShotReport> GameState::landPlayerShot(const Coord& target) {
    // Read the enemy board now, not when the shot was accepted.
    AttackResult result = resolveAttack(computer_board_, computer_fleet_,
                                        target.row, target.col);
    pending_.reset();
    if (isRejected(result.outcome)) {
        in_flight_ = false;
        logDebug("TURN", "player shot at " + coordText(target) + " dropped: "
                         + outcomeToString(result.outcome));
        return std::nullopt;
    }

    computer_board_ = result.board;
    computer_fleet_ = result.fleet;

    const bool hit = result.outcome == AttackOutcome::HIT;
    if (result.fleetDestroyed) {
        message_ = "TOTAL VICTORY! Enemy fleet annihilated!";
    } else if (result.sunk) {
        const Ship* ship = computer_fleet_.findShip(*result.shipId);
        message_ = "ENEMY " + toUpper(ship ? ship->getName() : std::string("VESSEL"))
                 + " DESTROYED! Outstanding work, Admiral!";
    } else if (hit) {
        message_ = "DIRECT HIT! Enemy vessel damaged!";
    } else {
        message_ = "MISS! Shells hit open water.";
    }

    ShotInfo info{target, hit, result.sunk, result.shipId ? *result.shipId : -1};
    advanceTurn(Side::PLAYER, result);
    return ShotReport{Side::PLAYER, info, phase_ == GamePhase::GAME_OVER};
}

std::optional<ShotReport> GameState::landComputerShot(const Coord& target) {
    AttackResult result = resolveAttack(player_board_, player_fleet_,
                                        target.row, target.col);
    if (isRejected(result.outcome)) {
        throw std::logic_error("targeting algorithm chose " + coordText(target)
                               + ", which is " + outcomeToString(result.outcome));
    }
    pending_.reset();

    player_board_ = result.board;
    player_fleet_ = result.fleet;

    const bool hit = result.outcome == AttackOutcome::HIT;
    ShotInfo info{target, hit, result.sunk, result.shipId ? *result.shipId : -1};
    ai_->notifyResult(info, MyBoardView(player_board_));

    if (result.fleetDestroyed) {
        message_ = "DEFEAT! Our fleet has been destroyed!";
    } else if (result.sunk) {
        const Ship* ship = player_fleet_.findShip(*result.shipId);
        message_ = "CRITICAL DAMAGE! Our " + toUpper(ship ? ship->getName() : std::string("VESSEL"))
                 + " has been sunk!";
    } else if (hit) {
        message_ = "INCOMING FIRE! Our vessel is hit!";
    } else {
        message_ = "Enemy salvo missed! We remain unscathed.";
    }

    advanceTurn(Side::COMPUTER, result);
    return ShotReport{Side::COMPUTER, info, phase_ == GamePhase::GAME_OVER};
}

//------------------------------------------------------------------------------
// The one place turn ownership changes. Same rule for both sides: a hit
// shoots again, a miss passes the turn, sinking the last ship ends the game.
//------------------------------------------------------------------------------
void GameState::advanceTurn(Side shooter, const AttackResult& result) {
    if (result.fleetDestroyed) {
        phase_     = GamePhase::GAME_OVER;
        winner_    = shooter;
        in_flight_ = false;
        logDebug("TURN", std::string(sideName(shooter)) + " wins");
        return;
    }

    if (result.outcome != AttackOutcome::HIT) {
        turn_ = opponentOf(shooter);
        logDebug("TURN", std::string("turn passes to ") + sideName(turn_));
    }

    if (turn_ == Side::COMPUTER) {
        armComputerShot();
    } else {
        in_flight_ = false;
    }
}

void GameState::armComputerShot() {
    MyBoardView view(player_board_);
    pending_         = ai_->chooseTarget(view);
    pending_shooter_ = Side::COMPUTER;
    in_flight_       = true;
    logDebug("TURN", "computer fires at " + coordText(*pending_));
}

//------------------------------------------------------------------------------
// Queries
//------------------------------------------------------------------------------
GamePhase GameState::getPhase() const { return phase_; }
Side GameState::getTurnOwner() const { return turn_; }
std::optional<Side> GameState::getWinner() const { return winner_; }
const std::string& GameState::getMessage() const { return message_; }
bool GameState::isInFlight() const { return in_flight_; }
std::optional<Coord> GameState::getPendingShot() const { return pending_; }

const Board& GameState::getPlayerBoard() const { return player_board_; }
const Board& GameState::getComputerBoard() const { return computer_board_; }
const Fleet& GameState::getPlayerFleet() const { return player_fleet_; }
const Fleet& GameState::getComputerFleet() const { return computer_fleet_; }

std::size_t GameState::getCurrentShipIndex() const {
    if (selected_ && !placed_[*selected_]) return *selected_;
    for (std::size_t i = 0; i < placed_.size(); ++i) {
        if (!placed_[i]) return i;
    }
    return config_.roster.size();
}

const ShipSpec* GameState::nextShipToPlace() const {
    const std::size_t i = getCurrentShipIndex();
    if (i >= config_.roster.size()) return nullptr;
    return &config_.roster[i];
}

std::size_t GameState::placedCount() const {
    std::size_t n = 0;
    for (bool p : placed_) {
        if (p) ++n;
    }
    return n;
}

std::vector<Placement> GameState::getPlayerPlacements() const {
    return derivePlacements(player_board_, player_fleet_);
}

// Enemy ships are only revealed once sunk.
std::vector<Placement> GameState::getSunkComputerPlacements() const {
    std::vector<Placement> out;
    for (const Placement& p : derivePlacements(computer_board_, computer_fleet_)) {
        const Ship* ship = computer_fleet_.findShip(p.shipId);
        if (ship && ship->isSunk()) out.push_back(p);
    }
    return out;
}

const GameConfig& GameState::getConfig() const { return config_; }
