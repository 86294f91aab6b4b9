#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "AttackResolver.h"
#include "Board.h"
#include "Fleet.h"
#include "GameConfig.h"
#include "Placement.h"
#include "common/Coord.h"
#include "common/ShotInfo.h"
#include "common/TargetingAlgorithm.h"
#include "common/TargetingAlgorithmFactory.h"

namespace naval {

enum class GamePhase {
    PLACEMENT,
    BATTLE,
    GAME_OVER
};

enum class Side {
    PLAYER,
    COMPUTER
};

/// Answer to attemptAttack(). Anything but ACCEPTED left the game untouched.
enum class ShotRequest {
    ACCEPTED,
    WRONG_PHASE,
    NOT_YOUR_TURN,
    IN_FLIGHT,
    OUT_OF_BOUNDS,
    ALREADY_RESOLVED
};

/// One resolved shot, as handed back to the presentation layer.
struct ShotReport {
    Side             shooter;
    common::ShotInfo shot;
    bool             gameOver;
};

const char* sideName(Side side);
const char* phaseName(GamePhase phase);
const char* shotRequestName(ShotRequest request);

/*
  Owns both boards and fleets and runs the game:

    PLACEMENT --(last human ship placed)--> BATTLE --(a fleet sunk)--> GAME_OVER

  A shot is two steps. attemptAttack() accepts the player's target and puts
  it in flight; resolvePendingShot() lands it later, after the caller has
  played its animation. While a shot is in flight every attemptAttack() is
  rejected. A hit keeps the turn, a miss passes it, for both sides. When
  the turn passes to the computer its shot is chosen at once and becomes the
  next in-flight shot, so the caller keeps calling resolvePendingShot()
  until isInFlight() turns false.
*/
class GameState {
public:
    GameState(const GameConfig& config,
              std::unique_ptr<common::TargetingAlgorithmFactory> aiFactory);
    ~GameState();

    /// Fresh boards and fleets, back to PLACEMENT.
    void reset();

    // ---- Placement phase ----

    /// Place the selected ship (or the first unplaced one) at (row, col).
    /// False when illegal or not in PLACEMENT. The last ship also deploys the
    /// computer fleet and may throw PlacementError, in which case nothing has
    /// changed.
    bool attemptPlacement(int row, int col, Orientation orientation);
    bool attemptPlacement(int row, int col);

    /// Place a given roster ship, in any order. False when the id is unknown
    /// or that ship is already placed.
    bool attemptPlacement(int shipId, int row, int col, Orientation orientation);

    /// Make an unplaced ship the one the next placement uses.
    bool selectShip(int shipId);
    bool isShipPlaced(int shipId) const;

    /// Randomly place every human ship not yet placed, then start the battle.
    /// False, with the board untouched, when they do not fit.
    bool autoPlaceRemaining();

    void        toggleOrientation();
    void        setOrientation(Orientation orientation);
    Orientation getOrientation() const;

    /// Cells the next ship would cover at (row, col); empty when illegal.
    std::vector<common::Coord> previewPlacement(int row, int col) const;

    // ---- Battle phase ----

    ShotRequest attemptAttack(int row, int col);

    /// Land the in-flight shot. nullopt when nothing is in flight.
    std::optional<ShotReport> resolvePendingShot();

    // ---- Queries ----
    GamePhase                    getPhase()       const;
    Side                         getTurnOwner()   const;
    std::optional<Side>          getWinner()      const;
    const std::string&           getMessage()     const;
    bool                         isInFlight()     const;
    std::optional<common::Coord> getPendingShot() const;

    const Board& getPlayerBoard()   const;
    const Board& getComputerBoard() const;
    const Fleet& getPlayerFleet()   const;
    const Fleet& getComputerFleet() const;

    /// Roster index of nextShipToPlace(); roster size once all are placed.
    std::size_t     getCurrentShipIndex() const;
    const ShipSpec* nextShipToPlace()     const;
    std::size_t     placedCount()         const;

    std::vector<Placement> getPlayerPlacements()       const;
    std::vector<Placement> getSunkComputerPlacements() const;

    const GameConfig& getConfig() const;

private:
    void commitPlayerBoard(const Board& board, const std::vector<std::size_t>& newlyPlaced);
    std::optional<std::size_t> rosterIndexOf(int shipId) const;
    void beginBattle(const Board& computerBoard);
    void armComputerShot();
    void promptNextShip();

    std::optional<ShotReport> landPlayerShot(const common::Coord& target);
    std::optional<ShotReport> landComputerShot(const common::Coord& target);
    void advanceTurn(Side shooter, const AttackResult& result);

    // ---- Internal state ----
    GameConfig config_;
    std::unique_ptr<common::TargetingAlgorithmFactory> ai_factory_;
    std::unique_ptr<common::TargetingAlgorithm>        ai_;
    std::mt19937 rng_;

    Board player_board_, computer_board_;
    Fleet player_fleet_, computer_fleet_;

    GamePhase           phase_{GamePhase::PLACEMENT};
    Side                turn_{Side::PLAYER};
    std::optional<Side> winner_;
    std::string         message_;

    bool                         in_flight_{false};
    std::optional<common::Coord> pending_;
    Side                         pending_shooter_{Side::PLAYER};

    std::vector<bool>          placed_;
    std::optional<std::size_t> selected_;
    Orientation orientation_{Orientation::HORIZONTAL};
};

} // namespace naval
