#include <gtest/gtest.h>

#include <limits>

#include "GameState.h"
#include "MyTargetingAlgorithmFactory.h"
#include "TestHelpers.h"

using namespace naval;
using namespace naval::test_support;
using common::Coord;

namespace {

std::unique_ptr<ScriptedFactory> scripted(std::deque<Coord> script,
                                          std::shared_ptr<ScriptLog> log)
{
    return std::make_unique<ScriptedFactory>(std::move(script), std::move(log));
}

// Player boats: Patrol at (0,0)-(0,1), Skiff at (3,3)-(3,4).
void deployPlayerFleet(GameState& game) {
    ASSERT_TRUE(game.attemptPlacement(0, 0, Orientation::HORIZONTAL));
    ASSERT_TRUE(game.attemptPlacement(3, 3, Orientation::HORIZONTAL));
    ASSERT_EQ(game.getPhase(), GamePhase::BATTLE);
}

// Land every pending shot, the computer's chain included.
void drain(GameState& game) {
    while (game.isInFlight()) {
        ASSERT_TRUE(game.resolvePendingShot().has_value());
    }
}

// Four full-width boats on a 7x7 board: the only layouts are every other
// row (or column) starting at an edge, so a single random draw per ship
// essentially never finds one.
GameConfig crampedConfig() {
    GameConfig cfg;
    cfg.boardSize            = 7;
    cfg.roster               = { {1, "North", 1, 7}, {2, "Mid", 1, 7},
                                 {3, "Low",   1, 7}, {4, "South", 1, 7} };
    cfg.seed                 = 99;
    cfg.maxPlacementAttempts = 1;
    cfg.maxPlacementRounds   = 1;
    cfg.shotDelayMs          = 0;
    return cfg;
}

} // namespace

TEST(GameStateTest, StartsInPlacementWithFirstShipPrompt) {
    GameState game(GameConfig{}, std::make_unique<MyTargetingAlgorithmFactory>());
    EXPECT_EQ(game.getPhase(), GamePhase::PLACEMENT);
    EXPECT_EQ(game.getTurnOwner(), Side::PLAYER);
    EXPECT_FALSE(game.getWinner().has_value());
    EXPECT_EQ(game.getMessage(), "DEPLOY CARRIER - 14 grid units");
    EXPECT_EQ(game.getPlayerBoard().getSize(), 15);
    ASSERT_NE(game.nextShipToPlace(), nullptr);
    EXPECT_EQ(game.nextShipToPlace()->name, "Carrier");
}

TEST(GameStateTest, InvalidConfigIsRefused) {
    GameConfig cfg;
    cfg.roster.clear();
    EXPECT_THROW(GameState(cfg, std::make_unique<MyTargetingAlgorithmFactory>()),
                 std::invalid_argument);
}

TEST(GameStateTest, PlacementAdvancesThroughRoster) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));

    EXPECT_FALSE(game.attemptPlacement(0, 5, Orientation::HORIZONTAL));  // off board
    EXPECT_EQ(game.getCurrentShipIndex(), 0u);

    ASSERT_TRUE(game.attemptPlacement(0, 0, Orientation::HORIZONTAL));
    EXPECT_EQ(game.getCurrentShipIndex(), 1u);
    EXPECT_EQ(game.getMessage(), "DEPLOY SKIFF - 2 grid units");

    // Touching the Patrol diagonally.
    EXPECT_FALSE(game.attemptPlacement(1, 2, Orientation::HORIZONTAL));
    EXPECT_EQ(game.getPhase(), GamePhase::PLACEMENT);

    ASSERT_TRUE(game.attemptPlacement(3, 3, Orientation::HORIZONTAL));
    EXPECT_EQ(game.getPhase(), GamePhase::BATTLE);
    EXPECT_EQ(game.getMessage(), "BATTLE STATIONS! Select enemy coordinates to fire!");
    EXPECT_EQ(game.getComputerBoard().countState(CellState::SHIP), 4);
    EXPECT_FALSE(game.attemptPlacement(5, 0, Orientation::HORIZONTAL));

    auto placements = game.getPlayerPlacements();
    ASSERT_EQ(placements.size(), 2u);
    EXPECT_EQ(placements[1].startRow, 3);
    EXPECT_EQ(placements[1].startCol, 3);
    EXPECT_EQ(placements[1].orientation, Orientation::HORIZONTAL);
}

TEST(GameStateTest, OrientationTogglesAndDrivesPreview) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));

    EXPECT_EQ(game.getOrientation(), Orientation::HORIZONTAL);
    auto h = game.previewPlacement(1, 1);
    ASSERT_EQ(h.size(), 2u);
    EXPECT_EQ(h[1], (Coord{1, 2}));

    game.toggleOrientation();
    EXPECT_EQ(game.getOrientation(), Orientation::VERTICAL);
    auto v = game.previewPlacement(1, 1);
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[1], (Coord{2, 1}));

    EXPECT_TRUE(game.previewPlacement(5, 5).empty());
    EXPECT_EQ(game.getPlayerBoard().countState(CellState::SHIP), 0);

    ASSERT_TRUE(game.attemptPlacement(1, 1));
    auto p = game.getPlayerPlacements();
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p[0].orientation, Orientation::VERTICAL);
}

TEST(GameStateTest, AutoPlaceRemainingStartsBattle) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));
    ASSERT_TRUE(game.attemptPlacement(0, 0, Orientation::HORIZONTAL));
    ASSERT_TRUE(game.autoPlaceRemaining());

    EXPECT_EQ(game.getPhase(), GamePhase::BATTLE);
    EXPECT_EQ(game.getPlayerBoard().cellsOf(1).size(), 2u);
    EXPECT_EQ(game.getPlayerBoard().cellsOf(2).size(), 2u);
    EXPECT_FALSE(game.autoPlaceRemaining());
}

TEST(GameStateTest, AttacksRejectedOutsideBattle) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));
    EXPECT_EQ(game.attemptAttack(0, 0), ShotRequest::WRONG_PHASE);
    EXPECT_FALSE(game.resolvePendingShot().has_value());
}

TEST(GameStateTest, SecondAttackWhileInFlightIsIgnored) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));
    deployPlayerFleet(game);

    auto water = firstCellWith(game.getComputerBoard(), CellState::EMPTY);
    ASSERT_TRUE(water.has_value());

    ASSERT_EQ(game.attemptAttack(water->row, water->col), ShotRequest::ACCEPTED);
    EXPECT_TRUE(game.isInFlight());
    ASSERT_TRUE(game.getPendingShot().has_value());

    // Same cell again, and a different one: both bounce, nothing changes.
    EXPECT_EQ(game.attemptAttack(water->row, water->col), ShotRequest::IN_FLIGHT);
    EXPECT_EQ(game.attemptAttack(0, 0), ShotRequest::IN_FLIGHT);
    EXPECT_EQ(game.getComputerBoard().countState(CellState::MISS), 0);
    EXPECT_EQ(game.getComputerBoard().countState(CellState::HIT), 0);
}

TEST(GameStateTest, PlayerHitKeepsTheTurn) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));
    deployPlayerFleet(game);

    auto ship = firstCellWith(game.getComputerBoard(), CellState::SHIP);
    ASSERT_TRUE(ship.has_value());
    ASSERT_EQ(game.attemptAttack(ship->row, ship->col), ShotRequest::ACCEPTED);

    auto report = game.resolvePendingShot();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->shooter, Side::PLAYER);
    EXPECT_TRUE(report->shot.hit);
    EXPECT_FALSE(report->gameOver);
    EXPECT_EQ(game.getMessage(), "DIRECT HIT! Enemy vessel damaged!");

    EXPECT_EQ(game.getTurnOwner(), Side::PLAYER);
    EXPECT_FALSE(game.isInFlight());
    EXPECT_TRUE(log->chosen.empty());

    EXPECT_EQ(game.attemptAttack(ship->row, ship->col), ShotRequest::ALREADY_RESOLVED);
    EXPECT_EQ(game.attemptAttack(9, 9), ShotRequest::OUT_OF_BOUNDS);
}

TEST(GameStateTest, PlayerMissHandsTurnToComputer) {
    auto log = std::make_shared<ScriptLog>();
    // Computer misses straight away at (5,5).
    GameState game(smallConfig(), scripted({ {5, 5} }, log));
    deployPlayerFleet(game);

    auto water = firstCellWith(game.getComputerBoard(), CellState::EMPTY);
    ASSERT_EQ(game.attemptAttack(water->row, water->col), ShotRequest::ACCEPTED);

    auto mine = game.resolvePendingShot();
    ASSERT_TRUE(mine.has_value());
    EXPECT_FALSE(mine->shot.hit);

    // The turn passed and the computer's shot is already in the air.
    EXPECT_EQ(game.getTurnOwner(), Side::COMPUTER);
    EXPECT_TRUE(game.isInFlight());
    ASSERT_TRUE(game.getPendingShot().has_value());
    EXPECT_EQ(*game.getPendingShot(), (Coord{5, 5}));
    EXPECT_EQ(game.attemptAttack(0, 0), ShotRequest::IN_FLIGHT);

    auto theirs = game.resolvePendingShot();
    ASSERT_TRUE(theirs.has_value());
    EXPECT_EQ(theirs->shooter, Side::COMPUTER);
    EXPECT_FALSE(theirs->shot.hit);
    EXPECT_EQ(game.getMessage(), "Enemy salvo missed! We remain unscathed.");

    EXPECT_EQ(game.getTurnOwner(), Side::PLAYER);
    EXPECT_FALSE(game.isInFlight());
    EXPECT_EQ(game.getPlayerBoard().getCell(5, 5).state, CellState::MISS);
}

TEST(GameStateTest, ComputerHitKeepsTheTurnToo) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({ {0, 0}, {0, 1}, {5, 0} }, log));
    deployPlayerFleet(game);

    auto water = firstCellWith(game.getComputerBoard(), CellState::EMPTY);
    ASSERT_EQ(game.attemptAttack(water->row, water->col), ShotRequest::ACCEPTED);
    ASSERT_TRUE(game.resolvePendingShot().has_value());

    auto first = game.resolvePendingShot();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->shot.hit);
    EXPECT_EQ(game.getMessage(), "INCOMING FIRE! Our vessel is hit!");
    EXPECT_EQ(game.getTurnOwner(), Side::COMPUTER);
    EXPECT_TRUE(game.isInFlight());

    auto second = game.resolvePendingShot();
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->shot.sunk);
    EXPECT_EQ(game.getMessage(), "CRITICAL DAMAGE! Our PATROL has been sunk!");
    EXPECT_EQ(game.getTurnOwner(), Side::COMPUTER);
    EXPECT_TRUE(game.getPlayerFleet().findShip(1)->isSunk());

    auto third = game.resolvePendingShot();
    ASSERT_TRUE(third.has_value());
    EXPECT_FALSE(third->shot.hit);
    EXPECT_EQ(game.getTurnOwner(), Side::PLAYER);
    EXPECT_FALSE(game.isInFlight());

    ASSERT_EQ(log->results.size(), 3u);
    EXPECT_TRUE(log->results[1].sunk);
    EXPECT_EQ(log->results[1].shipId, 1);
}

TEST(GameStateTest, PlayerSinkingEveryShipWins) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));
    deployPlayerFleet(game);

    std::vector<Coord> targets = game.getComputerBoard().cellsOf(1);
    for (const Coord& c : game.getComputerBoard().cellsOf(2)) targets.push_back(c);
    ASSERT_EQ(targets.size(), 4u);

    for (std::size_t i = 0; i < targets.size(); ++i) {
        ASSERT_EQ(game.attemptAttack(targets[i].row, targets[i].col), ShotRequest::ACCEPTED);
        auto report = game.resolvePendingShot();
        ASSERT_TRUE(report.has_value());
        EXPECT_TRUE(report->shot.hit);
        EXPECT_EQ(report->gameOver, i + 1 == targets.size());
    }

    EXPECT_EQ(game.getPhase(), GamePhase::GAME_OVER);
    ASSERT_TRUE(game.getWinner().has_value());
    EXPECT_EQ(*game.getWinner(), Side::PLAYER);
    EXPECT_EQ(game.getMessage(), "TOTAL VICTORY! Enemy fleet annihilated!");
    EXPECT_FALSE(game.isInFlight());
    EXPECT_EQ(game.getSunkComputerPlacements().size(), 2u);

    auto water = firstCellWith(game.getComputerBoard(), CellState::EMPTY);
    ASSERT_TRUE(water.has_value());
    EXPECT_EQ(game.attemptAttack(water->row, water->col), ShotRequest::WRONG_PHASE);
    EXPECT_TRUE(log->chosen.empty());
}

TEST(GameStateTest, OnlySunkEnemyShipsAreRevealed) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));
    deployPlayerFleet(game);
    EXPECT_TRUE(game.getSunkComputerPlacements().empty());

    for (const Coord& c : game.getComputerBoard().cellsOf(2)) {
        ASSERT_EQ(game.attemptAttack(c.row, c.col), ShotRequest::ACCEPTED);
        ASSERT_TRUE(game.resolvePendingShot().has_value());
    }
    auto revealed = game.getSunkComputerPlacements();
    ASSERT_EQ(revealed.size(), 1u);
    EXPECT_EQ(revealed[0].shipId, 2);
    EXPECT_EQ(game.getMessage(), "ENEMY SKIFF DESTROYED! Outstanding work, Admiral!");
}

TEST(GameStateTest, ComputerSinkingEveryShipWins) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(),
                   scripted({ {0, 0}, {0, 1}, {3, 3}, {3, 4} }, log));
    deployPlayerFleet(game);

    auto water = firstCellWith(game.getComputerBoard(), CellState::EMPTY);
    ASSERT_EQ(game.attemptAttack(water->row, water->col), ShotRequest::ACCEPTED);
    drain(game);

    EXPECT_EQ(game.getPhase(), GamePhase::GAME_OVER);
    ASSERT_TRUE(game.getWinner().has_value());
    EXPECT_EQ(*game.getWinner(), Side::COMPUTER);
    EXPECT_EQ(game.getMessage(), "DEFEAT! Our fleet has been destroyed!");
    EXPECT_TRUE(game.getPlayerFleet().allSunk());
    EXPECT_EQ(log->chosen.size(), 4u);
    EXPECT_EQ(game.attemptAttack(0, 0), ShotRequest::WRONG_PHASE);
}

TEST(GameStateTest, ComputerNeverRepeatsAShot) {
    GameConfig cfg;
    cfg.seed        = 555;
    cfg.shotDelayMs = 0;
    GameState game(cfg, std::make_unique<MyTargetingAlgorithmFactory>());
    ASSERT_TRUE(game.autoPlaceRemaining());

    // The player always misses if it can, so the computer gets every turn.
    int guard = 0;
    while (game.getPhase() == GamePhase::BATTLE && guard++ < 1000) {
        const int shotsBefore = game.getPlayerBoard().countState(CellState::HIT)
                              + game.getPlayerBoard().countState(CellState::MISS);
        auto water = firstCellWith(game.getComputerBoard(), CellState::EMPTY);
        if (!water) break;
        ASSERT_EQ(game.attemptAttack(water->row, water->col), ShotRequest::ACCEPTED);

        int landed = 0;
        while (game.isInFlight()) {
            auto report = game.resolvePendingShot();
            ASSERT_TRUE(report.has_value());
            if (report->shooter == Side::COMPUTER) ++landed;
        }
        const int shotsAfter = game.getPlayerBoard().countState(CellState::HIT)
                             + game.getPlayerBoard().countState(CellState::MISS);
        EXPECT_EQ(shotsAfter - shotsBefore, landed);
    }
    if (game.getPhase() == GamePhase::GAME_OVER) {
        ASSERT_TRUE(game.getWinner().has_value());
        EXPECT_EQ(*game.getWinner(), Side::COMPUTER);
    }
}

TEST(GameStateTest, ResetStartsOver) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));
    deployPlayerFleet(game);
    auto water = firstCellWith(game.getComputerBoard(), CellState::EMPTY);
    ASSERT_EQ(game.attemptAttack(water->row, water->col), ShotRequest::ACCEPTED);

    game.reset();
    EXPECT_EQ(game.getPhase(), GamePhase::PLACEMENT);
    EXPECT_FALSE(game.isInFlight());
    EXPECT_FALSE(game.getPendingShot().has_value());
    EXPECT_EQ(game.getCurrentShipIndex(), 0u);
    EXPECT_EQ(game.getPlayerBoard().countState(CellState::SHIP), 0);
    EXPECT_EQ(game.getComputerBoard().countState(CellState::SHIP), 0);
    EXPECT_EQ(game.getPlayerFleet().sunkCount(), 0);
    EXPECT_EQ(game.getMessage(), "DEPLOY PATROL - 2 grid units");
}

TEST(GameStateTest, HugeOriginIsNotAPlacement) {
    GameState game(GameConfig{}, std::make_unique<MyTargetingAlgorithmFactory>());
    const int big = std::numeric_limits<int>::max();

    EXPECT_FALSE(game.attemptPlacement(big, 0, Orientation::VERTICAL));
    EXPECT_FALSE(game.attemptPlacement(0, big, Orientation::HORIZONTAL));
    EXPECT_TRUE(game.previewPlacement(big, 0).empty());
    EXPECT_EQ(game.getCurrentShipIndex(), 0u);
    EXPECT_EQ(game.getPlayerBoard().countState(CellState::SHIP), 0);
}

TEST(GameStateTest, EnemyDeploymentFailureLeavesPlacementIntact) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(crampedConfig(), scripted({}, log));

    ASSERT_TRUE(game.attemptPlacement(0, 0, Orientation::HORIZONTAL));
    ASSERT_TRUE(game.attemptPlacement(2, 0, Orientation::HORIZONTAL));
    ASSERT_TRUE(game.attemptPlacement(4, 0, Orientation::HORIZONTAL));
    const Board before   = game.getPlayerBoard();
    const std::string msg = game.getMessage();

    EXPECT_THROW(game.attemptPlacement(6, 0, Orientation::HORIZONTAL), PlacementError);

    EXPECT_EQ(game.getPhase(), GamePhase::PLACEMENT);
    EXPECT_EQ(game.getCurrentShipIndex(), 3u);
    EXPECT_EQ(game.placedCount(), 3u);
    EXPECT_FALSE(game.isShipPlaced(4));
    EXPECT_EQ(game.getMessage(), msg);
    EXPECT_EQ(game.getPlayerBoard().countState(CellState::SHIP), 21);
    EXPECT_EQ(game.getPlayerBoard().getCell(6, 0).state, CellState::EMPTY);
    EXPECT_EQ(game.getComputerBoard().countState(CellState::SHIP), 0);
    EXPECT_EQ(before.getCell(4, 6).shipId.value_or(-1), game.getPlayerBoard().getCell(4, 6).shipId.value_or(-1));

    // The same legal spot is still open for another try.
    auto preview = game.previewPlacement(6, 0);
    EXPECT_EQ(preview.size(), 7u);
}

TEST(GameStateTest, AutoPlaceRemainingReportsNoRoom) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(crampedConfig(), scripted({}, log));

    // Row 1 leaves room for two more full-width boats, not three.
    ASSERT_TRUE(game.attemptPlacement(1, 0, Orientation::HORIZONTAL));

    EXPECT_FALSE(game.autoPlaceRemaining());
    EXPECT_EQ(game.getMessage(), "NO ROOM LEFT TO DEPLOY THE REMAINING SHIPS");
    EXPECT_EQ(game.getPhase(), GamePhase::PLACEMENT);
    EXPECT_EQ(game.placedCount(), 1u);
    EXPECT_EQ(game.getCurrentShipIndex(), 1u);
    EXPECT_EQ(game.getPlayerBoard().countState(CellState::SHIP), 7);
    EXPECT_TRUE(game.getPlayerBoard().cellsOf(2).empty());
}

TEST(GameStateTest, ShipsCanBePlacedInAnyOrder) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));

    ASSERT_TRUE(game.attemptPlacement(2, 3, 3, Orientation::HORIZONTAL));
    EXPECT_TRUE(game.isShipPlaced(2));
    EXPECT_FALSE(game.isShipPlaced(1));
    EXPECT_EQ(game.getCurrentShipIndex(), 0u);
    EXPECT_EQ(game.getMessage(), "DEPLOY PATROL - 2 grid units");

    EXPECT_FALSE(game.attemptPlacement(2, 0, 0, Orientation::HORIZONTAL));  // already placed
    EXPECT_FALSE(game.attemptPlacement(9, 0, 0, Orientation::HORIZONTAL));  // unknown id
    EXPECT_FALSE(game.selectShip(2));
    EXPECT_FALSE(game.selectShip(9));

    ASSERT_TRUE(game.attemptPlacement(0, 0, Orientation::HORIZONTAL));
    EXPECT_EQ(game.getPhase(), GamePhase::BATTLE);
    EXPECT_EQ(game.getPlayerBoard().cellsOf(1).size(), 2u);
    EXPECT_EQ(game.getPlayerBoard().getCell(3, 4).shipId.value_or(-1), 2);
}

TEST(GameStateTest, SelectedShipIsPlacedNext) {
    auto log = std::make_shared<ScriptLog>();
    GameState game(smallConfig(), scripted({}, log));

    ASSERT_TRUE(game.selectShip(2));
    EXPECT_EQ(game.getCurrentShipIndex(), 1u);
    EXPECT_EQ(game.getMessage(), "DEPLOY SKIFF - 2 grid units");
    ASSERT_NE(game.nextShipToPlace(), nullptr);
    EXPECT_EQ(game.nextShipToPlace()->name, "Skiff");

    ASSERT_TRUE(game.attemptPlacement(0, 0, Orientation::HORIZONTAL));
    EXPECT_EQ(game.getPlayerBoard().getCell(0, 0).shipId.value_or(-1), 2);
    EXPECT_EQ(game.nextShipToPlace()->name, "Patrol");

    game.reset();
    EXPECT_FALSE(game.isShipPlaced(2));
    EXPECT_EQ(game.getCurrentShipIndex(), 0u);
}
