#pragma once

#include "common/TargetingAlgorithm.h"
#include "common/BoardView.h"
#include "common/ShotInfo.h"

#include <cstddef>
#include <deque>
#include <optional>
#include <random>
#include <vector>

namespace naval {

// What to do with pending leads once a ship goes down.
enum class SinkPolicy {
    PRUNE_SUNK_SHIP,   // drop only the leads that came from the sunk ship
    CLEAR_ALL          // drop every lead
};

/*
  Hunt/target search. Per shot, in order:
    1. pop the target queue, skipping cells that are already resolved;
    2. otherwise a random open orthogonal neighbour of the last hit;
    3. otherwise a random open cell anywhere.
  Every hit appends its open orthogonal neighbours to the queue, so several
  wounded ships can be chased at once.
*/
class HuntTargetAlgorithm : public common::TargetingAlgorithm {
public:
    explicit HuntTargetAlgorithm(unsigned seed,
                                 SinkPolicy policy = SinkPolicy::PRUNE_SUNK_SHIP);

    common::Coord chooseTarget(const common::BoardView& view) override;
    void notifyResult(const common::ShotInfo& shot,
                      const common::BoardView& view) override;
    void reset() override;

    // Push a lead by hand; sourceShipId is the ship whose hit produced it.
    void enqueueTarget(const common::Coord& cell, int sourceShipId);
    void setLastHit(const common::Coord& cell, int shipId);

    std::size_t                  queueSize() const;
    std::optional<common::Coord> lastHit() const;
    SinkPolicy                   sinkPolicy() const;

private:
    struct QueuedTarget {
        common::Coord cell;
        int           sourceShip;
    };

    std::optional<common::Coord> popQueuedTarget(const common::BoardView& view);
    std::optional<common::Coord> followUpLastHit(const common::BoardView& view);
    common::Coord                randomSearch(const common::BoardView& view);

    std::vector<common::Coord> openNeighbours(const common::BoardView& view,
                                              const common::Coord& from) const;
    void forgetShip(int shipId);

    static bool isOpen(const common::BoardView& view, const common::Coord& c);

    std::deque<QueuedTarget>     queue_;
    std::optional<common::Coord> lastHit_;
    int                          lastHitShip_;
    std::mt19937                 rng_;
    unsigned                     seed_;
    SinkPolicy                   policy_;

    // up, down, left, right
    static constexpr int DR[4] = { -1, 1,  0, 0 };
    static constexpr int DC[4] = {  0, 0, -1, 1 };
};

} // namespace naval
