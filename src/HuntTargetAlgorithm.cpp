#include "HuntTargetAlgorithm.h"
#include "utils.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

using namespace naval;
using namespace common;

namespace {

std::string coordText(const Coord& c) {
    std::ostringstream oss;
    oss << "(" << c.row << "," << c.col << ")";
    return oss.str();
}

} // namespace

HuntTargetAlgorithm::HuntTargetAlgorithm(unsigned seed, SinkPolicy policy)
  : queue_()
  , lastHit_()
  , lastHitShip_(-1)
  , rng_(seed)
  , seed_(seed)
  , policy_(policy)
{}

bool HuntTargetAlgorithm::isOpen(const BoardView& view, const Coord& c) {
    return view.getStateAt(c.row, c.col) == ObservedCell::Unresolved;
}

Coord HuntTargetAlgorithm::chooseTarget(const BoardView& view) {
    if (auto queued = popQueuedTarget(view)) {
        logDebug("AI", "queue -> " + coordText(*queued)
                       + " (" + std::to_string(queue_.size()) + " left)");
        return *queued;
    }
    if (auto follow = followUpLastHit(view)) {
        logDebug("AI", "follow-up -> " + coordText(*follow));
        return *follow;
    }
    Coord c = randomSearch(view);
    logDebug("AI", "search -> " + coordText(c));
    return c;
}

void HuntTargetAlgorithm::notifyResult(const ShotInfo& shot, const BoardView& view) {
    if (!shot.hit) return;

    lastHit_     = shot.target;
    lastHitShip_ = shot.shipId;

    for (const Coord& n : openNeighbours(view, shot.target)) {
        queue_.push_back({n, shot.shipId});
    }

    if (shot.sunk) {
        if (policy_ == SinkPolicy::CLEAR_ALL) {
            queue_.clear();
            lastHit_.reset();
            lastHitShip_ = -1;
        } else {
            forgetShip(shot.shipId);
        }
        logDebug("AI", "ship " + std::to_string(shot.shipId) + " sunk, "
                       + std::to_string(queue_.size()) + " leads kept");
    }
}

void HuntTargetAlgorithm::reset() {
    queue_.clear();
    lastHit_.reset();
    lastHitShip_ = -1;
    rng_.seed(seed_);
}

void HuntTargetAlgorithm::enqueueTarget(const Coord& cell, int sourceShipId) {
    queue_.push_back({cell, sourceShipId});
}

void HuntTargetAlgorithm::setLastHit(const Coord& cell, int shipId) {
    lastHit_     = cell;
    lastHitShip_ = shipId;
}

std::size_t HuntTargetAlgorithm::queueSize() const { return queue_.size(); }
std::optional<Coord> HuntTargetAlgorithm::lastHit() const { return lastHit_; }
SinkPolicy HuntTargetAlgorithm::sinkPolicy() const { return policy_; }

//------------------------------------------------------------------------------
// (1) Queue: the same cell may have been queued by two different hits, or
//     hit by a random shot since it was queued.
//------------------------------------------------------------------------------
std::optional<Coord> HuntTargetAlgorithm::popQueuedTarget(const BoardView& view) {
    while (!queue_.empty()) {
        QueuedTarget next = queue_.front();
        queue_.pop_front();
        if (isOpen(view, next.cell)) {
            return next.cell;
        }
    }
    return std::nullopt;
}

//------------------------------------------------------------------------------
// (2) Around the last hit
//------------------------------------------------------------------------------
std::optional<Coord> HuntTargetAlgorithm::followUpLastHit(const BoardView& view) {
    if (!lastHit_) return std::nullopt;

    std::vector<Coord> options = openNeighbours(view, *lastHit_);
    if (options.empty()) {
        lastHit_.reset();
        lastHitShip_ = -1;
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, options.size() - 1);
    return options[pick(rng_)];
}

//------------------------------------------------------------------------------
// (3) Anywhere still open
//------------------------------------------------------------------------------
Coord HuntTargetAlgorithm::randomSearch(const BoardView& view) {
    std::vector<Coord> open;
    const int n = view.size();
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            if (view.getStateAt(r, c) == ObservedCell::Unresolved) {
                open.push_back({r, c});
            }
        }
    }
    if (open.empty()) {
        throw std::logic_error("no unresolved cell left to target");
    }
    std::uniform_int_distribution<std::size_t> pick(0, open.size() - 1);
    return open[pick(rng_)];
}

std::vector<Coord> HuntTargetAlgorithm::openNeighbours(const BoardView& view,
                                                       const Coord& from) const
{
    std::vector<Coord> out;
    for (int d = 0; d < 4; ++d) {
        Coord c{from.row + DR[d], from.col + DC[d]};
        if (isOpen(view, c)) out.push_back(c);
    }
    return out;
}

// Ships never touch, so every lead produced by a sunk ship's hits is dead.
void HuntTargetAlgorithm::forgetShip(int shipId) {
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                [shipId](const QueuedTarget& t) {
                                    return t.sourceShip == shipId;
                                }),
                 queue_.end());
    if (lastHitShip_ == shipId) {
        lastHit_.reset();
        lastHitShip_ = -1;
    }
}
