#pragma once

#include "BoardView.h"
#include "ShotInfo.h"

namespace common {

/*
  A TargetingAlgorithm drives the computer's guns:
   - chooseTarget(): returns the next cell to fire at. Must be Unresolved
       in the given view.
   - notifyResult(): called once the chosen shot has been resolved, with a
       view that already shows the result.
   - reset(): forget everything learned, for a new game.
*/
class TargetingAlgorithm {
public:
    virtual ~TargetingAlgorithm() {}
    virtual Coord chooseTarget(const BoardView& view) = 0;
    virtual void notifyResult(const ShotInfo& shot, const BoardView& view) = 0;
    virtual void reset() = 0;
};

} // namespace common
