#pragma once

#include <memory>
#include "TargetingAlgorithm.h"

namespace common {

class TargetingAlgorithmFactory {
public:
    virtual ~TargetingAlgorithmFactory() {}

    // GameState calls this once per game with a seed drawn from its own RNG.
    virtual std::unique_ptr<TargetingAlgorithm> create(unsigned seed) const = 0;
};

} // namespace common
