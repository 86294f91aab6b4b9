#include "MyTargetingAlgorithmFactory.h"

namespace naval {

std::unique_ptr<common::TargetingAlgorithm> MyTargetingAlgorithmFactory::create(
    unsigned seed) const
{
    return std::make_unique<HuntTargetAlgorithm>(seed, policy_);
}

} // namespace naval
