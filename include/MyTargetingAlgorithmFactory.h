#pragma once

#include <memory>
#include "common/TargetingAlgorithmFactory.h"
#include "HuntTargetAlgorithm.h"

namespace naval {

// Concrete TargetingAlgorithmFactory: builds the hunt/target search.
class MyTargetingAlgorithmFactory : public common::TargetingAlgorithmFactory {
public:
    explicit MyTargetingAlgorithmFactory(SinkPolicy policy = SinkPolicy::PRUNE_SUNK_SHIP)
        : policy_(policy)
    {}

    ~MyTargetingAlgorithmFactory() override = default;

    std::unique_ptr<common::TargetingAlgorithm> create(unsigned seed) const override;

private:
    SinkPolicy policy_;
};

} // namespace naval
