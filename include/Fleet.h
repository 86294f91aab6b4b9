#pragma once

#include <vector>
#include <cstddef>

#include "Ship.h"

namespace naval {

/// One side's ships, in roster order.
class Fleet {
public:
    Fleet() = default;
    explicit Fleet(const std::vector<ShipSpec>& roster);

    const std::vector<Ship>& ships() const;
    std::size_t              count() const;

    // nullptr when no ship has that id.
    const Ship* findShip(int id) const;
    Ship*       findShip(int id);

    bool allSunk()   const;
    int  sunkCount() const;
    int  remaining() const;

private:
    std::vector<Ship> ships_;
};

} // namespace naval
