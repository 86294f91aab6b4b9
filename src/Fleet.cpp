#include "Fleet.h"

#include <algorithm>

using namespace naval;

Fleet::Fleet(const std::vector<ShipSpec>& roster) {
    ships_.reserve(roster.size());
    for (const auto& spec : roster) {
        ships_.emplace_back(spec);
    }
}

const std::vector<Ship>& Fleet::ships() const { return ships_; }
std::size_t Fleet::count() const { return ships_.size(); }

const Ship* Fleet::findShip(int id) const {
    for (const auto& s : ships_) {
        if (s.getId() == id) return &s;
    }
    return nullptr;
}

Ship* Fleet::findShip(int id) {
    for (auto& s : ships_) {
        if (s.getId() == id) return &s;
    }
    return nullptr;
}

bool Fleet::allSunk() const {
    return std::all_of(ships_.begin(), ships_.end(),
                       [](const Ship& s) { return s.isSunk(); });
}

int Fleet::sunkCount() const {
    return static_cast<int>(std::count_if(ships_.begin(), ships_.end(),
                                          [](const Ship& s) { return s.isSunk(); }));
}

int Fleet::remaining() const {
    return static_cast<int>(ships_.size()) - sunkCount();
}
