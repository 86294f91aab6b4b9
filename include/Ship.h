#pragma once

#include <string>

namespace naval {

/*
  A roster entry: what a ship looks like before the game starts. The
  footprint is width x length cells (width <= length), so a ship may be more
  than one cell wide.
*/
struct ShipSpec {
    int         id;
    std::string name;
    int         width;
    int         length;

    int size() const { return width * length; }
};

/*
 A Ship is the runtime status of one roster entry for one side. Only the
 attack resolver calls registerHit(); ships are never removed, only sunk.
*/
class Ship {
public:
    explicit Ship(const ShipSpec& spec);

    int                getId() const;
    const std::string& getName() const;
    int                getSize() const;
    int                getWidth() const;
    int                getLength() const;
    int                getHits() const;
    bool               isSunk() const;

    // Count one more hit (never beyond size). Returns true if this hit sank it.
    bool registerHit();

private:
    int         id_;
    std::string name_;
    int         size_;
    int         width_;
    int         length_;
    int         hits_;
    bool        sunk_;
};

} // namespace naval
