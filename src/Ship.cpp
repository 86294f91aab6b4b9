#include "Ship.h"

using namespace naval;

Ship::Ship(const ShipSpec& spec)
    : id_(spec.id),
      name_(spec.name),
      size_(spec.size()),
      width_(spec.width),
      length_(spec.length),
      hits_(0),
      sunk_(false)
{
}

int Ship::getId() const {
    return id_;
}

const std::string& Ship::getName() const {
    return name_;
}

int Ship::getSize() const {
    return size_;
}

int Ship::getWidth() const {
    return width_;
}

int Ship::getLength() const {
    return length_;
}

int Ship::getHits() const {
    return hits_;
}

bool Ship::isSunk() const {
    return sunk_;
}

bool Ship::registerHit() {
    if (sunk_) return false;

    hits_++;
    if (hits_ >= size_) {
        hits_ = size_;
        sunk_ = true;
        return true;
    }
    return false;
}
