#pragma once

#include "Coord.h"

namespace common {

enum class ObservedCell {
    Unresolved,
    Hit,
    Miss,
    OutOfBounds
};

/*
  The opponent's board as a shooter may legally see it. Untouched water and
  untouched ship cells both read as Unresolved; only shot results show.
  Queries outside [0, size) return OutOfBounds.
*/
class BoardView {
public:
    virtual ~BoardView() {}
    virtual int size() const = 0;
    virtual ObservedCell getStateAt(int row, int col) const = 0;
};

} // namespace common
