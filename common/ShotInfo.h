#pragma once

#include "Coord.h"

namespace common {

/*
  What a shooter learns once its shot lands: the target, whether it hit,
  and, on a hit, which ship was struck and whether that hit sank it.
  shipId is -1 on a miss.
*/
struct ShotInfo {
    Coord target;
    bool  hit;
    bool  sunk;
    int   shipId;
};

} // namespace common
