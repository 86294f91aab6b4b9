#pragma once

namespace common {

/*
  A grid coordinate. Rows grow downwards, columns grow to the right, both
  zero-based.
*/
struct Coord {
    int row;
    int col;
};

inline bool operator==(const Coord& a, const Coord& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Coord& a, const Coord& b) {
    return !(a == b);
}

} // namespace common
