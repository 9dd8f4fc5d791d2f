#pragma once

#include "common.hpp"
#include "dungeon.hpp"

#include <cstdlib>

inline bool isAdjacent8(const Vec2i& a, const Vec2i& b) {
    return a != b && chebyshev(a, b) == 1;
}

// A diagonal step from `from` by (dx, dy) needs at least one of the two
// orthogonal tiles it brushes to be walkable. Closed doors count as blocked.
inline bool diagonalPassable(const Dungeon& dung, const Vec2i& from, int dx, int dy) {
    if (dx == 0 || dy == 0) return true;
    return dung.isWalkable(from.x + dx, from.y) || dung.isWalkable(from.x, from.y + dy);
}
