#include "dungeon.hpp"
#include <algorithm>
#include <cstdlib>
#include <functional>

namespace {

// Exact rational slope num/den with den > 0. Floats drift at the octant edges
// and break symmetry, so the scan works on integers only.
struct Slope {
    int num = 0;
    int den = 1;
};

int floorDiv(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && (a < 0)) --q;
    return q;
}

int ceilDiv(int a, int b) {
    return -floorDiv(-a, b);
}

// floor(depth * s + 1/2)
int roundTiesUp(int depth, const Slope& s) {
    return floorDiv(2 * depth * s.num + s.den, 2 * s.den);
}

// ceil(depth * s - 1/2)
int roundTiesDown(int depth, const Slope& s) {
    return ceilDiv(2 * depth * s.num - s.den, 2 * s.den);
}

// Slope through the near edge of the tile at (depth, col).
Slope edgeSlope(int depth, int col) {
    return { 2 * col - 1, 2 * depth };
}

// A floor tile is only lit when its centre lies inside the sector.
bool centreInSector(int depth, int col, const Slope& start, const Slope& end) {
    return col * start.den >= depth * start.num && col * end.den <= depth * end.num;
}

// Symmetric shadowcasting over four quadrants (rows scanned away from the
// observer). Walls are revealed when any part of them is lit; floors only when
// their centre is, which makes visibility between two floor tiles symmetric.
template <typename OpaqueFn, typename MarkFn>
void castSymmetric(int ox, int oy, int radius, OpaqueFn isOpaqueAt, MarkFn mark) {
    mark(ox, oy);

    const int r2 = radius * radius;

    for (int quadrant = 0; quadrant < 4; ++quadrant) {
        auto toMap = [&](int depth, int col, int& x, int& y) {
            switch (quadrant) {
                case 0: x = ox + col;   y = oy - depth; break; // north
                case 1: x = ox + depth; y = oy + col;   break; // east
                case 2: x = ox + col;   y = oy + depth; break; // south
                default: x = ox - depth; y = oy + col;  break; // west
            }
        };

        std::function<void(int, Slope, Slope)> scan;
        scan = [&](int depth, Slope start, Slope end) {
            if (radius > 0 && depth > radius) return;

            const int minCol = roundTiesUp(depth, start);
            const int maxCol = roundTiesDown(depth, end);

            // -1 = no previous tile in this row, 0 = floor, 1 = wall
            int prev = -1;
            for (int col = minCol; col <= maxCol; ++col) {
                int x = 0;
                int y = 0;
                toMap(depth, col, x, y);

                const bool wall = isOpaqueAt(x, y);
                const bool inRange = (radius <= 0) || (depth * depth + col * col <= r2);

                if (inRange && (wall || centreInSector(depth, col, start, end))) {
                    mark(x, y);
                }

                if (prev == 1 && !wall) {
                    start = edgeSlope(depth, col);
                }
                if (prev == 0 && wall) {
                    scan(depth + 1, start, edgeSlope(depth, col));
                }
                prev = wall ? 1 : 0;
            }

            if (prev == 0) {
                scan(depth + 1, start, end);
            }
        };

        scan(1, Slope{ -1, 1 }, Slope{ 1, 1 });
    }
}

} // namespace

Dungeon::Dungeon(int w, int h) : width(w), height(h) {
    tiles.resize(static_cast<size_t>(width * height));
}

bool Dungeon::isWalkable(int x, int y) const {
    if (!inBounds(x, y)) return false;
    TileType t = at(x, y).type;
    return (t == TileType::Floor || t == TileType::DoorOpen || t == TileType::StairsDown);
}

bool Dungeon::isPassable(int x, int y) const {
    if (!inBounds(x, y)) return false;
    TileType t = at(x, y).type;
    return (t == TileType::Floor || t == TileType::DoorOpen || t == TileType::DoorClosed || t == TileType::StairsDown);
}

bool Dungeon::isOpaque(int x, int y) const {
    if (!inBounds(x, y)) return true;
    TileType t = at(x, y).type;
    return (t == TileType::Wall || t == TileType::DoorClosed);
}

bool Dungeon::isDoorClosed(int x, int y) const {
    if (!inBounds(x, y)) return false;
    return at(x, y).type == TileType::DoorClosed;
}

void Dungeon::openDoor(int x, int y) {
    if (!inBounds(x, y)) return;
    if (at(x, y).type == TileType::DoorClosed) {
        at(x, y).type = TileType::DoorOpen;
    }
}

void Dungeon::computeFov(int px, int py, int radius) {
    // Visibility is per-pass; explored is permanent.
    for (auto& t : tiles) t.visible = false;
    if (!inBounds(px, py)) return;

    castSymmetric(px, py, radius,
        [&](int x, int y) { return isOpaque(x, y); },
        [&](int x, int y) {
            if (!inBounds(x, y)) return;
            Tile& t = at(x, y);
            t.visible = true;
            t.explored = true;
        });
}

void Dungeon::computeFovMask(int px, int py, int radius, std::vector<uint8_t>& outMask) const {
    outMask.assign(static_cast<size_t>(width * height), 0);
    if (!inBounds(px, py)) return;

    castSymmetric(px, py, radius,
        [&](int x, int y) { return isOpaque(x, y); },
        [&](int x, int y) {
            if (!inBounds(x, y)) return;
            outMask[static_cast<size_t>(y * width + x)] = 1;
        });
}

bool Dungeon::hasLineOfSight(int x0, int y0, int x1, int y1, int radius) const {
    if (!inBounds(x0, y0) || !inBounds(x1, y1)) return false;
    std::vector<uint8_t> mask;
    computeFovMask(x0, y0, radius, mask);
    return mask[static_cast<size_t>(y1 * width + x1)] != 0;
}

int Dungeon::visibleCount() const {
    return static_cast<int>(std::count_if(tiles.begin(), tiles.end(), [](const Tile& t) { return t.visible; }));
}

