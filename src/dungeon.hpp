#pragma once
#include "common.hpp"
#include "rng.hpp"
#include <cstdint>
#include <vector>

enum class TileType : uint8_t {
    Wall = 0,
    Floor,
    DoorClosed,
    DoorOpen,
    StairsDown,
};

constexpr int TILE_TYPE_COUNT = 5;

struct Tile {
    TileType type = TileType::Wall;
    bool visible = false;
    bool explored = false;
};

struct Room {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    int x2() const { return x + w; }
    int y2() const { return y + h; }
    int cx() const { return x + w / 2; }
    int cy() const { return y + h / 2; }

    bool contains(int px, int py) const {
        return px >= x && px < x2() && py >= y && py < y2();
    }

    bool intersects(const Room& o) const {
        return x < o.x2() && o.x < x2() && y < o.y2() && o.y < y2();
    }
};

class Dungeon {
public:
    int width = 0;
    int height = 0;
    std::vector<Tile> tiles;

    std::vector<Room> rooms;
    // Where the player arrives on this level.
    Vec2i entry{ -1, -1 };
    Vec2i stairsDown{ -1, -1 };

    Dungeon() = default;
    Dungeon(int w, int h);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    Tile& at(int x, int y) { return tiles[static_cast<size_t>(y * width + x)]; }
    const Tile& at(int x, int y) const { return tiles[static_cast<size_t>(y * width + x)]; }

    bool isWalkable(int x, int y) const;
    bool isPassable(int x, int y) const; // includes closed doors (connectivity/path)
    bool isOpaque(int x, int y) const;
    bool isDoorClosed(int x, int y) const;
    void openDoor(int x, int y);

    // Symmetric shadowcasting. Clears all visible flags, then marks the tiles
    // seen from (px, py) visible and explored. radius <= 0 means unlimited.
    void computeFov(int px, int py, int radius);

    // Same visibility set written into outMask (1 = visible); tile flags are untouched.
    void computeFovMask(int px, int py, int radius, std::vector<uint8_t>& outMask) const;

    bool hasLineOfSight(int x0, int y0, int x1, int y1, int radius) const;

    int visibleCount() const;

};
