#pragma once

#include "common.hpp"

#include <cstddef>
#include <vector>

// Non-owning per-tile index of which entity stands where.
//
// Each tile holds at most one entity id (0 = empty). The entity list in Game
// owns the entities; this grid only answers "who is at (x,y)" in O(1) and is
// kept in lockstep by place/move/remove.
class OccupancyGrid {
public:
    OccupancyGrid() = default;
    OccupancyGrid(int w, int h) { reset(w, h); }

    void reset(int w, int h);
    void clear();

    bool inBounds(const Vec2i& p) const {
        return p.x >= 0 && p.y >= 0 && p.x < width_ && p.y < height_;
    }

    // 0 if the tile is empty or out of bounds.
    int at(const Vec2i& p) const;
    bool occupied(const Vec2i& p) const { return at(p) != 0; }

    // Fails if the tile is out of bounds, already taken, or id is 0.
    bool place(int id, const Vec2i& p);
    // Fails unless `from` holds `id` and `to` is free.
    bool move(int id, const Vec2i& from, const Vec2i& to);
    // Fails unless `p` holds `id`.
    bool remove(int id, const Vec2i& p);

    int width() const { return width_; }
    int height() const { return height_; }
    size_t count() const { return count_; }

private:
    size_t index(const Vec2i& p) const { return static_cast<size_t>(p.y * width_ + p.x); }

    int width_ = 0;
    int height_ = 0;
    size_t count_ = 0;
    std::vector<int> cells_;
};
