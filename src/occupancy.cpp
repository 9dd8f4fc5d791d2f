#include "occupancy.hpp"

#include <algorithm>

void OccupancyGrid::reset(int w, int h) {
    width_ = std::max(0, w);
    height_ = std::max(0, h);
    cells_.assign(static_cast<size_t>(width_ * height_), 0);
    count_ = 0;
}

void OccupancyGrid::clear() {
    std::fill(cells_.begin(), cells_.end(), 0);
    count_ = 0;
}

int OccupancyGrid::at(const Vec2i& p) const {
    if (!inBounds(p)) return 0;
    return cells_[index(p)];
}

bool OccupancyGrid::place(int id, const Vec2i& p) {
    if (id == 0 || !inBounds(p)) return false;
    int& slot = cells_[index(p)];
    if (slot != 0) return false;
    slot = id;
    ++count_;
    return true;
}

bool OccupancyGrid::move(int id, const Vec2i& from, const Vec2i& to) {
    if (!inBounds(from) || !inBounds(to)) return false;
    if (cells_[index(from)] != id) return false;
    if (from == to) return true;
    if (cells_[index(to)] != 0) return false;
    cells_[index(from)] = 0;
    cells_[index(to)] = id;
    return true;
}

bool OccupancyGrid::remove(int id, const Vec2i& p) {
    if (!inBounds(p)) return false;
    int& slot = cells_[index(p)];
    if (slot != id || id == 0) return false;
    slot = 0;
    --count_;
    return true;
}
