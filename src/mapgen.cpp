#include "mapgen.hpp"
#include "pathfinding.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace {

struct Leaf {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    int left = -1;
    int right = -1;
    int roomIndex = -1;
};

int splitLeaf(const Leaf& n, bool splitH, RNG& rng, int minLeaf) {
    // Returns the split offset (in tiles) or -1 if the leaf is too small.
    if (splitH) {
        if (n.h < minLeaf * 2) return -1;
        return rng.range(minLeaf, n.h - minLeaf);
    }
    if (n.w < minLeaf * 2) return -1;
    return rng.range(minLeaf, n.w - minLeaf);
}

void fillWalls(Dungeon& d) {
    for (auto& t : d.tiles) {
        t.type = TileType::Wall;
        t.visible = false;
        t.explored = false;
    }
    d.rooms.clear();
    d.entry = {-1, -1};
    d.stairsDown = {-1, -1};
}

void carveRect(Dungeon& d, int x, int y, int w, int h) {
    for (int yy = y; yy < y + h; ++yy) {
        for (int xx = x; xx < x + w; ++xx) {
            if (!d.inBounds(xx, yy)) continue;
            d.at(xx, yy).type = TileType::Floor;
        }
    }
}

void carveFloor(Dungeon& d, int x, int y) {
    // Never carve the border ring.
    if (x <= 0 || y <= 0 || x >= d.width - 1 || y >= d.height - 1) return;
    Tile& t = d.at(x, y);
    // Don't overwrite doors or stairs.
    if (t.type == TileType::DoorClosed || t.type == TileType::DoorOpen || t.type == TileType::StairsDown)
        return;
    t.type = TileType::Floor;
}

void carveH(Dungeon& d, int x1, int x2, int y) {
    if (x2 < x1) std::swap(x1, x2);
    for (int x = x1; x <= x2; ++x) carveFloor(d, x, y);
}

void carveV(Dungeon& d, int y1, int y2, int x) {
    if (y2 < y1) std::swap(y1, y2);
    for (int y = y1; y <= y2; ++y) carveFloor(d, x, y);
}

std::vector<int> collectRoomsInSubtree(const std::vector<Leaf>& nodes, int idx) {
    std::vector<int> out;
    if (idx < 0) return out;
    const Leaf& n = nodes[static_cast<size_t>(idx)];
    if (n.roomIndex >= 0) out.push_back(n.roomIndex);
    if (n.left >= 0) {
        auto v = collectRoomsInSubtree(nodes, n.left);
        out.insert(out.end(), v.begin(), v.end());
    }
    if (n.right >= 0) {
        auto v = collectRoomsInSubtree(nodes, n.right);
        out.insert(out.end(), v.begin(), v.end());
    }
    return out;
}

int pickRandomRoomInSubtree(const std::vector<Leaf>& nodes, int idx, RNG& rng) {
    auto rooms = collectRoomsInSubtree(nodes, idx);
    if (rooms.empty()) return -1;
    return rooms[static_cast<size_t>(rng.range(0, static_cast<int>(rooms.size()) - 1))];
}

struct DoorPick {
    Vec2i doorInside;
    Vec2i corridorStart;
};

DoorPick pickDoorOnRoom(const Room& r, RNG& rng) {
    // Rooms sit at least one tile inside the border, so the tile outside any
    // non-corner edge tile is always in bounds.
    int side = rng.range(0, 3);
    Vec2i door{ r.cx(), r.cy() };
    Vec2i out{ r.cx(), r.cy() };

    if (side == 0) { // north
        door.x = rng.range(r.x + 1, r.x + r.w - 2);
        door.y = r.y;
        out = { door.x, door.y - 1 };
    } else if (side == 1) { // south
        door.x = rng.range(r.x + 1, r.x + r.w - 2);
        door.y = r.y + r.h - 1;
        out = { door.x, door.y + 1 };
    } else if (side == 2) { // west
        door.x = r.x;
        door.y = rng.range(r.y + 1, r.y + r.h - 2);
        out = { door.x - 1, door.y };
    } else { // east
        door.x = r.x + r.w - 1;
        door.y = rng.range(r.y + 1, r.y + r.h - 2);
        out = { door.x + 1, door.y };
    }
    return { door, out };
}

void connectRooms(Dungeon& d, const Room& a, const Room& b, RNG& rng) {
    DoorPick da = pickDoorOnRoom(a, rng);
    DoorPick db = pickDoorOnRoom(b, rng);

    d.at(da.doorInside.x, da.doorInside.y).type = TileType::DoorClosed;
    d.at(db.doorInside.x, db.doorInside.y).type = TileType::DoorClosed;

    carveFloor(d, da.corridorStart.x, da.corridorStart.y);
    carveFloor(d, db.corridorStart.x, db.corridorStart.y);

    // Carve L-shaped corridor
    const int x1 = da.corridorStart.x;
    const int y1 = da.corridorStart.y;
    const int x2 = db.corridorStart.x;
    const int y2 = db.corridorStart.y;

    if (rng.chance(0.5f)) {
        carveH(d, x1, x2, y1);
        carveV(d, y1, y2, x2);
    } else {
        carveV(d, y1, y2, x1);
        carveH(d, x1, x2, y2);
    }
}

void ensureBorders(Dungeon& d) {
    for (int x = 0; x < d.width; ++x) {
        d.at(x, 0).type = TileType::Wall;
        d.at(x, d.height - 1).type = TileType::Wall;
    }
    for (int y = 0; y < d.height; ++y) {
        d.at(0, y).type = TileType::Wall;
        d.at(d.width - 1, y).type = TileType::Wall;
    }
}

Vec2i farthestWalkableTile(const Dungeon& d, const std::vector<int>& dist, RNG& rng) {
    int bestDist = -1;
    std::vector<Vec2i> best;
    best.reserve(16);

    for (int y = 1; y < d.height - 1; ++y) {
        for (int x = 1; x < d.width - 1; ++x) {
            if (d.at(x, y).type != TileType::Floor) continue;
            const int di = dist[static_cast<size_t>(y * d.width + x)];
            if (di < 0) continue;
            if (di > bestDist) {
                bestDist = di;
                best.clear();
                best.push_back({x, y});
            } else if (di == bestDist) {
                best.push_back({x, y});
            }
        }
    }

    if (best.empty()) return {-1, -1};
    return best[static_cast<size_t>(rng.range(0, static_cast<int>(best.size()) - 1))];
}

// One BSP attempt. Returns false (with a reason) when not even one room fits.
bool generateBspRooms(Dungeon& d, RNG& rng, const GenParams& params, std::string* why) {
    const int minLeaf = std::max(params.minLeaf, params.minRoomSize + 2);
    const int minRoom = params.minRoomSize;

    std::vector<Leaf> nodes;
    nodes.reserve(128);

    nodes.push_back({1, 1, d.width - 2, d.height - 2, -1, -1, -1}); // root

    // Build BSP tree
    for (size_t i = 0; i < nodes.size(); ++i) {
        Leaf n = nodes[i];
        // Don't split too small leaves.
        if (n.w < minLeaf * 2 && n.h < minLeaf * 2) continue;

        // Random split orientation.
        bool splitH = rng.chance(0.5f);
        // Bias: split along longer dimension.
        if (n.w > n.h && n.w / std::max(1, n.h) >= 2) splitH = false;
        else if (n.h > n.w && n.h / std::max(1, n.w) >= 2) splitH = true;

        int split = splitLeaf(n, splitH, rng, minLeaf);
        if (split < 0) {
            // The preferred axis is too short; try the other one.
            splitH = !splitH;
            split = splitLeaf(n, splitH, rng, minLeaf);
        }
        if (split < 0) continue;

        Leaf a = n;
        Leaf b = n;
        a.left = a.right = b.left = b.right = -1;
        if (splitH) {
            a.h = split;
            b.y = n.y + split;
            b.h = n.h - split;
        } else {
            a.w = split;
            b.x = n.x + split;
            b.w = n.w - split;
        }

        const int leftIndex = static_cast<int>(nodes.size());
        nodes.push_back(a);
        const int rightIndex = static_cast<int>(nodes.size());
        nodes.push_back(b);
        nodes[i].left = leftIndex;
        nodes[i].right = rightIndex;
    }

    // Create rooms in each leaf that has no children. A one-tile margin inside
    // every leaf keeps rooms from touching each other or the border.
    d.rooms.clear();
    d.rooms.reserve(nodes.size());

    for (auto& n : nodes) {
        if (n.left >= 0 || n.right >= 0) continue;

        int rw = rng.range(minRoom, std::max(minRoom, n.w - 2));
        int rh = rng.range(minRoom, std::max(minRoom, n.h - 2));
        rw = std::min(rw, n.w - 2);
        rh = std::min(rh, n.h - 2);
        if (rw < minRoom || rh < minRoom) continue;

        int rx = rng.range(n.x + 1, n.x + n.w - rw - 1);
        int ry = rng.range(n.y + 1, n.y + n.h - rh - 1);

        carveRect(d, rx, ry, rw, rh);
        d.rooms.push_back({rx, ry, rw, rh});
        n.roomIndex = static_cast<int>(d.rooms.size()) - 1;
    }

    if (d.rooms.empty()) {
        if (why) {
            std::ostringstream ss;
            ss << "no room of " << minRoom << "x" << minRoom << " fits in a "
               << d.width << "x" << d.height << " map";
            *why = ss.str();
        }
        return false;
    }

    // Connect rooms following the BSP tree.
    for (const Leaf& n : nodes) {
        if (n.left < 0 || n.right < 0) continue;

        int ra = pickRandomRoomInSubtree(nodes, n.left, rng);
        int rb = pickRandomRoomInSubtree(nodes, n.right, rng);
        if (ra >= 0 && rb >= 0 && ra != rb) {
            connectRooms(d, d.rooms[static_cast<size_t>(ra)], d.rooms[static_cast<size_t>(rb)], rng);
        }
    }

    // Extra loops: connect random room pairs.
    const int extra = static_cast<int>(d.rooms.size()) / 3;
    for (int i = 0; i < extra; ++i) {
        int a = rng.range(0, static_cast<int>(d.rooms.size()) - 1);
        int b = rng.range(0, static_cast<int>(d.rooms.size()) - 1);
        if (a == b) continue;
        connectRooms(d, d.rooms[static_cast<size_t>(a)], d.rooms[static_cast<size_t>(b)], rng);
    }

    // Precompute which tiles are inside rooms (for branch carving).
    std::vector<uint8_t> inRoom(static_cast<size_t>(d.width * d.height), 0);
    for (const auto& r : d.rooms) {
        for (int y = r.y; y < r.y2(); ++y) {
            for (int x = r.x; x < r.x2(); ++x) {
                inRoom[static_cast<size_t>(y * d.width + x)] = 1;
            }
        }
    }

    // Branch corridors (dead ends) dug out of existing corridors.
    const int branches = static_cast<int>(d.rooms.size());
    for (int i = 0; i < branches; ++i) {
        int x = rng.range(1, d.width - 2);
        int y = rng.range(1, d.height - 2);

        if (d.at(x, y).type != TileType::Floor) continue;
        if (inRoom[static_cast<size_t>(y * d.width + x)] != 0) continue; // prefer corridors

        const int dirs[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};
        int dIdx = rng.range(0, 3);
        int dx = dirs[dIdx][0];
        int dy = dirs[dIdx][1];

        int len = rng.range(3, 8);
        int cx = x;
        int cy = y;
        for (int step = 0; step < len; ++step) {
            cx += dx;
            cy += dy;
            if (cx <= 0 || cy <= 0 || cx >= d.width - 1 || cy >= d.height - 1) break;
            if (d.at(cx, cy).type != TileType::Wall) break;
            carveFloor(d, cx, cy);
        }
    }

    // Entry in the first room, stairs down in the room farthest from it.
    const Room& startRoom = d.rooms.front();
    d.entry = { startRoom.cx(), startRoom.cy() };

    const auto dist = bfsDistanceMap(d, d.entry);
    int bestRoomIdx = 0;
    int bestDist = -1;
    for (int i = 1; i < static_cast<int>(d.rooms.size()); ++i) {
        const Room& r = d.rooms[static_cast<size_t>(i)];
        int d0 = dist[static_cast<size_t>(r.cy() * d.width + r.cx())];
        if (d0 > bestDist) {
            bestDist = d0;
            bestRoomIdx = i;
        }
    }

    if (bestDist > 0) {
        const Room& endRoom = d.rooms[static_cast<size_t>(bestRoomIdx)];
        d.stairsDown = { endRoom.cx(), endRoom.cy() };
    } else {
        // Single-room level: use the floor tile farthest from the entry.
        d.stairsDown = farthestWalkableTile(d, dist, rng);
        if (d.stairsDown == d.entry) d.stairsDown = {-1, -1};
    }
    if (d.inBounds(d.stairsDown.x, d.stairsDown.y)) {
        d.at(d.stairsDown.x, d.stairsDown.y).type = TileType::StairsDown;
    }

    return true;
}

} // namespace

bool validateDungeon(const Dungeon& d, const GenParams& params, std::string* why) {
    auto reject = [&](const std::string& msg) {
        if (why) *why = msg;
        return false;
    };

    if (d.width < 3 || d.height < 3) return reject("map too small");
    if (d.tiles.size() != static_cast<size_t>(d.width * d.height)) return reject("tile count mismatch");

    for (int x = 0; x < d.width; ++x) {
        if (d.at(x, 0).type != TileType::Wall || d.at(x, d.height - 1).type != TileType::Wall) {
            return reject("border is not solid");
        }
    }
    for (int y = 0; y < d.height; ++y) {
        if (d.at(0, y).type != TileType::Wall || d.at(d.width - 1, y).type != TileType::Wall) {
            return reject("border is not solid");
        }
    }

    if (d.rooms.empty()) return reject("level has no rooms");
    for (size_t i = 0; i < d.rooms.size(); ++i) {
        const Room& r = d.rooms[i];
        if (r.w < params.minRoomSize || r.h < params.minRoomSize) {
            std::ostringstream ss;
            ss << "degenerate room " << i << " (" << r.w << "x" << r.h << ")";
            return reject(ss.str());
        }
        if (r.x < 1 || r.y < 1 || r.x2() > d.width - 1 || r.y2() > d.height - 1) {
            std::ostringstream ss;
            ss << "room " << i << " crosses the border";
            return reject(ss.str());
        }
        for (size_t j = i + 1; j < d.rooms.size(); ++j) {
            if (r.intersects(d.rooms[j])) {
                std::ostringstream ss;
                ss << "rooms " << i << " and " << j << " overlap";
                return reject(ss.str());
            }
        }
    }

    if (!d.isWalkable(d.entry.x, d.entry.y)) return reject("entry is not walkable");

    const auto dist = bfsDistanceMap(d, d.entry);
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (!d.isPassable(x, y)) continue;
            if (dist[static_cast<size_t>(y * d.width + x)] < 0) {
                std::ostringstream ss;
                ss << "tile (" << x << "," << y << ") is unreachable from the entry";
                return reject(ss.str());
            }
        }
    }

    return true;
}

bool generateDungeon(Dungeon& out, uint32_t seed, const GenParams& params, GenReport* report, std::string* err) {
    if (report) *report = GenReport{};

    if (params.width < 3 || params.height < 3 || params.minRoomSize < 1 || params.maxRetries < 1) {
        if (err) *err = "invalid generation parameters";
        return false;
    }

    std::string lastWhy;
    for (int attempt = 0; attempt < params.maxRetries; ++attempt) {
        const uint32_t attemptSeed = (attempt == 0) ? seed : hashCombine(seed, tag32("REGEN"), static_cast<uint32_t>(attempt));
        RNG rng(attemptSeed);

        Dungeon d(params.width, params.height);
        fillWalls(d);

        if (report) report->attempts = attempt + 1;

        std::string why;
        if (!generateBspRooms(d, rng, params, &why)) {
            lastWhy = why;
            continue;
        }
        ensureBorders(d);

        if (!validateDungeon(d, params, &why)) {
            lastWhy = why;
            continue;
        }

        out = std::move(d);
        if (report) {
            report->usedSeed = attemptSeed;
            report->lastRejection = lastWhy;
        }
        return true;
    }

    out = Dungeon(params.width, params.height);
    if (report) report->lastRejection = lastWhy;
    if (err) {
        std::ostringstream ss;
        ss << "dungeon generation failed after " << params.maxRetries << " attempts: " << lastWhy;
        *err = ss.str();
    }
    return false;
}
