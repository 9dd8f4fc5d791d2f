#pragma once

#include "dungeon.hpp"

#include <cstdint>
#include <string>

// Tunables for the BSP room generator.
struct GenParams {
    int width = 80;
    int height = 45;
    int minLeaf = 8;      // BSP leaves are never split below this size
    int minRoomSize = 4;  // smallest room edge (interior tiles)
    int maxRetries = 8;   // attempts before generation is reported as failed
};

// Filled by generateDungeon for logging/tests.
struct GenReport {
    int attempts = 0;
    uint32_t usedSeed = 0;
    std::string lastRejection;
};

// Generates a connected level into `out`.
//
// Each attempt is validated with validateDungeon(). A rejected attempt is
// retried with a seed derived from (seed, attempt); after maxRetries the call
// fails, `out` is left as a blank wall map, and `err` explains the last
// rejection. The same (seed, params) always produces the same level.
bool generateDungeon(Dungeon& out, uint32_t seed, const GenParams& params,
                     GenReport* report = nullptr, std::string* err = nullptr);

// Structural checks: solid border, non-degenerate non-overlapping rooms inside
// the border, a walkable entry, and every passable tile reachable from it.
bool validateDungeon(const Dungeon& d, const GenParams& params, std::string* why = nullptr);
