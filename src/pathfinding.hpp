#pragma once

#include "common.hpp"

#include <vector>

class Dungeon;

// Distance maps over a Dungeon, indexed y * width + x. Unreachable tiles hold -1.

// Walking cost from every tile to `goal` with 8-way steps over passable tiles.
// Stepping into a closed door costs `doorCost`, any other tile costs 1.
// Diagonal steps that would cut a corner between two blocked tiles are skipped.
std::vector<int> costMapToward(const Dungeon& d, Vec2i goal, int doorCost = 2);

// 4-way step counts from `start` over Dungeon::isPassable (connectivity checks).
std::vector<int> bfsDistanceMap(const Dungeon& d, Vec2i start);
