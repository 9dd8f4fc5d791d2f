#include "pathfinding.hpp"
#include "dungeon.hpp"
#include "grid_utils.hpp"

#include <deque>
#include <functional>
#include <queue>
#include <utility>

namespace {

const int STEPS8[8][2] = {
    {1,0},{-1,0},{0,1},{0,-1},
    {1,1},{1,-1},{-1,1},{-1,-1}
};

const int STEPS4[4][2] = {{1,0},{-1,0},{0,1},{0,-1}};

} // namespace

std::vector<int> costMapToward(const Dungeon& d, Vec2i goal, int doorCost) {
    std::vector<int> cost(static_cast<size_t>(d.width * d.height), -1);
    if (!d.isPassable(goal.x, goal.y)) return cost;

    auto enterCost = [&](int x, int y) { return d.isDoorClosed(x, y) ? doorCost : 1; };

    // (cost, index); smallest cost first.
    using Entry = std::pair<int, int>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;

    const int goalIdx = goal.y * d.width + goal.x;
    cost[static_cast<size_t>(goalIdx)] = 0;
    open.push({0, goalIdx});

    while (!open.empty()) {
        const Entry cur = open.top();
        open.pop();
        if (cost[static_cast<size_t>(cur.second)] != cur.first) continue;

        const int x = cur.second % d.width;
        const int y = cur.second / d.width;
        // A neighbour reaches the goal by stepping onto this tile first.
        const int viaHere = cur.first + enterCost(x, y);

        for (const auto& s : STEPS8) {
            const Vec2i from{ x + s[0], y + s[1] };
            if (!d.isPassable(from.x, from.y)) continue;
            if (!diagonalPassable(d, from, -s[0], -s[1])) continue;

            int& slot = cost[static_cast<size_t>(from.y * d.width + from.x)];
            if (slot < 0 || viaHere < slot) {
                slot = viaHere;
                open.push({viaHere, from.y * d.width + from.x});
            }
        }
    }

    return cost;
}

std::vector<int> bfsDistanceMap(const Dungeon& d, Vec2i start) {
    std::vector<int> dist(static_cast<size_t>(d.width * d.height), -1);
    if (!d.inBounds(start.x, start.y)) return dist;
    dist[static_cast<size_t>(start.y * d.width + start.x)] = 0;

    std::deque<Vec2i> frontier;
    frontier.push_back(start);

    while (!frontier.empty()) {
        const Vec2i p = frontier.front();
        frontier.pop_front();
        const int next = dist[static_cast<size_t>(p.y * d.width + p.x)] + 1;

        for (const auto& s : STEPS4) {
            const int nx = p.x + s[0];
            const int ny = p.y + s[1];
            if (!d.isPassable(nx, ny)) continue;
            int& slot = dist[static_cast<size_t>(ny * d.width + nx)];
            if (slot != -1) continue;
            slot = next;
            frontier.push_back({nx, ny});
        }
    }

    return dist;
}
