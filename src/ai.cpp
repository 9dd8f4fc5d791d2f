#include "game.hpp"

#include "grid_utils.hpp"
#include "pathfinding.hpp"

#include <vector>

namespace {

const int DIRS8[8][2] = {{1,0},{-1,0},{0,1},{0,-1},{1,1},{1,-1},{-1,1},{-1,-1}};

} // namespace

bool Game::tryMoveEntity(Entity& e, Vec2i to) {
    if (!dung.isWalkable(to.x, to.y)) return false;
    if (!occ.move(e.id, e.pos, to)) return false;
    e.pos = to;
    return true;
}

void Game::monsterAct(Entity& m) {
    if (isFinished() || !m.alive()) return;

    const Entity& p = player();

    // FOV is symmetric, so "the player can see this tile" is the same as
    // "this monster can see the player".
    const bool seesPlayer = dung.at(m.pos.x, m.pos.y).visible;
    if (seesPlayer) {
        if (!m.alerted) {
            pushMsg(std::string("THE ") + kindName(m.kind) + " NOTICES YOU!", MessageKind::Warning);
        }
        m.alerted = true;
        m.lastKnownPlayerPos = p.pos;
    }

    if (!m.alerted) return;

    if (seesPlayer && isAdjacent8(m.pos, p.pos)) {
        const int dx = p.pos.x - m.pos.x;
        const int dy = p.pos.y - m.pos.y;
        if (diagonalPassable(dung, m.pos, dx, dy)) {
            Entity& target = playerMut();
            attackMelee(m, target);
            return;
        }
    }

    const Vec2i goal = m.lastKnownPlayerPos;
    if (!dung.inBounds(goal.x, goal.y)) {
        m.alerted = false;
        return;
    }
    if (m.pos == goal) {
        // Reached the last sighting and the player is gone.
        m.alerted = false;
        m.lastKnownPlayerPos = {-1, -1};
        return;
    }

    const std::vector<int> cost = costMapToward(dung, goal);

    // Only steps that get strictly closer; a blocked monster waits in place.
    const int here = cost[static_cast<size_t>(m.pos.y * dung.width + m.pos.x)];
    if (here < 0) return;

    Vec2i best = m.pos;
    int bestScore = here;
    for (const auto& dv : DIRS8) {
        const int dx = dv[0];
        const int dy = dv[1];
        const int nx = m.pos.x + dx;
        const int ny = m.pos.y + dy;
        if (!dung.isPassable(nx, ny)) continue;
        if (!diagonalPassable(dung, m.pos, dx, dy)) continue;
        if (occ.occupied({nx, ny})) continue;

        const int c = cost[static_cast<size_t>(ny * dung.width + nx)];
        if (c < 0) continue;
        if (c < bestScore) {
            bestScore = c;
            best = {nx, ny};
        }
    }

    if (best == m.pos) return;

    if (dung.isDoorClosed(best.x, best.y)) {
        dung.openDoor(best.x, best.y);
        recomputeFov();
        return;
    }

    (void)tryMoveEntity(m, best);
}
