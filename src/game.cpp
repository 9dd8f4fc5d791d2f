#include "game.hpp"
#include "grid_utils.hpp"

#include <algorithm>
#include <ctime>
#include <sstream>
#include <utility>

namespace {

EntityKind pickMonsterKind(RNG& rng, int depth) {
    // Deeper floors shift the mix toward orcs and trolls.
    const int trollChance = clampi((depth - 1) * 8, 0, 35);
    const int orcChance = clampi(20 + (depth - 1) * 5, 20, 45);

    int roll = rng.range(1, 100);
    if (roll <= trollChance) return EntityKind::Troll;
    roll -= trollChance;
    if (roll <= orcChance) return EntityKind::Orc;
    return (rng.range(0, 1) == 0) ? EntityKind::Rat : EntityKind::Goblin;
}

} // namespace

Game::Game() = default;

Game::Game(const GameConfig& cfg) : cfg_(cfg) {}

void Game::pushMsg(const std::string& s, MessageKind kind) {
    // Coalesce consecutive identical messages to reduce spam in combat.
    if (!msgs.empty()) {
        Message& last = msgs.back();
        if (last.text == s && last.kind == kind) {
            if (last.repeat < 9999) {
                ++last.repeat;
            }
            return;
        }
    }

    // Keep some scrollback
    if (msgs.size() > 400) {
        msgs.erase(msgs.begin(), msgs.begin() + 100);
    }
    msgs.push_back({s, kind, 1});
}

const Entity& Game::player() const {
    static const Entity none{};
    if (!ents.empty() && ents.front().id == playerId_) return ents.front();
    return none;
}

Entity& Game::playerMut() {
    return ents.front();
}

Entity* Game::entityByIdMut(int id) {
    for (auto& e : ents) if (e.id == id) return &e;
    return nullptr;
}

const Entity* Game::entityById(int id) const {
    for (const auto& e : ents) if (e.id == id) return &e;
    return nullptr;
}

const Entity* Game::entityAt(Vec2i p) const {
    const int id = occ.at(p);
    if (id == 0) return nullptr;
    return entityById(id);
}

void Game::resetSession(uint32_t seed) {
    rng = RNG(seed);
    seed_ = seed;
    depth_ = 1;
    turnCount_ = 0;
    killCount_ = 0;
    lastAutosaveTurn_ = 0;
    gameOver_ = false;
    playerId_ = 0;
    nextEntityId_ = 1;

    ents.clear();
    queue = TurnQueue{};
    msgs.clear();
}

void Game::installLevel(Dungeon d, Entity player) {
    dung = std::move(d);
    occ.reset(dung.width, dung.height);
    ents.clear();
    queue.clear();

    player.pos = dung.entry;
    ents.push_back(player);
    (void)occ.place(player.id, player.pos);

    // The player opens every level.
    queue.push(player.id, queue.now());
}

int Game::spawnMonster(EntityKind kind, Vec2i pos) {
    if (kind == EntityKind::Player) return 0;
    if (!dung.isWalkable(pos.x, pos.y)) return 0;
    if (occ.occupied(pos)) return 0;

    Entity m = makeEntity(nextEntityId_++, kind, pos);
    if (!occ.place(m.id, m.pos)) return 0;
    ents.push_back(m);
    queue.push(m.id, queue.now() + actionDelayFor(m.speed));
    return m.id;
}

void Game::spawnMonsters() {
    if (cfg_.monstersPerRoom <= 0) return;

    // The entry room starts empty.
    for (size_t i = 1; i < dung.rooms.size(); ++i) {
        const Room& r = dung.rooms[i];
        const int n = rng.range(0, cfg_.monstersPerRoom);
        for (int k = 0; k < n; ++k) {
            const Vec2i pos{ rng.range(r.x, r.x2() - 1), rng.range(r.y, r.y2() - 1) };
            const EntityKind kind = pickMonsterKind(rng, depth_);
            (void)spawnMonster(kind, pos);
        }
    }
}

bool Game::newGame(uint32_t seed, std::string* err) {
    if (seed == 0) {
        seed = hash32(static_cast<uint32_t>(std::time(nullptr)) ^ 0xA5A5F00Du);
    }

    Dungeon level;
    GenReport report;
    if (!generateDungeon(level, seed, cfg_.gen, &report, err)) {
        return false;
    }

    resetSession(seed);

    Entity p = makeEntity(nextEntityId_++, EntityKind::Player, level.entry);
    playerId_ = p.id;
    installLevel(std::move(level), p);
    spawnMonsters();
    recomputeFov();

    std::ostringstream ss;
    ss << "WELCOME, " << toUpper(cfg_.playerName) << ". DEPTH " << depth_ << ", SEED " << seed_ << ".";
    pushMsg(ss.str(), MessageKind::System);
    if (report.attempts > 1) {
        std::ostringstream rs;
        rs << "LEVEL REBUILT " << (report.attempts - 1) << "X (" << toUpper(report.lastRejection) << ").";
        pushMsg(rs.str(), MessageKind::System);
    }
    return true;
}

bool Game::startCustomLevel(Dungeon d, uint32_t seed, std::string* err) {
    if (d.width <= 0 || d.height <= 0 || d.tiles.size() != static_cast<size_t>(d.width * d.height)) {
        if (err) *err = "custom level has an invalid size";
        return false;
    }
    if (!d.isWalkable(d.entry.x, d.entry.y)) {
        if (err) *err = "custom level entry is not walkable";
        return false;
    }

    resetSession(seed);

    Entity p = makeEntity(nextEntityId_++, EntityKind::Player, d.entry);
    playerId_ = p.id;
    installLevel(std::move(d), p);
    recomputeFov();
    return true;
}

bool Game::descend() {
    const uint32_t levelSeed = hashCombine(seed_, tag32("LEVEL"), static_cast<uint32_t>(depth_ + 1));

    Dungeon next;
    std::string err;
    if (!generateDungeon(next, levelSeed, cfg_.gen, nullptr, &err)) {
        pushMsg("THE STAIRS ARE BLOCKED (" + toUpper(err) + ").", MessageKind::Warning);
        return false;
    }

    const Entity keep = player();
    ++depth_;
    installLevel(std::move(next), keep);
    spawnMonsters();

    std::ostringstream ss;
    ss << "YOU DESCEND TO DEPTH " << depth_ << ".";
    pushMsg(ss.str(), MessageKind::System);
    return true;
}

bool Game::playerMove(Vec2i delta) {
    Entity& p = playerMut();
    const Vec2i to{ p.pos.x + delta.x, p.pos.y + delta.y };

    if (!dung.inBounds(to.x, to.y)) {
        pushMsg("THE EDGE OF THE WORLD BLOCKS YOUR WAY.");
        return false;
    }
    if (!diagonalPassable(dung, p.pos, delta.x, delta.y)) {
        pushMsg("YOU CAN'T SQUEEZE THROUGH THERE.");
        return false;
    }

    // Bump to attack.
    const int occupant = occ.at(to);
    if (occupant != 0 && occupant != p.id) {
        Entity* target = entityByIdMut(occupant);
        if (target && target->alive()) {
            attackMelee(p, *target);
            return true;
        }
    }

    if (dung.isDoorClosed(to.x, to.y)) {
        dung.openDoor(to.x, to.y);
        pushMsg("YOU OPEN THE DOOR.");
        return true;
    }

    if (!dung.isWalkable(to.x, to.y)) {
        pushMsg("THAT WAY IS BLOCKED.");
        return false;
    }

    return tryMoveEntity(p, to);
}

bool Game::playerInteract() {
    const Vec2i pos = player().pos;

    if (dung.at(pos.x, pos.y).type == TileType::StairsDown) {
        return descend();
    }

    static const int dirs[8][2] = {
        {1,0},{-1,0},{0,1},{0,-1},
        {1,1},{1,-1},{-1,1},{-1,-1},
    };
    for (const auto& dv : dirs) {
        const int nx = pos.x + dv[0];
        const int ny = pos.y + dv[1];
        if (dung.isDoorClosed(nx, ny)) {
            dung.openDoor(nx, ny);
            pushMsg("YOU OPEN THE DOOR.");
            return true;
        }
    }

    pushMsg("THERE IS NOTHING HERE TO INTERACT WITH.");
    return false;
}

ActionResult Game::playerAct(Action a) {
    if (a == Action::None) return ActionResult::NoOp;
    if (a == Action::Quit) return ActionResult::Quit;
    if (!hasSession()) return ActionResult::NoOp;

    if (a == Action::Save) {
        std::string err;
        if (saveToFile(cfg_.savePath, &err)) {
            pushMsg("GAME SAVED.", MessageKind::System);
        } else {
            pushMsg("SAVE FAILED: " + toUpper(err), MessageKind::Warning);
        }
        return ActionResult::NoOp;
    }

    if (isFinished()) return ActionResult::NoOp;

    // Monsters ahead of the player in the queue go first.
    if (queue.front() != playerId_) advanceMonsters();
    if (isFinished()) return ActionResult::NoOp;

    bool acted = false;
    if (isMoveAction(a)) {
        acted = playerMove(actionDelta(a));
    } else if (a == Action::Wait) {
        acted = true;
    } else if (a == Action::Interact) {
        acted = playerInteract();
    }

    if (!acted) return ActionResult::Rejected;

    endPlayerTurn();
    return ActionResult::Acted;
}

void Game::endPlayerTurn() {
    ++turnCount_;
    queue.reschedule(actionDelayFor(player().speed));
    cleanupDead();

    // Monsters perceive the player through the updated FOV.
    recomputeFov();
    advanceMonsters();

    maybeAutosave();
}

void Game::advanceMonsters() {
    while (!isFinished() && !queue.empty()) {
        const int id = queue.front();
        if (id == playerId_) return;

        Entity* m = entityByIdMut(id);
        if (!m || !m->alive()) {
            (void)queue.remove(id);
            continue;
        }

        const uint32_t delay = actionDelayFor(m->speed);
        monsterAct(*m);
        queue.reschedule(delay);
        cleanupDead();
    }
}

bool Game::runTurn(InputSource& input) {
    if (!hasSession()) return false;
    advanceMonsters();

    while (!isFinished()) {
        const Action a = input.nextAction(*this);
        if (a == Action::None) return false;

        const ActionResult r = playerAct(a);
        if (r == ActionResult::Quit) return false;
        if (r == ActionResult::Acted) return true;
        // Rejected or free actions: the player still holds the turn.
    }
    return false;
}

int Game::run(InputSource& input, RenderSurface* surface, int maxTurns) {
    int turns = 0;
    if (surface) surface->draw(*this);
    while (maxTurns <= 0 || turns < maxTurns) {
        if (!runTurn(input)) break;
        ++turns;
        if (surface) surface->draw(*this);
    }
    return turns;
}

void Game::recomputeFov() {
    if (!hasSession()) return;
    const Entity& p = player();
    dung.computeFov(p.pos.x, p.pos.y, cfg_.fovRadius);
}

void Game::maybeAutosave() {
    if (cfg_.autosaveEveryTurns <= 0) return;
    if (isFinished()) return;
    if (turnCount_ == 0) return;
    if (cfg_.autosavePath.empty()) return;

    const uint32_t interval = static_cast<uint32_t>(cfg_.autosaveEveryTurns);
    if ((turnCount_ % interval) != 0) return;
    if (lastAutosaveTurn_ == turnCount_) return;

    std::string err;
    if (saveToFile(cfg_.autosavePath, &err)) {
        lastAutosaveTurn_ = turnCount_;
    } else {
        pushMsg("AUTOSAVE FAILED: " + toUpper(err), MessageKind::Warning);
    }
}

uint64_t Game::stateHash() const {
    // FNV-1a 64 over the simulation state, field by field.
    uint64_t h = 1469598103934665603ull;
    auto mix = [&](uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            h ^= static_cast<uint8_t>(v >> (i * 8));
            h *= 1099511628211ull;
        }
    };

    mix(seed_);
    mix(rng.state);
    mix(static_cast<uint64_t>(depth_));
    mix(turnCount_);
    mix(killCount_);
    mix(gameOver_ ? 1u : 0u);
    mix(static_cast<uint64_t>(nextEntityId_));

    mix(static_cast<uint64_t>(dung.width));
    mix(static_cast<uint64_t>(dung.height));
    for (const auto& t : dung.tiles) {
        mix((static_cast<uint64_t>(t.type) << 1) | (t.explored ? 1u : 0u));
    }

    for (const auto& e : ents) {
        mix(static_cast<uint64_t>(e.id));
        mix(static_cast<uint64_t>(e.kind));
        mix(static_cast<uint64_t>(static_cast<uint32_t>(e.pos.x)));
        mix(static_cast<uint64_t>(static_cast<uint32_t>(e.pos.y)));
        mix(static_cast<uint64_t>(static_cast<uint32_t>(e.hp)));
        mix(e.alerted ? 1u : 0u);
    }

    mix(queue.now());
    for (const auto& s : queue.slots()) {
        mix(s.time);
        mix(static_cast<uint64_t>(s.id));
    }

    return h;
}
