#include "actions.hpp"
#include "dungeon.hpp"
#include "game.hpp"
#include "mapgen.hpp"
#include "occupancy.hpp"
#include "pathfinding.hpp"
#include "replay.hpp"
#include "replay_runner.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "turn_queue.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

std::string tempPath(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

// Walled box with an open interior.
Dungeon openRoom(int w, int h) {
    Dungeon d(w, h);
    for (int y = 1; y < h - 1; ++y) {
        for (int x = 1; x < w - 1; ++x) {
            d.at(x, y).type = TileType::Floor;
        }
    }
    d.rooms.push_back({1, 1, w - 2, h - 2});
    return d;
}

Game customGame(Dungeon d, Vec2i entry, const GameConfig& cfg = GameConfig()) {
    d.entry = entry;
    Game g(cfg);
    std::string err;
    const bool ok = g.startCustomLevel(d, 1u, &err);
    expect(ok, "startCustomLevel failed: " + err);
    return g;
}

GameConfig smallConfig() {
    GameConfig cfg;
    cfg.gen.width = 40;
    cfg.gen.height = 25;
    cfg.monstersPerRoom = 2;
    cfg.autosaveEveryTurns = 0;
    return cfg;
}

std::vector<uint8_t> readBytes(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

void writeBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

// Byte layout of a save written by Game::saveToFile (little-endian host).
constexpr size_t SAVE_RNG_STATE = 12;
constexpr size_t SAVE_NEXT_ENTITY = 37;
constexpr size_t SAVE_SLOT_COUNT = 57;
constexpr size_t SAVE_SLOTS = 61;
constexpr size_t SAVE_SLOT_BYTES = 20;
constexpr size_t SAVE_ENTITY_BYTES = 42;

// Offsets inside one saved entity.
constexpr size_t ENT_ID = 0;
constexpr size_t ENT_KIND = 4;
constexpr size_t ENT_X = 5;
constexpr size_t ENT_Y = 9;
constexpr size_t ENT_HP = 13;
constexpr size_t ENT_ATK = 21;

uint32_t getU32(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<uint32_t>(b[off]) | (static_cast<uint32_t>(b[off + 1]) << 8)
        | (static_cast<uint32_t>(b[off + 2]) << 16) | (static_cast<uint32_t>(b[off + 3]) << 24);
}

void putU32(std::vector<uint8_t>& b, size_t off, uint32_t v) {
    for (size_t i = 0; i < 4; ++i) b[off + i] = static_cast<uint8_t>(v >> (8 * i));
}

size_t saveMapOffset(const std::vector<uint8_t>& b) {
    return SAVE_SLOTS + SAVE_SLOT_BYTES * getU32(b, SAVE_SLOT_COUNT);
}

size_t saveEntityOffset(const std::vector<uint8_t>& b, size_t index) {
    const size_t map = saveMapOffset(b);
    const size_t w = getU32(b, map);
    const size_t h = getU32(b, map + 4);
    const size_t rooms = getU32(b, map + 24);
    return map + 28 + 16 * rooms + 2 * w * h + 4 + SAVE_ENTITY_BYTES * index;
}

// Rewrites the CRC32 footer so an edited payload passes the integrity check.
void resealSave(std::vector<uint8_t>& b) {
    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i + 4 < b.size(); ++i) {
        crc ^= b[i];
        for (int k = 0; k < 8; ++k) crc = (crc & 1u) ? (0xEDB88320u ^ (crc >> 1)) : (crc >> 1);
    }
    putU32(b, b.size() - 4, crc ^ 0xFFFFFFFFu);
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    // Also validate range() stays within bounds.
    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }
}

void test_generation_connected_many_seeds() {
    const GenParams params;
    for (uint32_t seed = 1; seed <= 40; ++seed) {
        Dungeon d;
        std::string err;
        const bool ok = generateDungeon(d, seed, params, nullptr, &err);
        expect(ok, "generation failed for seed " + std::to_string(seed) + ": " + err);
        if (!ok) continue;

        expect(d.isWalkable(d.entry.x, d.entry.y), "entry not walkable for seed " + std::to_string(seed));
        expect(d.inBounds(d.stairsDown.x, d.stairsDown.y)
               && d.at(d.stairsDown.x, d.stairsDown.y).type == TileType::StairsDown,
               "stairs down missing for seed " + std::to_string(seed));

        // Every passable tile must be reachable from the entry.
        const std::vector<int> dist = bfsDistanceMap(d, d.entry);
        int unreachable = 0;
        for (int y = 0; y < d.height; ++y) {
            for (int x = 0; x < d.width; ++x) {
                if (d.isPassable(x, y) && dist[static_cast<size_t>(y * d.width + x)] < 0) ++unreachable;
            }
        }
        expect(unreachable == 0, "unreachable tiles for seed " + std::to_string(seed));

        // Solid border.
        bool border = true;
        for (int x = 0; x < d.width; ++x) {
            border = border && d.at(x, 0).type == TileType::Wall && d.at(x, d.height - 1).type == TileType::Wall;
        }
        for (int y = 0; y < d.height; ++y) {
            border = border && d.at(0, y).type == TileType::Wall && d.at(d.width - 1, y).type == TileType::Wall;
        }
        expect(border, "border not solid for seed " + std::to_string(seed));
    }
}

void test_generation_deterministic() {
    const GenParams params;
    Dungeon a;
    Dungeon b;
    expect(generateDungeon(a, 777u, params), "generation failed (a)");
    expect(generateDungeon(b, 777u, params), "generation failed (b)");

    bool same = a.width == b.width && a.height == b.height && a.tiles.size() == b.tiles.size();
    for (size_t i = 0; same && i < a.tiles.size(); ++i) {
        same = a.tiles[i].type == b.tiles[i].type;
    }
    expect(same, "same seed produced different tiles");
    expect(a.rooms.size() == b.rooms.size(), "same seed produced different room counts");
    expect(a.entry == b.entry && a.stairsDown == b.stairsDown, "same seed produced different stairs");

    Dungeon c;
    expect(generateDungeon(c, 778u, params), "generation failed (c)");
    bool differs = false;
    for (size_t i = 0; i < a.tiles.size() && i < c.tiles.size(); ++i) {
        if (a.tiles[i].type != c.tiles[i].type) { differs = true; break; }
    }
    expect(differs, "different seeds produced identical maps");
}

void test_generation_no_degenerate_rooms() {
    GenParams params;
    params.minRoomSize = 5;
    for (uint32_t seed = 100; seed < 120; ++seed) {
        Dungeon d;
        if (!generateDungeon(d, seed, params)) {
            expect(false, "generation failed for seed " + std::to_string(seed));
            continue;
        }
        expect(!d.rooms.empty(), "no rooms generated");
        for (size_t i = 0; i < d.rooms.size(); ++i) {
            const Room& r = d.rooms[i];
            expect(r.w >= params.minRoomSize && r.h >= params.minRoomSize, "degenerate room");
            expect(r.x >= 1 && r.y >= 1 && r.x2() <= d.width - 1 && r.y2() <= d.height - 1, "room crosses border");
            for (size_t j = i + 1; j < d.rooms.size(); ++j) {
                expect(!r.intersects(d.rooms[j]), "rooms overlap");
            }
        }
        expect(validateDungeon(d, params), "validateDungeon rejected a generated map");
    }
}

void test_generation_fails_after_retries() {
    GenParams params;
    params.width = 7;
    params.height = 7;
    params.maxRetries = 3;

    Dungeon d = openRoom(10, 10);
    GenReport report;
    std::string err;
    const bool ok = generateDungeon(d, 5u, params, &report, &err);
    expect(!ok, "7x7 map with 4x4 rooms should not generate");
    expect(report.attempts == 3, "generation should stop after maxRetries attempts");
    expect(!err.empty() && err.find("3 attempts") != std::string::npos, "error should name the attempt count");
    expect(d.width == 7 && d.height == 7, "failed generation should leave a blank map of the requested size");
    bool allWall = true;
    for (const auto& t : d.tiles) allWall = allWall && t.type == TileType::Wall;
    expect(allWall, "failed generation should leave no floor behind");

    // Parameter errors fail before any attempt.
    params.width = 2;
    err.clear();
    expect(!generateDungeon(d, 5u, params, &report, &err), "2-wide map should be rejected");
    expect(report.attempts == 0, "invalid parameters should not consume attempts");
    expect(!err.empty(), "invalid parameters should report an error");

    // The smallest map that fits one room still works.
    params.width = 8;
    params.height = 8;
    expect(generateDungeon(d, 5u, params, &report, &err), "8x8 map should hold one room: " + err);
    expect(d.rooms.size() == 1, "8x8 map should hold exactly one room");
}

void test_game_reports_generation_failure() {
    GameConfig cfg;
    cfg.gen.width = 6;
    cfg.gen.height = 6;
    cfg.gen.maxRetries = 2;
    Game g(cfg);
    std::string err;
    expect(!g.newGame(42u, &err), "newGame should fail when no level can be built");
    expect(!err.empty(), "newGame failure should carry a reason");
    expect(!g.hasSession(), "failed newGame must not start a session");
}

void test_fov_symmetric() {
    // Open room with a scatter of pillars.
    Dungeon d = openRoom(24, 16);
    RNG rng(99u);
    for (int i = 0; i < 40; ++i) {
        const int x = rng.range(1, d.width - 2);
        const int y = rng.range(1, d.height - 2);
        d.at(x, y).type = TileType::Wall;
    }

    std::vector<Vec2i> floors;
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            if (!d.isOpaque(x, y)) floors.push_back({x, y});
        }
    }

    for (int radius : {0, 6}) {
        std::vector<std::vector<uint8_t>> masks(floors.size());
        for (size_t i = 0; i < floors.size(); ++i) {
            d.computeFovMask(floors[i].x, floors[i].y, radius, masks[i]);
        }

        int asymmetric = 0;
        for (size_t i = 0; i < floors.size(); ++i) {
            for (size_t j = i + 1; j < floors.size(); ++j) {
                const Vec2i a = floors[i];
                const Vec2i b = floors[j];
                const bool ab = masks[i][static_cast<size_t>(b.y * d.width + b.x)] != 0;
                const bool ba = masks[j][static_cast<size_t>(a.y * d.width + a.x)] != 0;
                if (ab != ba) ++asymmetric;
            }
        }
        expect(asymmetric == 0, "FOV asymmetric for " + std::to_string(asymmetric) + " pairs (radius "
               + std::to_string(radius) + ")");
    }
}

void test_fov_visible_resets_explored_persists() {
    Dungeon d = openRoom(20, 5);

    d.computeFov(2, 2, 3);
    expect(d.at(2, 2).visible, "observer tile should be visible");
    expect(d.at(4, 2).visible && d.at(4, 2).explored, "nearby tile should be visible and explored");
    expect(!d.at(10, 2).visible && !d.at(10, 2).explored, "far tile should be outside the radius");

    d.computeFov(15, 2, 3);
    expect(!d.at(4, 2).visible, "visible flag should reset on the next pass");
    expect(d.at(4, 2).explored, "explored flag should persist");
    expect(d.at(15, 2).visible, "new observer tile should be visible");
    expect(d.visibleCount() > 0, "some tiles should be visible");
}

void test_fov_walls_and_doors_block() {
    Dungeon d = openRoom(11, 5);
    for (int y = 1; y <= 3; ++y) d.at(5, y).type = TileType::Wall;

    d.computeFov(2, 2, 0);
    expect(d.at(5, 2).visible, "the blocking wall itself should be visible");
    expect(!d.at(8, 2).visible, "tile behind a wall should not be visible");

    d.at(5, 2).type = TileType::DoorClosed;
    d.computeFov(2, 2, 0);
    expect(!d.at(8, 2).visible, "closed door should block sight");

    d.openDoor(5, 2);
    d.computeFov(2, 2, 0);
    expect(d.at(8, 2).visible, "open door should let sight through");
    expect(d.hasLineOfSight(2, 2, 8, 2, 0) && d.hasLineOfSight(8, 2, 2, 2, 0), "line of sight should be mutual");
}

void test_occupancy_grid() {
    OccupancyGrid o(5, 5);
    expect(o.place(1, {1, 1}), "place on empty tile");
    expect(!o.place(2, {1, 1}), "place on occupied tile should fail");
    expect(!o.place(2, {5, 1}), "place out of bounds should fail");
    expect(o.at({1, 1}) == 1 && o.count() == 1, "occupant lookup");
    expect(!o.move(2, {1, 1}, {2, 2}), "move by the wrong id should fail");
    expect(o.move(1, {1, 1}, {2, 2}), "move to free tile");
    expect(o.at({1, 1}) == 0 && o.at({2, 2}) == 1, "move updates both tiles");
    expect(o.remove(1, {2, 2}) && o.count() == 0, "remove");
}

void test_turn_queue_fifo_ties() {
    TurnQueue q;
    q.push(1, 0);
    q.push(2, 0);
    q.push(3, 0);

    std::vector<int> order;
    for (int i = 0; i < 9; ++i) {
        order.push_back(q.front());
        q.reschedule(actionDelayFor(100));
    }
    const std::vector<int> expected = {1, 2, 3, 1, 2, 3, 1, 2, 3};
    expect(order == expected, "equal-speed entities should alternate in insertion order");
    expect(q.now() == 200, "clock should advance to the last popped slot");
}

void test_turn_queue_remove_and_speed() {
    TurnQueue q;
    q.push(1, 0);
    q.push(2, 0);
    expect(q.remove(2), "remove queued entity");
    expect(!q.remove(2), "second remove should report absence");
    expect(!q.contains(2), "removed entity should be gone");
    for (int i = 0; i < 10; ++i) {
        expect(q.front() != 2, "removed entity popped again");
        q.reschedule(100);
    }

    TurnQueue fast;
    fast.push(1, 0);
    fast.push(2, 0);
    int c1 = 0;
    int c2 = 0;
    for (int i = 0; i < 60; ++i) {
        const int id = fast.front();
        if (id == 1) ++c1; else ++c2;
        fast.reschedule(actionDelayFor(id == 1 ? 200 : 100));
    }
    expect(c1 > c2, "faster entity should act more often");
    expect(c1 >= c2 * 2 - 1 && c1 <= c2 * 2 + 1, "double speed should act about twice as often");

    expect(fast.popFront() != 0 && fast.size() == 1, "popFront removes the front entry");
}

void test_rejected_move_keeps_turn() {
    Game g = customGame(openRoom(7, 5), {1, 1});
    const uint64_t before = g.stateHash();
    const uint64_t queueTime = g.turnQueue().frontTime();

    expect(g.playerAct(Action::Up) == ActionResult::Rejected, "walking into a wall should be rejected");
    expect(g.playerAct(Action::UpLeft) == ActionResult::Rejected, "walking into a corner should be rejected");
    expect(g.turnCount() == 0, "rejected move should not spend a turn");
    expect(g.turnQueue().frontTime() == queueTime, "rejected move should not advance the queue");
    expect(g.turnQueue().front() == g.playerId(), "player should keep the turn");
    expect(g.stateHash() == before, "rejected move should not change state");

    expect(g.playerAct(Action::Right) == ActionResult::Acted, "valid move should act");
    expect(g.turnCount() == 1, "valid move should spend a turn");
    expect(g.player().pos == Vec2i{2, 1}, "player should have moved");
    expect(g.occupancy().at({2, 1}) == g.playerId() && g.occupancy().at({1, 1}) == 0, "occupancy follows the player");
}

void test_corner_cutting_rejected() {
    Dungeon d = openRoom(7, 7);
    d.at(3, 2).type = TileType::Wall;
    d.at(2, 1).type = TileType::Wall;
    Game g = customGame(d, {2, 2});
    expect(g.playerAct(Action::UpRight) == ActionResult::Rejected, "diagonal between two walls should be rejected");
    expect(g.turnCount() == 0, "corner cut should not spend a turn");
}

void test_doors_open_on_bump() {
    Dungeon d = openRoom(9, 5);
    d.at(3, 2).type = TileType::DoorClosed;
    Game g = customGame(d, {2, 2});

    expect(g.playerAct(Action::Right) == ActionResult::Acted, "bumping a door should open it");
    expect(g.dungeon().at(3, 2).type == TileType::DoorOpen, "door should be open");
    expect(g.player().pos == Vec2i{2, 2}, "opening a door should not move the player");

    expect(g.playerAct(Action::Right) == ActionResult::Acted, "walking through an open door");
    expect(g.player().pos == Vec2i{3, 2}, "player should stand in the doorway");

    expect(g.playerAct(Action::Interact) == ActionResult::Rejected, "interact with nothing should be rejected");
}

void test_bump_kill_cleans_up() {
    Game g = customGame(openRoom(9, 5), {2, 2});
    const int rat = g.spawnMonster(EntityKind::Rat, {3, 2});
    expect(rat != 0, "spawn rat");
    expect(g.spawnMonster(EntityKind::Goblin, {3, 2}) == 0, "spawn on an occupied tile should fail");
    expect(g.turnQueue().contains(rat), "rat should be scheduled");

    expect(g.playerAct(Action::Right) == ActionResult::Acted, "attack should act");
    expect(g.entityById(rat) == nullptr, "dead rat should be removed from the entity list");
    expect(g.occupancy().at({3, 2}) == 0, "dead rat should be removed from the spatial index");
    expect(!g.turnQueue().contains(rat), "dead rat should be removed from the turn queue");
    expect(g.killCount() == 1, "kill should be counted");
    expect(g.player().pos == Vec2i{2, 2}, "attacking should not move the player");

    for (int i = 0; i < 5; ++i) {
        (void)g.playerAct(Action::Wait);
        expect(g.turnQueue().front() != rat, "dead entity popped again");
    }
}

void test_monster_chases_and_attacks() {
    Game g = customGame(openRoom(12, 7), {2, 2});
    const int gob = g.spawnMonster(EntityKind::Goblin, {6, 2});
    expect(gob != 0, "spawn goblin");

    for (int i = 0; i < 6; ++i) {
        expect(g.playerAct(Action::Wait) == ActionResult::Acted, "wait should act");
    }

    const Entity* m = g.entityById(gob);
    expect(m != nullptr, "goblin should still exist");
    if (m) {
        expect(m->alerted, "goblin should have noticed the player");
        expect(chebyshev(m->pos, g.player().pos) == 1, "goblin should have closed in");
    }
    expect(g.player().hp < g.player().hpMax, "goblin should have hit the player");
    expect(g.turnQueue().front() == g.playerId(), "control returns to the player after monsters act");
}

void test_player_death_ends_run() {
    Game g = customGame(openRoom(9, 5), {2, 2});
    expect(g.spawnMonster(EntityKind::Troll, {3, 2}) != 0, "spawn troll");

    for (int i = 0; i < 200 && !g.isFinished(); ++i) {
        (void)g.playerAct(Action::Wait);
    }
    expect(g.isFinished(), "troll should kill a passive player");
    expect(!g.turnQueue().contains(g.playerId()), "dead player should leave the queue");
    expect(g.occupancy().at(g.player().pos) == 0, "dead player should leave the spatial index");

    const uint32_t turns = g.turnCount();
    expect(g.playerAct(Action::Wait) == ActionResult::NoOp, "no actions after death");
    expect(g.turnCount() == turns, "turn count frozen after death");

    ScriptedInput in({Action::Wait});
    expect(!g.runTurn(in), "runTurn should stop once the run is over");
    expect(in.consumed() == 0, "no input should be read after death");
}

void test_run_loop_uses_input() {
    Game g = customGame(openRoom(9, 5), {2, 2});
    ScriptedInput in({Action::Up, Action::Up, Action::Right, Action::Wait, Action::Quit, Action::Wait});
    const int turns = g.run(in);
    expect(turns == 3, "run should count only spent turns (got " + std::to_string(turns) + ")");
    expect(in.consumed() == 5, "run should stop at Quit");
    expect(g.turnCount() == 3, "three turns spent");
}

void test_descend_keeps_stats() {
    Dungeon d = openRoom(9, 5);
    d.at(4, 2).type = TileType::StairsDown;
    Game g = customGame(d, {3, 2});
    g.setConfig(smallConfig());

    expect(g.playerAct(Action::Right) == ActionResult::Acted, "step onto the stairs");
    const int hp = g.player().hp;
    expect(g.playerAct(Action::Interact) == ActionResult::Acted, "descend");
    expect(g.depth() == 2, "depth should increase");
    expect(g.player().hp == hp, "player keeps hp across levels");
    expect(g.player().pos == g.dungeon().entry, "player arrives at the new entry");
    expect(g.dungeon().width == 40 && g.dungeon().height == 25, "new level uses the configured size");
    expect(g.occupancy().at(g.player().pos) == g.playerId(), "player indexed on the new level");
}

void test_message_log_coalesces() {
    Game g;
    g.pushMsg("HELLO.");
    g.pushMsg("HELLO.");
    g.pushMsg("WORLD.");
    expect(g.messages().size() == 2, "duplicate messages should coalesce");
    expect(g.messages().front().repeat == 2, "coalesced message should count repeats");
}

void test_save_load_roundtrip() {
    const std::string path = tempPath("delve_test_roundtrip.dat");

    Game a(smallConfig());
    std::string err;
    expect(a.newGame(1234u, &err), "newGame failed: " + err);
    for (int i = 0; i < 5; ++i) (void)a.playerAct(Action::Wait);
    expect(a.saveToFile(path, &err), "save failed: " + err);

    Game b(smallConfig());
    expect(b.loadFromFile(path, &err), "load failed: " + err);
    expect(b.stateHash() == a.stateHash(), "loaded state hash differs");
    expect(b.turnCount() == a.turnCount() && b.depth() == a.depth(), "loaded counters differ");
    expect(b.entities().size() == a.entities().size(), "loaded entity count differs");

    // The restored session continues identically.
    const Action script[] = {Action::Wait, Action::Right, Action::Down, Action::Wait, Action::Left};
    for (Action act : script) {
        (void)a.playerAct(act);
        (void)b.playerAct(act);
    }
    expect(b.stateHash() == a.stateHash(), "sessions diverged after load");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

void test_load_failure_leaves_session() {
    const std::string path = tempPath("delve_test_corrupt.dat");

    Game src(smallConfig());
    expect(src.newGame(55u), "newGame (src)");
    expect(src.saveToFile(path), "save (src)");
    const std::vector<uint8_t> good = readBytes(path);
    expect(good.size() > 64, "save file unexpectedly small");

    Game g(smallConfig());
    expect(g.newGame(66u), "newGame (g)");
    (void)g.playerAct(Action::Wait);
    const uint64_t before = g.stateHash();
    std::string err;

    // Flipped byte in the payload.
    std::vector<uint8_t> bad = good;
    bad[bad.size() / 2] ^= 0x5Au;
    writeBytes(path, bad);
    expect(!g.loadFromFile(path, &err), "corrupted save should fail");
    expect(!err.empty(), "corrupted save should report a reason");
    expect(g.stateHash() == before, "failed load changed the session (corrupt)");

    // Truncated file.
    bad.assign(good.begin(), good.begin() + static_cast<std::ptrdiff_t>(good.size() / 2));
    writeBytes(path, bad);
    expect(!g.loadFromFile(path, &err), "truncated save should fail");
    expect(g.stateHash() == before, "failed load changed the session (truncated)");

    // Wrong magic.
    writeBytes(path, std::vector<uint8_t>{'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd', '!'});
    expect(!g.loadFromFile(path, &err), "garbage file should fail");
    expect(g.stateHash() == before, "failed load changed the session (garbage)");

    std::error_code ec;
    std::filesystem::remove(path, ec);
    expect(!g.loadFromFile(path, &err), "missing file should fail");
    expect(g.stateHash() == before, "failed load changed the session (missing)");

    // The good file still loads.
    writeBytes(path, good);
    expect(g.loadFromFile(path, &err), "intact save should load: " + err);
    expect(g.stateHash() == src.stateHash(), "intact save restores the saved state");
    std::filesystem::remove(path, ec);
}

void test_load_rejects_inconsistent_content() {
    const std::string path = tempPath("delve_test_content.dat");

    // Player at (2,2), rat at (5,2) on a 9x5 room.
    Game src = customGame(openRoom(9, 5), {2, 2});
    const int rat = src.spawnMonster(EntityKind::Rat, {5, 2});
    expect(rat != 0, "spawn rat");
    expect(src.saveToFile(path), "save (content)");
    const std::vector<uint8_t> good = readBytes(path);

    const size_t player = saveEntityOffset(good, 0);
    const size_t monster = saveEntityOffset(good, 1);
    expect(getU32(good, player + ENT_ID) == static_cast<uint32_t>(src.playerId()), "layout: player id");
    expect(getU32(good, monster + ENT_ID) == static_cast<uint32_t>(rat), "layout: rat id");
    expect(getU32(good, monster + ENT_X) == 5u, "layout: rat position");

    Game g(smallConfig());
    expect(g.newGame(77u), "newGame (content)");
    const uint64_t before = g.stateHash();

    auto expectRejected = [&](std::vector<uint8_t> bytes, const std::string& reason, const std::string& what) {
        resealSave(bytes);
        writeBytes(path, bytes);
        std::string err;
        expect(!g.loadFromFile(path, &err), what + " should fail to load");
        expect(err.find(reason) != std::string::npos, what + ": unexpected error '" + err + "'");
        expect(g.stateHash() == before, what + " changed the session");
    };

    // A resealed but unedited file still loads.
    {
        std::vector<uint8_t> same = good;
        resealSave(same);
        expect(same == good, "resealing an intact save should be a no-op");
    }

    std::vector<uint8_t> b = good;
    putU32(b, player + ENT_X, 0u);
    expectRejected(b, "blocked tile", "player on a wall");

    b = good;
    b[player + ENT_KIND] = static_cast<uint8_t>(EntityKind::Rat);
    expectRejected(b, "no player", "player kind changed");

    b = good;
    putU32(b, monster + ENT_HP, 0u);
    expectRejected(b, "dead monster", "dead monster still scheduled");

    b = good;
    putU32(b, monster + ENT_X, 2u);
    expectRejected(b, "overlapping", "two entities on one tile");

    b = good;
    putU32(b, monster + ENT_ID, getU32(good, SAVE_NEXT_ENTITY));
    expectRejected(b, "entity ids", "entity id at the id counter");

    b = good;
    putU32(b, SAVE_SLOTS + SAVE_SLOT_BYTES + 16, 99u);
    expectRejected(b, "unknown entity", "queue slot for an unknown id");

    b = good;
    putU32(b, saveMapOffset(good) + 8, 0u);
    expectRejected(b, "invalid entry", "entry on the border wall");

    b = good;
    putU32(b, SAVE_RNG_STATE, 0u);
    expectRejected(b, "invalid header", "zero rng state");

    b = good;
    putU32(b, monster + ENT_ATK, 0x7FFFFFFFu);
    expectRejected(b, "out-of-range", "huge attack value");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

void test_autosave_interval() {
    const std::string path = tempPath("delve_test_autosave.dat");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    GameConfig cfg;
    cfg.autosaveEveryTurns = 2;
    cfg.autosavePath = path;
    Game g = customGame(openRoom(9, 5), {2, 2}, cfg);

    expect(g.playerAct(Action::Wait) == ActionResult::Acted, "turn 1");
    expect(!fileExists(path), "no autosave after turn 1");
    expect(g.playerAct(Action::Right) == ActionResult::Acted, "turn 2");
    expect(fileExists(path), "autosave after turn 2");

    Game restored;
    std::string err;
    expect(restored.loadFromFile(path, &err), "autosave loads: " + err);
    expect(restored.stateHash() == g.stateHash(), "autosave holds the turn-2 state");

    std::filesystem::remove(path, ec);
    (void)g.playerAct(Action::Wait);
    expect(!fileExists(path), "no autosave after turn 3");
    (void)g.playerAct(Action::Wait);
    expect(fileExists(path), "autosave after turn 4");

    // Every turn autosaves until the player dies; the fatal turn does not.
    cfg.autosaveEveryTurns = 1;
    Game doomed = customGame(openRoom(9, 5), {2, 2}, cfg);
    expect(doomed.spawnMonster(EntityKind::Troll, {3, 2}) != 0, "spawn troll");
    for (int i = 0; i < 200 && !doomed.isFinished(); ++i) {
        std::filesystem::remove(path, ec);
        (void)doomed.playerAct(Action::Wait);
        if (doomed.isFinished()) {
            expect(!fileExists(path), "no autosave once the run is over");
        } else {
            expect(fileExists(path), "autosave every turn while alive");
        }
    }
    expect(doomed.isFinished(), "troll should end the run");

    std::filesystem::remove(path, ec);
}

void test_blocked_monster_waits() {
    // One-tile corridor: player, goblin, orc in a row.
    Dungeon d(12, 5);
    for (int x = 1; x <= 10; ++x) d.at(x, 2).type = TileType::Floor;
    d.rooms.push_back({1, 2, 10, 1});
    Game g = customGame(d, {1, 2});

    const int gob = g.spawnMonster(EntityKind::Goblin, {2, 2});
    const int orc = g.spawnMonster(EntityKind::Orc, {3, 2});
    expect(gob != 0 && orc != 0, "spawn corridor monsters");

    for (int i = 0; i < 4; ++i) {
        expect(g.playerAct(Action::Wait) == ActionResult::Acted, "wait in corridor");
        const Entity* o = g.entityById(orc);
        expect(o != nullptr && o->pos == Vec2i{3, 2}, "blocked orc should hold its tile, not back off");
    }
    const Entity* o = g.entityById(orc);
    expect(o != nullptr && o->alerted, "orc should still be hunting");
    expect(g.player().hp < g.player().hpMax, "goblin in front should be attacking");
}

void test_welcome_uses_player_name() {
    GameConfig cfg = smallConfig();
    cfg.playerName = "Rogue";
    Game g(cfg);
    expect(g.newGame(31u), "newGame (name)");
    expect(!g.messages().empty() && g.messages().front().text.find("ROGUE") != std::string::npos,
           "welcome message should greet the player by name");
}

void test_settings_parse_and_clamp() {
    const std::string path = tempPath("delve_test_settings.ini");
    {
        std::ofstream f(path);
        f << "# comment line\n"
          << "map_width = 9999\n"
          << "MAP_HEIGHT=30 ; trailing comment\n"
          << "fov_radius = abc\n"
          << "monsters_per_room = -4\n"
          << "vsync = off\n"
          << "seed = 42\n"
          << "player_name = Rogue\n"
          << "no_such_key = 1\n"
          << "this line has no equals sign\n";
    }

    Settings s = loadSettings(path);
    expect(s.mapWidth == 250, "map_width should clamp to 250");
    expect(s.mapHeight == 30, "keys are case-insensitive and comments stripped");
    expect(s.fovRadius == 8, "invalid fov_radius keeps the default");
    expect(s.monstersPerRoom == 0, "monsters_per_room should clamp to 0");
    expect(!s.vsync, "vsync = off");
    expect(s.seed == 42u, "seed parsed");
    expect(s.playerName == "Rogue", "player_name parsed");

    expect(updateIniKey(path, "fov_radius", "5"), "updateIniKey existing key");
    expect(updateIniKey(path, "max_gen_retries", "3"), "updateIniKey new key");
    s = loadSettings(path);
    expect(s.fovRadius == 5, "updated key read back");
    expect(s.maxGenRetries == 3, "appended key read back");

    const GameConfig cfg = gameConfigFrom(s);
    expect(cfg.gen.width == 250 && cfg.gen.height == 30 && cfg.gen.maxRetries == 3, "config carries generation settings");
    expect(cfg.fovRadius == 5 && cfg.monstersPerRoom == 0, "config carries gameplay settings");
    expect(cfg.playerName == "Rogue", "config carries the player name");

    expect(writeDefaultSettings(path), "write default settings");
    const Settings d = loadSettings(path);
    const Settings defaults;
    expect(d.mapWidth == defaults.mapWidth && d.fovRadius == defaults.fovRadius, "default file matches defaults");

    const Settings missing = loadSettings(tempPath("delve_no_such_settings.ini"));
    expect(missing.mapWidth == defaults.mapWidth, "missing file yields defaults");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

void test_action_names() {
    expect(parseActionName(" Up_Left ") == Action::UpLeft, "action names are trimmed and case-insensitive");
    expect(parseActionName("interact") == Action::Interact, "interact parses");
    expect(!parseActionName("fly").has_value(), "unknown action rejected");
    expect(actionDelta(Action::DownLeft) == Vec2i{-1, 1}, "down_left delta");
}

void test_replay_record_and_verify() {
    const std::string path = tempPath("delve_test_replay.drr");
    const GameConfig cfg = smallConfig();

    Game g(cfg);
    std::string err;
    expect(g.newGame(4242u, &err), "newGame failed: " + err);

    ScriptedInput script({Action::Wait, Action::Right, Action::Right, Action::Down, Action::Wait,
                          Action::Left, Action::Up, Action::UpRight, Action::Wait, Action::Wait});
    ReplayWriter writer;
    expect(writer.open(path, replayMetaFor(cfg, g.seed()), &err), "open replay writer: " + err);
    RecordingInput rec(script, writer);
    (void)g.run(rec);
    rec.finish(g);
    writer.close();

    ReplayFile rf;
    expect(loadReplayFile(path, rf, &err), "load replay: " + err);
    expect(rf.meta.seed == 4242u, "replay seed");
    expect(rf.meta.mapWidth == 40 && rf.meta.mapHeight == 25, "replay map size");

    int checkpoints = 0;
    for (const auto& ev : rf.events) {
        if (ev.kind == ReplayEventType::StateHash) ++checkpoints;
    }
    expect(checkpoints == static_cast<int>(g.turnCount()), "one checkpoint per spent turn");

    Game r;
    expect(prepareGameForReplay(r, rf, &err), "prepare replay: " + err);
    ReplayRunStats st;
    expect(runReplayHeadless(r, rf, {}, &st, &err), "replay verification failed: " + err);
    expect(r.stateHash() == g.stateHash(), "replay should reproduce the final state");
    expect(st.checkpointsVerified == static_cast<uint32_t>(checkpoints), "all checkpoints verified");

    // A tampered checkpoint is reported as a desync.
    ReplayFile tampered = rf;
    for (auto& ev : tampered.events) {
        if (ev.kind == ReplayEventType::StateHash) { ev.hash ^= 1u; break; }
    }
    Game t;
    expect(prepareGameForReplay(t, tampered, &err), "prepare tampered replay");
    expect(!runReplayHeadless(t, tampered, {}, &st, &err), "tampered replay should fail");
    expect(st.failure == ReplayFailureKind::HashMismatch, "tampered replay should be a hash mismatch");

    // Header without the magic line is rejected.
    {
        std::ofstream f(path, std::ios::trunc);
        f << "@seed 5\n@end_header\nA 9\n";
    }
    expect(!loadReplayFile(path, rf, &err), "replay without magic header should fail");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace

int main() {
    std::cout << "Running Delve tests...\n";

    test_rng_reproducible();

    test_generation_connected_many_seeds();
    test_generation_deterministic();
    test_generation_no_degenerate_rooms();
    test_generation_fails_after_retries();
    test_game_reports_generation_failure();

    test_fov_symmetric();
    test_fov_visible_resets_explored_persists();
    test_fov_walls_and_doors_block();

    test_occupancy_grid();
    test_turn_queue_fifo_ties();
    test_turn_queue_remove_and_speed();

    test_rejected_move_keeps_turn();
    test_corner_cutting_rejected();
    test_doors_open_on_bump();
    test_bump_kill_cleans_up();
    test_monster_chases_and_attacks();
    test_player_death_ends_run();
    test_run_loop_uses_input();
    test_descend_keeps_stats();
    test_message_log_coalesces();

    test_save_load_roundtrip();
    test_load_failure_leaves_session();
    test_load_rejects_inconsistent_content();
    test_autosave_interval();
    test_blocked_monster_waits();
    test_welcome_uses_player_name();
    test_settings_parse_and_clamp();
    test_action_names();
    test_replay_record_and_verify();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
