#pragma once
#include "actions.hpp"
#include "common.hpp"
#include "dungeon.hpp"
#include "entity.hpp"
#include "input.hpp"
#include "mapgen.hpp"
#include "occupancy.hpp"
#include "rng.hpp"
#include "turn_queue.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Warning,
    System,
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;
    int repeat = 1;
};

// Session tunables (normally filled from the settings file).
struct GameConfig {
    GenParams gen;
    int fovRadius = 8;          // <= 0 means unlimited
    int monstersPerRoom = 2;    // upper bound per room, rolled per room
    int autosaveEveryTurns = 0; // 0 = off
    std::string savePath = "delve_save.dat";
    std::string autosavePath = "delve_autosave.dat";
    std::string playerName = "PLAYER"; // greeting only
};

class Game {
public:
    Game();
    explicit Game(const GameConfig& cfg);

    const GameConfig& config() const { return cfg_; }
    void setConfig(const GameConfig& cfg) { cfg_ = cfg; }

    // Starts a new run. Generation problems are retried inside the generator;
    // if they persist this returns false and the current session is untouched.
    // seed == 0 picks a time-based seed.
    bool newGame(uint32_t seed, std::string* err = nullptr);

    // Starts a run on a prebuilt level (player at d.entry, no monsters).
    bool startCustomLevel(Dungeon d, uint32_t seed, std::string* err = nullptr);

    // Places a monster and schedules it. Returns its id, or 0 if the tile is
    // not walkable or already occupied.
    int spawnMonster(EntityKind kind, Vec2i pos);

    // Performs one player command. Only an Acted result spends a turn; then the
    // monsters due before the player's next turn act in initiative order.
    ActionResult playerAct(Action a);

    // Runs monsters until the player is at the front of the turn queue, then
    // asks `input` for commands until one spends a turn. Returns false when
    // the input is closed, the player quits, or the run is over.
    bool runTurn(InputSource& input);

    // Runs turns until the input closes, the run ends, or maxTurns turns have
    // been spent (0 = no limit). Draws after every turn when a surface is given.
    int run(InputSource& input, RenderSurface* surface = nullptr, int maxTurns = 0);

    const Dungeon& dungeon() const { return dung; }
    const std::vector<Entity>& entities() const { return ents; }
    const OccupancyGrid& occupancy() const { return occ; }
    const TurnQueue& turnQueue() const { return queue; }
    const std::vector<Message>& messages() const { return msgs; }

    const Entity& player() const;
    int playerId() const { return playerId_; }
    const Entity* entityById(int id) const;
    const Entity* entityAt(Vec2i p) const;

    uint32_t seed() const { return seed_; }
    int depth() const { return depth_; }
    uint32_t turnCount() const { return turnCount_; }
    uint32_t killCount() const { return killCount_; }
    bool isFinished() const { return gameOver_; }
    bool hasSession() const { return playerId_ != 0; }

    // Deterministic 64-bit digest of the simulation state (not the message log).
    uint64_t stateHash() const;

    bool saveToFile(const std::string& path, std::string* err = nullptr) const;
    // All-or-nothing: on any failure the current session is left as it was.
    bool loadFromFile(const std::string& path, std::string* err = nullptr);

    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);

private:
    GameConfig cfg_;

    RNG rng;
    uint32_t seed_ = 0;
    int depth_ = 1;
    uint32_t turnCount_ = 0;
    uint32_t killCount_ = 0;
    uint32_t lastAutosaveTurn_ = 0;
    bool gameOver_ = false;

    int playerId_ = 0;
    int nextEntityId_ = 1;

    Dungeon dung;
    std::vector<Entity> ents; // player is always ents.front() while a session exists
    OccupancyGrid occ;
    TurnQueue queue;

    std::vector<Message> msgs;

    Entity& playerMut();
    Entity* entityByIdMut(int id);

    void resetSession(uint32_t seed);
    void installLevel(Dungeon d, Entity player);
    void spawnMonsters();
    bool descend();

    bool playerMove(Vec2i delta);
    bool playerInteract();
    void endPlayerTurn();

    // Turn scheduler: every queued entity ahead of the player acts once per pop.
    void advanceMonsters();

    // ai.cpp
    void monsterAct(Entity& m);
    bool tryMoveEntity(Entity& e, Vec2i to);

    // combat.cpp
    void attackMelee(Entity& attacker, Entity& defender);
    void cleanupDead();

    void recomputeFov();
    void maybeAutosave();
};
