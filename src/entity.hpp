#pragma once
#include "common.hpp"

#include <cstdint>

enum class EntityKind : uint8_t {
    Player = 0,
    Rat,
    Goblin,
    Orc,
    Troll,
};

constexpr int ENTITY_KIND_COUNT = 5;

struct EntityStats {
    int hp = 1;
    int atk = 1;
    int def = 0;
    // 100 = normal speed (one action per player turn).
    // Values above 100 act more often; values below 100 act less often.
    int speed = 100;
};

inline EntityStats baseStatsFor(EntityKind k) {
    switch (k) {
        case EntityKind::Player: return {30, 5, 2, 100};
        case EntityKind::Rat:    return {4, 2, 0, 125};
        case EntityKind::Goblin: return {8, 3, 0, 100};
        case EntityKind::Orc:    return {10, 4, 0, 100};
        case EntityKind::Troll:  return {16, 6, 1, 80};
        default:                 return {};
    }
}

inline const char* kindName(EntityKind k) {
    switch (k) {
        case EntityKind::Player: return "PLAYER";
        case EntityKind::Rat:    return "RAT";
        case EntityKind::Goblin: return "GOBLIN";
        case EntityKind::Orc:    return "ORC";
        case EntityKind::Troll:  return "TROLL";
        default:                 return "THING";
    }
}

struct Entity {
    int id = 0;
    EntityKind kind = EntityKind::Goblin;
    Vec2i pos{0,0};

    int hp = 1;
    int hpMax = 1;
    int atk = 1;
    int def = 0;
    int speed = 100;

    bool alerted = false;

    // Last place the player was seen; AI chases this once sight is lost.
    Vec2i lastKnownPlayerPos{-1, -1};

    bool alive() const { return hp > 0; }
    bool isPlayerControlled() const { return kind == EntityKind::Player; }
};

inline Entity makeEntity(int id, EntityKind kind, Vec2i pos) {
    const EntityStats s = baseStatsFor(kind);
    Entity e;
    e.id = id;
    e.kind = kind;
    e.pos = pos;
    e.hp = s.hp;
    e.hpMax = s.hp;
    e.atk = s.atk;
    e.def = s.def;
    e.speed = s.speed;
    return e;
}
