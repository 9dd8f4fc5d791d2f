#pragma once

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class Action : uint8_t {
    None = 0,

    // Movement
    Up,
    Down,
    Left,
    Right,
    UpLeft,
    UpRight,
    DownLeft,
    DownRight,

    Wait,
    Interact,   // open an adjacent door / take the stairs down

    Save,
    Quit,
};

constexpr int ACTION_COUNT = 13;

// What a player command did to the schedule.
enum class ActionResult : uint8_t {
    Acted = 0,   // a turn was spent; the queue advanced
    Rejected,    // invalid command; no turn spent, queue untouched
    NoOp,        // handled without spending a turn (save, input while finished)
    Quit,
};

inline bool isMoveAction(Action a) {
    return a >= Action::Up && a <= Action::DownRight;
}

inline Vec2i actionDelta(Action a) {
    switch (a) {
        case Action::Up:        return {0, -1};
        case Action::Down:      return {0, 1};
        case Action::Left:      return {-1, 0};
        case Action::Right:     return {1, 0};
        case Action::UpLeft:    return {-1, -1};
        case Action::UpRight:   return {1, -1};
        case Action::DownLeft:  return {-1, 1};
        case Action::DownRight: return {1, 1};
        default:                return {0, 0};
    }
}

// Stable tokens used by key bindings (bind_<name>) and replay files.
inline const char* actionName(Action a) {
    switch (a) {
        case Action::Up:        return "up";
        case Action::Down:      return "down";
        case Action::Left:      return "left";
        case Action::Right:     return "right";
        case Action::UpLeft:    return "up_left";
        case Action::UpRight:   return "up_right";
        case Action::DownLeft:  return "down_left";
        case Action::DownRight: return "down_right";
        case Action::Wait:      return "wait";
        case Action::Interact:  return "interact";
        case Action::Save:      return "save";
        case Action::Quit:      return "quit";
        default:                return "none";
    }
}

inline std::optional<Action> parseActionName(const std::string& name) {
    const std::string n = toLower(trim(name));
    for (int i = 1; i < ACTION_COUNT; ++i) {
        const Action a = static_cast<Action>(i);
        if (n == actionName(a)) return a;
    }
    return std::nullopt;
}
