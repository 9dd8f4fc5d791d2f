#pragma once

#include "actions.hpp"

#include <cstddef>
#include <utility>
#include <vector>

class Game;

// Source of player commands for the turn scheduler.
//
// nextAction() is called only when the player is at the front of the turn
// queue and may block until a command arrives. Returning Action::None means
// the source is closed (window shut, script exhausted).
class InputSource {
public:
    virtual ~InputSource() = default;
    virtual Action nextAction(const Game& game) = 0;
};

// Feeds a fixed list of actions. Used by tests, replays and the headless runner.
class ScriptedInput : public InputSource {
public:
    ScriptedInput() = default;
    explicit ScriptedInput(std::vector<Action> actions) : actions_(std::move(actions)) {}

    void push(Action a) { actions_.push_back(a); }

    Action nextAction(const Game&) override {
        if (cursor_ >= actions_.size()) return Action::None;
        return actions_[cursor_++];
    }

    size_t consumed() const { return cursor_; }
    bool exhausted() const { return cursor_ >= actions_.size(); }

private:
    std::vector<Action> actions_;
    size_t cursor_ = 0;
};

// Read-only view consumer (SDL front end, text dumps).
class RenderSurface {
public:
    virtual ~RenderSurface() = default;
    virtual void draw(const Game& game) = 0;
};
