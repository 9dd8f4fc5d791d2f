#pragma once

#include "sdl.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <utility>

#include "game.hpp"

// Configurable keybindings loaded from the settings file.
//
// The binding format is:
//   bind_<action> = key[, key, ...]
//
// Each key can be:
//   - a single character: k, ., g
//   - a named key: up, down, left, right, enter, escape, f5, kp_8, ...
// Modifiers can be prefixed with: shift+, ctrl+, alt+  (example: shift+period)
//
// Bindings are (keycode + required modifiers). Extra modifiers do NOT match.

struct KeyChord {
    SDL_Keycode key = SDLK_UNKNOWN;
    Uint16 mods = KMOD_NONE; // only SHIFT/CTRL/ALT bits are used
};

struct ActionHash {
    size_t operator()(Action a) const noexcept { return static_cast<size_t>(a); }
};

class KeyBinds {
public:
    static KeyBinds defaults();
    void loadOverridesFromIni(const std::string& settingsPath);

    Action mapKey(SDL_Keycode key, Uint16 mods) const;

    std::string describeAction(Action a) const;

private:
    std::unordered_map<Action, std::vector<KeyChord>, ActionHash> binds;

    static Uint16 normalizeMods(Uint16 mods);
    static bool chordMatches(const KeyChord& chord, SDL_Keycode key, Uint16 mods);

    static std::optional<Action> parseBindKey(const std::string& bindKey);
    static std::vector<KeyChord> parseChordList(const std::string& value);
    static std::vector<std::string> split(const std::string& s, char delim);

    static std::optional<KeyChord> parseChord(const std::string& token);
    static SDL_Keycode parseKeycode(const std::string& keyName);
    static std::string chordToString(const KeyChord& chord);
};

// Blocking keyboard input for the turn scheduler. Waits on the SDL event queue
// until a bound key is pressed; window close maps to Action::None. Redraws the
// surface when the window is exposed while waiting.
class SdlInput : public InputSource {
public:
    SdlInput(const KeyBinds& binds, RenderSurface* surface) : binds_(binds), surface_(surface) {}

    Action nextAction(const Game& game) override;

private:
    const KeyBinds& binds_;
    RenderSurface* surface_ = nullptr;
};
