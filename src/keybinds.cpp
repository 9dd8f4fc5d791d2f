#include "keybinds.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

Uint16 KeyBinds::normalizeMods(Uint16 mods) {
    Uint16 out = KMOD_NONE;
    if (mods & KMOD_SHIFT) out |= KMOD_SHIFT;
    if (mods & KMOD_CTRL) out |= KMOD_CTRL;
    if (mods & KMOD_ALT) out |= KMOD_ALT;
    return out;
}

bool KeyBinds::chordMatches(const KeyChord& chord, SDL_Keycode key, Uint16 mods) {
    return chord.key == key && chord.mods == normalizeMods(mods);
}

std::vector<std::string> KeyBinds::split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, delim)) out.push_back(cur);
    return out;
}

SDL_Keycode KeyBinds::parseKeycode(const std::string& keyNameIn) {
    const std::string keyName = toLower(trim(keyNameIn));
    if (keyName.empty()) return SDLK_UNKNOWN;

    // Single character (letters are treated case-insensitively).
    if (keyName.size() == 1) {
        return static_cast<SDL_Keycode>(static_cast<unsigned char>(keyName[0]));
    }

    if (keyName == "up") return SDLK_UP;
    if (keyName == "down") return SDLK_DOWN;
    if (keyName == "left") return SDLK_LEFT;
    if (keyName == "right") return SDLK_RIGHT;
    if (keyName == "home") return SDLK_HOME;
    if (keyName == "end") return SDLK_END;
    if (keyName == "pageup" || keyName == "pgup") return SDLK_PAGEUP;
    if (keyName == "pagedown" || keyName == "pgdn") return SDLK_PAGEDOWN;

    if (keyName == "enter" || keyName == "return") return SDLK_RETURN;
    if (keyName == "escape" || keyName == "esc") return SDLK_ESCAPE;
    if (keyName == "space") return SDLK_SPACE;
    if (keyName == "tab") return SDLK_TAB;

    if (keyName == "comma") return SDLK_COMMA;
    if (keyName == "period" || keyName == "dot") return SDLK_PERIOD;
    if (keyName == "less") return SDLK_LESS;
    if (keyName == "greater") return SDLK_GREATER;

    if (keyName.size() >= 2 && keyName[0] == 'f' && std::isdigit(static_cast<unsigned char>(keyName[1]))) {
        int n = 0;
        for (size_t i = 1; i < keyName.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(keyName[i]))) { n = 0; break; }
            n = n * 10 + (keyName[i] - '0');
            if (n > 24) break;
        }
        if (n >= 1 && n <= 12) return static_cast<SDL_Keycode>(SDLK_F1 + (n - 1));
    }

    if (keyName == "kp_enter") return SDLK_KP_ENTER;
    if (keyName == "kp_1") return SDLK_KP_1;
    if (keyName == "kp_2") return SDLK_KP_2;
    if (keyName == "kp_3") return SDLK_KP_3;
    if (keyName == "kp_4") return SDLK_KP_4;
    if (keyName == "kp_5") return SDLK_KP_5;
    if (keyName == "kp_6") return SDLK_KP_6;
    if (keyName == "kp_7") return SDLK_KP_7;
    if (keyName == "kp_8") return SDLK_KP_8;
    if (keyName == "kp_9") return SDLK_KP_9;

    // Fallback: SDL's own key names ("Keypad 8", "Left Shift", ...).
    return SDL_GetKeyFromName(keyNameIn.c_str());
}

std::optional<KeyChord> KeyBinds::parseChord(const std::string& tokenIn) {
    const std::string token = trim(tokenIn);
    if (token.empty()) return std::nullopt;

    std::vector<std::string> parts = split(token, '+');
    if (parts.empty()) return std::nullopt;

    Uint16 mods = KMOD_NONE;

    // All parts except the last are modifiers.
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        const std::string m = toLower(trim(parts[i]));
        if (m == "shift") mods |= KMOD_SHIFT;
        else if (m == "ctrl" || m == "control") mods |= KMOD_CTRL;
        else if (m == "alt") mods |= KMOD_ALT;
        else return std::nullopt;
    }

    const SDL_Keycode key = parseKeycode(parts.back());
    if (key == SDLK_UNKNOWN) return std::nullopt;

    KeyChord chord;
    chord.key = key;
    chord.mods = normalizeMods(mods);
    return chord;
}

std::vector<KeyChord> KeyBinds::parseChordList(const std::string& valueIn) {
    const std::string value = trim(valueIn);
    if (value.empty()) return {};
    const std::string vLow = toLower(value);
    if (vLow == "none" || vLow == "unbound" || vLow == "disabled") return {};

    std::vector<KeyChord> out;
    for (const auto& part : split(value, ',')) {
        auto chord = parseChord(part);
        if (chord.has_value()) out.push_back(*chord);
    }
    return out;
}

std::optional<Action> KeyBinds::parseBindKey(const std::string& bindKeyIn) {
    const std::string key = toLower(trim(bindKeyIn));
    if (key.rfind("bind_", 0) != 0) return std::nullopt;
    return parseActionName(key.substr(5));
}

KeyBinds KeyBinds::defaults() {
    KeyBinds kb;

    auto add = [&](Action a, SDL_Keycode key, Uint16 mods = KMOD_NONE) {
        kb.binds[a].push_back({key, normalizeMods(mods)});
    };

    // Movement (vi keys, arrows, keypad)
    add(Action::Up, SDLK_k);
    add(Action::Up, SDLK_UP);
    add(Action::Up, SDLK_KP_8);

    add(Action::Down, SDLK_j);
    add(Action::Down, SDLK_DOWN);
    add(Action::Down, SDLK_KP_2);

    add(Action::Left, SDLK_h);
    add(Action::Left, SDLK_LEFT);
    add(Action::Left, SDLK_KP_4);

    add(Action::Right, SDLK_l);
    add(Action::Right, SDLK_RIGHT);
    add(Action::Right, SDLK_KP_6);

    add(Action::UpLeft, SDLK_y);
    add(Action::UpLeft, SDLK_KP_7);

    add(Action::UpRight, SDLK_u);
    add(Action::UpRight, SDLK_KP_9);

    add(Action::DownLeft, SDLK_b);
    add(Action::DownLeft, SDLK_KP_1);

    add(Action::DownRight, SDLK_n);
    add(Action::DownRight, SDLK_KP_3);

    // Actions
    add(Action::Wait, SDLK_PERIOD);
    add(Action::Wait, SDLK_SPACE);
    add(Action::Wait, SDLK_KP_5);

    add(Action::Interact, SDLK_g);
    add(Action::Interact, SDLK_PERIOD, KMOD_SHIFT);
    add(Action::Interact, SDLK_RETURN);

    add(Action::Save, SDLK_F5);
    add(Action::Quit, SDLK_ESCAPE);

    return kb;
}

void KeyBinds::loadOverridesFromIni(const std::string& settingsPath) {
    std::ifstream in(settingsPath);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        // Strip comments
        auto commentPos = line.find_first_of("#;");
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = trim(line.substr(0, eq));
        const std::string val = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        auto act = parseBindKey(key);
        if (!act.has_value()) continue;

        binds[*act] = parseChordList(val);
    }
}

Action KeyBinds::mapKey(SDL_Keycode key, Uint16 mods) const {
    // Modifiers must match exactly, so "shift+period" and "period" can be bound apart.
    // Actions are checked in enum order: a chord bound twice maps to the lower action.
    for (int i = 1; i < ACTION_COUNT; ++i) {
        const Action a = static_cast<Action>(i);
        auto it = binds.find(a);
        if (it == binds.end()) continue;
        for (const auto& chord : it->second) {
            if (chordMatches(chord, key, mods)) return a;
        }
    }
    return Action::None;
}

std::string KeyBinds::chordToString(const KeyChord& chord) {
    std::string out;
    if (chord.mods & KMOD_CTRL) out += "ctrl+";
    if (chord.mods & KMOD_ALT) out += "alt+";
    if (chord.mods & KMOD_SHIFT) out += "shift+";
    const char* name = SDL_GetKeyName(chord.key);
    out += toLower(name ? name : "?");
    return out;
}

std::string KeyBinds::describeAction(Action a) const {
    auto it = binds.find(a);
    if (it == binds.end() || it->second.empty()) return "unbound";

    std::string out;
    for (const auto& chord : it->second) {
        if (!out.empty()) out += ", ";
        out += chordToString(chord);
    }
    return out;
}

Action SdlInput::nextAction(const Game& game) {
    SDL_Event ev;
    while (SDL_WaitEvent(&ev)) {
        switch (ev.type) {
            case SDL_QUIT:
                return Action::None;
            case SDL_WINDOWEVENT:
                if (surface_ && (ev.window.event == SDL_WINDOWEVENT_EXPOSED
                                 || ev.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)) {
                    surface_->draw(game);
                }
                break;
            case SDL_KEYDOWN: {
                const Action a = binds_.mapKey(ev.key.keysym.sym, static_cast<Uint16>(ev.key.keysym.mod));
                if (a != Action::None) return a;
                break;
            }
            default:
                break;
        }
    }
    // SDL_WaitEvent failed; treat like a closed window.
    return Action::None;
}
