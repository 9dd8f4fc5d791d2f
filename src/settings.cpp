#include "settings.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    size_t used = 0;
    try {
        out = std::stoi(s, &used, 10);
    } catch (const std::exception&) {
        return false;
    }
    // Reject trailing junk like "12abc".
    return used == s.size();
}

bool parseU32(const std::string& v, uint32_t& out) {
    const std::string s = trim(v);
    if (s.empty() || s[0] == '-') return false;
    size_t used = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(s, &used, 0);
    } catch (const std::exception&) {
        return false;
    }
    if (used != s.size() || n > 0xFFFFFFFFull) return false;
    out = static_cast<uint32_t>(n);
    return true;
}

std::string stripComment(const std::string& line) {
    const auto hash = line.find('#');
    const auto semi = line.find(';');
    const size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                                semi == std::string::npos ? line.size() : semi);
    return line.substr(0, cut);
}

} // namespace

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        line = trim(stripComment(line));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        if (key == "map_width") {
            int v = 0;
            if (parseInt(val, v)) s.mapWidth = std::clamp(v, 20, 250);
        } else if (key == "map_height") {
            int v = 0;
            if (parseInt(val, v)) s.mapHeight = std::clamp(v, 15, 150);
        } else if (key == "fov_radius") {
            int v = 0;
            if (parseInt(val, v)) s.fovRadius = std::clamp(v, 0, 40);
        } else if (key == "monsters_per_room") {
            int v = 0;
            if (parseInt(val, v)) s.monstersPerRoom = std::clamp(v, 0, 8);
        } else if (key == "max_gen_retries") {
            int v = 0;
            if (parseInt(val, v)) s.maxGenRetries = std::clamp(v, 1, 64);
        } else if (key == "autosave_every_turns") {
            int v = 0;
            if (parseInt(val, v)) s.autosaveEveryTurns = std::clamp(v, 0, 5000);
        } else if (key == "tile_size") {
            int v = 0;
            if (parseInt(val, v)) s.tileSize = std::clamp(v, 4, 64);
        } else if (key == "vsync") {
            bool b = true;
            if (parseBool(val, b)) s.vsync = b;
        } else if (key == "player_name") {
            if (!val.empty()) s.playerName = val.substr(0, 24);
        } else if (key == "seed") {
            uint32_t v = 0;
            if (parseU32(val, v)) s.seed = v;
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# Delve settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# Level generation
# map_width: 20..250, map_height: 15..150
map_width = 80
map_height = 45
# max_gen_retries: 1..64 (attempts before a level is reported as unbuildable)
max_gen_retries = 8

# Gameplay
# fov_radius: 0 = unlimited, otherwise 1..40
fov_radius = 8
# monsters_per_room: 0..8 (upper bound, rolled per room)
monsters_per_room = 2

# Autosave
# autosave_every_turns: 0 disables; otherwise saves an autosave file every N turns.
autosave_every_turns = 0

# Rendering
tile_size = 16
vsync = true

player_name = PLAYER

# seed: 0 picks a seed from the clock
seed = 0

# -----------------------------------------------------------------------------
# Keybindings
#
# Rebind keys by adding entries of the form:
#   bind_<action> = key[, key, ...]
#
# Modifiers: shift, ctrl, alt. Example: shift+period
# Set a binding to "none" to disable it.
# -----------------------------------------------------------------------------

# Movement
bind_up = k, up, kp_8
bind_down = j, down, kp_2
bind_left = h, left, kp_4
bind_right = l, right, kp_6
bind_up_left = y, kp_7
bind_up_right = u, kp_9
bind_down_left = b, kp_1
bind_down_right = n, kp_3

# Actions
bind_wait = period, space, kp_5
bind_interact = g, shift+period, enter
bind_save = f5
bind_quit = escape
)INI";

    return static_cast<bool>(f);
}

bool updateIniKey(const std::string& path, const std::string& key, const std::string& value) {
    std::ifstream in(path);
    if (!in) return false;

    std::vector<std::string> lines;
    std::string line;

    const std::string wanted = toLower(trim(key));

    bool found = false;
    while (std::getline(in, line)) {
        // Match on the comment-stripped text but keep other lines verbatim.
        const std::string raw = stripComment(line);

        auto eq = raw.find('=');
        if (eq != std::string::npos) {
            std::string k = trim(raw.substr(0, eq));
            if (!k.empty() && toLower(k) == wanted) {
                lines.push_back(key + " = " + value);
                found = true;
                continue;
            }
        }

        lines.push_back(line);
    }
    in.close();

    if (!found) {
        lines.push_back(key + " = " + value);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;

    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 < lines.size()) out << "\n";
    }
    return static_cast<bool>(out);
}

GameConfig gameConfigFrom(const Settings& s) {
    GameConfig cfg;
    cfg.gen.width = s.mapWidth;
    cfg.gen.height = s.mapHeight;
    cfg.gen.maxRetries = s.maxGenRetries;
    cfg.fovRadius = s.fovRadius;
    cfg.monstersPerRoom = s.monstersPerRoom;
    cfg.autosaveEveryTurns = s.autosaveEveryTurns;
    cfg.playerName = s.playerName;
    return cfg;
}
