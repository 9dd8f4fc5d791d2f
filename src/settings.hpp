#pragma once

#include <cstdint>
#include <string>

#include "game.hpp"

// Simple user-editable settings file (INI-ish: key = value).
// The SDL front end creates it next to the save file on first run.
struct Settings {
    // Level generation
    int mapWidth = 80;
    int mapHeight = 45;
    int maxGenRetries = 8;

    // Gameplay
    int fovRadius = 8;        // 0 = unlimited
    int monstersPerRoom = 2;

    // Autosave (0 = off)
    int autosaveEveryTurns = 0;

    // Rendering (SDL front end only)
    int tileSize = 16;
    bool vsync = true;

    std::string playerName = "PLAYER";

    // 0 = pick a seed from the clock. Overridden by --seed.
    uint32_t seed = 0;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
// Unknown keys are ignored; out-of-range values are clamped.
Settings loadSettings(const std::string& path);

// Update (or append) a single key=value entry in the settings file.
// Returns false if the file could not be read/written.
bool updateIniKey(const std::string& path, const std::string& key, const std::string& value);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);

// Session tunables derived from the settings file.
GameConfig gameConfigFrom(const Settings& s);
