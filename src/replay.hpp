#pragma once

#include "common.hpp"
#include "game.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Replay recording + playback
// ------------------------------------------------------------
//
// Line-based text format. Actions are recorded (not raw keys), so replays
// survive keybind changes. The header carries the settings that shape the
// simulation.
//
//   @delve_replay 1
//   @game_version 0.1.0
//   @seed 123456
//   @map_width 80
//   @map_height 45
//   @max_gen_retries 8
//   @fov_radius 8
//   @monsters_per_room 2
//   @end_header
//
//   A <action_id>
//   H <turn> <hash64hex>

enum class ReplayEventType : uint8_t {
    Action = 0,
    StateHash, // deterministic state hash after a turn
};

struct ReplayMeta {
    int formatVersion = 1;
    std::string gameVersion;
    uint32_t seed = 0;

    int mapWidth = 80;
    int mapHeight = 45;
    int maxGenRetries = 8;
    int fovRadius = 8;
    int monstersPerRoom = 2;
};

struct ReplayEvent {
    ReplayEventType kind = ReplayEventType::Action;
    Action action = Action::None;

    // StateHash only
    uint32_t turn = 0;
    uint64_t hash = 0;
};

struct ReplayFile {
    ReplayMeta meta;
    std::vector<ReplayEvent> events;
};

// Snapshot of the simulation-relevant parts of a session config.
ReplayMeta replayMetaFor(const GameConfig& cfg, uint32_t seed);
GameConfig gameConfigFromReplay(const ReplayMeta& meta);

// ------------------------------------------------------------
// Writer (streaming)
// ------------------------------------------------------------
class ReplayWriter {
public:
    bool open(const std::filesystem::path& path, const ReplayMeta& meta, std::string* err = nullptr);
    void close();
    bool isOpen() const { return f_.is_open(); }
    std::filesystem::path path() const { return path_; }

    void writeAction(Action a);
    void writeStateHash(uint32_t turn, uint64_t hash);

private:
    void writeLine_(const std::string& line);

    std::filesystem::path path_;
    std::ofstream f_;
};

// Records every command pulled from `inner`, plus a state hash checkpoint each
// time a turn has been spent. Call finish() after the run to flush the last one.
class RecordingInput : public InputSource {
public:
    RecordingInput(InputSource& inner, ReplayWriter& writer) : inner_(inner), writer_(writer) {}

    Action nextAction(const Game& game) override;
    void finish(const Game& game);

private:
    void checkpoint(const Game& game);

    InputSource& inner_;
    ReplayWriter& writer_;
    uint32_t lastTurn_ = 0;
};

// ------------------------------------------------------------
// Reader (loads all events)
// ------------------------------------------------------------
bool loadReplayFile(const std::filesystem::path& path, ReplayFile& out, std::string* err = nullptr);
