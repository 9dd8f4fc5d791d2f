#include "replay.hpp"

#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    const size_t n = std::char_traits<char>::length(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
}

std::optional<int> parseInt(const std::string& s) {
    try {
        size_t idx = 0;
        int v = std::stoi(s, &idx, 10);
        if (idx != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<uint32_t> parseU32(const std::string& s) {
    if (!s.empty() && s[0] == '-') return std::nullopt;
    try {
        size_t idx = 0;
        unsigned long long v = std::stoull(s, &idx, 10);
        if (idx != s.size()) return std::nullopt;
        if (v > 0xFFFFFFFFull) return std::nullopt;
        return static_cast<uint32_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<uint64_t> parseHex64(const std::string& s) {
    try {
        size_t idx = 0;
        unsigned long long v = std::stoull(s, &idx, 16);
        if (idx != s.size()) return std::nullopt;
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

} // namespace

ReplayMeta replayMetaFor(const GameConfig& cfg, uint32_t seed) {
    ReplayMeta m;
    m.seed = seed;
    m.mapWidth = cfg.gen.width;
    m.mapHeight = cfg.gen.height;
    m.maxGenRetries = cfg.gen.maxRetries;
    m.fovRadius = cfg.fovRadius;
    m.monstersPerRoom = cfg.monstersPerRoom;
    return m;
}

GameConfig gameConfigFromReplay(const ReplayMeta& meta) {
    GameConfig cfg;
    cfg.gen.width = meta.mapWidth;
    cfg.gen.height = meta.mapHeight;
    cfg.gen.maxRetries = meta.maxGenRetries;
    cfg.fovRadius = meta.fovRadius;
    cfg.monstersPerRoom = meta.monstersPerRoom;
    // Verification must not touch save files.
    cfg.autosaveEveryTurns = 0;
    return cfg;
}

bool ReplayWriter::open(const std::filesystem::path& path, const ReplayMeta& meta, std::string* err) {
    close();
    path_ = path;
    f_.open(path_, std::ios::out | std::ios::trunc);
    if (!f_) {
        setErr(err, "Failed to open replay for writing: " + path_.string());
        return false;
    }

    f_ << "@delve_replay " << meta.formatVersion << "\n";
    if (!meta.gameVersion.empty()) {
        f_ << "@game_version " << meta.gameVersion << "\n";
    }
    f_ << "@seed " << meta.seed << "\n";
    f_ << "@map_width " << meta.mapWidth << "\n";
    f_ << "@map_height " << meta.mapHeight << "\n";
    f_ << "@max_gen_retries " << meta.maxGenRetries << "\n";
    f_ << "@fov_radius " << meta.fovRadius << "\n";
    f_ << "@monsters_per_room " << meta.monstersPerRoom << "\n";
    f_ << "@end_header\n";
    f_.flush();

    return true;
}

void ReplayWriter::close() {
    if (f_.is_open()) {
        f_.flush();
        f_.close();
    }
    path_.clear();
}

void ReplayWriter::writeLine_(const std::string& line) {
    if (!f_.is_open()) return;
    f_ << line << "\n";
}

void ReplayWriter::writeAction(Action a) {
    writeLine_("A " + std::to_string(static_cast<int>(a)));
}

void ReplayWriter::writeStateHash(uint32_t turn, uint64_t hash) {
    std::ostringstream ss;
    ss << "H " << turn << " ";
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    writeLine_(ss.str());
}

void RecordingInput::checkpoint(const Game& game) {
    if (game.turnCount() == lastTurn_) return;
    lastTurn_ = game.turnCount();
    writer_.writeStateHash(lastTurn_, game.stateHash());
}

Action RecordingInput::nextAction(const Game& game) {
    checkpoint(game);
    const Action a = inner_.nextAction(game);
    if (a != Action::None) writer_.writeAction(a);
    return a;
}

void RecordingInput::finish(const Game& game) {
    checkpoint(game);
}

bool loadReplayFile(const std::filesystem::path& path, ReplayFile& out, std::string* err) {
    out = ReplayFile{};

    std::ifstream f(path);
    if (!f) {
        setErr(err, "Failed to open replay for reading: " + path.string());
        return false;
    }

    bool sawMagic = false;
    bool inHeader = true;
    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty()) continue;
        if (line[0] == '#') continue;

        if (inHeader) {
            if (line == "@end_header") {
                inHeader = false;
                continue;
            }

            if (!startsWith(line, "@")) {
                setErr(err, "Replay parse error (expected header @key): line " + std::to_string(lineNo));
                return false;
            }

            // Header line: @key value
            std::istringstream iss(line);
            std::string key;
            iss >> key;
            std::string value;
            std::getline(iss, value);
            value = trim(value);

            if (key == "@delve_replay") {
                auto v = parseInt(value);
                if (!v.has_value() || *v <= 0) {
                    setErr(err, "Replay parse error (bad format version) line " + std::to_string(lineNo));
                    return false;
                }
                if (*v > 1) {
                    setErr(err, "Replay format version " + value + " is newer than this build");
                    return false;
                }
                out.meta.formatVersion = *v;
                sawMagic = true;
                continue;
            }
            if (key == "@game_version") {
                out.meta.gameVersion = value;
                continue;
            }
            if (key == "@seed") {
                auto v = parseU32(value);
                if (!v.has_value()) {
                    setErr(err, "Replay parse error (bad seed) line " + std::to_string(lineNo));
                    return false;
                }
                out.meta.seed = *v;
                continue;
            }

            int* intField = nullptr;
            if (key == "@map_width") intField = &out.meta.mapWidth;
            else if (key == "@map_height") intField = &out.meta.mapHeight;
            else if (key == "@max_gen_retries") intField = &out.meta.maxGenRetries;
            else if (key == "@fov_radius") intField = &out.meta.fovRadius;
            else if (key == "@monsters_per_room") intField = &out.meta.monstersPerRoom;

            if (intField) {
                auto v = parseInt(value);
                if (!v.has_value()) {
                    setErr(err, "Replay parse error (bad " + key.substr(1) + ") line " + std::to_string(lineNo));
                    return false;
                }
                *intField = *v;
            }

            // Unknown header keys are ignored for forward compat.
            continue;
        }

        std::istringstream iss(line);
        std::string code;
        iss >> code;

        ReplayEvent ev;

        if (code == "A") {
            int ai = 0;
            if (!(iss >> ai)) {
                setErr(err, "Replay parse error (bad action) line " + std::to_string(lineNo));
                return false;
            }
            if (ai <= 0 || ai >= ACTION_COUNT) {
                setErr(err, "Replay parse error (action out of range) line " + std::to_string(lineNo));
                return false;
            }
            ev.kind = ReplayEventType::Action;
            ev.action = static_cast<Action>(static_cast<uint8_t>(ai));
            out.events.push_back(ev);
            continue;
        }
        if (code == "H") {
            std::string turnStr;
            std::string hex;
            if (!(iss >> turnStr >> hex)) {
                setErr(err, "Replay parse error (bad state hash payload) line " + std::to_string(lineNo));
                return false;
            }
            auto turn = parseU32(turnStr);
            auto hv = parseHex64(hex);
            if (!turn.has_value() || !hv.has_value()) {
                setErr(err, "Replay parse error (bad state hash) line " + std::to_string(lineNo));
                return false;
            }
            ev.kind = ReplayEventType::StateHash;
            ev.turn = *turn;
            ev.hash = *hv;
            out.events.push_back(ev);
            continue;
        }

        // Unknown event codes are ignored for forward compat.
    }

    if (!sawMagic) {
        setErr(err, "Not a replay file (missing @delve_replay header)");
        return false;
    }
    if (inHeader) {
        setErr(err, "Replay parse error (missing @end_header)");
        return false;
    }
    return true;
}
