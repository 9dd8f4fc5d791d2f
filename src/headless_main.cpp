#include "replay.hpp"
#include "replay_runner.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n"
        << "  " << argv0 << " --replay <file.drr> [--no-verify-hashes]\n\n"
        << "Options:\n"
        << "  --seed <n>              Run seed (0 or omitted = time based).\n"
        << "  --settings <path>       Settings INI to read (default: none).\n"
        << "  --load <path>           Resume from a save file instead of starting a new run.\n"
        << "  --save <path>           Save the final state to this file.\n"
        << "  --actions <list>        Comma-separated commands (up, down_left, wait, interact, ...).\n"
        << "  --turns <n>             Stop after n spent turns. Without --actions, waits n turns.\n"
        << "  --record <path>         Record the session as a replay file.\n"
        << "  --replay <path>         Verify a replay file and exit.\n"
        << "  --no-verify-hashes      With --replay: do not check state hash checkpoints.\n"
        << "  --print-map             Print an ASCII view of the final state.\n"
        << "  --version               Print version.\n"
        << "  --help                  Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static bool parseActionList(const std::string& list, std::vector<Action>& out, std::string* err) {
    std::stringstream ss(list);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        tok = trim(tok);
        if (tok.empty()) continue;
        auto a = parseActionName(tok);
        if (!a.has_value()) {
            if (err) *err = "unknown action: " + tok;
            return false;
        }
        out.push_back(*a);
    }
    return true;
}

static std::string hex64(uint64_t v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << v;
    return ss.str();
}

// Plain-text view of the known map: visible tiles and visible entities.
class AsciiSurface : public RenderSurface {
public:
    explicit AsciiSurface(std::ostream& out) : out_(out) {}

    void draw(const Game& game) override {
        const Dungeon& d = game.dungeon();
        for (int y = 0; y < d.height; ++y) {
            std::string row;
            row.reserve(static_cast<size_t>(d.width));
            for (int x = 0; x < d.width; ++x) {
                const Tile& t = d.at(x, y);
                char c = ' ';
                if (t.explored) {
                    switch (t.type) {
                        case TileType::Wall:       c = '#'; break;
                        case TileType::Floor:      c = t.visible ? '.' : ','; break;
                        case TileType::DoorClosed: c = '+'; break;
                        case TileType::DoorOpen:   c = '\''; break;
                        case TileType::StairsDown: c = '>'; break;
                    }
                }
                if (t.visible) {
                    if (const Entity* e = game.entityAt({x, y})) {
                        c = e->isPlayerControlled() ? '@' : kindName(e->kind)[0];
                    }
                }
                row.push_back(c);
            }
            out_ << row << "\n";
        }
    }

private:
    std::ostream& out_;
};

static void printSummary(const Game& game) {
    const Entity& p = game.player();
    std::cout << "seed=" << game.seed()
              << " depth=" << game.depth()
              << " turns=" << game.turnCount()
              << " kills=" << game.killCount()
              << " hp=" << p.hp << "/" << p.hpMax
              << " pos=" << p.pos.x << "," << p.pos.y
              << " finished=" << (game.isFinished() ? 1 : 0)
              << " hash=" << hex64(game.stateHash()) << "\n";

    const auto& msgs = game.messages();
    const size_t from = msgs.size() > 5 ? msgs.size() - 5 : 0;
    for (size_t i = from; i < msgs.size(); ++i) {
        std::cout << "  " << msgs[i].text;
        if (msgs[i].repeat > 1) std::cout << " (x" << msgs[i].repeat << ")";
        std::cout << "\n";
    }
}

static int verifyReplay(const std::string& path, bool verifyHashes) {
    ReplayFile rf;
    std::string err;
    if (!loadReplayFile(path, rf, &err)) {
        std::cerr << "Failed to load replay: " << err << "\n";
        return 2;
    }

    Game game;
    if (!prepareGameForReplay(game, rf, &err)) {
        std::cerr << "Failed to start replay: " << err << "\n";
        return 2;
    }

    ReplayRunOptions opt;
    opt.verifyHashes = verifyHashes;
    ReplayRunStats st;
    if (!runReplayHeadless(game, rf, opt, &st, &err)) {
        std::cerr << path << ": FAIL (" << replayFailureKindName(st.failure) << ") " << err << "\n";
        return 1;
    }

    std::cout << path << ": OK (" << st.actionsDispatched << " actions, "
              << st.checkpointsVerified << " checkpoints)\n";
    printSummary(game);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string settingsPath;
    std::string loadPath;
    std::string savePath;
    std::string recordPath;
    std::string replayPath;
    std::string actionList;
    uint32_t seed = 0;
    bool haveSeed = false;
    uint32_t turns = 0;
    bool verifyHashes = true;
    bool printMap = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;

        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (a == "--version") {
            std::cout << DELVE_APPNAME << " " << DELVE_VERSION << "\n";
            return 0;
        }
        if (a == "--no-verify-hashes") { verifyHashes = false; continue; }
        if (a == "--print-map") { printMap = true; continue; }

        const bool takesValue = (a == "--seed" || a == "--settings" || a == "--load" || a == "--save"
                                 || a == "--record" || a == "--replay" || a == "--actions" || a == "--turns");
        if (!takesValue) {
            std::cerr << "Unknown argument: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
        if (!argValue(i, argc, argv, v)) {
            std::cerr << "Missing value for " << a << "\n";
            return 2;
        }

        if (a == "--seed") {
            if (!parseU32(v, seed)) {
                std::cerr << "Invalid --seed value: " << v << "\n";
                return 2;
            }
            haveSeed = true;
        } else if (a == "--turns") {
            if (!parseU32(v, turns)) {
                std::cerr << "Invalid --turns value: " << v << "\n";
                return 2;
            }
        } else if (a == "--settings") {
            settingsPath = v;
        } else if (a == "--load") {
            loadPath = v;
        } else if (a == "--save") {
            savePath = v;
        } else if (a == "--record") {
            recordPath = v;
        } else if (a == "--replay") {
            replayPath = v;
        } else if (a == "--actions") {
            actionList = v;
        }
    }

    if (!replayPath.empty()) {
        return verifyReplay(replayPath, verifyHashes);
    }

    Settings settings;
    if (!settingsPath.empty()) settings = loadSettings(settingsPath);
    if (!haveSeed) seed = settings.seed;

    GameConfig cfg = gameConfigFrom(settings);
    if (!savePath.empty()) cfg.savePath = savePath;
    Game game(cfg);

    std::string err;
    if (!loadPath.empty()) {
        if (!recordPath.empty()) {
            std::cerr << "--record cannot be combined with --load\n";
            return 2;
        }
        if (!game.loadFromFile(loadPath, &err)) {
            std::cerr << "Failed to load " << loadPath << ": " << err << "\n";
            return 1;
        }
    } else if (!game.newGame(seed, &err)) {
        std::cerr << "Level generation failed: " << err << "\n";
        return 1;
    }

    std::vector<Action> actions;
    if (!parseActionList(actionList, actions, &err)) {
        std::cerr << err << "\n";
        return 2;
    }
    if (actions.empty() && turns > 0) {
        actions.assign(turns, Action::Wait);
    }

    ScriptedInput script(actions);

    ReplayWriter writer;
    if (!recordPath.empty()) {
        ReplayMeta meta = replayMetaFor(game.config(), game.seed());
        meta.gameVersion = DELVE_VERSION;
        if (!writer.open(recordPath, meta, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
        RecordingInput rec(script, writer);
        (void)game.run(rec, nullptr, static_cast<int>(turns));
        rec.finish(game);
        writer.close();
    } else {
        (void)game.run(script, nullptr, static_cast<int>(turns));
    }

    if (!savePath.empty()) {
        if (!game.saveToFile(savePath, &err)) {
            std::cerr << "Failed to save " << savePath << ": " << err << "\n";
            return 1;
        }
    }

    if (printMap) {
        AsciiSurface surface(std::cout);
        surface.draw(game);
    }
    printSummary(game);
    return 0;
}
