#include "sdl.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "game.hpp"
#include "keybinds.hpp"
#include "render.hpp"
#include "replay.hpp"
#include "settings.hpp"
#include "version.hpp"

static std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            try {
                unsigned long v = std::stoul(argv[i + 1], nullptr, 0);
                return static_cast<uint32_t>(v);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe, const KeyBinds& keys) {
    std::cout
        << DELVE_APPNAME << " " << DELVE_VERSION << "\n"
        << "Usage: " << (exe ? exe : "delve") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Start a new run with a specific seed\n"
        << "  --settings <path>    Settings INI to use (created with defaults if missing)\n"
        << "  --load [path]        Resume from a save file (default: the manual save)\n"
        << "  --save <path>        Where the save command writes\n"
        << "  --record <path>      Record the session as a replay file\n"
        << "  --turns <n>          Quit after n turns\n"
        << "  --data-dir <path>    Directory for settings and saves\n"
        << "  --reset-settings     Rewrite the settings file with defaults\n"
        << "  --version            Print version and exit\n"
        << "  --help               Show this help\n\n"
        << "Keys:\n";
    for (int i = 1; i < ACTION_COUNT; ++i) {
        const Action a = static_cast<Action>(i);
        std::cout << "  " << actionName(a) << ": " << keys.describeAction(a) << "\n";
    }
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        KeyBinds keys = KeyBinds::defaults();
        if (auto sp = parseStringArg(argc, argv, "--settings")) keys.loadOverridesFromIni(*sp);
        printUsage(argv[0], keys);
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << DELVE_APPNAME << " " << DELVE_VERSION << "\n";
        return 0;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    // Settings and saves live in a per-user writable directory unless overridden.
    const std::optional<std::string> dataDirArg = parseStringArg(argc, argv, "--data-dir");
    std::filesystem::path baseDir;
    if (dataDirArg && !dataDirArg->empty()) {
        baseDir = std::filesystem::path(*dataDirArg);
    } else if (char* p = SDL_GetPrefPath("delve", DELVE_APPNAME)) {
        baseDir = std::filesystem::path(p);
        SDL_free(p);
    } else {
        baseDir = std::filesystem::current_path();
    }
    {
        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
    }

    const std::string settingsPath = parseStringArg(argc, argv, "--settings")
        .value_or((baseDir / "delve_settings.ini").string());

    {
        std::error_code ec;
        if (hasFlag(argc, argv, "--reset-settings") || !std::filesystem::exists(settingsPath, ec)) {
            if (!writeDefaultSettings(settingsPath)) {
                std::cerr << "Warning: could not write " << settingsPath << "\n";
            }
        }
    }

    const Settings settings = loadSettings(settingsPath);

    GameConfig cfg = gameConfigFrom(settings);
    cfg.savePath = parseStringArg(argc, argv, "--save").value_or((baseDir / "delve_save.dat").string());
    cfg.autosavePath = (baseDir / "delve_autosave.dat").string();

    KeyBinds keyBinds = KeyBinds::defaults();
    keyBinds.loadOverridesFromIni(settingsPath);

    Game game(cfg);
    std::string err;

    if (hasFlag(argc, argv, "--load")) {
        std::string loadPath = cfg.savePath;
        if (auto p = parseStringArg(argc, argv, "--load")) {
            if (p->rfind("--", 0) != 0) loadPath = *p;
        }
        if (!game.loadFromFile(loadPath, &err)) {
            std::cerr << "Failed to load " << loadPath << ": " << err << "\n";
            SDL_Quit();
            return 1;
        }
    } else {
        const uint32_t seed = parseSeedArg(argc, argv).value_or(settings.seed);
        if (!game.newGame(seed, &err)) {
            std::cerr << "Level generation failed: " << err << "\n";
            SDL_Quit();
            return 1;
        }
    }

    int maxTurns = 0;
    if (auto t = parseStringArg(argc, argv, "--turns")) {
        try {
            maxTurns = std::max(0, std::stoi(*t));
        } catch (const std::exception&) {
            std::cerr << "Invalid --turns value: " << *t << "\n";
            SDL_Quit();
            return 2;
        }
    }

    Renderer renderer(settings.tileSize, settings.vsync);
    if (!renderer.init(game.dungeon().width, game.dungeon().height, &err)) {
        std::cerr << err << "\n";
        SDL_Quit();
        return 1;
    }

    SdlInput input(keyBinds, &renderer);

    std::optional<std::string> recordPath = parseStringArg(argc, argv, "--record");
    if (recordPath && hasFlag(argc, argv, "--load")) {
        std::cerr << "--record cannot be combined with --load; not recording.\n";
        recordPath.reset();
    }

    ReplayWriter writer;
    if (recordPath) {
        ReplayMeta meta = replayMetaFor(game.config(), game.seed());
        meta.gameVersion = DELVE_VERSION;
        if (!writer.open(*recordPath, meta, &err)) {
            std::cerr << err << "\n";
        }
    }

    if (writer.isOpen()) {
        RecordingInput rec(input, writer);
        (void)game.run(rec, &renderer, maxTurns);
        rec.finish(game);
        writer.close();
    } else {
        (void)game.run(input, &renderer, maxTurns);
    }

    if (game.isFinished()) {
        // Keep the final screen up until the player closes it.
        renderer.draw(game);
        for (;;) {
            const Action a = input.nextAction(game);
            if (a == Action::None || a == Action::Quit) break;
        }
        std::cout << settings.playerName << " died on depth " << game.depth() << " after " << game.turnCount()
                  << " turns (" << game.killCount() << " kills).\n";
    }

    renderer.shutdown();
    SDL_Quit();
    return 0;
}
