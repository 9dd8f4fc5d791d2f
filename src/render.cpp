#include "render.hpp"
#include "version.hpp"

#include <algorithm>
#include <sstream>

namespace {

struct Rgb {
    uint8_t r, g, b;
};

Rgb tileColor(TileType t, bool visible) {
    Rgb c{0, 0, 0};
    switch (t) {
        case TileType::Wall:       c = {110, 100, 90}; break;
        case TileType::Floor:      c = {60, 60, 70}; break;
        case TileType::DoorClosed: c = {150, 95, 40}; break;
        case TileType::DoorOpen:   c = {90, 60, 30}; break;
        case TileType::StairsDown: c = {200, 200, 80}; break;
    }
    if (!visible) {
        // Remembered tiles are drawn dimmed.
        c.r = static_cast<uint8_t>(c.r / 3);
        c.g = static_cast<uint8_t>(c.g / 3);
        c.b = static_cast<uint8_t>(c.b / 3);
    }
    return c;
}

Rgb entityColor(EntityKind k) {
    switch (k) {
        case EntityKind::Player: return {240, 240, 240};
        case EntityKind::Rat:    return {150, 120, 100};
        case EntityKind::Goblin: return {80, 200, 80};
        case EntityKind::Orc:    return {40, 140, 40};
        case EntityKind::Troll:  return {200, 60, 60};
        default:                 return {255, 0, 255};
    }
}

} // namespace

Renderer::Renderer(int tileSize, bool vsync)
    : tile(std::max(4, tileSize)), vsyncEnabled(vsync) {}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init(int mapW, int mapH, std::string* err) {
    if (window) return true;

    winW = mapW * tile;
    winH = mapH * tile + HUD_H;

    const std::string title = std::string(DELVE_APPNAME) + " v" + DELVE_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        if (err) *err = std::string("SDL_CreateWindow failed: ") + SDL_GetError();
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        if (err) *err = std::string("SDL_CreateRenderer failed: ") + SDL_GetError();
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Keep a fixed virtual resolution and let SDL scale the output.
    SDL_RenderSetLogicalSize(renderer, winW, winH);
    return true;
}

void Renderer::shutdown() {
    if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
    if (window) { SDL_DestroyWindow(window); window = nullptr; }
}

void Renderer::fillTile(int x, int y, uint8_t r, uint8_t g, uint8_t b, int inset) {
    SDL_Rect rect{ x * tile + inset, HUD_H + y * tile + inset, tile - inset * 2, tile - inset * 2 };
    SDL_SetRenderDrawColor(renderer, r, g, b, 255);
    SDL_RenderFillRect(renderer, &rect);
}

void Renderer::drawHud(const Game& game) {
    const Entity& p = game.player();

    SDL_Rect bg{0, 0, winW, HUD_H};
    SDL_SetRenderDrawColor(renderer, 20, 20, 24, 255);
    SDL_RenderFillRect(renderer, &bg);

    // HP bar across the left half.
    const int barW = winW / 2 - 8;
    const int hpMax = std::max(1, p.hpMax);
    const int filled = std::clamp(p.hp, 0, hpMax) * barW / hpMax;
    SDL_Rect back{4, 3, barW, HUD_H - 6};
    SDL_Rect front{4, 3, filled, HUD_H - 6};
    SDL_SetRenderDrawColor(renderer, 70, 20, 20, 255);
    SDL_RenderFillRect(renderer, &back);
    SDL_SetRenderDrawColor(renderer, 200, 40, 40, 255);
    SDL_RenderFillRect(renderer, &front);

    // One pip per dungeon level on the right half.
    for (int i = 0; i < game.depth() && i < 32; ++i) {
        SDL_Rect pip{ winW / 2 + 4 + i * (HUD_H - 2), 3, HUD_H - 6, HUD_H - 6 };
        SDL_SetRenderDrawColor(renderer, 200, 200, 80, 255);
        SDL_RenderFillRect(renderer, &pip);
    }
}

void Renderer::updateTitle(const Game& game) {
    std::ostringstream ss;
    ss << DELVE_APPNAME << "  DEPTH " << game.depth()
       << "  HP " << game.player().hp << "/" << game.player().hpMax
       << "  TURN " << game.turnCount();
    if (game.isFinished()) ss << "  (DEAD)";
    if (!game.messages().empty()) ss << "  |  " << game.messages().back().text;

    const std::string title = ss.str();
    if (title != lastTitle) {
        SDL_SetWindowTitle(window, title.c_str());
        lastTitle = title;
    }
}

void Renderer::draw(const Game& game) {
    if (!renderer) return;

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    const Dungeon& d = game.dungeon();
    for (int y = 0; y < d.height; ++y) {
        for (int x = 0; x < d.width; ++x) {
            const Tile& t = d.at(x, y);
            if (!t.explored) continue;
            const Rgb c = tileColor(t.type, t.visible);
            fillTile(x, y, c.r, c.g, c.b);
        }
    }

    // Entities are only shown where the player can currently see.
    for (const auto& e : game.entities()) {
        if (!e.alive()) continue;
        if (!d.inBounds(e.pos.x, e.pos.y) || !d.at(e.pos.x, e.pos.y).visible) continue;
        const Rgb c = entityColor(e.kind);
        fillTile(e.pos.x, e.pos.y, c.r, c.g, c.b, std::max(1, tile / 6));
    }

    drawHud(game);
    updateTitle(game);

    SDL_RenderPresent(renderer);
}
