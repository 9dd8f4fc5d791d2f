#pragma once

#include "sdl.hpp"

#include "game.hpp"

#include <cstdint>
#include <string>

// Solid-colour tile renderer. No fonts or textures: the map is drawn as
// rectangles, the HUD as bars, and status text goes to the window title.
class Renderer : public RenderSurface {
public:
    Renderer(int tileSize, bool vsync);
    ~Renderer() override;

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Creates the window sized for a mapW x mapH level.
    bool init(int mapW, int mapH, std::string* err = nullptr);
    void shutdown();

    void draw(const Game& game) override;

private:
    static constexpr int HUD_H = 12;

    int tile = 16;
    bool vsyncEnabled = true;
    int winW = 0;
    int winH = 0;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    std::string lastTitle;

    void fillTile(int x, int y, uint8_t r, uint8_t g, uint8_t b, int inset = 0);
    void drawHud(const Game& game);
    void updateTitle(const Game& game);
};
