#pragma once

// Single place the SDL front end includes SDL from.
// SDL_MAIN_HANDLED keeps our own main() as the entry point, so no SDL2main
// library is needed. main() calls SDL_SetMainReady() before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
