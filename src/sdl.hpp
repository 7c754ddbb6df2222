#pragma once

// Centralized SDL include.
// SDL is only used for surfaces and BMP I/O; the entrypoint is a plain main(),
// so SDL_MAIN_HANDLED keeps SDL from redefining it as SDL_main.
//
// initImaging() calls SDL_SetMainReady() before SDL_Init().
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
