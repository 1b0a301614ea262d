// Platform.cpp
#include "Platform.h"

#if __has_include(<SDL2/SDL.h>)
#include <SDL2/SDL.h>
#elif __has_include(<SDL3/SDL.h>)
#include <SDL3/SDL.h>
#else
#include <SDL.h>
#endif
#include <cstdio>

#ifdef __SWITCH__
#include <switch.h>
#endif

#ifndef __SWITCH__
// Desktop state for SDL_QUIT handling
static bool g_running = true;
#endif

bool PlatformInit() {
#ifdef __SWITCH__
    socketInitializeDefault();
    nxlinkStdio();
    setvbuf(stdout, NULL, _IONBF, 0);
    return true;
#else
    // Log lines should show up immediately when piped.
    std::setvbuf(stdout, nullptr, _IOLBF, 0);
    g_running = true;
    return true;
#endif
}

void PlatformShutdown() {
#ifdef __SWITCH__
    socketExit();
#endif
}

bool PlatformRunning() {
#ifdef __SWITCH__
    return appletMainLoop();
#else
    if (!g_running)
        return false;

    SDL_PumpEvents();
    SDL_Event e;
    // Peek only; the event stays queued so the game loop still sees SDL_QUIT.
    if (SDL_PeepEvents(&e, 1, SDL_PEEKEVENT, SDL_QUIT, SDL_QUIT) > 0) {
        g_running = false;
    }
    return g_running;
#endif
}

uint64_t PlatformTicks() {
#ifdef __SWITCH__
    return SDL_GetTicks();
#else
    return SDL_GetTicks64();
#endif
}
