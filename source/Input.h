// Input.h
#pragma once

#if __has_include(<SDL2/SDL.h>)
#include <SDL2/SDL.h>
#elif __has_include(<SDL3/SDL.h>)
#include <SDL3/SDL.h>
#else
#include <SDL.h>
#endif
#include <cstdint>
#include "GameState.h"

// Discrete requests gathered from one frame's events.
struct FrameIntents {
    bool quit = false;
    bool startPressed = false;
    bool firePressed = false;
    bool toggleFullscreen = false;
};

// Folds a keyboard, mouse, controller-button or quit event into intents.
// Other events are ignored; window and device events stay with the main loop.
void handleInputEvent(const SDL_Event& ev, FrameIntents& intents);

// Stick Y is negative when pushed forward.
int treadFromAxis(int16_t raw);

// Q/A drive the left tread and W/S the right one. The sticks only count
// when no tread key is held. keys is SDL_GetKeyboardState's array.
void readTreads(const Uint8* keys, int16_t leftStickY, int16_t rightStickY, PlayerInput& input);
