// Input.cpp
#include "Input.h"

void handleInputEvent(const SDL_Event& ev, FrameIntents& intents) {
    switch (ev.type) {
        case SDL_QUIT:
            intents.quit = true;
            break;
        case SDL_CONTROLLERBUTTONDOWN:
            if (ev.cbutton.button == SDL_CONTROLLER_BUTTON_START) {
                intents.quit = true;
            }
            if (ev.cbutton.button == SDL_CONTROLLER_BUTTON_A) {
                intents.startPressed = true;
                intents.firePressed = true;
            }
            break;
        case SDL_MOUSEBUTTONDOWN:
            // Click starts or restarts a round but never fires.
            intents.startPressed = true;
            break;
        case SDL_KEYDOWN:
            if (ev.key.repeat)
                break;
            if (ev.key.keysym.sym == SDLK_SPACE) {
                intents.startPressed = true;
                intents.firePressed = true;
            }
#ifndef __SWITCH__
            if (ev.key.keysym.sym == SDLK_ESCAPE) {
                intents.quit = true;
            }
            if ((ev.key.keysym.sym == SDLK_c) && (ev.key.keysym.mod & KMOD_CTRL)) {
                intents.quit = true;
            }
            if ((ev.key.keysym.sym == SDLK_RETURN) && (ev.key.keysym.mod & KMOD_ALT)) {
                intents.toggleFullscreen = !intents.toggleFullscreen;
            }
#endif
            break;
        default:
            break;
    }
}

int treadFromAxis(int16_t raw) {
    const int deadzone = 8000;
    if (raw < -deadzone) return 1;
    if (raw > deadzone) return -1;
    return 0;
}

void readTreads(const Uint8* keys, int16_t leftStickY, int16_t rightStickY, PlayerInput& input) {
    input.leftTread = 0;
    input.rightTread = 0;
    if (keys) {
        if (keys[SDL_SCANCODE_Q]) input.leftTread += 1;
        if (keys[SDL_SCANCODE_A]) input.leftTread -= 1;
        if (keys[SDL_SCANCODE_W]) input.rightTread += 1;
        if (keys[SDL_SCANCODE_S]) input.rightTread -= 1;
    }
    if (input.leftTread == 0 && input.rightTread == 0) {
        input.leftTread = treadFromAxis(leftStickY);
        input.rightTread = treadFromAxis(rightStickY);
    }
}
