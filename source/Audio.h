// Audio.h
#pragma once

#if __has_include(<SDL2/SDL.h>)
#include <SDL2/SDL.h>
#elif __has_include(<SDL3/SDL.h>)
#include <SDL3/SDL.h>
#else
#include <SDL.h>
#endif
#include <random>
#include <vector>
#include "GameState.h"
#include "SoundSynth.h"

// Procedural sound effects pushed to an SDL queue-mode device. Effects that
// start close together are mixed in m_pending and fed to the device a little
// ahead of playback, so they overlap instead of playing back to back.
class Audio {
public:
    Audio();
    ~Audio();

    // Brings up SDL_INIT_AUDIO on its own so a missing audio driver never
    // stops the game. On failure play() and update() are no-ops.
    bool init();
    void shutdown();

    void play(SoundEffect effect);
    void playEvents(const SoundEvents& events);

    // Tops the device queue up from the pending mix. Call once per frame.
    void update();

    bool isOpen() const { return m_device != 0; }

private:
    SDL_AudioDeviceID m_device;
    int m_sampleRate;
    std::vector<float> m_pending;
    std::vector<float> m_scratch;
    std::mt19937 m_rng;
};
