// Audio.cpp
#include "Audio.h"
#include <algorithm>
#include <cstdio>

Audio::Audio()
    : m_device(0)
    , m_sampleRate(kSoundSampleRate)
    , m_rng(0x5eedu)
{
}

Audio::~Audio() {
    shutdown();
}

bool Audio::init() {
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
        std::printf("SDL audio init failed: %s\n", SDL_GetError());
        return false;
    }

    SDL_AudioSpec want;
    SDL_zero(want);
    want.freq = kSoundSampleRate;
    want.format = AUDIO_F32SYS;
    want.channels = 1;
    want.samples = 1024;
    want.callback = nullptr;

    SDL_AudioSpec have;
    m_device = SDL_OpenAudioDevice(nullptr, 0, &want, &have, SDL_AUDIO_ALLOW_FREQUENCY_CHANGE);
    if (m_device == 0) {
        std::printf("SDL_OpenAudioDevice failed: %s\n", SDL_GetError());
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        return false;
    }

    m_sampleRate = have.freq;
    SDL_PauseAudioDevice(m_device, 0);
    std::printf("Audio ready: %d Hz\n", m_sampleRate);
    return true;
}

void Audio::shutdown() {
    if (m_device) {
        SDL_CloseAudioDevice(m_device);
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_device = 0;
    }
    m_pending.clear();
}

void Audio::play(SoundEffect effect) {
    if (!m_device)
        return;
    if (!synthesizeSound(effect, m_sampleRate, m_rng, m_scratch))
        return;
    mixSamples(m_pending, m_scratch);
}

void Audio::playEvents(const SoundEvents& events) {
    if (events.shoot) play(SoundEffect::Shoot);
    if (events.impact) play(SoundEffect::Impact);
    if (events.explosion) play(SoundEffect::Explosion);
    if (events.gameOver) play(SoundEffect::GameOver);
}

void Audio::update() {
    if (!m_device || m_pending.empty())
        return;

    // About 50 ms of lead keeps up with a 60 Hz frame without adding much lag.
    const size_t lead = static_cast<size_t>(m_sampleRate / 20);
    const size_t queued = SDL_GetQueuedAudioSize(m_device) / sizeof(float);
    if (queued >= lead)
        return;

    const size_t count = std::min(lead - queued, m_pending.size());
    for (size_t i = 0; i < count; ++i) {
        m_pending[i] = clampSample(m_pending[i]);
    }
    if (SDL_QueueAudio(m_device, m_pending.data(), static_cast<Uint32>(count * sizeof(float))) != 0) {
        std::printf("SDL_QueueAudio failed: %s\n", SDL_GetError());
        m_pending.clear();
        return;
    }
    m_pending.erase(m_pending.begin(), m_pending.begin() + count);
}
