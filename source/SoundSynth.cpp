// SoundSynth.cpp
#include "SoundSynth.h"
#include "Vec3.h"
#include <cmath>

// Value that decays geometrically from `from` to `to` over `length` seconds
// and holds `to` afterwards.
static float expRamp(float from, float to, float t, float length) {
    if (t >= length)
        return to;
    return from * std::pow(to / from, t / length);
}

static float triangleWave(float phase) {
    const float frac = phase - std::floor(phase);
    return 4.0f * std::fabs(frac - 0.5f) - 1.0f;
}

float soundDuration(SoundEffect effect) {
    switch (effect) {
        case SoundEffect::Shoot:     return 0.1f;
        case SoundEffect::Explosion: return 0.5f;
        case SoundEffect::Impact:    return 0.15f;
        case SoundEffect::GameOver:  return 2.0f;
    }
    return 0.0f;
}

// Triangle sweep 800 -> 400 Hz.
static void synthShoot(int sampleRate, std::vector<float>& out) {
    const float length = soundDuration(SoundEffect::Shoot);
    float phase = 0.0f;
    for (size_t i = 0; i < out.size(); ++i) {
        const float t = static_cast<float>(i) / sampleRate;
        const float freq = expRamp(800.0f, 400.0f, t, length);
        out[i] = triangleWave(phase) * expRamp(0.3f, 0.01f, t, length);
        phase += freq / sampleRate;
    }
}

// Low-passed noise with a falling cutoff over a sine bass drop.
static void synthExplosion(int sampleRate, std::mt19937& rng, std::vector<float>& out) {
    const float length = soundDuration(SoundEffect::Explosion);
    std::uniform_real_distribution<float> noise(-1.0f, 1.0f);
    float filtered = 0.0f;
    float bassPhase = 0.0f;
    for (size_t i = 0; i < out.size(); ++i) {
        const float t = static_cast<float>(i) / sampleRate;

        const float cutoff = expRamp(1000.0f, 100.0f, t, length);
        const float alpha = 1.0f - std::exp(-2.0f * kPi * cutoff / sampleRate);
        filtered += alpha * (noise(rng) - filtered);

        const float bassFreq = expRamp(80.0f, 40.0f, t, length);
        const float bass = std::sin(2.0f * kPi * bassPhase);
        bassPhase += bassFreq / sampleRate;

        out[i] = filtered * expRamp(0.5f, 0.01f, t, length) +
                 bass * expRamp(0.4f, 0.01f, t, length);
    }
}

// Three detuned square waves, each entering 10 ms after the last.
static void synthImpact(int sampleRate, std::vector<float>& out) {
    const float length = soundDuration(SoundEffect::Impact);
    const float freqs[3] = { 200.0f, 300.0f, 400.0f };
    for (int k = 0; k < 3; ++k) {
        const float start = 0.01f * k;
        for (size_t i = 0; i < out.size(); ++i) {
            const float t = static_cast<float>(i) / sampleRate;
            if (t < start)
                continue;
            const float phase = freqs[k] * (t - start);
            const float square = (phase - std::floor(phase)) < 0.5f ? 1.0f : -1.0f;
            out[i] += square * expRamp(0.2f, 0.01f, t, length);
        }
    }
}

// A G F E D, each note with a 50 ms attack and exponential release.
static void synthGameOver(int sampleRate, std::vector<float>& out) {
    const float notes[5] = { 440.0f, 392.0f, 349.0f, 330.0f, 294.0f };
    const float noteLength = 0.4f;
    const float attack = 0.05f;
    for (size_t i = 0; i < out.size(); ++i) {
        const float t = static_cast<float>(i) / sampleRate;
        int note = static_cast<int>(t / noteLength);
        if (note > 4) note = 4;
        const float local = t - note * noteLength;
        const float gain = local < attack
            ? 0.3f * local / attack
            : expRamp(0.3f, 0.01f, local - attack, noteLength - attack);
        out[i] = std::sin(2.0f * kPi * notes[note] * local) * gain;
    }
}

bool synthesizeSound(SoundEffect effect, int sampleRate, std::mt19937& rng, std::vector<float>& out) {
    out.clear();
    if (sampleRate <= 0)
        return false;

    out.assign(static_cast<size_t>(soundDuration(effect) * sampleRate), 0.0f);
    switch (effect) {
        case SoundEffect::Shoot:     synthShoot(sampleRate, out); break;
        case SoundEffect::Explosion: synthExplosion(sampleRate, rng, out); break;
        case SoundEffect::Impact:    synthImpact(sampleRate, out); break;
        case SoundEffect::GameOver:  synthGameOver(sampleRate, out); break;
    }
    for (float& s : out) {
        s = clampSample(s);
    }
    return true;
}

void mixSamples(std::vector<float>& dst, const std::vector<float>& src) {
    if (dst.size() < src.size())
        dst.resize(src.size(), 0.0f);
    for (size_t i = 0; i < src.size(); ++i) {
        dst[i] += src[i];
    }
}

float clampSample(float s) {
    if (s > 1.0f) return 1.0f;
    if (s < -1.0f) return -1.0f;
    return s;
}
