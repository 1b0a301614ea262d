// SoundSynth.h
#pragma once

#include <random>
#include <vector>

enum class SoundEffect {
    Shoot,
    Explosion,
    Impact,
    GameOver
};

constexpr int kSoundSampleRate = 44100;

// Length of an effect in seconds, tails included.
float soundDuration(SoundEffect effect);

// Renders one effect as mono float samples in [-1, 1]. Replaces out.
// Returns false for a non-positive sample rate.
bool synthesizeSound(SoundEffect effect, int sampleRate, std::mt19937& rng, std::vector<float>& out);

// Adds src onto the start of dst, growing dst as needed. Samples are summed
// unclamped; clamp once when the mix is handed to the device.
void mixSamples(std::vector<float>& dst, const std::vector<float>& src);

float clampSample(float s);
