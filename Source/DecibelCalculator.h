#pragma once

#include <juce_audio_basics/juce_audio_basics.h>

// Amplitude <-> decibel conversions, in dBFS and in an approximate dB SPL scale.
// All functions are pure and return finite values for any input.
class DecibelCalculator
{
public:
    // dBFS -> dB SPL. A quiet room (~-45 dBFS) reads ~30 dB SPL, normal
    // conversation (~-25 dBFS) ~50 dB SPL. The user calibration shifts this.
    static constexpr float baseDbFSToSPLOffset = 75.0f;

    static constexpr float minimumDecibelsSPL = 0.0f;
    static constexpr float maximumDecibelsSPL = 130.0f;

    static constexpr float minimumDecibels = -160.0f;
    static constexpr float maximumDecibels = 0.0f;

    static constexpr float minimumAmplitude = 1.0e-8f;

    // Root mean square of the samples. Non-finite samples count as silence.
    static float calculateRMS(const float* samples, int numSamples);
    static float calculatePeak(const float* samples, int numSamples);

    // Peak / RMS, 0 for silence
    static float calculateCrestFactor(const float* samples, int numSamples);

    // Linear amplitude -> dBFS, clamped to [minimumDecibels, maximumDecibels]
    static float rmsToDecibels(float rms);
    static float decibelsToAmplitude(float decibels);

    static float dbFSToSPL(float dbFS, float calibrationOffset = 0.0f);
    static float splToDbFS(float dbSPL, float calibrationOffset = 0.0f);

    static float calculateDecibels(const float* samples, int numSamples);
    static float calculatePeakDecibels(const float* samples, int numSamples);
    static float calculateDecibelsSPL(const float* samples, int numSamples, float calibrationOffset = 0.0f);
    static float calculateDecibelsSPL(const juce::AudioBuffer<float>& buffer, float calibrationOffset = 0.0f);

    // For meters: dBFS range -> 0..1, and 30..100 dB SPL -> 0..1
    static float normalizeDecibels(float decibels);
    static float normalizeDecibelsSPL(float dbSPL);

private:
    DecibelCalculator() = delete;
};
