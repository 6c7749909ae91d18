#include "DecibelCalculator.h"
#include <cmath>

namespace
{
    inline float finiteOrZero(float sample)
    {
        return std::isfinite(sample) ? sample : 0.0f;
    }
}

float DecibelCalculator::calculateRMS(const float* samples, int numSamples)
{
    if (samples == nullptr || numSamples <= 0)
        return 0.0f;

    double sum = 0.0;
    for (int i = 0; i < numSamples; ++i)
    {
        const auto sample = finiteOrZero(samples[i]);
        sum += sample * sample;
    }

    return static_cast<float>(std::sqrt(sum / numSamples));
}

float DecibelCalculator::calculatePeak(const float* samples, int numSamples)
{
    if (samples == nullptr || numSamples <= 0)
        return 0.0f;

    float peak = 0.0f;
    for (int i = 0; i < numSamples; ++i)
        peak = juce::jmax(peak, std::abs(finiteOrZero(samples[i])));

    return peak;
}

float DecibelCalculator::calculateCrestFactor(const float* samples, int numSamples)
{
    const auto rms = calculateRMS(samples, numSamples);

    if (rms <= 0.0f)
        return 0.0f;

    return calculatePeak(samples, numSamples) / rms;
}

float DecibelCalculator::rmsToDecibels(float rms)
{
    if (!std::isfinite(rms))
        return minimumDecibels;

    const auto clampedRMS = juce::jmax(std::abs(rms), minimumAmplitude);
    const auto decibels = juce::Decibels::gainToDecibels(clampedRMS, minimumDecibels);

    return juce::jlimit(minimumDecibels, maximumDecibels, decibels);
}

float DecibelCalculator::decibelsToAmplitude(float decibels)
{
    if (!std::isfinite(decibels))
        return 0.0f;

    return juce::Decibels::decibelsToGain(juce::jlimit(minimumDecibels, maximumDecibels, decibels),
                                          minimumDecibels - 1.0f);
}

float DecibelCalculator::dbFSToSPL(float dbFS, float calibrationOffset)
{
    const auto spl = dbFS + baseDbFSToSPLOffset + calibrationOffset;

    if (!std::isfinite(spl))
        return minimumDecibelsSPL;

    return juce::jlimit(minimumDecibelsSPL, maximumDecibelsSPL, spl);
}

float DecibelCalculator::splToDbFS(float dbSPL, float calibrationOffset)
{
    return dbSPL - (baseDbFSToSPLOffset + calibrationOffset);
}

float DecibelCalculator::calculateDecibels(const float* samples, int numSamples)
{
    if (samples == nullptr || numSamples <= 0)
        return minimumDecibels;

    return rmsToDecibels(calculateRMS(samples, numSamples));
}

float DecibelCalculator::calculatePeakDecibels(const float* samples, int numSamples)
{
    if (samples == nullptr || numSamples <= 0)
        return minimumDecibels;

    return rmsToDecibels(calculatePeak(samples, numSamples));
}

float DecibelCalculator::calculateDecibelsSPL(const float* samples, int numSamples, float calibrationOffset)
{
    return dbFSToSPL(calculateDecibels(samples, numSamples), calibrationOffset);
}

float DecibelCalculator::calculateDecibelsSPL(const juce::AudioBuffer<float>& buffer, float calibrationOffset)
{
    if (buffer.getNumChannels() == 0 || buffer.getNumSamples() == 0)
        return minimumDecibelsSPL;

    // Mono analysis: channel 0 only
    return calculateDecibelsSPL(buffer.getReadPointer(0), buffer.getNumSamples(), calibrationOffset);
}

float DecibelCalculator::normalizeDecibels(float decibels)
{
    if (!std::isfinite(decibels))
        return 0.0f;

    const auto normalized = (decibels - minimumDecibels) / (maximumDecibels - minimumDecibels);
    return juce::jlimit(0.0f, 1.0f, normalized);
}

float DecibelCalculator::normalizeDecibelsSPL(float dbSPL)
{
    constexpr float minDisplay = 30.0f;  // quiet room
    constexpr float maxDisplay = 100.0f; // very loud

    if (!std::isfinite(dbSPL))
        return 0.0f;

    return juce::jlimit(0.0f, 1.0f, (dbSPL - minDisplay) / (maxDisplay - minDisplay));
}
