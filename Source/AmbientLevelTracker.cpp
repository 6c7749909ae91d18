#include "AmbientLevelTracker.h"
#include "DecibelCalculator.h"
#include <algorithm>
#include <cmath>
#include <vector>

AmbientLevelTracker::AmbientLevelTracker(int windowSizeToUse, int minimumSamplesToUse)
    : windowSize(juce::jmax(1, windowSizeToUse)),
      minimumSamples(juce::jlimit(1, juce::jmax(1, windowSizeToUse), minimumSamplesToUse))
{
}

void AmbientLevelTracker::addReading(float dbLevel)
{
    if (!std::isfinite(dbLevel))
        return;

    const juce::ScopedLock sl(lock);

    readings.push_back(dbLevel);

    while (static_cast<int>(readings.size()) > windowSize)
        readings.pop_front();

    if (static_cast<int>(readings.size()) >= minimumSamples)
    {
        updateAmbientEstimate();

        if (!calibrated)
        {
            calibrated = true;
            juce::Logger::writeToLog("Ambient level calibrated: " + juce::String(ambientLevel, 1) + " dB");
        }
    }
}

void AmbientLevelTracker::addReading(const float* samples, int numSamples, float calibrationOffset)
{
    if (samples == nullptr || numSamples <= 0)
        return;

    if (DecibelCalculator::calculateRMS(samples, numSamples) <= 0.0f)
        return;

    addReading(DecibelCalculator::calculateDecibelsSPL(samples, numSamples, calibrationOffset));
}

void AmbientLevelTracker::reset()
{
    const juce::ScopedLock sl(lock);

    readings.clear();
    ambientLevel = defaultAmbientLevel;
    calibrated = false;
}

float AmbientLevelTracker::getAmbientLevel() const
{
    const juce::ScopedLock sl(lock);
    return ambientLevel;
}

bool AmbientLevelTracker::isCalibrated() const
{
    const juce::ScopedLock sl(lock);
    return calibrated;
}

AmbientLevelTracker::Snapshot AmbientLevelTracker::getSnapshot() const
{
    const juce::ScopedLock sl(lock);
    return { ambientLevel, calibrated, static_cast<int>(readings.size()) };
}

AmbientLevelTracker::Thresholds AmbientLevelTracker::getThresholds(float sensitivityOffset) const
{
    return makeThresholds(getAmbientLevel(), sensitivityOffset);
}

AmbientLevelTracker::Thresholds AmbientLevelTracker::makeThresholds(float ambient, float sensitivityOffset)
{
    const auto base = ambient + sensitivityOffset;
    return { base + 5.0f, base + 10.0f, base + 15.0f, base + 20.0f };
}

void AmbientLevelTracker::updateAmbientEstimate()
{
    std::vector<float> sorted(readings.begin(), readings.end());
    std::sort(sorted.begin(), sorted.end());

    const auto count = static_cast<int>(sorted.size());
    const auto lowerIndex = static_cast<int>(static_cast<float>(count) * lowerPercentile);
    const auto upperIndex = juce::jmin(count - 1, static_cast<int>(static_cast<float>(count) * upperPercentile));

    double sum = 0.0;
    for (int i = lowerIndex; i <= upperIndex; ++i)
        sum += sorted[(size_t) i];

    ambientLevel = static_cast<float>(sum / (upperIndex - lowerIndex + 1));
}
