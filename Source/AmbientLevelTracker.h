#pragma once

#include <juce_core/juce_core.h>
#include <deque>

// Estimates the background noise floor as the mean of the lowest 10% of the
// recent dB SPL readings. Written by the analysis path, readable from any thread.
class AmbientLevelTracker
{
public:
    static constexpr float defaultAmbientLevel = 30.0f;

    struct Snapshot
    {
        float ambientLevel = defaultAmbientLevel;
        bool calibrated = false;
        int readingCount = 0;
    };

    struct Thresholds
    {
        float mild = 0.0f;
        float medium = 0.0f;
        float hard = 0.0f;
        float extreme = 0.0f;
    };

    explicit AmbientLevelTracker(int windowSize = 100, int minimumSamples = 20);

    void addReading(float dbLevel);

    // Converts the buffer to dB SPL first. Silent buffers are not counted.
    void addReading(const float* samples, int numSamples, float calibrationOffset = 0.0f);

    void reset();

    float getAmbientLevel() const;
    bool isCalibrated() const;
    Snapshot getSnapshot() const;

    // Tier boundaries: mild = ambient + offset + 5, then +10, +15, +20
    Thresholds getThresholds(float sensitivityOffset = 0.0f) const;
    static Thresholds makeThresholds(float ambientLevel, float sensitivityOffset);

    int getWindowSize() const { return windowSize; }

private:
    void updateAmbientEstimate();

    const int windowSize;
    const int minimumSamples;

    static constexpr float lowerPercentile = 0.0f;
    static constexpr float upperPercentile = 0.10f;

    std::deque<float> readings;
    float ambientLevel = defaultAmbientLevel;
    bool calibrated = false;

    mutable juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE(AmbientLevelTracker)
};
