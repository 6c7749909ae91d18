#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <optional>

// A buffer that passed the cheap local gate and is worth a spectral look
struct CandidateEvent
{
    double timestamp = 0.0;
    float rmsAmplitude = 0.0f;
    double sampleRate = 44100.0;
    juce::AudioBuffer<float> buffer; // mono copy of the originating samples
};

// Flags buffers that may contain an impact: RMS above threshold, a prominent
// peak, and at least minimumEventInterval since the previous candidate.
class EventDetector
{
public:
    static constexpr double minimumEventInterval = 0.1;
    static constexpr int peakWindowSize = 512;
    static constexpr float minimumPeakProminence = 0.1f;

    explicit EventDetector(float detectionThreshold = 0.0075f);

    // Returns a candidate (with a copy of channel 0) or nothing
    std::optional<CandidateEvent> analyze(const juce::AudioBuffer<float>& buffer, double sampleRate, double timestamp);

    // Same gate without copying the samples
    bool isCandidate(const float* samples, int numSamples, double timestamp, float* rmsOut = nullptr);

    void setDetectionThreshold(float threshold);
    float getDetectionThreshold() const { return detectionThreshold; }

    void reset();

    std::optional<double> getLastEventTime() const { return lastEventTime; }

    bool detectPeaks(const float* samples, int numSamples) const;

private:
    float detectionThreshold;
    std::optional<double> lastEventTime;
};
