#include "EventDetector.h"
#include "DecibelCalculator.h"
#include <cmath>
#include <limits>

EventDetector::EventDetector(float threshold)
    : detectionThreshold(juce::jlimit(0.0f, 1.0f, threshold))
{
}

std::optional<CandidateEvent> EventDetector::analyze(const juce::AudioBuffer<float>& buffer, double sampleRate, double timestamp)
{
    if (buffer.getNumChannels() == 0 || buffer.getNumSamples() == 0)
        return std::nullopt;

    float rms = 0.0f;

    if (!isCandidate(buffer.getReadPointer(0), buffer.getNumSamples(), timestamp, &rms))
        return std::nullopt;

    CandidateEvent candidate;
    candidate.timestamp = timestamp;
    candidate.rmsAmplitude = rms;
    candidate.sampleRate = sampleRate;
    candidate.buffer.setSize(1, buffer.getNumSamples());
    candidate.buffer.copyFrom(0, 0, buffer, 0, 0, buffer.getNumSamples());

    return candidate;
}

bool EventDetector::isCandidate(const float* samples, int numSamples, double timestamp, float* rmsOut)
{
    if (samples == nullptr || numSamples <= 0 || !std::isfinite(timestamp))
        return false;

    const auto rms = DecibelCalculator::calculateRMS(samples, numSamples);

    if (rmsOut != nullptr)
        *rmsOut = rms;

    const auto meetsThreshold = rms > detectionThreshold;
    const auto meetsTimeInterval = !lastEventTime.has_value()
                                    || (timestamp - *lastEventTime) >= minimumEventInterval;

    if (!(meetsThreshold && meetsTimeInterval && detectPeaks(samples, numSamples)))
        return false;

    lastEventTime = timestamp;
    return true;
}

void EventDetector::setDetectionThreshold(float threshold)
{
    detectionThreshold = std::isfinite(threshold) ? juce::jlimit(0.0f, 1.0f, threshold) : detectionThreshold;
}

void EventDetector::reset()
{
    lastEventTime.reset();
}

bool EventDetector::detectPeaks(const float* samples, int numSamples) const
{
    if (samples == nullptr || numSamples <= 0)
        return false;

    if (numSamples < peakWindowSize)
    {
        // Too short for windowing: any sample over the threshold will do
        for (int i = 0; i < numSamples; ++i)
            if (std::abs(samples[i]) > detectionThreshold)
                return true;

        return false;
    }

    const auto windowCount = numSamples / peakWindowSize;
    float maxPeak = 0.0f;
    float minValley = std::numeric_limits<float>::max();

    for (int w = 0; w < windowCount; ++w)
    {
        const auto* window = samples + w * peakWindowSize;
        float windowMax = 0.0f;
        float windowMin = std::numeric_limits<float>::max();

        for (int i = 0; i < peakWindowSize; ++i)
        {
            const auto sample = std::isfinite(window[i]) ? std::abs(window[i]) : 0.0f;
            windowMax = juce::jmax(windowMax, sample);
            windowMin = juce::jmin(windowMin, sample);
        }

        maxPeak = juce::jmax(maxPeak, windowMax);
        minValley = juce::jmin(minValley, windowMin);
    }

    const auto prominence = maxPeak - minValley;
    return prominence >= minimumPeakProminence && maxPeak > detectionThreshold;
}
