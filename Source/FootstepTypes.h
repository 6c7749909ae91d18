#pragma once

#include <juce_core/juce_core.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include <optional>

// Footstep categories. The stomping tiers are relative to the ambient level:
// mild [ambient+5, +10), medium [+10, +15), hard [+15, +20), extreme +20 and up.
enum class FootstepType
{
    mildStomping,
    mediumStomping,
    hardStomping,
    extremeStomping,
    running,
    unknown
};

namespace FootstepTypes
{
    juce::String toId(FootstepType type);
    juce::String getDisplayName(FootstepType type);
    std::optional<FootstepType> fromId(const juce::String& id);

    // Everything except unknown
    bool isFootstep(FootstepType type);

    const juce::Array<FootstepType>& getAllTypes();
}

// (timestamp, level) of a previously classified event
struct EventMark
{
    double time = 0.0;
    float decibels = 0.0f;
};

struct Classification
{
    FootstepType type = FootstepType::unknown;
    float confidence = 0.0f;       // 0.0 to 1.0
    float decibelLevel = 0.0f;     // dB SPL approximation
    float dominantFrequency = 0.0f;
    std::optional<double> intervalFromPrevious;
};

struct FootstepEvent
{
    juce::Uuid id;
    juce::Uuid sessionId;
    juce::Time detectedAt;
    double timestampInRecording = 0.0;
    Classification classification;

    // Samples of the originating buffer, empty when clips are not kept
    juce::AudioBuffer<float> audioClip;
    double clipSampleRate = 0.0;

    bool hasAudioClip() const { return audioClip.getNumSamples() > 0; }
    FootstepEvent withoutAudioClip() const;
};

enum class SessionStatus
{
    recording,
    paused,
    completed
};

struct RecordingSession
{
    juce::Uuid id;
    juce::Time startTime = juce::Time::getCurrentTime();
    std::optional<juce::Time> endTime;
    int eventCount = 0;
    SessionStatus status = SessionStatus::recording;

    juce::RelativeTime getDuration() const;
};
