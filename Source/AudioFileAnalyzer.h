#pragma once

#include "AnalysisContext.h"
#include "AnalysisOrchestrator.h"
#include "ClassifierConfig.h"
#include "FootstepTypes.h"
#include <juce_audio_formats/juce_audio_formats.h>
#include <map>
#include <vector>

struct AnalysisSummary
{
    int totalEvents = 0;
    std::map<FootstepType, int> countsByType;
    float averageDecibels = 0.0f;
    float averageDominantFrequency = 0.0f;
    float ambientLevel = 0.0f;
    bool ambientCalibrated = false;
    double durationSeconds = 0.0;

    int getCount(FootstepType type) const;
};

// Level and band balance of one loud buffer
struct SpectralProfile
{
    double timestamp = 0.0;
    float decibelLevel = 0.0f;
    float dominantFrequency = 0.0f;
    float spectralCentroid = 0.0f;
    float crestFactor = 0.0f;
    float impactRatio = 0.0f;
    float lowMidRatio = 0.0f;
    float midRatio = 0.0f;
    float highMidRatio = 0.0f;
    float highRatio = 0.0f;
};

// Offline analysis of a recording, one 4096-sample buffer at a time
class AudioFileAnalyzer
{
public:
    static constexpr int bufferSize = 4096;
    static constexpr float defaultProfileThresholdDb = 35.0f;
    static constexpr double minimumProfileSpacing = 0.25;

    struct Results
    {
        std::vector<FootstepEvent> events;
        AnalysisSummary summary;
    };

    explicit AudioFileAnalyzer(AnalysisContext& context, ClassifierConfig classifierConfig = {});

    // Runs the file through a synchronous orchestrator. Channel 0 only.
    juce::Result analyse(const juce::File& file, Results& results);

    juce::Result spectralProfile(const juce::File& file, float thresholdDb, std::vector<SpectralProfile>& profiles);

    static AnalysisSummary summarise(const std::vector<FootstepEvent>& events,
                                     const AmbientLevelTracker::Snapshot& ambient,
                                     double durationSeconds);

private:
    juce::Result openReader(const juce::File& file, std::unique_ptr<juce::AudioFormatReader>& reader);

    template <typename Callback>
    void forEachBuffer(juce::AudioFormatReader& reader, Callback&& callback);

    AnalysisContext& context;
    const ClassifierConfig classifierConfig;
    juce::AudioFormatManager formatManager;

    JUCE_DECLARE_NON_COPYABLE(AudioFileAnalyzer)
};
