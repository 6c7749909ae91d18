#pragma once

#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>

// Tunable thresholds for the footstep classifier. Fixed for a session.
struct ClassifierConfig
{
    // Footstep candidacy
    float lowFrequencyCutoff = 65.0f;       // Hz
    float minimumImpactRatio = 0.70f;

    // Tonal sounds sitting right at the cutoff need a different rule
    float boundaryLowFrequency = 60.0f;     // Hz
    float boundaryHighFrequency = 70.0f;    // Hz
    float boundaryHighLevelDb = 43.0f;
    float boundaryModerateLevelDb = 38.0f;
    float boundaryMaximumImpactRatio = 0.57f;

    double runningIntervalThreshold = 0.15; // seconds

    double echoWindowSeconds = 0.5;
    float echoDbDropThreshold = 12.0f;

    // Confidence assigned to sounds that are not footstep-shaped
    float unknownConfidence = 0.3f;

    bool isBoundaryFrequency(float frequency) const
    {
        return frequency >= boundaryLowFrequency && frequency <= boundaryHighFrequency;
    }

    // Missing properties keep their defaults
    static ClassifierConfig fromValueTree(const juce::ValueTree& tree);
    juce::ValueTree toValueTree() const;

    static juce::Result loadFromXmlFile(const juce::File& file, ClassifierConfig& result);

    static const juce::Identifier stateType;
};
