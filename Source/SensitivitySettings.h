#pragma once

#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>
#include <atomic>

// Immutable snapshot handed to the classifier for one decision
struct SensitivityConfig
{
    float offsetDb = 0.0f;       // added to every ambient-relative threshold
    float calibrationDb = 0.0f;  // added to the dBFS -> dB SPL conversion
};

// User-adjustable sensitivity and microphone calibration.
// Positive sensitivity offset = higher thresholds = fewer detections.
class SensitivitySettings
{
public:
    static constexpr float minSensitivityOffset = -10.0f;
    static constexpr float maxSensitivityOffset = 10.0f;
    static constexpr float minCalibrationOffset = -20.0f;
    static constexpr float maxCalibrationOffset = 20.0f;

    // Detector RMS threshold at offset 0
    static constexpr float baseDetectionThreshold = 0.0075f;

    SensitivitySettings() = default;

    void setSensitivityOffset(float db);
    void setCalibrationOffset(float db);

    float getSensitivityOffset() const { return sensitivityOffset.load(); }
    float getCalibrationOffset() const { return calibrationOffset.load(); }

    void resetSensitivity();
    void resetCalibration();
    void resetAll();

    SensitivityConfig getConfig() const;

    // RMS gate for the event detector, scaled with the sensitivity offset
    float getDetectionThreshold() const;
    static float detectionThresholdFor(float sensitivityOffsetDb);

    // Base dBFS -> SPL offset plus the user calibration
    float getEffectiveDbOffset() const;

    juce::String getSensitivityLabel() const;
    juce::String getCalibrationLabel() const;

    juce::ValueTree toValueTree() const;
    void fromValueTree(const juce::ValueTree& tree);

    juce::Result saveToXml(const juce::File& file) const;
    juce::Result loadFromXml(const juce::File& file);

    static const juce::Identifier stateType;

private:
    std::atomic<float> sensitivityOffset { 0.0f };
    std::atomic<float> calibrationOffset { 0.0f };

    JUCE_DECLARE_NON_COPYABLE(SensitivitySettings)
};
