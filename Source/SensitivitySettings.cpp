#include "SensitivitySettings.h"
#include "DecibelCalculator.h"
#include <cmath>

const juce::Identifier SensitivitySettings::stateType("SensitivitySettings");

namespace
{
    const juce::Identifier sensitivityOffsetId("sensitivityOffset");
    const juce::Identifier calibrationOffsetId("calibrationOffset");

    float sanitise(float value, float minValue, float maxValue)
    {
        if (!std::isfinite(value))
            return 0.0f;

        return juce::jlimit(minValue, maxValue, value);
    }
}

void SensitivitySettings::setSensitivityOffset(float db)
{
    sensitivityOffset.store(sanitise(db, minSensitivityOffset, maxSensitivityOffset));
}

void SensitivitySettings::setCalibrationOffset(float db)
{
    calibrationOffset.store(sanitise(db, minCalibrationOffset, maxCalibrationOffset));
}

void SensitivitySettings::resetSensitivity()
{
    sensitivityOffset.store(0.0f);
}

void SensitivitySettings::resetCalibration()
{
    calibrationOffset.store(0.0f);
}

void SensitivitySettings::resetAll()
{
    resetSensitivity();
    resetCalibration();
}

SensitivityConfig SensitivitySettings::getConfig() const
{
    return { sensitivityOffset.load(), calibrationOffset.load() };
}

float SensitivitySettings::getDetectionThreshold() const
{
    return detectionThresholdFor(sensitivityOffset.load());
}

float SensitivitySettings::detectionThresholdFor(float sensitivityOffsetDb)
{
    const auto offset = sanitise(sensitivityOffsetDb, minSensitivityOffset, maxSensitivityOffset);
    return baseDetectionThreshold * juce::Decibels::decibelsToGain(offset);
}

float SensitivitySettings::getEffectiveDbOffset() const
{
    return DecibelCalculator::baseDbFSToSPLOffset + calibrationOffset.load();
}

juce::String SensitivitySettings::getSensitivityLabel() const
{
    const auto offset = sensitivityOffset.load();

    if (offset < -5.0f)  return "High";
    if (offset < 0.0f)   return "Medium-High";
    if (offset == 0.0f)  return "Medium";
    if (offset <= 5.0f)  return "Medium-Low";
    return "Low";
}

juce::String SensitivitySettings::getCalibrationLabel() const
{
    const auto offset = juce::roundToInt(calibrationOffset.load());
    return (offset > 0 ? "+" : "") + juce::String(offset) + " dB";
}

juce::ValueTree SensitivitySettings::toValueTree() const
{
    juce::ValueTree tree(stateType);
    tree.setProperty(sensitivityOffsetId, sensitivityOffset.load(), nullptr);
    tree.setProperty(calibrationOffsetId, calibrationOffset.load(), nullptr);
    return tree;
}

void SensitivitySettings::fromValueTree(const juce::ValueTree& tree)
{
    if (!tree.hasType(stateType))
        return;

    setSensitivityOffset(static_cast<float>(tree.getProperty(sensitivityOffsetId, 0.0f)));
    setCalibrationOffset(static_cast<float>(tree.getProperty(calibrationOffsetId, 0.0f)));
}

juce::Result SensitivitySettings::saveToXml(const juce::File& file) const
{
    std::unique_ptr<juce::XmlElement> xml(toValueTree().createXml());

    if (xml == nullptr)
        return juce::Result::fail("Could not serialise sensitivity settings");

    if (!xml->writeTo(file))
        return juce::Result::fail("Could not write " + file.getFullPathName());

    return juce::Result::ok();
}

juce::Result SensitivitySettings::loadFromXml(const juce::File& file)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Settings file not found: " + file.getFullPathName());

    std::unique_ptr<juce::XmlElement> xml(juce::XmlDocument::parse(file));

    if (xml == nullptr || !xml->hasTagName(stateType.toString()))
        return juce::Result::fail("Not a sensitivity settings file: " + file.getFullPathName());

    fromValueTree(juce::ValueTree::fromXml(*xml));
    return juce::Result::ok();
}
