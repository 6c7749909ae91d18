#include "ClassifierConfig.h"

const juce::Identifier ClassifierConfig::stateType("ClassifierConfig");

namespace
{
    const juce::Identifier lowFrequencyCutoffId("lowFrequencyCutoff");
    const juce::Identifier minimumImpactRatioId("minimumImpactRatio");
    const juce::Identifier boundaryLowFrequencyId("boundaryLowFrequency");
    const juce::Identifier boundaryHighFrequencyId("boundaryHighFrequency");
    const juce::Identifier boundaryHighLevelDbId("boundaryHighLevelDb");
    const juce::Identifier boundaryModerateLevelDbId("boundaryModerateLevelDb");
    const juce::Identifier boundaryMaximumImpactRatioId("boundaryMaximumImpactRatio");
    const juce::Identifier runningIntervalThresholdId("runningIntervalThreshold");
    const juce::Identifier echoWindowSecondsId("echoWindowSeconds");
    const juce::Identifier echoDbDropThresholdId("echoDbDropThreshold");
    const juce::Identifier unknownConfidenceId("unknownConfidence");

    template <typename Type>
    void readProperty(const juce::ValueTree& tree, const juce::Identifier& id, Type& value)
    {
        if (tree.hasProperty(id))
            value = static_cast<Type>(static_cast<double>(tree.getProperty(id)));
    }
}

ClassifierConfig ClassifierConfig::fromValueTree(const juce::ValueTree& tree)
{
    ClassifierConfig config;

    if (!tree.hasType(stateType))
        return config;

    readProperty(tree, lowFrequencyCutoffId, config.lowFrequencyCutoff);
    readProperty(tree, minimumImpactRatioId, config.minimumImpactRatio);
    readProperty(tree, boundaryLowFrequencyId, config.boundaryLowFrequency);
    readProperty(tree, boundaryHighFrequencyId, config.boundaryHighFrequency);
    readProperty(tree, boundaryHighLevelDbId, config.boundaryHighLevelDb);
    readProperty(tree, boundaryModerateLevelDbId, config.boundaryModerateLevelDb);
    readProperty(tree, boundaryMaximumImpactRatioId, config.boundaryMaximumImpactRatio);
    readProperty(tree, runningIntervalThresholdId, config.runningIntervalThreshold);
    readProperty(tree, echoWindowSecondsId, config.echoWindowSeconds);
    readProperty(tree, echoDbDropThresholdId, config.echoDbDropThreshold);
    readProperty(tree, unknownConfidenceId, config.unknownConfidence);

    config.minimumImpactRatio = juce::jlimit(0.0f, 1.0f, config.minimumImpactRatio);
    config.boundaryMaximumImpactRatio = juce::jlimit(0.0f, 1.0f, config.boundaryMaximumImpactRatio);
    config.unknownConfidence = juce::jlimit(0.0f, 1.0f, config.unknownConfidence);
    config.runningIntervalThreshold = juce::jmax(0.0, config.runningIntervalThreshold);
    config.echoWindowSeconds = juce::jmax(0.0, config.echoWindowSeconds);

    return config;
}

juce::ValueTree ClassifierConfig::toValueTree() const
{
    juce::ValueTree tree(stateType);
    tree.setProperty(lowFrequencyCutoffId, lowFrequencyCutoff, nullptr);
    tree.setProperty(minimumImpactRatioId, minimumImpactRatio, nullptr);
    tree.setProperty(boundaryLowFrequencyId, boundaryLowFrequency, nullptr);
    tree.setProperty(boundaryHighFrequencyId, boundaryHighFrequency, nullptr);
    tree.setProperty(boundaryHighLevelDbId, boundaryHighLevelDb, nullptr);
    tree.setProperty(boundaryModerateLevelDbId, boundaryModerateLevelDb, nullptr);
    tree.setProperty(boundaryMaximumImpactRatioId, boundaryMaximumImpactRatio, nullptr);
    tree.setProperty(runningIntervalThresholdId, runningIntervalThreshold, nullptr);
    tree.setProperty(echoWindowSecondsId, echoWindowSeconds, nullptr);
    tree.setProperty(echoDbDropThresholdId, echoDbDropThreshold, nullptr);
    tree.setProperty(unknownConfidenceId, unknownConfidence, nullptr);
    return tree;
}

juce::Result ClassifierConfig::loadFromXmlFile(const juce::File& file, ClassifierConfig& result)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Classifier config not found: " + file.getFullPathName());

    std::unique_ptr<juce::XmlElement> xml(juce::XmlDocument::parse(file));

    if (xml == nullptr)
        return juce::Result::fail("Could not parse " + file.getFullPathName());

    if (!xml->hasTagName(stateType.toString()))
        return juce::Result::fail("Expected a <" + stateType.toString() + "> element in " + file.getFileName());

    result = fromValueTree(juce::ValueTree::fromXml(*xml));
    return juce::Result::ok();
}
