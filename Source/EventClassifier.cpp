#include "EventClassifier.h"
#include "AmbientLevelTracker.h"
#include "DecibelCalculator.h"
#include <cmath>

namespace
{
    constexpr float tierWidthDb = 5.0f;

    // Extreme confidence keeps climbing until this far above its threshold
    constexpr float extremeSaturationDb = 20.0f;

    constexpr float maximumConfidence = 0.95f;
    constexpr float runningConfidenceBoost = 0.1f;

    float fractionWithinTier(float decibelLevel, float tierStart, float tierWidth)
    {
        return juce::jlimit(0.0f, 1.0f, (decibelLevel - tierStart) / tierWidth);
    }
}

FootstepEventClassifier::FootstepEventClassifier(ClassifierConfig configToUse)
    : config(configToUse)
{
}

ClassificationResult FootstepEventClassifier::evaluate(const CandidateEvent& candidate,
                                                       const FrequencySpectrum& spectrum,
                                                       const ClassificationContext& context) const
{
    ClassificationResult result;

    if (candidate.buffer.getNumChannels() == 0 || candidate.buffer.getNumSamples() == 0
         || !std::isfinite(context.currentTime) || !std::isfinite(context.ambientLevel))
        return result;

    const auto decibelLevel = DecibelCalculator::calculateDecibelsSPL(candidate.buffer, context.sensitivity.calibrationDb);
    const auto thresholds = AmbientLevelTracker::makeThresholds(context.ambientLevel, context.sensitivity.offsetDb);

    result.decibelLevel = decibelLevel;
    result.impactRatio = spectrum.getImpactRatio();

    if (decibelLevel < thresholds.mild)
    {
        result.outcome = ClassificationOutcome::belowThreshold;
        return result;
    }

    if (isLikelyEcho(decibelLevel, context))
    {
        result.outcome = ClassificationOutcome::echoSuppressed;
        return result;
    }

    std::optional<double> interval;

    if (context.lastConfirmedEvent.has_value())
        interval = juce::jmax(0.0, context.currentTime - context.lastConfirmedEvent->time);

    const auto nyquist = static_cast<float>(candidate.sampleRate > 0.0 ? candidate.sampleRate * 0.5 : 22050.0);
    const auto dominantFrequency = std::isfinite(spectrum.dominantFrequency)
                                     ? juce::jlimit(0.0f, nyquist, spectrum.dominantFrequency)
                                     : 0.0f;

    Classification classification;
    classification.decibelLevel = decibelLevel;
    classification.dominantFrequency = dominantFrequency;
    classification.intervalFromPrevious = interval;

    if (!isFootstepCandidate(spectrum, decibelLevel))
    {
        classification.type = FootstepType::unknown;
        classification.confidence = config.unknownConfidence;
    }
    else
    {
        auto [type, confidence] = selectTier(decibelLevel, context.ambientLevel, context.sensitivity.offsetDb);

        if (interval.has_value() && *interval <= config.runningIntervalThreshold)
        {
            type = FootstepType::running;
            confidence = juce::jmin(maximumConfidence, confidence + runningConfidenceBoost);
        }

        classification.type = type;
        classification.confidence = confidence;
    }

    classification.confidence = juce::jlimit(0.0f, 1.0f, classification.confidence);

    result.outcome = ClassificationOutcome::classified;
    result.classification = classification;
    return result;
}

bool FootstepEventClassifier::isFootstepCandidate(const FrequencySpectrum& spectrum, float decibelLevel) const
{
    const auto dominantFrequency = spectrum.dominantFrequency;
    const auto impactRatio = spectrum.getImpactRatio();

    if (!std::isfinite(dominantFrequency))
        return false;

    // Near the cutoff, tonal hum passes the impact-ratio test, so require
    // either a very loud hit or a moderate one with broadband content
    if (config.isBoundaryFrequency(dominantFrequency))
        return decibelLevel >= config.boundaryHighLevelDb
                || (decibelLevel >= config.boundaryModerateLevelDb && impactRatio < config.boundaryMaximumImpactRatio);

    return dominantFrequency <= config.lowFrequencyCutoff
            && impactRatio >= config.minimumImpactRatio;
}

bool FootstepEventClassifier::isLikelyEcho(float decibelLevel, const ClassificationContext& context) const
{
    if (!context.lastLoudEvent.has_value())
        return false;

    const auto timeSinceLoud = context.currentTime - context.lastLoudEvent->time;
    const auto dbDrop = context.lastLoudEvent->decibels - decibelLevel;

    return timeSinceLoud <= config.echoWindowSeconds && dbDrop >= config.echoDbDropThreshold;
}

std::pair<FootstepType, float> FootstepEventClassifier::selectTier(float decibelLevel, float ambientLevel, float sensitivityOffset)
{
    const auto thresholds = AmbientLevelTracker::makeThresholds(ambientLevel, sensitivityOffset);

    if (decibelLevel < thresholds.medium)
        return { FootstepType::mildStomping, 0.70f + fractionWithinTier(decibelLevel, thresholds.mild, tierWidthDb) * 0.05f };

    if (decibelLevel < thresholds.hard)
        return { FootstepType::mediumStomping, 0.75f + fractionWithinTier(decibelLevel, thresholds.medium, tierWidthDb) * 0.05f };

    if (decibelLevel < thresholds.extreme)
        return { FootstepType::hardStomping, 0.80f + fractionWithinTier(decibelLevel, thresholds.hard, tierWidthDb) * 0.05f };

    return { FootstepType::extremeStomping,
             0.85f + fractionWithinTier(decibelLevel, thresholds.extreme, extremeSaturationDb) * 0.10f };
}
