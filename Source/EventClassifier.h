#pragma once

#include "ClassifierConfig.h"
#include "EventDetector.h"
#include "FootstepTypes.h"
#include "SensitivitySettings.h"
#include "SpectrumAnalyzer.h"
#include <optional>
#include <utility>

// Everything the classifier needs besides the candidate and its spectrum
struct ClassificationContext
{
    float ambientLevel = 30.0f;
    SensitivityConfig sensitivity;
    std::optional<EventMark> lastConfirmedEvent;
    std::optional<EventMark> lastLoudEvent;
    double currentTime = 0.0;
};

enum class ClassificationOutcome
{
    classified,       // footstep type or unknown
    belowThreshold,   // quieter than the mild tier
    echoSuppressed,   // reflection of a recent louder event
    invalidInput      // empty or unusable buffer
};

struct ClassificationResult
{
    ClassificationOutcome outcome = ClassificationOutcome::invalidInput;
    std::optional<Classification> classification;
    float decibelLevel = 0.0f;
    float impactRatio = 0.0f;
};

class EventClassifier
{
public:
    virtual ~EventClassifier() = default;

    // Never throws. No result for rejected or invalid input.
    virtual ClassificationResult evaluate(const CandidateEvent& candidate,
                                          const FrequencySpectrum& spectrum,
                                          const ClassificationContext& context) const = 0;

    std::optional<Classification> classify(const CandidateEvent& candidate,
                                           const FrequencySpectrum& spectrum,
                                           const ClassificationContext& context) const
    {
        return evaluate(candidate, spectrum, context).classification;
    }
};

// Ambient-relative, impact-ratio-gated classifier with echo suppression and
// running detection
class FootstepEventClassifier : public EventClassifier
{
public:
    explicit FootstepEventClassifier(ClassifierConfig config = {});

    ClassificationResult evaluate(const CandidateEvent& candidate,
                                  const FrequencySpectrum& spectrum,
                                  const ClassificationContext& context) const override;

    const ClassifierConfig& getConfig() const { return config; }

    bool isFootstepCandidate(const FrequencySpectrum& spectrum, float decibelLevel) const;
    bool isLikelyEcho(float decibelLevel, const ClassificationContext& context) const;

    // Base stomping tier and its confidence for a qualifying footstep
    static std::pair<FootstepType, float> selectTier(float decibelLevel, float ambientLevel, float sensitivityOffset);

private:
    const ClassifierConfig config;
};
