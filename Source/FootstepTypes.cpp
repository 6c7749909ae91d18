#include "FootstepTypes.h"

namespace FootstepTypes
{
    juce::String toId(FootstepType type)
    {
        switch (type)
        {
            case FootstepType::mildStomping:    return "mild_stomping";
            case FootstepType::mediumStomping:  return "medium_stomping";
            case FootstepType::hardStomping:    return "hard_stomping";
            case FootstepType::extremeStomping: return "extreme_stomping";
            case FootstepType::running:         return "running";
            case FootstepType::unknown:         break;
        }

        return "unknown";
    }

    juce::String getDisplayName(FootstepType type)
    {
        switch (type)
        {
            case FootstepType::mildStomping:    return "Mild Stomping";
            case FootstepType::mediumStomping:  return "Medium Stomping";
            case FootstepType::hardStomping:    return "Hard Stomping";
            case FootstepType::extremeStomping: return "Extreme Stomping";
            case FootstepType::running:         return "Running";
            case FootstepType::unknown:         break;
        }

        return "Unknown";
    }

    std::optional<FootstepType> fromId(const juce::String& id)
    {
        for (auto type : getAllTypes())
            if (toId(type) == id.trim())
                return type;

        return std::nullopt;
    }

    bool isFootstep(FootstepType type)
    {
        return type != FootstepType::unknown;
    }

    const juce::Array<FootstepType>& getAllTypes()
    {
        static const juce::Array<FootstepType> types { FootstepType::mildStomping,
                                                       FootstepType::mediumStomping,
                                                       FootstepType::hardStomping,
                                                       FootstepType::extremeStomping,
                                                       FootstepType::running,
                                                       FootstepType::unknown };
        return types;
    }
}

FootstepEvent FootstepEvent::withoutAudioClip() const
{
    FootstepEvent copy;
    copy.id = id;
    copy.sessionId = sessionId;
    copy.detectedAt = detectedAt;
    copy.timestampInRecording = timestampInRecording;
    copy.classification = classification;
    return copy;
}

juce::RelativeTime RecordingSession::getDuration() const
{
    return endTime.value_or(juce::Time::getCurrentTime()) - startTime;
}
