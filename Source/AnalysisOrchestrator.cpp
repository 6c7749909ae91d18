#include "AnalysisOrchestrator.h"

class AnalysisOrchestrator::ClassificationWorker : public juce::Thread
{
public:
    explicit ClassificationWorker(AnalysisOrchestrator& o)
        : juce::Thread("Footstep classification"), owner(o)
    {
    }

    ~ClassificationWorker() override
    {
        signalThreadShouldExit();
        notify();
        stopThread(2000);
    }

    void run() override
    {
        while (!threadShouldExit())
        {
            if (!owner.classifyNextPending())
                wait(100);
        }
    }

private:
    AnalysisOrchestrator& owner;

    JUCE_DECLARE_NON_COPYABLE(ClassificationWorker)
};

//==============================================================================
AnalysisOrchestrator::AnalysisOrchestrator(AnalysisContext& contextToUse)
    : AnalysisOrchestrator(contextToUse, Options())
{
}

AnalysisOrchestrator::AnalysisOrchestrator(AnalysisContext& contextToUse, Options optionsToUse)
    : AnalysisOrchestrator(contextToUse,
                           std::make_unique<FootstepEventClassifier>(optionsToUse.classifierConfig),
                           optionsToUse)
{
}

AnalysisOrchestrator::AnalysisOrchestrator(AnalysisContext& contextToUse, std::unique_ptr<EventClassifier> classifierToUse)
    : AnalysisOrchestrator(contextToUse, std::move(classifierToUse), Options())
{
}

AnalysisOrchestrator::AnalysisOrchestrator(AnalysisContext& contextToUse,
                                           std::unique_ptr<EventClassifier> classifierToUse,
                                           Options optionsToUse)
    : context(contextToUse),
      options(optionsToUse),
      classifier(std::move(classifierToUse)),
      spectrumAnalyzer(optionsToUse.fftOrder),
      detector(context.getSensitivitySettings().getDetectionThreshold())
{
    if (classifier == nullptr)
        classifier = std::make_unique<FootstepEventClassifier>(options.classifierConfig);

    if (options.mode == ExecutionMode::background)
    {
        worker = std::make_unique<ClassificationWorker>(*this);
        worker->startThread();
    }
}

AnalysisOrchestrator::~AnalysisOrchestrator()
{
    listeners.clear();
    stop();
    worker.reset();
}

//==============================================================================
void AnalysisOrchestrator::start(const RecordingSession& session)
{
    {
        const juce::ScopedLock cl(classificationLock);
        const juce::ScopedLock sl(sessionLock);

        if (state == State::analyzing)
            return;

        ++generation;
        currentSession = session;
        sessionState = SessionAnalysisState();
        detector.reset();
        detector.setDetectionThreshold(context.getSensitivitySettings().getDetectionThreshold());
        context.resetAmbient();
        state = State::analyzing;
    }

    juce::Logger::writeToLog("Footstep analysis started for session " + session.id.toDashedString());
    listeners.call([&session](Listener& l) { l.analysisStarted(session); });
}

void AnalysisOrchestrator::stop()
{
    {
        const juce::ScopedLock sl(sessionLock);

        if (state == State::idle)
            return;

        state = State::idle;
        ++generation;
        detector.reset();
    }

    discardPending();

    {
        const juce::ScopedLock cl(classificationLock);
        const juce::ScopedLock sl(sessionLock);
        sessionState.reset();
        currentSession.reset();
    }

    // Waits for an event that is already being delivered
    {
        const juce::ScopedLock dl(deliveryLock);
    }

    juce::Logger::writeToLog("Footstep analysis stopped");
    listeners.call([](Listener& l) { l.analysisStopped(); });
}

void AnalysisOrchestrator::processBuffer(const juce::AudioBuffer<float>& buffer, double sampleRate, double timestamp)
{
    if (options.mode == ExecutionMode::background)
    {
        if (auto job = detectCandidate(buffer, sampleRate, timestamp))
            enqueue(std::move(*job));

        return;
    }

    if (auto job = detectCandidate(buffer, sampleRate, timestamp))
        classifyAndDeliver(*job);
}

void AnalysisOrchestrator::flush()
{
    for (;;)
    {
        {
            const juce::ScopedLock ql(queueLock);

            if (pendingCount == 0)
                return;
        }

        queueDrained.wait(50);
    }
}

//==============================================================================
AnalysisOrchestrator::State AnalysisOrchestrator::getState() const
{
    const juce::ScopedLock sl(sessionLock);
    return state;
}

std::optional<juce::Uuid> AnalysisOrchestrator::getCurrentSessionId() const
{
    const juce::ScopedLock sl(sessionLock);

    if (currentSession.has_value())
        return currentSession->id;

    return std::nullopt;
}

std::optional<RecordingSession> AnalysisOrchestrator::getCurrentSession() const
{
    const juce::ScopedLock sl(sessionLock);
    return currentSession;
}

std::optional<EventMark> AnalysisOrchestrator::getLastConfirmedEvent() const
{
    const juce::ScopedLock cl(classificationLock);
    return sessionState.has_value() ? sessionState->lastConfirmedEvent : std::nullopt;
}

std::optional<EventMark> AnalysisOrchestrator::getLastLoudEvent() const
{
    const juce::ScopedLock cl(classificationLock);
    return sessionState.has_value() ? sessionState->lastLoudEvent : std::nullopt;
}

int AnalysisOrchestrator::getPendingCount() const
{
    const juce::ScopedLock ql(queueLock);
    return pendingCount;
}

//==============================================================================
std::optional<AnalysisOrchestrator::PendingCandidate> AnalysisOrchestrator::detectCandidate(const juce::AudioBuffer<float>& buffer,
                                                                                             double sampleRate,
                                                                                             double timestamp)
{
    const juce::ScopedLock sl(sessionLock);

    if (state != State::analyzing || !currentSession.has_value())
        return std::nullopt;

    if (buffer.getNumChannels() == 0 || buffer.getNumSamples() == 0 || sampleRate <= 0.0)
        return std::nullopt;

    auto& sensitivity = context.getSensitivitySettings();
    auto& ambient = context.getAmbientTracker();
    const auto config = sensitivity.getConfig();

    ambient.addReading(buffer.getReadPointer(0), buffer.getNumSamples(), config.calibrationDb);

    detector.setDetectionThreshold(sensitivity.getDetectionThreshold());
    auto candidate = detector.analyze(buffer, sampleRate, timestamp);

    if (!candidate.has_value())
        return std::nullopt;

    PendingCandidate job;
    job.candidate = std::move(*candidate);
    job.ambientLevel = ambient.getAmbientLevel();
    job.sensitivity = config;
    job.sessionId = currentSession->id;
    job.generation = generation;
    return job;
}

std::optional<FootstepEvent> AnalysisOrchestrator::classify(const PendingCandidate& job)
{
    {
        const juce::ScopedLock sl(sessionLock);

        if (state != State::analyzing || job.generation != generation)
            return std::nullopt;
    }

    if (!sessionState.has_value())
        return std::nullopt;

    const auto& candidate = job.candidate;

    if (candidate.sampleRate > 0.0 && candidate.sampleRate != spectrumAnalyzer.getSampleRate())
        spectrumAnalyzer.prepare(candidate.sampleRate);

    const auto spectrum = spectrumAnalyzer.analyze(candidate.buffer);

    if (!spectrum.has_value())
        return std::nullopt;

    ClassificationContext classificationContext;
    classificationContext.ambientLevel = job.ambientLevel;
    classificationContext.sensitivity = job.sensitivity;
    classificationContext.lastConfirmedEvent = sessionState->lastConfirmedEvent;
    classificationContext.lastLoudEvent = sessionState->lastLoudEvent;
    classificationContext.currentTime = candidate.timestamp;

    const auto result = classifier->evaluate(candidate, *spectrum, classificationContext);

    if (!result.classification.has_value() || !FootstepTypes::isFootstep(result.classification->type))
        return std::nullopt;

    const EventMark mark { candidate.timestamp, result.classification->decibelLevel };
    sessionState->lastConfirmedEvent = mark;
    sessionState->lastLoudEvent = mark;

    {
        const juce::ScopedLock sl(sessionLock);

        if (currentSession.has_value())
            ++currentSession->eventCount;
    }

    FootstepEvent event;
    event.sessionId = job.sessionId;
    event.detectedAt = juce::Time::getCurrentTime();
    event.timestampInRecording = candidate.timestamp;
    event.classification = *result.classification;

    if (options.keepAudioClips)
    {
        event.audioClip.makeCopyOf(candidate.buffer);
        event.clipSampleRate = candidate.sampleRate;
    }

    return event;
}

void AnalysisOrchestrator::deliver(const FootstepEvent& event)
{
    juce::Logger::writeToLog("Footstep detected: " + FootstepTypes::getDisplayName(event.classification.type)
                             + " at " + juce::String(event.timestampInRecording, 3) + "s, "
                             + juce::String(event.classification.decibelLevel, 1) + " dB, confidence "
                             + juce::String(event.classification.confidence, 2));

    listeners.call([&event](Listener& l) { l.footstepDetected(event); });
}

void AnalysisOrchestrator::classifyAndDeliver(const PendingCandidate& job)
{
    const juce::ScopedLock dl(deliveryLock);
    std::optional<FootstepEvent> event;

    {
        const juce::ScopedLock cl(classificationLock);
        event = classify(job);
    }

    if (event.has_value())
        deliver(*event);
}

bool AnalysisOrchestrator::classifyNextPending()
{
    std::optional<PendingCandidate> job;

    {
        const juce::ScopedLock ql(queueLock);

        if (pending.empty())
            return false;

        job = std::move(pending.front());
        pending.pop_front();
    }

    classifyAndDeliver(*job);

    const juce::ScopedLock ql(queueLock);

    if (--pendingCount == 0)
        queueDrained.signal();

    return true;
}

void AnalysisOrchestrator::enqueue(PendingCandidate job)
{
    {
        const juce::ScopedLock ql(queueLock);
        pending.push_back(std::move(job));
        ++pendingCount;
    }

    if (worker != nullptr)
        worker->notify();
}

void AnalysisOrchestrator::discardPending()
{
    const juce::ScopedLock ql(queueLock);

    pendingCount -= static_cast<int>(pending.size());
    pending.clear();

    if (pendingCount == 0)
        queueDrained.signal();
}

//==============================================================================
void FootstepEventCollector::footstepDetected(const FootstepEvent& event)
{
    const juce::ScopedLock sl(lock);
    events.push_back(event);
}

std::vector<FootstepEvent> FootstepEventCollector::getEvents() const
{
    const juce::ScopedLock sl(lock);
    return events;
}

int FootstepEventCollector::getNumEvents() const
{
    const juce::ScopedLock sl(lock);
    return static_cast<int>(events.size());
}

void FootstepEventCollector::clear()
{
    const juce::ScopedLock sl(lock);
    events.clear();
}
