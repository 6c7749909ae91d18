#pragma once

#include "AnalysisContext.h"
#include "ClassifierConfig.h"
#include "EventClassifier.h"
#include "EventDetector.h"
#include "FootstepTypes.h"
#include "SpectrumAnalyzer.h"
#include <deque>
#include <memory>
#include <optional>
#include <vector>

// Runs one recording session's buffers through ambient tracking, detection,
// spectral analysis and classification, and reports footstep events.
//
// In synchronous mode everything happens inside processBuffer(). In background
// mode processBuffer() only does the cheap stages; candidates are classified in
// arrival order on a single worker thread and listeners are called from there.
//
// stop() discards queued candidates. A classification already running when
// stop() is called is delivered before stop() returns; nothing is delivered
// for the session afterwards. Listeners may call the getters from any thread,
// but must not wait on a thread that is calling stop().
class AnalysisOrchestrator
{
public:
    enum class ExecutionMode
    {
        synchronous,
        background
    };

    enum class State
    {
        idle,
        analyzing
    };

    struct Options
    {
        ExecutionMode mode = ExecutionMode::synchronous;
        ClassifierConfig classifierConfig;
        int fftOrder = SpectrumAnalyzer::defaultFFTOrder;
        bool keepAudioClips = false;
    };

    class Listener
    {
    public:
        virtual ~Listener() = default;

        virtual void footstepDetected(const FootstepEvent& event) = 0;
        virtual void analysisStarted(const RecordingSession&) {}
        virtual void analysisStopped() {}
    };

    explicit AnalysisOrchestrator(AnalysisContext& context);
    AnalysisOrchestrator(AnalysisContext& context, Options options);
    AnalysisOrchestrator(AnalysisContext& context, std::unique_ptr<EventClassifier> classifier);
    AnalysisOrchestrator(AnalysisContext& context, std::unique_ptr<EventClassifier> classifier, Options options);
    ~AnalysisOrchestrator();

    // Idempotent while already analyzing
    void start(const RecordingSession& session);
    void stop();

    // Ignored while idle. Channel 0 is analysed.
    void processBuffer(const juce::AudioBuffer<float>& buffer, double sampleRate, double timestamp);

    // Blocks until every queued candidate has been classified (background mode)
    void flush();

    State getState() const;
    bool isAnalyzing() const { return getState() == State::analyzing; }
    std::optional<juce::Uuid> getCurrentSessionId() const;
    std::optional<RecordingSession> getCurrentSession() const;

    std::optional<EventMark> getLastConfirmedEvent() const;
    std::optional<EventMark> getLastLoudEvent() const;
    int getPendingCount() const;

    void addListener(Listener* listener)      { listeners.add(listener); }
    void removeListener(Listener* listener)   { listeners.remove(listener); }

    AnalysisContext& getContext() { return context; }
    const Options& getOptions() const { return options; }

private:
    struct SessionAnalysisState
    {
        std::optional<EventMark> lastConfirmedEvent;
        std::optional<EventMark> lastLoudEvent;
    };

    // Candidate plus the settings in force when it was detected
    struct PendingCandidate
    {
        CandidateEvent candidate;
        float ambientLevel = AmbientLevelTracker::defaultAmbientLevel;
        SensitivityConfig sensitivity;
        juce::Uuid sessionId;
        juce::uint32 generation = 0;
    };

    class ClassificationWorker;

    std::optional<PendingCandidate> detectCandidate(const juce::AudioBuffer<float>& buffer, double sampleRate, double timestamp);
    std::optional<FootstepEvent> classify(const PendingCandidate& job);
    void deliver(const FootstepEvent& event);
    void classifyAndDeliver(const PendingCandidate& job);
    bool classifyNextPending();
    void enqueue(PendingCandidate job);
    void discardPending();

    AnalysisContext& context;
    const Options options;
    std::unique_ptr<EventClassifier> classifier;
    SpectrumAnalyzer spectrumAnalyzer;
    EventDetector detector;

    // Lock order: deliveryLock, classificationLock, sessionLock. queueLock is never held with the others.
    // Listeners are called with deliveryLock only.
    mutable juce::CriticalSection deliveryLock;
    mutable juce::CriticalSection classificationLock; // sessionState, spectrumAnalyzer
    mutable juce::CriticalSection sessionLock; // state, generation, detector, currentSession
    mutable juce::CriticalSection queueLock;   // pending, pendingCount

    State state = State::idle;
    juce::uint32 generation = 0;
    std::optional<RecordingSession> currentSession;
    std::optional<SessionAnalysisState> sessionState;

    std::deque<PendingCandidate> pending;
    int pendingCount = 0; // queued + being classified
    juce::WaitableEvent queueDrained;

    juce::ListenerList<Listener, juce::Array<Listener*, juce::CriticalSection>> listeners;
    std::unique_ptr<ClassificationWorker> worker;

    JUCE_DECLARE_NON_COPYABLE(AnalysisOrchestrator)
};

// Listener that keeps every event it receives
class FootstepEventCollector : public AnalysisOrchestrator::Listener
{
public:
    void footstepDetected(const FootstepEvent& event) override;

    std::vector<FootstepEvent> getEvents() const;
    int getNumEvents() const;
    void clear();

private:
    std::vector<FootstepEvent> events;
    mutable juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE(FootstepEventCollector)
};
