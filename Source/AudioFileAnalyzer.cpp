#include "AudioFileAnalyzer.h"
#include "DecibelCalculator.h"
#include "SpectrumAnalyzer.h"

int AnalysisSummary::getCount(FootstepType type) const
{
    const auto it = countsByType.find(type);
    return it != countsByType.end() ? it->second : 0;
}

//==============================================================================
AudioFileAnalyzer::AudioFileAnalyzer(AnalysisContext& contextToUse, ClassifierConfig config)
    : context(contextToUse), classifierConfig(config)
{
    formatManager.registerBasicFormats();
}

juce::Result AudioFileAnalyzer::openReader(const juce::File& file, std::unique_ptr<juce::AudioFormatReader>& reader)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Audio file not found: " + file.getFullPathName());

    reader.reset(formatManager.createReaderFor(file));

    if (reader == nullptr)
        return juce::Result::fail("Unsupported or unreadable audio file: " + file.getFullPathName());

    if (reader->sampleRate <= 0.0 || reader->numChannels == 0)
        return juce::Result::fail("Audio file has no usable audio: " + file.getFileName());

    return juce::Result::ok();
}

template <typename Callback>
void AudioFileAnalyzer::forEachBuffer(juce::AudioFormatReader& reader, Callback&& callback)
{
    juce::AudioBuffer<float> buffer(1, bufferSize);
    const auto totalFrames = reader.lengthInSamples;

    for (juce::int64 frame = 0; frame < totalFrames; frame += bufferSize)
    {
        const auto framesToRead = (int) juce::jmin((juce::int64) bufferSize, totalFrames - frame);

        buffer.setSize(1, framesToRead, false, false, true);
        reader.read(&buffer, 0, framesToRead, frame, true, false);

        callback(buffer, (double) frame / reader.sampleRate);
    }
}

juce::Result AudioFileAnalyzer::analyse(const juce::File& file, Results& results)
{
    std::unique_ptr<juce::AudioFormatReader> reader;
    const auto opened = openReader(file, reader);

    if (opened.failed())
        return opened;

    juce::Logger::writeToLog("Analysing " + file.getFileName() + " ("
                             + juce::String(reader->sampleRate, 0) + " Hz, "
                             + juce::String(reader->lengthInSamples) + " frames)");

    AnalysisOrchestrator::Options options;
    options.mode = AnalysisOrchestrator::ExecutionMode::synchronous;
    options.classifierConfig = classifierConfig;

    AnalysisOrchestrator orchestrator(context, options);
    FootstepEventCollector collector;
    orchestrator.addListener(&collector);

    RecordingSession session;
    orchestrator.start(session);

    const auto sampleRate = reader->sampleRate;
    forEachBuffer(*reader, [&](const juce::AudioBuffer<float>& buffer, double timestamp)
    {
        orchestrator.processBuffer(buffer, sampleRate, timestamp);
    });

    const auto ambient = context.getAmbientTracker().getSnapshot();
    orchestrator.stop();
    orchestrator.removeListener(&collector);

    results.events = collector.getEvents();
    results.summary = summarise(results.events, ambient, (double) reader->lengthInSamples / sampleRate);

    juce::Logger::writeToLog("Found " + juce::String(results.summary.totalEvents) + " footstep events in "
                             + file.getFileName());
    return juce::Result::ok();
}

juce::Result AudioFileAnalyzer::spectralProfile(const juce::File& file, float thresholdDb, std::vector<SpectralProfile>& profiles)
{
    std::unique_ptr<juce::AudioFormatReader> reader;
    const auto opened = openReader(file, reader);

    if (opened.failed())
        return opened;

    SpectrumAnalyzer analyzer(SpectrumAnalyzer::defaultFFTOrder, reader->sampleRate);
    const auto calibration = context.getSensitivitySettings().getCalibrationOffset();
    std::optional<double> lastProfileTime;

    profiles.clear();

    forEachBuffer(*reader, [&](const juce::AudioBuffer<float>& buffer, double timestamp)
    {
        const auto* samples = buffer.getReadPointer(0);
        const auto numSamples = buffer.getNumSamples();
        const auto decibelLevel = DecibelCalculator::calculateDecibelsSPL(samples, numSamples, calibration);

        if (decibelLevel < thresholdDb)
            return;

        if (lastProfileTime.has_value() && timestamp - *lastProfileTime < minimumProfileSpacing)
            return;

        const auto spectrum = analyzer.analyze(buffer);

        if (!spectrum.has_value())
            return;

        const auto total = spectrum->getTotalEnergy();
        const auto ratio = [total](float energy) { return total > 0.0f ? energy / total : 0.0f; };

        SpectralProfile profile;
        profile.timestamp = timestamp;
        profile.decibelLevel = decibelLevel;
        profile.dominantFrequency = spectrum->dominantFrequency;
        profile.spectralCentroid = spectrum->spectralCentroid;
        profile.crestFactor = DecibelCalculator::calculateCrestFactor(samples, numSamples);
        profile.impactRatio = ratio(spectrum->impactEnergy);
        profile.lowMidRatio = ratio(spectrum->lowMidEnergy);
        profile.midRatio = ratio(spectrum->midEnergy);
        profile.highMidRatio = ratio(spectrum->highMidEnergy);
        profile.highRatio = ratio(spectrum->highEnergy);

        profiles.push_back(profile);
        lastProfileTime = timestamp;
    });

    return juce::Result::ok();
}

AnalysisSummary AudioFileAnalyzer::summarise(const std::vector<FootstepEvent>& events,
                                             const AmbientLevelTracker::Snapshot& ambient,
                                             double durationSeconds)
{
    AnalysisSummary summary;
    summary.totalEvents = (int) events.size();
    summary.ambientLevel = ambient.ambientLevel;
    summary.ambientCalibrated = ambient.calibrated;
    summary.durationSeconds = durationSeconds;

    if (events.empty())
        return summary;

    double decibelSum = 0.0;
    double frequencySum = 0.0;

    for (const auto& event : events)
    {
        ++summary.countsByType[event.classification.type];
        decibelSum += event.classification.decibelLevel;
        frequencySum += event.classification.dominantFrequency;
    }

    summary.averageDecibels = (float)(decibelSum / (double) events.size());
    summary.averageDominantFrequency = (float)(frequencySum / (double) events.size());
    return summary;
}
