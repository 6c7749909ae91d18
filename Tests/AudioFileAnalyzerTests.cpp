#include <gtest/gtest.h>
#include "AudioFileAnalyzer.h"
#include "TestSignals.h"
#include <cmath>

namespace
{
    void writeWav(const juce::File& file, const juce::AudioBuffer<float>& audio)
    {
        file.deleteFile();

        juce::WavAudioFormat wav;
        std::unique_ptr<juce::AudioFormatWriter> writer(wav.createWriterFor(new juce::FileOutputStream(file),
                                                                            TestSignals::sampleRate,
                                                                            (unsigned int) audio.getNumChannels(),
                                                                            32, {}, 0));
        ASSERT_TRUE(writer != nullptr);
        ASSERT_TRUE(writer->writeFromAudioSampleBuffer(audio, 0, audio.getNumSamples()));
    }

    FootstepEvent makeEvent(FootstepType type, float decibels, float frequency)
    {
        FootstepEvent event;
        event.classification.type = type;
        event.classification.decibelLevel = decibels;
        event.classification.dominantFrequency = frequency;
        return event;
    }
}

TEST(AudioFileAnalyzer, FindsTheThudInARecording)
{
    juce::TemporaryFile temp(".wav");
    writeWav(temp.getFile(), TestSignals::makeImpactRecording());

    AnalysisContext context;
    AudioFileAnalyzer analyzer(context);
    AudioFileAnalyzer::Results results;

    const auto result = analyzer.analyse(temp.getFile(), results);

    ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    ASSERT_EQ(results.events.size(), 1u);
    EXPECT_NEAR(results.events[0].timestampInRecording, 25 * TestSignals::bufferDuration(), 1.0e-6);

    const auto& summary = results.summary;
    EXPECT_EQ(summary.totalEvents, 1);
    EXPECT_EQ(summary.getCount(FootstepType::hardStomping) + summary.getCount(FootstepType::extremeStomping), 1);
    EXPECT_EQ(summary.getCount(FootstepType::running), 0);
    EXPECT_NEAR(summary.averageDecibels, 70.0f, 0.5f);
    EXPECT_NEAR(summary.averageDominantFrequency, 60.0f, 10.0f);
    EXPECT_TRUE(summary.ambientCalibrated);
    EXPECT_NEAR(summary.ambientLevel, 30.0f, 0.1f);
    EXPECT_NEAR(summary.durationSeconds, TestSignals::makeImpactRecording().getNumSamples() / TestSignals::sampleRate, 1.0e-6);
}

TEST(AudioFileAnalyzer, QuietRecordingHasNoEvents)
{
    juce::TemporaryFile temp(".wav");
    writeWav(temp.getFile(), TestSignals::makeSineAtDecibels(30.0f, 20 * TestSignals::bufferSize));

    AnalysisContext context;
    AudioFileAnalyzer analyzer(context);
    AudioFileAnalyzer::Results results;

    ASSERT_TRUE(analyzer.analyse(temp.getFile(), results).wasOk());
    EXPECT_TRUE(results.events.empty());
    EXPECT_EQ(results.summary.totalEvents, 0);
    EXPECT_EQ(results.summary.averageDecibels, 0.0f);
}

TEST(AudioFileAnalyzer, MissingFileFails)
{
    AnalysisContext context;
    AudioFileAnalyzer analyzer(context);
    AudioFileAnalyzer::Results results;

    const auto missing = juce::File::getSpecialLocation(juce::File::tempDirectory).getNonexistentChildFile("missing", ".wav");
    const auto result = analyzer.analyse(missing, results);

    EXPECT_TRUE(result.failed());
    EXPECT_TRUE(result.getErrorMessage().contains("not found"));
}

TEST(AudioFileAnalyzer, NonAudioFileFails)
{
    juce::TemporaryFile temp(".wav");
    ASSERT_TRUE(temp.getFile().replaceWithText("definitely not a wave file"));

    AnalysisContext context;
    AudioFileAnalyzer analyzer(context);
    std::vector<SpectralProfile> profiles;

    const auto result = analyzer.spectralProfile(temp.getFile(), 35.0f, profiles);

    EXPECT_TRUE(result.failed());
    EXPECT_TRUE(profiles.empty());
}

TEST(AudioFileAnalyzer, SpectralProfileOfLoudBuffers)
{
    juce::TemporaryFile temp(".wav");
    writeWav(temp.getFile(), TestSignals::makeImpactRecording());

    AnalysisContext context;
    AudioFileAnalyzer analyzer(context);
    std::vector<SpectralProfile> profiles;

    ASSERT_TRUE(analyzer.spectralProfile(temp.getFile(), AudioFileAnalyzer::defaultProfileThresholdDb, profiles).wasOk());

    // The tail of the thud in the next buffer is too close to count again
    ASSERT_EQ(profiles.size(), 1u);

    const auto& profile = profiles[0];
    EXPECT_NEAR(profile.timestamp, 25 * TestSignals::bufferDuration(), 1.0e-6);
    EXPECT_NEAR(profile.decibelLevel, 70.0f, 0.5f);
    EXPECT_NEAR(profile.dominantFrequency, 60.0f, 10.0f);
    EXPECT_GE(profile.impactRatio, 0.7f);
    EXPECT_NEAR(profile.crestFactor, std::sqrt(2.0f), 0.05f);
    EXPECT_NEAR(profile.impactRatio + profile.lowMidRatio + profile.midRatio + profile.highMidRatio + profile.highRatio, 1.0f, 1.0e-4f);

    ASSERT_TRUE(analyzer.spectralProfile(temp.getFile(), 80.0f, profiles).wasOk());
    EXPECT_TRUE(profiles.empty());
}

TEST(AudioFileAnalyzer, SummaryAveragesAndCounts)
{
    const std::vector<FootstepEvent> events {
        makeEvent(FootstepType::mildStomping, 46.0f, 40.0f),
        makeEvent(FootstepType::mildStomping, 48.0f, 50.0f),
        makeEvent(FootstepType::running, 58.0f, 60.0f),
    };

    AmbientLevelTracker::Snapshot ambient;
    ambient.ambientLevel = 38.0f;
    ambient.calibrated = true;

    const auto summary = AudioFileAnalyzer::summarise(events, ambient, 12.5);

    EXPECT_EQ(summary.totalEvents, 3);
    EXPECT_EQ(summary.getCount(FootstepType::mildStomping), 2);
    EXPECT_EQ(summary.getCount(FootstepType::running), 1);
    EXPECT_EQ(summary.getCount(FootstepType::hardStomping), 0);
    EXPECT_NEAR(summary.averageDecibels, 50.6667f, 0.001f);
    EXPECT_NEAR(summary.averageDominantFrequency, 50.0f, 0.001f);
    EXPECT_FLOAT_EQ(summary.ambientLevel, 38.0f);
    EXPECT_DOUBLE_EQ(summary.durationSeconds, 12.5);
}
