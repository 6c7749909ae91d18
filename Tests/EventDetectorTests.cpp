#include <gtest/gtest.h>
#include "EventDetector.h"
#include "TestSignals.h"
#include <cmath>

TEST(EventDetector, SilenceIsNotACandidate)
{
    EventDetector detector;

    EXPECT_FALSE(detector.analyze(TestSignals::makeSilence(), TestSignals::sampleRate, 0.0).has_value());
    EXPECT_FALSE(detector.getLastEventTime().has_value());
}

TEST(EventDetector, EmptyBufferIsIgnored)
{
    EventDetector detector;

    EXPECT_FALSE(detector.analyze(juce::AudioBuffer<float>(), TestSignals::sampleRate, 0.0).has_value());
    EXPECT_FALSE(detector.isCandidate(nullptr, 0, 0.0));
}

TEST(EventDetector, ImpactBecomesCandidate)
{
    EventDetector detector;
    const auto impact = TestSignals::makeImpact();

    const auto candidate = detector.analyze(impact, TestSignals::sampleRate, 1.5);

    ASSERT_TRUE(candidate.has_value());
    EXPECT_DOUBLE_EQ(candidate->timestamp, 1.5);
    EXPECT_DOUBLE_EQ(candidate->sampleRate, TestSignals::sampleRate);
    EXPECT_NEAR(candidate->rmsAmplitude, 0.8f / std::sqrt(2.0f), 0.01f);
    EXPECT_EQ(candidate->buffer.getNumSamples(), impact.getNumSamples());
    EXPECT_EQ(candidate->buffer.getSample(0, 1000), impact.getSample(0, 1000));
    ASSERT_TRUE(detector.getLastEventTime().has_value());
    EXPECT_DOUBLE_EQ(*detector.getLastEventTime(), 1.5);
}

TEST(EventDetector, CandidateIsMonoCopyOfFirstChannel)
{
    EventDetector detector;
    auto stereo = TestSignals::makeSine(60.0f, 0.8f, TestSignals::bufferSize, 2);
    stereo.clear(1, 0, stereo.getNumSamples());

    const auto candidate = detector.analyze(stereo, TestSignals::sampleRate, 0.0);

    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->buffer.getNumChannels(), 1);
    EXPECT_EQ(candidate->buffer.getSample(0, 300), stereo.getSample(0, 300));
}

TEST(EventDetector, QuietSignalStaysBelowThreshold)
{
    EventDetector detector;

    // RMS 0.0056 against the 0.0075 default gate
    EXPECT_FALSE(detector.analyze(TestSignals::makeSineAtDecibels(30.0f), TestSignals::sampleRate, 0.0).has_value());
}

TEST(EventDetector, MinimumIntervalBetweenCandidates)
{
    EventDetector detector;
    const auto impact = TestSignals::makeImpact();

    EXPECT_TRUE(detector.analyze(impact, TestSignals::sampleRate, 1.0).has_value());
    EXPECT_FALSE(detector.analyze(impact, TestSignals::sampleRate, 1.05).has_value());
    EXPECT_TRUE(detector.analyze(impact, TestSignals::sampleRate, 1.1).has_value());
    EXPECT_FALSE(detector.analyze(impact, TestSignals::sampleRate, 0.5).has_value());
}

TEST(EventDetector, SteadyLevelHasNoPeak)
{
    EventDetector detector;

    // Loud but flat: no window contains a valley
    EXPECT_FALSE(detector.analyze(TestSignals::makeConstant(0.5f), TestSignals::sampleRate, 0.0).has_value());
}

TEST(EventDetector, ShortBuffersOnlyNeedOneLoudSample)
{
    EventDetector detector;
    auto shortBuffer = TestSignals::makeSilence(200);
    shortBuffer.setSample(0, 50, 0.9f);

    EXPECT_TRUE(detector.detectPeaks(shortBuffer.getReadPointer(0), 200));
    EXPECT_TRUE(detector.isCandidate(shortBuffer.getReadPointer(0), 200, 0.0));
}

TEST(EventDetector, ResetForgetsLastEvent)
{
    EventDetector detector;
    const auto impact = TestSignals::makeImpact();

    ASSERT_TRUE(detector.analyze(impact, TestSignals::sampleRate, 2.0).has_value());

    detector.reset();

    EXPECT_FALSE(detector.getLastEventTime().has_value());
    EXPECT_TRUE(detector.analyze(impact, TestSignals::sampleRate, 2.01).has_value());
}

TEST(EventDetector, ThresholdIsClamped)
{
    EventDetector detector;

    detector.setDetectionThreshold(2.0f);
    EXPECT_FLOAT_EQ(detector.getDetectionThreshold(), 1.0f);

    detector.setDetectionThreshold(-1.0f);
    EXPECT_FLOAT_EQ(detector.getDetectionThreshold(), 0.0f);

    detector.setDetectionThreshold(0.02f);
    detector.setDetectionThreshold(std::nanf(""));
    EXPECT_FLOAT_EQ(detector.getDetectionThreshold(), 0.02f);
}

TEST(EventDetector, RaisedThresholdRejectsModerateImpacts)
{
    EventDetector detector(0.7f);

    EXPECT_FALSE(detector.analyze(TestSignals::makeImpact(), TestSignals::sampleRate, 0.0).has_value());
}
