#include <gtest/gtest.h>
#include "DecibelCalculator.h"
#include "TestSignals.h"
#include <cmath>
#include <limits>

TEST(DecibelCalculator, RmsOfWholePeriodSine)
{
    const auto buffer = TestSignals::makeSine(TestSignals::wholePeriodFrequency, 0.5f);
    const auto rms = DecibelCalculator::calculateRMS(buffer.getReadPointer(0), buffer.getNumSamples());

    EXPECT_NEAR(rms, 0.5f / std::sqrt(2.0f), 1.0e-4f);
}

TEST(DecibelCalculator, EmptyInputIsSilence)
{
    EXPECT_EQ(DecibelCalculator::calculateRMS(nullptr, 0), 0.0f);
    EXPECT_EQ(DecibelCalculator::calculateDecibels(nullptr, 0), DecibelCalculator::minimumDecibels);
    EXPECT_EQ(DecibelCalculator::calculateDecibelsSPL(juce::AudioBuffer<float>()), DecibelCalculator::minimumDecibelsSPL);
}

TEST(DecibelCalculator, SilenceClampsToFloor)
{
    const auto silence = TestSignals::makeSilence();

    EXPECT_NEAR(DecibelCalculator::calculateDecibels(silence.getReadPointer(0), silence.getNumSamples()),
                DecibelCalculator::minimumDecibels, 1.0e-3f);
    EXPECT_EQ(DecibelCalculator::calculateDecibelsSPL(silence), 0.0f);
}

TEST(DecibelCalculator, FullScaleIsBaseOffset)
{
    const auto buffer = TestSignals::makeConstant(1.0f, 256);

    EXPECT_NEAR(DecibelCalculator::calculateDecibels(buffer.getReadPointer(0), 256), 0.0f, 1.0e-4f);
    EXPECT_NEAR(DecibelCalculator::calculateDecibelsSPL(buffer), 75.0f, 1.0e-3f);
}

TEST(DecibelCalculator, SineAtRequestedLevel)
{
    for (auto target : { 30.0f, 46.0f, 61.0f })
    {
        const auto buffer = TestSignals::makeSineAtDecibels(target);
        EXPECT_NEAR(DecibelCalculator::calculateDecibelsSPL(buffer), target, 0.01f) << target;
    }
}

TEST(DecibelCalculator, CalibrationShiftsSPL)
{
    const auto buffer = TestSignals::makeSineAtDecibels(50.0f);

    EXPECT_NEAR(DecibelCalculator::calculateDecibelsSPL(buffer, 10.0f), 60.0f, 0.01f);
    EXPECT_NEAR(DecibelCalculator::calculateDecibelsSPL(buffer, -20.0f), 30.0f, 0.01f);
}

TEST(DecibelCalculator, SplIsClamped)
{
    EXPECT_EQ(DecibelCalculator::dbFSToSPL(100.0f), DecibelCalculator::maximumDecibelsSPL);
    EXPECT_EQ(DecibelCalculator::dbFSToSPL(-200.0f), DecibelCalculator::minimumDecibelsSPL);
    EXPECT_EQ(DecibelCalculator::dbFSToSPL(std::numeric_limits<float>::quiet_NaN()), DecibelCalculator::minimumDecibelsSPL);
}

TEST(DecibelCalculator, SplAndDbFSAreInverse)
{
    EXPECT_NEAR(DecibelCalculator::splToDbFS(DecibelCalculator::dbFSToSPL(-30.0f, 5.0f), 5.0f), -30.0f, 1.0e-4f);
}

TEST(DecibelCalculator, NonFiniteSamplesStayFinite)
{
    auto buffer = TestSignals::makeSineAtDecibels(50.0f, 512);
    buffer.setSample(0, 10, std::numeric_limits<float>::quiet_NaN());
    buffer.setSample(0, 20, std::numeric_limits<float>::infinity());

    const auto* samples = buffer.getReadPointer(0);

    EXPECT_TRUE(std::isfinite(DecibelCalculator::calculateRMS(samples, 512)));
    EXPECT_TRUE(std::isfinite(DecibelCalculator::calculatePeak(samples, 512)));
    EXPECT_TRUE(std::isfinite(DecibelCalculator::calculateDecibelsSPL(samples, 512)));
    EXPECT_EQ(DecibelCalculator::rmsToDecibels(std::numeric_limits<float>::quiet_NaN()), DecibelCalculator::minimumDecibels);
}

TEST(DecibelCalculator, CrestFactor)
{
    const auto sine = TestSignals::makeSine(TestSignals::wholePeriodFrequency, 0.5f);
    const auto silence = TestSignals::makeSilence(128);

    EXPECT_NEAR(DecibelCalculator::calculateCrestFactor(sine.getReadPointer(0), sine.getNumSamples()), std::sqrt(2.0f), 0.01f);
    EXPECT_EQ(DecibelCalculator::calculateCrestFactor(silence.getReadPointer(0), 128), 0.0f);
}

TEST(DecibelCalculator, DecibelsToAmplitude)
{
    EXPECT_NEAR(DecibelCalculator::decibelsToAmplitude(0.0f), 1.0f, 1.0e-6f);
    EXPECT_NEAR(DecibelCalculator::decibelsToAmplitude(-20.0f), 0.1f, 1.0e-6f);
    EXPECT_EQ(DecibelCalculator::decibelsToAmplitude(std::numeric_limits<float>::quiet_NaN()), 0.0f);
}

TEST(DecibelCalculator, Normalisation)
{
    EXPECT_FLOAT_EQ(DecibelCalculator::normalizeDecibels(-160.0f), 0.0f);
    EXPECT_FLOAT_EQ(DecibelCalculator::normalizeDecibels(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(DecibelCalculator::normalizeDecibelsSPL(65.0f), 0.5f);
    EXPECT_FLOAT_EQ(DecibelCalculator::normalizeDecibelsSPL(10.0f), 0.0f);
    EXPECT_FLOAT_EQ(DecibelCalculator::normalizeDecibelsSPL(120.0f), 1.0f);
}
