#include "SpectrumAnalyzer.h"
#include <algorithm>
#include <cmath>

namespace
{
    constexpr float impactBandLow = 20.0f;
    constexpr float impactBandHigh = 100.0f;

    constexpr float lowMidBandLow = 100.0f;
    constexpr float lowMidBandHigh = 300.0f;

    constexpr float midBandLow = 300.0f;
    constexpr float midBandHigh = 1000.0f;

    constexpr float highMidBandLow = 1000.0f;
    constexpr float highMidBandHigh = 3000.0f;

    constexpr float highBandLow = 3000.0f;
    constexpr float highBandHigh = 8000.0f;

    // DC and rumble are ignored when looking for the dominant peak
    constexpr float dominantSearchFloor = 20.0f;
}

float FrequencySpectrum::getTotalEnergy() const
{
    return impactEnergy + lowMidEnergy + midEnergy + highMidEnergy + highEnergy;
}

float FrequencySpectrum::getImpactRatio() const
{
    const auto total = getTotalEnergy();

    if (!(total > 0.0f) || !std::isfinite(total))
        return 0.0f;

    return juce::jlimit(0.0f, 1.0f, impactEnergy / total);
}

SpectrumAnalyzer::SpectrumAnalyzer(int fftOrder, double sampleRateToUse)
    : fftSize(1 << fftOrder),
      fft(fftOrder),
      window((size_t)(1 << fftOrder), juce::dsp::WindowingFunction<float>::hann, false)
{
    // performFrequencyOnlyForwardTransform needs room for 2 * fftSize floats
    fftBuffer.resize((size_t) fftSize * 2, 0.0f);
    amplitudes.resize((size_t) fftSize / 2, 0.0f);

    prepare(sampleRateToUse);
}

SpectrumAnalyzer::~SpectrumAnalyzer() = default;

void SpectrumAnalyzer::prepare(double newSampleRate)
{
    jassert(newSampleRate > 0.0);

    sampleRate = newSampleRate > 0.0 ? newSampleRate : 44100.0;
    frequencyResolution = static_cast<float>(sampleRate / fftSize);
}

std::optional<FrequencySpectrum> SpectrumAnalyzer::analyze(const juce::AudioBuffer<float>& buffer)
{
    if (buffer.getNumChannels() == 0)
        return std::nullopt;

    return analyze(buffer.getReadPointer(0), buffer.getNumSamples());
}

std::optional<FrequencySpectrum> SpectrumAnalyzer::analyze(const float* samples, int numSamples)
{
    if (samples == nullptr || numSamples <= 0)
        return std::nullopt;

    const auto analysisSize = std::min(numSamples, fftSize);

    std::fill(fftBuffer.begin(), fftBuffer.end(), 0.0f);

    for (int i = 0; i < analysisSize; ++i)
        fftBuffer[(size_t) i] = std::isfinite(samples[i]) ? samples[i] : 0.0f;

    // The window spans the full transform; padded zeros stay zero
    window.multiplyWithWindowingTable(fftBuffer.data(), (size_t) fftSize);

    fft.performFrequencyOnlyForwardTransform(fftBuffer.data());

    const auto scale = 2.0f / static_cast<float>(fftSize);

    for (size_t i = 0; i < amplitudes.size(); ++i)
    {
        const auto amplitude = fftBuffer[i] * scale;
        amplitudes[i] = std::isfinite(amplitude) ? amplitude : 0.0f;
    }

    FrequencySpectrum spectrum;
    spectrum.impactEnergy = calculateBandEnergy(impactBandLow, impactBandHigh);
    spectrum.lowMidEnergy = calculateBandEnergy(lowMidBandLow, lowMidBandHigh);
    spectrum.midEnergy = calculateBandEnergy(midBandLow, midBandHigh);
    spectrum.highMidEnergy = calculateBandEnergy(highMidBandLow, highMidBandHigh);
    spectrum.highEnergy = calculateBandEnergy(highBandLow, highBandHigh);
    spectrum.dominantFrequency = findDominantFrequency();
    spectrum.spectralCentroid = calculateSpectralCentroid();

    return spectrum;
}

float SpectrumAnalyzer::calculateBandEnergy(float lowFrequency, float highFrequency) const
{
    const auto lastBin = static_cast<int>(amplitudes.size()) - 1;
    const auto lowBin = juce::jmax(0, static_cast<int>(lowFrequency / frequencyResolution));
    const auto highBin = juce::jmin(lastBin, static_cast<int>(highFrequency / frequencyResolution));

    if (lowBin >= highBin)
        return 0.0f;

    double energy = 0.0;
    for (int i = lowBin; i <= highBin; ++i)
        energy += amplitudes[(size_t) i] * amplitudes[(size_t) i];

    return static_cast<float>(std::sqrt(energy / (highBin - lowBin + 1)));
}

float SpectrumAnalyzer::findDominantFrequency() const
{
    const auto startBin = juce::jmax(1, static_cast<int>(dominantSearchFloor / frequencyResolution));

    float maxAmplitude = 0.0f;
    int maxIndex = 0;

    for (int i = startBin; i < static_cast<int>(amplitudes.size()); ++i)
    {
        if (amplitudes[(size_t) i] > maxAmplitude)
        {
            maxAmplitude = amplitudes[(size_t) i];
            maxIndex = i;
        }
    }

    return static_cast<float>(maxIndex) * frequencyResolution;
}

float SpectrumAnalyzer::calculateSpectralCentroid() const
{
    double weightedSum = 0.0;
    double totalAmplitude = 0.0;

    for (size_t i = 0; i < amplitudes.size(); ++i)
    {
        weightedSum += static_cast<double>(i) * frequencyResolution * amplitudes[i];
        totalAmplitude += amplitudes[i];
    }

    if (totalAmplitude <= 0.0)
        return 0.0f;

    return static_cast<float>(weightedSum / totalAmplitude);
}
