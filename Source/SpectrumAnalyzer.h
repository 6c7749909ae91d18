#pragma once

#include <juce_dsp/juce_dsp.h>
#include <optional>
#include <vector>

struct FrequencySpectrum
{
    float impactEnergy = 0.0f;     // 20-100 Hz, floor impacts
    float lowMidEnergy = 0.0f;     // 100-300 Hz, heel strikes
    float midEnergy = 0.0f;        // 300-1000 Hz
    float highMidEnergy = 0.0f;    // 1-3 kHz, shuffling / scraping
    float highEnergy = 0.0f;       // 3-8 kHz, transients
    float dominantFrequency = 0.0f;
    float spectralCentroid = 0.0f;

    float getTotalEnergy() const;

    // impact / total, 0 when there is no energy at all
    float getImpactRatio() const;
};

class SpectrumAnalyzer
{
public:
    static constexpr int defaultFFTOrder = 11; // 2048 points

    explicit SpectrumAnalyzer(int fftOrder = defaultFFTOrder, double sampleRate = 44100.0);
    ~SpectrumAnalyzer();

    void prepare(double sampleRate);

    // Analyses the first fftSize samples (zero-padded if shorter).
    // Returns nothing only for an empty buffer.
    std::optional<FrequencySpectrum> analyze(const float* samples, int numSamples);
    std::optional<FrequencySpectrum> analyze(const juce::AudioBuffer<float>& buffer);

    int getFFTSize() const { return fftSize; }
    double getSampleRate() const { return sampleRate; }
    float getFrequencyResolution() const { return frequencyResolution; }

    // Amplitude spectrum of the last analysed buffer, fftSize / 2 bins
    const std::vector<float>& getAmplitudes() const { return amplitudes; }

private:
    float calculateBandEnergy(float lowFrequency, float highFrequency) const;
    float findDominantFrequency() const;
    float calculateSpectralCentroid() const;

    const int fftSize;
    double sampleRate = 44100.0;
    float frequencyResolution = 0.0f;

    juce::dsp::FFT fft;
    juce::dsp::WindowingFunction<float> window;
    std::vector<float> fftBuffer;
    std::vector<float> amplitudes;

    JUCE_DECLARE_NON_COPYABLE(SpectrumAnalyzer)
};
