#include <gtest/gtest.h>
#include "dsp/SpectrogramEngine.h"
#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

using namespace SynthScan;
using namespace SynthScan::DSP;

class SpectrogramEngineTest : public ::testing::Test {
protected:
    Core::AudioSignal makeSine(double frequency, int sampleRate, size_t numSamples,
                               float amplitude = 0.5f) {
        std::vector<float> samples(numSamples);
        for (size_t i = 0; i < numSamples; ++i) {
            samples[i] = amplitude * static_cast<float>(std::sin(2.0 * M_PI * frequency * i / sampleRate));
        }
        return Core::AudioSignal(std::move(samples), sampleRate);
    }
};

// ============================================================================
// FFT
// ============================================================================

TEST_F(SpectrogramEngineTest, FFTOfImpulseIsFlat) {
    std::vector<std::complex<double>> data(64, {0.0, 0.0});
    data[0] = {1.0, 0.0};

    SpectrogramEngine::fft(data);
    for (const auto& bin : data) {
        EXPECT_NEAR(bin.real(), 1.0, 1e-12);
        EXPECT_NEAR(bin.imag(), 0.0, 1e-12);
    }
}

TEST_F(SpectrogramEngineTest, FFTOfCosineHasTwoBins) {
    const size_t n = 128;
    std::vector<std::complex<double>> data(n);
    for (size_t i = 0; i < n; ++i) {
        data[i] = {std::cos(2.0 * M_PI * 8.0 * i / n), 0.0};
    }

    SpectrogramEngine::fft(data);
    EXPECT_NEAR(std::abs(data[8]), n / 2.0, 1e-9);
    EXPECT_NEAR(std::abs(data[n - 8]), n / 2.0, 1e-9);
    EXPECT_NEAR(std::abs(data[9]), 0.0, 1e-9);
}

TEST_F(SpectrogramEngineTest, FFTRejectsNonPowerOfTwo) {
    std::vector<std::complex<double>> data(100);
    EXPECT_THROW(SpectrogramEngine::fft(data), std::invalid_argument);
}

TEST_F(SpectrogramEngineTest, ConstructorValidatesSizes) {
    EXPECT_THROW(SpectrogramEngine(1000), std::invalid_argument);
    EXPECT_THROW(SpectrogramEngine(2), std::invalid_argument);

    SpectrogramEngine defaults;
    EXPECT_EQ(defaults.getFFTSize(), 16384);
    EXPECT_EQ(defaults.getHopSize(), 4096);
}

// ============================================================================
// Spectrogram
// ============================================================================

TEST_F(SpectrogramEngineTest, Dimensions) {
    SpectrogramEngine engine(1024);
    Spectrogram spec = engine.compute(makeSine(1000.0, 16000, 5000));

    EXPECT_EQ(spec.getNumBins(), 513);
    EXPECT_EQ(spec.getNumFrames(), 1 + 5000 / 256);
    EXPECT_EQ(spec.getHopSize(), 256);
    EXPECT_DOUBLE_EQ(spec.getFrequencyForBin(0), 0.0);
    EXPECT_DOUBLE_EQ(spec.getFrequencyForBin(512), 8000.0);
    EXPECT_THROW(spec.at(513, 0), std::out_of_range);
}

TEST_F(SpectrogramEngineTest, SilenceHitsPowerFloor) {
    SpectrogramEngine engine(512);
    Spectrogram spec = engine.compute(Core::AudioSignal(std::vector<float>(2048, 0.0f), 16000));

    FrequencyProfile profile = spec.timeAverage();
    ASSERT_EQ(profile.size(), 257u);
    for (double v : profile.values) {
        EXPECT_NEAR(v, -100.0, 1e-4);
    }
    EXPECT_DOUBLE_EQ(spec.meanMagnitudeAbove(4000.0), 0.0);
}

TEST_F(SpectrogramEngineTest, SinePeaksAtItsBin) {
    // 1 kHz sits exactly on bin 64 of a 1024-point FFT at 16 kHz
    SpectrogramEngine engine(1024);
    Spectrogram spec = engine.compute(makeSine(1000.0, 16000, 16000));

    FrequencyProfile profile = spec.timeAverage();
    auto peak = std::max_element(profile.values.begin(), profile.values.end());
    EXPECT_EQ(std::distance(profile.values.begin(), peak), 64);
    EXPECT_DOUBLE_EQ(profile.frequencies[64], 1000.0);
}

TEST_F(SpectrogramEngineTest, EmptySignalYieldsOneFrame) {
    SpectrogramEngine engine(256);
    Spectrogram spec = engine.compute(Core::AudioSignal(std::vector<float>(), 16000));

    EXPECT_EQ(spec.getNumFrames(), 1);
    EXPECT_NEAR(spec.at(10, 0), -100.0f, 1e-4);
}

TEST_F(SpectrogramEngineTest, MeanMagnitudeAbove) {
    SpectrogramEngine engine(1024);
    Spectrogram low = engine.compute(makeSine(1000.0, 16000, 8000));
    Spectrogram high = engine.compute(makeSine(6000.0, 16000, 8000));

    EXPECT_GT(high.meanMagnitudeAbove(4000.0), low.meanMagnitudeAbove(4000.0));
    // Nothing lies strictly above Nyquist
    EXPECT_DOUBLE_EQ(high.meanMagnitudeAbove(8000.0), 0.0);
}
