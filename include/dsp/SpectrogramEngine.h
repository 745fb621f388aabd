#pragma once

#include "core/AudioSignal.h"
#include <vector>
#include <complex>

namespace SynthScan {
namespace DSP {

/**
 * @brief Time-averaged dB curve with the centre frequency of each bin
 */
struct FrequencyProfile {
    std::vector<double> frequencies;
    std::vector<double> values;

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
};

/**
 * @brief Power spectrogram in dB, indexed [bin, frame]
 *
 * Also keeps the per-bin mean linear magnitude (before dB clipping), which is
 * all the high-frequency energy term needs.
 */
class Spectrogram {
public:
    Spectrogram(int sampleRate, int fftSize, int hopSize, int numFrames,
                std::vector<float> db, std::vector<double> meanMagnitudes);

    int getSampleRate() const { return sampleRate_; }
    int getFFTSize() const { return fftSize_; }
    int getHopSize() const { return hopSize_; }
    int getNumBins() const { return numBins_; }
    int getNumFrames() const { return numFrames_; }

    float at(int bin, int frame) const;
    double getFrequencyForBin(int bin) const;

    /**
     * @brief Mean dB over all frames, per bin
     */
    FrequencyProfile timeAverage() const;

    /**
     * @brief Mean |X| over every bin strictly above cutoffHz and every frame
     * @return 0 when no bin lies above the cutoff
     */
    double meanMagnitudeAbove(double cutoffHz) const;

    const std::vector<double>& getMeanMagnitudes() const { return meanMagnitudes_; }

private:
    int sampleRate_;
    int fftSize_;
    int hopSize_;
    int numBins_;
    int numFrames_;
    std::vector<float> db_;          // bin-major: db_[bin * numFrames_ + frame]
    std::vector<double> meanMagnitudes_;
};

/**
 * @brief Short-time Fourier analysis producing a dB spectrogram
 *
 * Periodic Hann window, centred frames (fftSize / 2 zeros of padding on both
 * ends), power clipped to [1e-10, 1e6] before the dB conversion.
 */
class SpectrogramEngine {
public:
    static constexpr double kMinPower = 1e-10;
    static constexpr double kMaxPower = 1e6;

    /**
     * @param fftSize Window length, power of 2
     * @param hopSize Frame advance; 0 selects fftSize / 4
     * @throws std::invalid_argument for a non power-of-2 size or bad hop
     */
    explicit SpectrogramEngine(int fftSize = 16384, int hopSize = 0);

    Spectrogram compute(const Core::AudioSignal& signal) const;

    int getFFTSize() const { return fftSize_; }
    int getHopSize() const { return hopSize_; }

    /**
     * @brief In-place radix-2 Cooley-Tukey FFT (forward)
     * @throws std::invalid_argument if data.size() is not a power of 2
     */
    static void fft(std::vector<std::complex<double>>& data);

private:
    int fftSize_;
    int hopSize_;
    std::vector<double> window_;

    void generateWindow();
};

} // namespace DSP
} // namespace SynthScan
