#include "dsp/SpectrogramEngine.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace SynthScan {
namespace DSP {

// ============================================================================
// Spectrogram
// ============================================================================

Spectrogram::Spectrogram(int sampleRate, int fftSize, int hopSize, int numFrames,
                         std::vector<float> db, std::vector<double> meanMagnitudes)
    : sampleRate_(sampleRate)
    , fftSize_(fftSize)
    , hopSize_(hopSize)
    , numBins_(fftSize / 2 + 1)
    , numFrames_(numFrames)
    , db_(std::move(db))
    , meanMagnitudes_(std::move(meanMagnitudes))
{
    if (db_.size() != static_cast<size_t>(numBins_) * numFrames_ ||
        meanMagnitudes_.size() != static_cast<size_t>(numBins_)) {
        throw std::invalid_argument("Spectrogram data does not match its dimensions");
    }
}

float Spectrogram::at(int bin, int frame) const {
    if (bin < 0 || bin >= numBins_ || frame < 0 || frame >= numFrames_) {
        throw std::out_of_range("Spectrogram index out of range");
    }
    return db_[static_cast<size_t>(bin) * numFrames_ + frame];
}

double Spectrogram::getFrequencyForBin(int bin) const {
    // Evenly spaced from 0 to Nyquist, inclusive
    const double step = (sampleRate_ / 2.0) / (numBins_ - 1);
    return bin * step;
}

FrequencyProfile Spectrogram::timeAverage() const {
    FrequencyProfile profile;
    profile.frequencies.resize(numBins_);
    profile.values.resize(numBins_);

    for (int bin = 0; bin < numBins_; ++bin) {
        const float* row = db_.data() + static_cast<size_t>(bin) * numFrames_;
        double sum = 0.0;
        for (int frame = 0; frame < numFrames_; ++frame) {
            sum += row[frame];
        }
        profile.frequencies[bin] = getFrequencyForBin(bin);
        profile.values[bin] = numFrames_ > 0 ? sum / numFrames_ : 0.0;
    }

    return profile;
}

double Spectrogram::meanMagnitudeAbove(double cutoffHz) const {
    double sum = 0.0;
    int count = 0;

    for (int bin = 0; bin < numBins_; ++bin) {
        if (getFrequencyForBin(bin) > cutoffHz) {
            sum += meanMagnitudes_[bin];
            ++count;
        }
    }

    if (count == 0) {
        return 0.0;
    }

    double mean = sum / count;
    return std::isfinite(mean) ? mean : 0.0;
}

// ============================================================================
// SpectrogramEngine
// ============================================================================

SpectrogramEngine::SpectrogramEngine(int fftSize, int hopSize)
    : fftSize_(fftSize)
    , hopSize_(hopSize > 0 ? hopSize : fftSize / 4)
{
    if (fftSize < 4 || (fftSize & (fftSize - 1)) != 0) {
        throw std::invalid_argument("FFT size must be a power of 2");
    }
    if (hopSize_ <= 0) {
        throw std::invalid_argument("Hop size must be positive");
    }
    generateWindow();
}

void SpectrogramEngine::generateWindow() {
    // Periodic Hann (denominator N, not N - 1) for spectral analysis
    window_.resize(fftSize_);
    for (int i = 0; i < fftSize_; ++i) {
        window_[i] = 0.5 * (1.0 - std::cos(2.0 * M_PI * i / fftSize_));
    }
}

void SpectrogramEngine::fft(std::vector<std::complex<double>>& data) {
    const size_t n = data.size();
    if (n == 0 || (n & (n - 1)) != 0) {
        throw std::invalid_argument("FFT size must be a power of 2");
    }

    // Bit-reversal permutation
    size_t j = 0;
    for (size_t i = 0; i < n - 1; ++i) {
        if (i < j) {
            std::swap(data[i], data[j]);
        }

        size_t k = n / 2;
        while (k <= j) {
            j -= k;
            k /= 2;
        }
        j += k;
    }

    // Cooley-Tukey butterflies; twiddles computed directly to avoid drift at large n
    for (size_t len = 2; len <= n; len *= 2) {
        const double angle = -2.0 * M_PI / static_cast<double>(len);
        const size_t half = len / 2;

        for (size_t m = 0; m < half; ++m) {
            const std::complex<double> w(std::cos(angle * m), std::sin(angle * m));
            for (size_t i = 0; i < n; i += len) {
                std::complex<double> u = data[i + m];
                std::complex<double> v = data[i + m + half] * w;
                data[i + m] = u + v;
                data[i + m + half] = u - v;
            }
        }
    }
}

Spectrogram SpectrogramEngine::compute(const Core::AudioSignal& signal) const {
    const int numBins = fftSize_ / 2 + 1;
    const int pad = fftSize_ / 2;
    const long long numSamples = static_cast<long long>(signal.size());
    const int numFrames = static_cast<int>(1 + numSamples / hopSize_);
    const float* samples = signal.data();

    std::vector<float> db(static_cast<size_t>(numBins) * numFrames);
    std::vector<double> magnitudeSums(numBins, 0.0);
    std::vector<std::complex<double>> bins(fftSize_);

    for (int frame = 0; frame < numFrames; ++frame) {
        // Frame centre sits at frame * hop in the unpadded signal
        const long long start = static_cast<long long>(frame) * hopSize_ - pad;

        for (int i = 0; i < fftSize_; ++i) {
            const long long pos = start + i;
            const double sample = (pos >= 0 && pos < numSamples) ? samples[pos] : 0.0;
            bins[i] = std::complex<double>(sample * window_[i], 0.0);
        }

        fft(bins);

        for (int bin = 0; bin < numBins; ++bin) {
            const double power = std::norm(bins[bin]);
            magnitudeSums[bin] += std::sqrt(power);

            const double clipped = std::clamp(power, kMinPower, kMaxPower);
            db[static_cast<size_t>(bin) * numFrames + frame] =
                static_cast<float>(10.0 * std::log10(clipped));
        }
    }

    for (double& sum : magnitudeSums) {
        sum /= numFrames;
    }

    return Spectrogram(signal.getSampleRate(), fftSize_, hopSize_, numFrames,
                       std::move(db), std::move(magnitudeSums));
}

} // namespace DSP
} // namespace SynthScan
