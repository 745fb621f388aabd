#pragma once

#include <vector>
#include <cstddef>

namespace SynthScan {
namespace Core {

/**
 * @brief Immutable mono PCM signal at a fixed sample rate
 *
 * Produced once by the decoder and read by every analysis stage.
 */
class AudioSignal {
public:
    AudioSignal(std::vector<float> samples, int sampleRate);

    const std::vector<float>& samples() const { return samples_; }
    const float* data() const { return samples_.data(); }
    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    int getSampleRate() const { return sampleRate_; }
    double getDurationSeconds() const;

private:
    std::vector<float> samples_;
    int sampleRate_;
};

} // namespace Core
} // namespace SynthScan
