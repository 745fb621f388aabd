#pragma once

#include <vector>
#include <memory>
#include <cstddef>

namespace SynthScan {
namespace Core {

/**
 * @brief Planar multi-channel PCM buffer filled by the decoder
 *
 * Channels share one contiguous allocation. The analysis pipeline never reads
 * this type directly: it is folded into a mono AudioSignal first.
 */
class AudioBuffer {
public:
    /**
     * @brief Construct a zeroed buffer with the given channels and length
     * @throws std::invalid_argument if numChannels <= 0 or numSamples < 0
     */
    AudioBuffer(int numChannels, int numSamples);

    ~AudioBuffer() = default;

    // Move semantics
    AudioBuffer(AudioBuffer&& other) noexcept;
    AudioBuffer& operator=(AudioBuffer&& other) noexcept;

    // Disable copying
    AudioBuffer(const AudioBuffer&) = delete;
    AudioBuffer& operator=(const AudioBuffer&) = delete;

    int getNumChannels() const { return numChannels_; }
    int getNumSamples() const { return numSamples_; }

    /**
     * @brief Get read pointer for a channel
     * @throws std::out_of_range for an invalid channel index
     */
    const float* getReadPointer(int channel) const;

    /**
     * @brief Get write pointer for a channel
     * @throws std::out_of_range for an invalid channel index
     */
    float* getWritePointer(int channel);

    /**
     * @brief Planar buffer from frame-interleaved samples
     * @throws std::invalid_argument if the sample count is not a whole number of frames
     */
    static AudioBuffer fromInterleaved(const std::vector<float>& interleaved, int numChannels);

    /**
     * @brief Copy of one channel
     */
    std::vector<float> getChannel(int channel) const;

    /**
     * @brief Average all channels into a single mono channel
     */
    std::vector<float> mixToMono() const;

private:
    int numChannels_;
    int numSamples_;
    std::vector<float*> channels_;
    std::unique_ptr<float[]> data_;

    void allocate();
};

} // namespace Core
} // namespace SynthScan
