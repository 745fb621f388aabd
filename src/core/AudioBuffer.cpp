#include "core/AudioBuffer.h"
#include <stdexcept>
#include <algorithm>

namespace SynthScan {
namespace Core {

AudioBuffer::AudioBuffer(int numChannels, int numSamples)
    : numChannels_(numChannels), numSamples_(numSamples) {
    if (numChannels <= 0 || numSamples < 0) {
        throw std::invalid_argument("Invalid buffer dimensions");
    }
    allocate();
}

AudioBuffer::AudioBuffer(AudioBuffer&& other) noexcept
    : numChannels_(other.numChannels_),
      numSamples_(other.numSamples_),
      channels_(std::move(other.channels_)),
      data_(std::move(other.data_)) {
    other.numChannels_ = 0;
    other.numSamples_ = 0;
}

AudioBuffer& AudioBuffer::operator=(AudioBuffer&& other) noexcept {
    if (this != &other) {
        numChannels_ = other.numChannels_;
        numSamples_ = other.numSamples_;
        channels_ = std::move(other.channels_);
        data_ = std::move(other.data_);
        other.numChannels_ = 0;
        other.numSamples_ = 0;
    }
    return *this;
}

const float* AudioBuffer::getReadPointer(int channel) const {
    if (channel < 0 || channel >= numChannels_) {
        throw std::out_of_range("Channel index out of range");
    }
    return channels_[channel];
}

float* AudioBuffer::getWritePointer(int channel) {
    if (channel < 0 || channel >= numChannels_) {
        throw std::out_of_range("Channel index out of range");
    }
    return channels_[channel];
}

AudioBuffer AudioBuffer::fromInterleaved(const std::vector<float>& interleaved, int numChannels) {
    if (numChannels <= 0 || interleaved.size() % static_cast<size_t>(numChannels) != 0) {
        throw std::invalid_argument("Interleaved data does not hold whole frames");
    }

    const int numFrames = static_cast<int>(interleaved.size() / numChannels);
    AudioBuffer buffer(numChannels, numFrames);

    for (int ch = 0; ch < numChannels; ++ch) {
        float* dest = buffer.channels_[ch];
        for (int i = 0; i < numFrames; ++i) {
            dest[i] = interleaved[static_cast<size_t>(i) * numChannels + ch];
        }
    }

    return buffer;
}

std::vector<float> AudioBuffer::getChannel(int channel) const {
    const float* data = getReadPointer(channel);
    return std::vector<float>(data, data + numSamples_);
}

std::vector<float> AudioBuffer::mixToMono() const {
    std::vector<float> mono(numSamples_, 0.0f);
    if (numChannels_ == 0) {
        return mono;
    }

    for (int i = 0; i < numSamples_; ++i) {
        double sum = 0.0;
        for (int ch = 0; ch < numChannels_; ++ch) {
            sum += channels_[ch][i];
        }
        mono[i] = static_cast<float>(sum / numChannels_);
    }

    return mono;
}

void AudioBuffer::allocate() {
    size_t totalSamples = static_cast<size_t>(numChannels_) * numSamples_;
    data_ = std::make_unique<float[]>(std::max<size_t>(totalSamples, 1));
    std::fill_n(data_.get(), totalSamples, 0.0f);

    channels_.resize(numChannels_);
    for (int i = 0; i < numChannels_; ++i) {
        channels_[i] = data_.get() + (static_cast<size_t>(i) * numSamples_);
    }
}

} // namespace Core
} // namespace SynthScan
