#include "core/AudioSignal.h"
#include <stdexcept>
#include <utility>

namespace SynthScan {
namespace Core {

AudioSignal::AudioSignal(std::vector<float> samples, int sampleRate)
    : samples_(std::move(samples)), sampleRate_(sampleRate) {
    if (sampleRate <= 0) {
        throw std::invalid_argument("Sample rate must be positive");
    }
}

double AudioSignal::getDurationSeconds() const {
    return static_cast<double>(samples_.size()) / sampleRate_;
}

} // namespace Core
} // namespace SynthScan
