#pragma once

#include "dsp/SpectrogramEngine.h"
#include "forensic/EnvelopeExtractor.h"
#include <vector>

namespace SynthScan {
namespace Forensic {

/**
 * @brief Normalized residual energy over the analysis band
 *
 * Values lie in [0, 1]. The largest value is 1 (within the normalization
 * epsilon) unless every residual was zero, in which case all values are 0.
 */
struct Fakeprint {
    std::vector<double> frequencies;
    std::vector<double> values;

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    bool isDegenerate() const;
};

class FakeprintBuilder {
public:
    static constexpr double kNormalizationEpsilon = 1e-6;

    FakeprintBuilder(double minFrequency = 5000.0,
                     double maxFrequency = 16000.0,
                     double ceilingDb = 5.0,
                     EnvelopeExtractor envelope = EnvelopeExtractor());

    /**
     * @brief Keep bins with minFrequency < f < maxFrequency
     */
    DSP::FrequencyProfile bandLimit(const DSP::FrequencyProfile& profile) const;

    /**
     * @brief Clip to [0, ceilingDb] and divide by (max + epsilon)
     */
    std::vector<double> normalize(const std::vector<double>& residual) const;

    Fakeprint build(const DSP::FrequencyProfile& profile) const;

    double getMinFrequency() const { return minFrequency_; }
    double getMaxFrequency() const { return maxFrequency_; }
    const EnvelopeExtractor& getEnvelope() const { return envelope_; }

private:
    double minFrequency_;
    double maxFrequency_;
    double ceilingDb_;
    EnvelopeExtractor envelope_;
};

} // namespace Forensic
} // namespace SynthScan
