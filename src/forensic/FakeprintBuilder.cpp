#include "forensic/FakeprintBuilder.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace SynthScan {
namespace Forensic {

bool Fakeprint::isDegenerate() const {
    return std::all_of(values.begin(), values.end(), [](double v) { return v == 0.0; });
}

FakeprintBuilder::FakeprintBuilder(double minFrequency, double maxFrequency,
                                   double ceilingDb, EnvelopeExtractor envelope)
    : minFrequency_(minFrequency)
    , maxFrequency_(maxFrequency)
    , ceilingDb_(ceilingDb)
    , envelope_(envelope)
{
    if (minFrequency >= maxFrequency) {
        throw std::invalid_argument("Fakeprint band is empty (fmin >= fmax)");
    }
    if (ceilingDb <= 0.0) {
        throw std::invalid_argument("Residual ceiling must be positive");
    }
}

DSP::FrequencyProfile FakeprintBuilder::bandLimit(const DSP::FrequencyProfile& profile) const {
    DSP::FrequencyProfile band;
    for (size_t i = 0; i < profile.size(); ++i) {
        const double f = profile.frequencies[i];
        if (minFrequency_ < f && f < maxFrequency_) {
            band.frequencies.push_back(f);
            band.values.push_back(profile.values[i]);
        }
    }
    return band;
}

std::vector<double> FakeprintBuilder::normalize(const std::vector<double>& residual) const {
    std::vector<double> clipped(residual.size());
    double peak = 0.0;
    for (size_t i = 0; i < residual.size(); ++i) {
        clipped[i] = std::clamp(residual[i], 0.0, ceilingDb_);
        peak = std::max(peak, clipped[i]);
    }

    const double scale = peak + kNormalizationEpsilon;
    for (double& v : clipped) {
        v /= scale;
    }
    return clipped;
}

Fakeprint FakeprintBuilder::build(const DSP::FrequencyProfile& profile) const {
    DSP::FrequencyProfile band = bandLimit(profile);
    EnvelopeResult envelope = envelope_.extract(band.values);

    Fakeprint fakeprint;
    fakeprint.frequencies = std::move(band.frequencies);
    fakeprint.values = normalize(envelope.residual);
    return fakeprint;
}

} // namespace Forensic
} // namespace SynthScan
