#include "forensic/EnvelopeExtractor.h"
#include "dsp/QuadraticSpline.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace SynthScan {
namespace Forensic {

EnvelopeExtractor::EnvelopeExtractor(int area, double floorDb)
    : area_(area), floorDb_(floorDb) {
    if (area < 1) {
        throw std::invalid_argument("Hull window must cover at least one bin");
    }
}

Hull EnvelopeExtractor::lowerHull(const std::vector<double>& curve) const {
    Hull hull;
    const int n = static_cast<int>(curve.size());
    if (n == 0) {
        return hull;
    }

    const int area = std::min(area_, n);

    // Window minima only ever move right, so deduplicating against the last
    // recorded index keeps first-seen order
    for (int i = 0; i + area <= n; ++i) {
        auto first = curve.begin() + i;
        const int index = static_cast<int>(std::min_element(first, first + area) - curve.begin());
        if (hull.empty() || hull.back().index != index) {
            hull.push_back({index, curve[index]});
        }
    }

    if (hull.front().index != 0) {
        hull.insert(hull.begin(), {0, curve.front()});
    }
    if (hull.back().index != n - 1) {
        hull.push_back({n - 1, curve.back()});
    }

    return hull;
}

std::vector<double> EnvelopeExtractor::noiseFloor(const Hull& hull, size_t length) const {
    std::vector<double> floor(length, floorDb_);
    if (hull.empty() || length == 0) {
        return floor;
    }

    std::vector<double> x, y;
    x.reserve(hull.size());
    y.reserve(hull.size());
    for (const auto& point : hull) {
        x.push_back(static_cast<double>(point.index));
        y.push_back(point.value);
    }

    DSP::QuadraticSpline spline(std::move(x), std::move(y));
    for (size_t i = 0; i < length; ++i) {
        floor[i] = std::max(spline(static_cast<double>(i)), floorDb_);
    }

    return floor;
}

EnvelopeResult EnvelopeExtractor::extract(const std::vector<double>& curve) const {
    EnvelopeResult result;
    result.hull = lowerHull(curve);
    result.floor = noiseFloor(result.hull, curve.size());

    result.residual.resize(curve.size());
    for (size_t i = 0; i < curve.size(); ++i) {
        result.residual[i] = std::max(0.0, curve[i] - result.floor[i]);
    }

    return result;
}

} // namespace Forensic
} // namespace SynthScan
