#include "forensic/PiecewiseFunction.h"
#include <algorithm>

namespace SynthScan {
namespace Forensic {

bool Interval::contains(double x) const {
    const bool aboveLower = lowerInclusive ? x >= lower : x > lower;
    const bool belowUpper = upperInclusive ? x <= upper : x < upper;
    return aboveLower && belowUpper;
}

double Segment::evaluate(double x) const {
    return std::max(floor, base + slope * (x - pivot));
}

PiecewiseFunction::PiecewiseFunction(std::initializer_list<Segment> segments, double fallback)
    : segments_(segments), fallback_(fallback) {}

double PiecewiseFunction::operator()(double x) const {
    for (const auto& segment : segments_) {
        if (segment.range.contains(x)) {
            return segment.evaluate(x);
        }
    }
    return fallback_;
}

} // namespace Forensic
} // namespace SynthScan
