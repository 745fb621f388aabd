#pragma once

#include <limits>
#include <vector>
#include <initializer_list>

namespace SynthScan {
namespace Forensic {

/**
 * @brief Interval on the real line with independently open/closed ends
 */
struct Interval {
    double lower = -std::numeric_limits<double>::infinity();
    double upper = std::numeric_limits<double>::infinity();
    bool lowerInclusive = false;
    bool upperInclusive = false;

    bool contains(double x) const;

    static Interval closed(double lo, double hi) { return {lo, hi, true, true}; }
    static Interval closedOpen(double lo, double hi) { return {lo, hi, true, false}; }
    static Interval openClosed(double lo, double hi) { return {lo, hi, false, true}; }
    static Interval below(double hi) { return {-std::numeric_limits<double>::infinity(), hi, false, false}; }
    static Interval atMost(double hi) { return {-std::numeric_limits<double>::infinity(), hi, false, true}; }
    static Interval above(double lo) { return {lo, std::numeric_limits<double>::infinity(), false, false}; }
    static Interval atLeast(double lo) { return {lo, std::numeric_limits<double>::infinity(), true, false}; }
};

/**
 * @brief One row of a rule table: on `range`, value = max(floor, base + slope * (x - pivot))
 */
struct Segment {
    Interval range;
    double base = 0.0;
    double slope = 0.0;
    double pivot = 0.0;
    double floor = -std::numeric_limits<double>::infinity();

    double evaluate(double x) const;

    static Segment constant(Interval range, double value) { return {range, value, 0.0, 0.0}; }
    static Segment linear(Interval range, double base, double slope, double pivot = 0.0,
                          double floor = -std::numeric_limits<double>::infinity()) {
        return {range, base, slope, pivot, floor};
    }
};

/**
 * @brief Ordered list of segments; the first segment containing x wins
 */
class PiecewiseFunction {
public:
    PiecewiseFunction(std::initializer_list<Segment> segments, double fallback = 0.0);

    double operator()(double x) const;

    const std::vector<Segment>& getSegments() const { return segments_; }

private:
    std::vector<Segment> segments_;
    double fallback_;
};

} // namespace Forensic
} // namespace SynthScan
