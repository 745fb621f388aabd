#include "forensic/FeatureExtractor.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace SynthScan {
namespace Forensic {

namespace {

double finiteOrZero(double value) {
    return std::isfinite(value) ? value : 0.0;
}

double density(int count, size_t length) {
    return length > 0 ? static_cast<double>(count) / length : 0.0;
}

} // namespace

bool FeatureVector::operator==(const FeatureVector& other) const {
    return peakCountHigh == other.peakCountHigh &&
           peakCountMedium == other.peakCountMedium &&
           peakCountLow == other.peakCountLow &&
           peakDensityHigh == other.peakDensityHigh &&
           peakDensityMedium == other.peakDensityMedium &&
           peakDensityLow == other.peakDensityLow &&
           peakSpacingStd == other.peakSpacingStd &&
           peakSpacingMean == other.peakSpacingMean &&
           peakSpacingCv == other.peakSpacingCv &&
           peakRegularityScore == other.peakRegularityScore &&
           mean == other.mean &&
           maxValue == other.maxValue &&
           stdDev == other.stdDev &&
           p75 == other.p75 &&
           p90 == other.p90 &&
           kurtosis == other.kurtosis &&
           periodicityScore == other.periodicityScore &&
           highFreqEnergy == other.highFreqEnergy &&
           highFreqRatio == other.highFreqRatio;
}

const PiecewiseFunction& FeatureExtractor::regularitySchedule() {
    static const PiecewiseFunction schedule{
        Segment::linear(Interval::below(0.3), 0.8, -0.67, 0.3),
        Segment::linear(Interval::closedOpen(0.3, 0.5), 0.5, -1.5, 0.5),
        Segment::linear(Interval::closedOpen(0.5, 0.7), 0.3, -1.0, 0.7),
        Segment::linear(Interval::atLeast(0.7), 0.3, -0.5, 0.7, 0.0),
    };
    return schedule;
}

double FeatureExtractor::regularityFromCv(double cv) {
    return regularitySchedule()(cv);
}

std::vector<int> FeatureExtractor::peaksAbove(const std::vector<double>& values, double threshold) {
    std::vector<int> peaks;
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] > threshold) {
            peaks.push_back(static_cast<int>(i));
        }
    }
    return peaks;
}

double FeatureExtractor::percentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }

    std::sort(values.begin(), values.end());
    const double rank = (q / 100.0) * (values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(rank));
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double fraction = rank - lower;

    return finiteOrZero(values[lower] + (values[upper] - values[lower]) * fraction);
}

double FeatureExtractor::periodicity(const std::vector<double>& values) {
    const size_t n = values.size();
    if (n < kMinPeriodicityLength) {
        return 0.0;
    }

    const double mean = finiteOrZero(std::accumulate(values.begin(), values.end(), 0.0) / n);
    std::vector<double> centered(n);
    for (size_t i = 0; i < n; ++i) {
        centered[i] = values[i] - mean;
    }

    auto lagProduct = [&](size_t lag) {
        double sum = 0.0;
        for (size_t i = 0; i + lag < n; ++i) {
            sum += centered[i] * centered[i + lag];
        }
        return sum;
    };

    const double norm = lagProduct(0) + 1e-10;
    const size_t lastLag = std::min(kMaxPeriodicityLag, n);

    double best = -std::numeric_limits<double>::infinity();
    for (size_t lag = 2; lag < lastLag; ++lag) {
        best = std::max(best, lagProduct(lag) / norm);
    }

    return finiteOrZero(best);
}

FeatureVector FeatureExtractor::extract(const Fakeprint& fakeprint, double highFreqEnergy) const {
    FeatureVector features;
    const std::vector<double>& x = fakeprint.values;
    const size_t n = x.size();

    // Peaks
    const std::vector<int> high = peaksAbove(x, kHighPeakThreshold);
    const std::vector<int> medium = peaksAbove(x, kMediumPeakThreshold);
    const std::vector<int> low = peaksAbove(x, kLowPeakThreshold);

    features.peakCountHigh = static_cast<int>(high.size());
    features.peakCountMedium = static_cast<int>(medium.size());
    features.peakCountLow = static_cast<int>(low.size());
    features.peakDensityHigh = density(features.peakCountHigh, n);
    features.peakDensityMedium = density(features.peakCountMedium, n);
    features.peakDensityLow = density(features.peakCountLow, n);

    // Spacing regularity of medium peaks
    if (features.peakCountMedium >= kMinPeaksForSpacing) {
        std::vector<double> spacings(medium.size() - 1);
        for (size_t i = 1; i < medium.size(); ++i) {
            spacings[i - 1] = static_cast<double>(medium[i] - medium[i - 1]);
        }

        const double spacingMean = std::accumulate(spacings.begin(), spacings.end(), 0.0) / spacings.size();
        double sq = 0.0;
        for (double s : spacings) {
            sq += (s - spacingMean) * (s - spacingMean);
        }

        features.peakSpacingMean = finiteOrZero(spacingMean);
        features.peakSpacingStd = finiteOrZero(std::sqrt(sq / spacings.size()));

        if (features.peakSpacingMean > 0.0) {
            features.peakSpacingCv = features.peakSpacingStd / features.peakSpacingMean;
            features.peakRegularityScore = regularityFromCv(features.peakSpacingCv);
        } else {
            // Unreachable for distinct indices; neutral score
            features.peakSpacingCv = 0.0;
            features.peakRegularityScore = 0.5;
        }
    }

    // Distribution
    if (n > 0) {
        const double mean = finiteOrZero(std::accumulate(x.begin(), x.end(), 0.0) / n);
        double sq = 0.0;
        double fourth = 0.0;
        for (double v : x) {
            const double d = v - mean;
            sq += d * d;
            fourth += d * d * d * d;
        }
        const double stdDev = finiteOrZero(std::sqrt(sq / n));

        features.mean = mean;
        features.maxValue = finiteOrZero(*std::max_element(x.begin(), x.end()));
        features.stdDev = stdDev;
        features.p75 = percentile(x, 75.0);
        features.p90 = percentile(x, 90.0);
        features.kurtosis = finiteOrZero((fourth / n) / (std::pow(stdDev, 4) + 1e-10));
    }

    features.periodicityScore = periodicity(x);

    // Energy
    double totalEnergy = 0.0;
    for (double v : x) {
        totalEnergy += v * v;
    }
    features.highFreqEnergy = finiteOrZero(highFreqEnergy);
    features.highFreqRatio = finiteOrZero(features.highFreqEnergy / (totalEnergy + 1e-10));

    return features;
}

} // namespace Forensic
} // namespace SynthScan
