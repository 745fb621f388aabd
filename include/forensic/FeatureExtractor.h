#pragma once

#include "forensic/FakeprintBuilder.h"
#include "forensic/PiecewiseFunction.h"
#include <vector>

namespace SynthScan {
namespace Forensic {

/**
 * @brief Scalar descriptors of a fakeprint
 *
 * Every value is finite; statistics that would be NaN/Inf are stored as 0.
 */
struct FeatureVector {
    // Peaks above 0.5 / 0.3 / 0.1
    int peakCountHigh = 0;
    int peakCountMedium = 0;
    int peakCountLow = 0;
    double peakDensityHigh = 0.0;
    double peakDensityMedium = 0.0;
    double peakDensityLow = 0.0;

    // Spacing of medium peaks
    double peakSpacingStd = 0.0;
    double peakSpacingMean = 0.0;
    double peakSpacingCv = 0.0;
    double peakRegularityScore = 0.0;

    // Distribution
    double mean = 0.0;
    double maxValue = 0.0;
    double stdDev = 0.0;
    double p75 = 0.0;
    double p90 = 0.0;
    double kurtosis = 0.0;          ///< mean((x - mean)^4) / (std^4 + 1e-10), no -3 offset

    double periodicityScore = 0.0;

    double highFreqEnergy = 0.0;    ///< Mean STFT magnitude above the cutoff
    double highFreqRatio = 0.0;     ///< highFreqEnergy / (sum(x^2) + 1e-10)

    bool operator==(const FeatureVector& other) const;
    bool operator!=(const FeatureVector& other) const { return !(*this == other); }
};

class FeatureExtractor {
public:
    static constexpr double kHighPeakThreshold = 0.5;
    static constexpr double kMediumPeakThreshold = 0.3;
    static constexpr double kLowPeakThreshold = 0.1;
    static constexpr int kMinPeaksForSpacing = 4;
    static constexpr size_t kMinPeriodicityLength = 11;
    static constexpr size_t kMaxPeriodicityLag = 50;

    FeatureVector extract(const Fakeprint& fakeprint, double highFreqEnergy) const;

    /**
     * @brief Map a spacing coefficient of variation to a regularity score
     *
     * Non-increasing in cv: evenly spaced peaks (low cv) score high.
     */
    static double regularityFromCv(double cv);

    /**
     * @brief Percentile with linear interpolation between order statistics
     * @param q Percentile in [0, 100]
     */
    static double percentile(std::vector<double> values, double q);

    /**
     * @brief Strongest normalized autocorrelation over lags 2..min(50, n) - 1
     * @return 0 for 10 samples or fewer
     */
    static double periodicity(const std::vector<double>& values);

    static std::vector<int> peaksAbove(const std::vector<double>& values, double threshold);

    static const PiecewiseFunction& regularitySchedule();
};

} // namespace Forensic
} // namespace SynthScan
