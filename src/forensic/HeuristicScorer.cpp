#include "forensic/HeuristicScorer.h"
#include <algorithm>

namespace SynthScan {
namespace Forensic {

bool ScoreDetail::operator==(const ScoreDetail& other) const {
    return features == other.features &&
           regularityMultiplier == other.regularityMultiplier &&
           peakCountPoints == other.peakCountPoints &&
           highPeakPoints == other.highPeakPoints &&
           meanIntensityPoints == other.meanIntensityPoints &&
           maxIntensityPoints == other.maxIntensityPoints &&
           p90Points == other.p90Points &&
           periodicityPoints == other.periodicityPoints &&
           regularityPoints == other.regularityPoints &&
           kurtosisBonus == other.kurtosisBonus &&
           hfAdjustment == other.hfAdjustment &&
           combinedIndicator == other.combinedIndicator &&
           combinedBonus == other.combinedBonus &&
           abundanceBonus == other.abundanceBonus &&
           rawScore == other.rawScore &&
           score == other.score;
}

// ============================================================================
// Rule tables
// ============================================================================

const PiecewiseFunction& HeuristicScorer::table(Bucket bucket) {
    static const PiecewiseFunction peakCount{
        Segment::constant(Interval::closed(50.0, 150.0), 20.0),
        Segment::linear(Interval::below(50.0), 0.0, 0.3),
        Segment::linear(Interval::above(150.0), 20.0, -0.1, 150.0, 0.0),
    };

    static const PiecewiseFunction highPeakCount{
        Segment::constant(Interval::closed(5.0, 30.0), 15.0),
        Segment::linear(Interval::below(5.0), 0.0, 3.0),
        Segment::linear(Interval::above(30.0), 15.0, -0.2, 30.0, 5.0),
    };

    static const PiecewiseFunction meanIntensity{
        Segment::constant(Interval::closed(0.06, 0.10), 15.0),
        Segment::linear(Interval::below(0.06), 0.0, 250.0),
        Segment::constant(Interval::openClosed(0.10, 0.12), 10.0),
        Segment::linear(Interval::above(0.12), 8.0, -80.0, 0.12, 0.0),
    };

    static const PiecewiseFunction maxIntensity{
        Segment::constant(Interval::above(0.8), 8.0),
        Segment::constant(Interval::openClosed(0.6, 0.8), 6.0),
        Segment::linear(Interval::atMost(0.6), 0.0, 10.0),
    };

    static const PiecewiseFunction percentile90{
        Segment::constant(Interval::closed(0.12, 0.22), 10.0),
        Segment::linear(Interval::below(0.12), 0.0, 80.0),
        Segment::constant(Interval::openClosed(0.22, 0.28), 5.0),
        Segment::linear(Interval::above(0.28), 3.0, -15.0, 0.28, 0.0),
    };

    static const PiecewiseFunction periodicity{
        Segment::constant(Interval::above(0.5), 12.0),
        Segment::constant(Interval::openClosed(0.40, 0.5), 8.0),
        Segment::constant(Interval::openClosed(0.30, 0.40), 4.0),
        Segment::constant(Interval::openClosed(0.20, 0.30), 2.0),
        Segment::linear(Interval::atMost(0.20), 0.0, 8.0),
    };

    static const PiecewiseFunction kurtosisBonus{
        Segment::constant(Interval::above(15.0), 20.0),
        Segment::linear(Interval::openClosed(10.0, 15.0), 15.0, 1.0, 10.0),
        Segment::linear(Interval::openClosed(6.0, 10.0), 8.0, 1.75, 6.0),
        Segment::linear(Interval::openClosed(4.0, 6.0), 0.0, 4.0, 4.0),
        Segment::constant(Interval::atMost(4.0), 0.0),
    };

    switch (bucket) {
        case Bucket::PeakCount:     return peakCount;
        case Bucket::HighPeakCount: return highPeakCount;
        case Bucket::MeanIntensity: return meanIntensity;
        case Bucket::MaxIntensity:  return maxIntensity;
        case Bucket::Percentile90:  return percentile90;
        case Bucket::Periodicity:   return periodicity;
        case Bucket::KurtosisBonus: return kurtosisBonus;
    }
    return peakCount;
}

double HeuristicScorer::evaluateBucket(Bucket bucket, double x) {
    return table(bucket)(x);
}

double HeuristicScorer::highFrequencyAdjustment(double highFreqEnergy, double kurtosisBonus,
                                                double regularity) {
    if (highFreqEnergy < 1e-7) {
        return (kurtosisBonus > 10.0 || regularity > 0.5) ? 10.0 : 3.0;
    }
    if (highFreqEnergy < 1e-5) {
        return 2.0;
    }
    if (highFreqEnergy < 5e-5) {
        return -3.0;
    }
    return 0.0;
}

// ============================================================================
// Scoring
// ============================================================================

ScoreDetail HeuristicScorer::score(const FeatureVector& features) const {
    ScoreDetail detail;
    detail.features = features;

    const double regularity = features.peakRegularityScore;
    detail.regularityMultiplier = 1.0 + regularity;

    detail.peakCountPoints = evaluateBucket(Bucket::PeakCount, features.peakCountMedium)
                             * detail.regularityMultiplier;
    detail.highPeakPoints = evaluateBucket(Bucket::HighPeakCount, features.peakCountHigh);
    detail.meanIntensityPoints = evaluateBucket(Bucket::MeanIntensity, features.mean);
    detail.maxIntensityPoints = evaluateBucket(Bucket::MaxIntensity, features.maxValue);
    detail.p90Points = evaluateBucket(Bucket::Percentile90, features.p90);
    detail.periodicityPoints = evaluateBucket(Bucket::Periodicity, features.periodicityScore);
    detail.regularityPoints = regularity * kRegularityWeight;

    detail.kurtosisBonus = evaluateBucket(Bucket::KurtosisBonus, features.kurtosis);
    detail.hfAdjustment = highFrequencyAdjustment(features.highFreqEnergy, detail.kurtosisBonus,
                                                  regularity);

    if (features.kurtosis > 5.0 && features.kurtosis < 10.0 &&
        features.highFreqEnergy < 5e-5 && regularity > 0.3) {
        detail.combinedIndicator = true;
        detail.combinedBonus = kCombinedBonus;
    }

    if (features.peakCountMedium > 50 && regularity > 0.6) {
        detail.abundanceBonus = kAbundanceBonus;
    }

    // Summed in rule order so results are reproducible to the last bit
    double total = 0.0;
    total += detail.peakCountPoints;
    total += detail.highPeakPoints;
    total += detail.meanIntensityPoints;
    total += detail.maxIntensityPoints;
    total += detail.p90Points;
    total += detail.periodicityPoints;
    total += detail.regularityPoints;
    total += detail.kurtosisBonus;
    total += detail.hfAdjustment;
    total += detail.combinedBonus;
    total += detail.abundanceBonus;

    detail.rawScore = total;
    detail.score = std::clamp(total, 0.0, 100.0);
    return detail;
}

} // namespace Forensic
} // namespace SynthScan
