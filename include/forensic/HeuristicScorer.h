#pragma once

#include "forensic/FeatureExtractor.h"
#include "forensic/PiecewiseFunction.h"

namespace SynthScan {
namespace Forensic {

/**
 * @brief Audit trail of one heuristic scoring pass
 *
 * Holds the input features and every sub-score, bonus and flag that went
 * into the final score.
 */
struct ScoreDetail {
    FeatureVector features;

    double regularityMultiplier = 1.0;   ///< 1 + regularity score

    // Buckets
    double peakCountPoints = 0.0;        ///< Already scaled by regularityMultiplier
    double highPeakPoints = 0.0;
    double meanIntensityPoints = 0.0;
    double maxIntensityPoints = 0.0;
    double p90Points = 0.0;
    double periodicityPoints = 0.0;
    double regularityPoints = 0.0;

    // Adjustments
    double kurtosisBonus = 0.0;
    double hfAdjustment = 0.0;
    bool combinedIndicator = false;
    double combinedBonus = 0.0;
    double abundanceBonus = 0.0;

    double rawScore = 0.0;               ///< Sum before clipping
    double score = 0.0;                  ///< Clipped to [0, 100]

    bool isAiGenerated() const { return score > 50.0; }

    bool operator==(const ScoreDetail& other) const;
    bool operator!=(const ScoreDetail& other) const { return !(*this == other); }
};

/**
 * @brief Deterministic rule engine mapping a FeatureVector to a 0-100 score
 *
 * Each bucket is a rule table evaluated by PiecewiseFunction. The scorer
 * holds no state and never writes output; see ScoreReporter for that.
 */
class HeuristicScorer {
public:
    enum class Bucket {
        PeakCount,       ///< Medium-peak count, before the regularity multiplier
        HighPeakCount,
        MeanIntensity,
        MaxIntensity,
        Percentile90,
        Periodicity,
        KurtosisBonus
    };

    static constexpr double kRegularityWeight = 20.0;
    static constexpr double kCombinedBonus = 15.0;
    static constexpr double kAbundanceBonus = 5.0;
    static constexpr double kVerdictThreshold = 50.0;

    static const PiecewiseFunction& table(Bucket bucket);
    static double evaluateBucket(Bucket bucket, double x);

    /**
     * @brief Adjustment driven by high-frequency energy
     *
     * Near-zero HF energy is only a strong signal when another indicator
     * (kurtosis bonus or regularity) agrees.
     */
    static double highFrequencyAdjustment(double highFreqEnergy, double kurtosisBonus,
                                          double regularity);

    ScoreDetail score(const FeatureVector& features) const;
};

} // namespace Forensic
} // namespace SynthScan
