#include "forensic/ScoreReporter.h"
#include <iomanip>

namespace SynthScan {
namespace Forensic {

void ScoreReporter::printRule() const {
    out_ << std::string(60, '=') << "\n";
}

std::string ScoreReporter::conclusion(double score) {
    if (score > 70.0) {
        return "Very likely AI";
    } else if (score > 50.0) {
        return "Likely AI";
    } else if (score > 30.0) {
        return "Uncertain";
    }
    return "Likely human";
}

void ScoreReporter::print(const ScoreDetail& detail) const {
    const FeatureVector& f = detail.features;
    const auto flags = out_.flags();
    const auto precision = out_.precision();

    out_ << "\n";
    printRule();
    out_ << "  HEURISTIC ANALYSIS\n";
    printRule();

    out_ << std::fixed << std::setprecision(3);

    out_ << "\n[1] Spectral peaks\n";
    out_ << "    High (>0.5):    " << std::setw(5) << f.peakCountHigh
         << "  | density " << f.peakDensityHigh << "\n";
    out_ << "    Medium (>0.3):  " << std::setw(5) << f.peakCountMedium
         << "  | density " << f.peakDensityMedium << "\n";
    out_ << "    Low (>0.1):     " << std::setw(5) << f.peakCountLow << "\n";

    out_ << "\n[2] Regularity\n";
    out_ << "    Spacing CV:     " << f.peakSpacingCv << "\n";
    out_ << "    Regularity:     " << f.peakRegularityScore << "\n";
    out_ << "    Spacing std:    " << f.peakSpacingStd << "\n";
    out_ << "    Points:         " << std::setprecision(1) << detail.regularityPoints << "\n";

    out_ << std::setprecision(4);
    out_ << "\n[3] Fakeprint statistics\n";
    out_ << "    Mean:           " << f.mean << "\n";
    out_ << "    Max:            " << f.maxValue << "\n";
    out_ << "    Std:            " << f.stdDev << "\n";
    out_ << "    P90:            " << f.p90 << "\n";
    out_ << "    Kurtosis:       " << std::setprecision(2) << f.kurtosis << "\n";

    out_ << "\n[4] Periodicity\n";
    out_ << "    Autocorrelation: " << std::setprecision(3) << f.periodicityScore << "\n";

    out_ << "\n[5] Energy\n";
    out_ << "    High frequency: " << std::setprecision(6) << f.highFreqEnergy << "\n";
    out_ << "    HF / total:     " << std::setprecision(4) << f.highFreqRatio << "\n";

    out_ << std::setprecision(1);
    out_ << "\n[6] Adjustments\n";
    if (detail.kurtosisBonus > 0.0) {
        out_ << "    Kurtosis " << f.kurtosis << ": +" << detail.kurtosisBonus << "\n";
    }
    if (detail.hfAdjustment != 0.0) {
        out_ << "    HF energy: " << std::showpos << detail.hfAdjustment << std::noshowpos
             << (detail.hfAdjustment > 0.0 ? " (AI indicator)" : " (typical human)") << "\n";
    }
    if (detail.combinedIndicator) {
        out_ << "    Combined kurtosis/HF/regularity pattern: +" << detail.combinedBonus << "\n";
    }
    if (detail.abundanceBonus > 0.0) {
        out_ << "    Abundant regular peaks: +" << detail.abundanceBonus << "\n";
    }

    out_ << "\n";
    printRule();
    out_ << "  SCORE: " << detail.score << "/100\n";
    out_ << "  CONCLUSION: " << conclusion(detail.score) << "\n";
    printRule();

    out_.flags(flags);
    out_.precision(precision);
}

} // namespace Forensic
} // namespace SynthScan
