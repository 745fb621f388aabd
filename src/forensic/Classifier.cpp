#include "forensic/Classifier.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace SynthScan {
namespace Forensic {

// ============================================================================
// HeuristicClassifier
// ============================================================================

ClassificationResult HeuristicClassifier::fromScore(const ScoreDetail& detail) {
    ClassificationResult result;
    result.aiProbability = detail.score;
    result.humanProbability = 100.0 - detail.score;
    result.isAiGenerated = detail.score > HeuristicScorer::kVerdictThreshold;
    result.confidence = std::abs(detail.score - HeuristicScorer::kVerdictThreshold) /
                        HeuristicScorer::kVerdictThreshold;
    result.details = detail;
    return result;
}

ClassificationResult HeuristicClassifier::classify(const FakeprintAnalysis& analysis) const {
    return fromScore(scorer_.score(analysis.features));
}

// ============================================================================
// LinearModelClassifier
// ============================================================================

LinearModelClassifier::LinearModelClassifier(std::shared_ptr<const LinearModel> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw std::invalid_argument("LinearModelClassifier requires a model");
    }
}

ClassificationResult LinearModelClassifier::classify(const FakeprintAnalysis& analysis) const {
    const auto& x = analysis.fakeprint.values;
    const auto probability = model_->predictProbability(x);

    ClassificationResult result;
    result.isAiGenerated = model_->predict(x);
    result.aiProbability = probability[1] * 100.0;
    result.humanProbability = probability[0] * 100.0;
    result.confidence = std::max(probability[0], probability[1]);
    return result;
}

} // namespace Forensic
} // namespace SynthScan
