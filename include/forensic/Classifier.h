#pragma once

#include "forensic/FakeprintBuilder.h"
#include "forensic/FeatureExtractor.h"
#include "forensic/HeuristicScorer.h"
#include "forensic/LinearModel.h"
#include <memory>
#include <optional>
#include <string>

namespace SynthScan {
namespace Forensic {

/**
 * @brief Everything extracted from one signal that a classifier may consume
 */
struct FakeprintAnalysis {
    Fakeprint fakeprint;
    FeatureVector features;
};

struct ClassificationResult {
    bool isAiGenerated = false;
    double confidence = 0.0;          ///< [0, 1]
    double aiProbability = 0.0;       ///< [0, 100]
    double humanProbability = 100.0;  ///< [0, 100]
    std::optional<ScoreDetail> details;  ///< Heuristic audit trail only
};

/**
 * @brief Common interface of the heuristic and trained classification paths
 */
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual ClassificationResult classify(const FakeprintAnalysis& analysis) const = 0;
    virtual std::string getName() const = 0;
};

class HeuristicClassifier : public Classifier {
public:
    ClassificationResult classify(const FakeprintAnalysis& analysis) const override;
    std::string getName() const override { return "heuristic"; }

    /**
     * @brief Map a score to the result contract
     */
    static ClassificationResult fromScore(const ScoreDetail& detail);

private:
    HeuristicScorer scorer_;
};

/**
 * @brief Logistic model over the fakeprint vector
 */
class LinearModelClassifier : public Classifier {
public:
    explicit LinearModelClassifier(std::shared_ptr<const LinearModel> model);

    /**
     * @throws std::invalid_argument if the fakeprint length does not match the model
     */
    ClassificationResult classify(const FakeprintAnalysis& analysis) const override;
    std::string getName() const override { return "trained"; }

    const LinearModel& getModel() const { return *model_; }

private:
    std::shared_ptr<const LinearModel> model_;
};

} // namespace Forensic
} // namespace SynthScan
