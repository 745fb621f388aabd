#pragma once

#include "forensic/Classifier.h"
#include "forensic/FakeprintDetector.h"
#include <nlohmann/json.hpp>

namespace SynthScan {
namespace Forensic {

/**
 * @brief JSON form of analysis results (snake_case keys)
 */
class ResultSerializer {
public:
    static nlohmann::json toJson(const FeatureVector& features);
    static nlohmann::json toJson(const ScoreDetail& detail);

    /**
     * @brief is_ai_generated, confidence, probabilities and, for heuristic results, details
     */
    static nlohmann::json toJson(const ClassificationResult& result);

    /**
     * @brief Classification plus filename, duration, quality and status "success"
     */
    static nlohmann::json toJson(const FileAnalysis& analysis);

    static nlohmann::json toJson(const BatchItem& item);

    /**
     * @brief {status, total, results}
     */
    static nlohmann::json toJson(const BatchResult& batch);

    static nlohmann::json toJson(const DetectorInfo& info);

    static nlohmann::json errorJson(const std::string& filename, const std::string& message);
};

} // namespace Forensic
} // namespace SynthScan
