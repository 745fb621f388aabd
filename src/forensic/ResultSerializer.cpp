#include "forensic/ResultSerializer.h"

using json = nlohmann::json;

namespace SynthScan {
namespace Forensic {

json ResultSerializer::toJson(const FeatureVector& features) {
    json j;

    // Peaks
    j["peak_count_high"] = features.peakCountHigh;
    j["peak_count_medium"] = features.peakCountMedium;
    j["peak_count_low"] = features.peakCountLow;
    j["peak_density_high"] = features.peakDensityHigh;
    j["peak_density_medium"] = features.peakDensityMedium;
    j["peak_density_low"] = features.peakDensityLow;

    // Regularity
    j["peak_regularity_score"] = features.peakRegularityScore;
    j["peak_spacing_variance"] = features.peakSpacingStd;
    j["peak_spacing_mean"] = features.peakSpacingMean;
    j["peak_spacing_cv"] = features.peakSpacingCv;

    // Distribution
    j["fakeprint_mean"] = features.mean;
    j["fakeprint_max"] = features.maxValue;
    j["fakeprint_std"] = features.stdDev;
    j["fakeprint_p75"] = features.p75;
    j["fakeprint_p90"] = features.p90;
    j["fakeprint_kurtosis"] = features.kurtosis;

    j["periodicity_score"] = features.periodicityScore;

    // Energy
    j["high_freq_energy"] = features.highFreqEnergy;
    j["high_freq_ratio"] = features.highFreqRatio;

    return j;
}

json ResultSerializer::toJson(const ScoreDetail& detail) {
    json j = toJson(detail.features);

    j["regularity_multiplier"] = detail.regularityMultiplier;
    j["peak_count_points"] = detail.peakCountPoints;
    j["high_peak_points"] = detail.highPeakPoints;
    j["mean_intensity_points"] = detail.meanIntensityPoints;
    j["max_intensity_points"] = detail.maxIntensityPoints;
    j["p90_points"] = detail.p90Points;
    j["periodicity_points"] = detail.periodicityPoints;
    j["regularity_points"] = detail.regularityPoints;

    j["kurtosis_bonus"] = detail.kurtosisBonus;
    j["hf_adjustment"] = detail.hfAdjustment;
    j["combined_ia_indicator"] = detail.combinedIndicator;
    j["combined_bonus"] = detail.combinedBonus;
    j["abundance_bonus"] = detail.abundanceBonus;

    j["raw_score"] = detail.rawScore;
    j["score"] = detail.score;

    return j;
}

json ResultSerializer::toJson(const ClassificationResult& result) {
    json j;
    j["is_ai_generated"] = result.isAiGenerated;
    j["confidence"] = result.confidence;
    j["ai_probability"] = result.aiProbability;
    j["human_probability"] = result.humanProbability;
    if (result.details) {
        j["details"] = toJson(*result.details);
    }
    return j;
}

json ResultSerializer::toJson(const FileAnalysis& analysis) {
    json j = toJson(analysis.result);
    j["filename"] = analysis.filename;
    j["duration"] = analysis.durationSeconds;
    j["quality"] = analysis.quality;
    j["status"] = "success";
    return j;
}

json ResultSerializer::toJson(const BatchItem& item) {
    if (item.success && item.analysis) {
        return toJson(*item.analysis);
    }
    return errorJson(item.filename, item.error);
}

json ResultSerializer::toJson(const BatchResult& batch) {
    json results = json::array();
    for (const auto& item : batch.items) {
        results.push_back(toJson(item));
    }

    json j;
    j["status"] = "success";
    j["total"] = batch.total();
    j["results"] = results;
    return j;
}

json ResultSerializer::toJson(const DetectorInfo& info) {
    json j;
    j["name"] = info.name;
    j["version"] = info.version;
    j["analysis_method"] = info.method;
    j["frequency_range"] = info.frequencyRange;
    j["model_status"] = info.modelStatus;
    j["supported_formats"] = info.supportedFormats;
    j["max_duration"] = info.maxDurationSeconds;
    return j;
}

json ResultSerializer::errorJson(const std::string& filename, const std::string& message) {
    json j;
    j["filename"] = filename;
    j["status"] = "error";
    j["error"] = message;
    return j;
}

} // namespace Forensic
} // namespace SynthScan
