#pragma once

#include "core/AudioSignal.h"
#include "core/DetectorConfig.h"
#include "dsp/SpectrogramEngine.h"
#include "forensic/Classifier.h"
#include "forensic/FakeprintBuilder.h"
#include "forensic/FeatureExtractor.h"
#include "forensic/LinearModel.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SynthScan {
namespace Forensic {

struct FileAnalysis {
    std::string filename;
    double durationSeconds = 0.0;
    std::string quality;            ///< "Lossless", "High", "Medium" or "Low"
    ClassificationResult result;
};

struct BatchItem {
    std::string filename;
    bool success = false;
    std::optional<FileAnalysis> analysis;
    std::string error;
};

struct BatchResult {
    std::vector<BatchItem> items;

    size_t total() const { return items.size(); }
    size_t succeeded() const;
};

struct DetectorInfo {
    std::string name;
    std::string version;
    std::string method;
    std::string frequencyRange;
    std::string modelStatus;        ///< "heuristic" or "trained"
    std::vector<std::string> supportedFormats;
    double maxDurationSeconds = 0.0;
};

/**
 * @brief Audio -> fakeprint -> features -> classification
 *
 * Starts in heuristic mode. A successful loadModel() switches to the trained
 * linear model for the rest of the detector's lifetime; a failed load leaves
 * the heuristic path in place. After construction and loading, the detector
 * is read-only and may be shared between threads.
 */
class FakeprintDetector {
public:
    enum class Mode {
        Heuristic,
        Trained
    };

    static constexpr const char* kName = "SynthScan";
    static constexpr const char* kVersion = "1.0.0";

    /**
     * @throws Core::ConfigError if the configuration is invalid
     */
    explicit FakeprintDetector(const Core::DetectorConfig& config = Core::DetectorConfig());

    /**
     * @brief Load a persisted linear model
     * @return true if the detector is now in trained mode
     *
     * Only the first successful load takes effect.
     */
    bool loadModel(const std::string& filepath);

    Mode getMode() const { return mode_; }
    bool isTrained() const { return mode_ == Mode::Trained; }
    const Classifier& getClassifier() const { return *classifier_; }
    const Core::DetectorConfig& getConfig() const { return config_; }

    /**
     * @brief Fakeprint and feature vector of a decoded signal
     */
    FakeprintAnalysis extract(const Core::AudioSignal& signal) const;

    ClassificationResult classify(const FakeprintAnalysis& analysis) const;

    ClassificationResult analyzeSignal(const Core::AudioSignal& signal) const;

    /**
     * @brief Decode and classify one file
     * @throws DSP::DecodeError for disallowed, unreadable or unsupported files
     */
    FileAnalysis analyzeFile(const std::string& filepath) const;

    /**
     * @brief Analyze files in order; failures become error items
     */
    BatchResult analyzeBatch(const std::vector<std::string>& filepaths) const;

    DetectorInfo getInfo() const;

    /**
     * @brief Quality class from the average bitrate of the file
     */
    static std::string classifyQuality(uint64_t fileSizeBytes, double durationSeconds);

private:
    Core::DetectorConfig config_;
    DSP::SpectrogramEngine engine_;
    FakeprintBuilder builder_;
    FeatureExtractor extractor_;

    Mode mode_ = Mode::Heuristic;
    std::shared_ptr<const LinearModel> model_;
    std::unique_ptr<Classifier> classifier_;
};

} // namespace Forensic
} // namespace SynthScan
