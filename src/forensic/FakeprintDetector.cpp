#include "forensic/FakeprintDetector.h"
#include "dsp/AudioFile.h"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <utility>

namespace SynthScan {
namespace Forensic {

namespace {

Core::DetectorConfig validated(const Core::DetectorConfig& config) {
    config.validate();
    return config;
}

} // namespace

size_t BatchResult::succeeded() const {
    size_t count = 0;
    for (const auto& item : items) {
        if (item.success) {
            ++count;
        }
    }
    return count;
}

FakeprintDetector::FakeprintDetector(const Core::DetectorConfig& config)
    : config_(validated(config))
    , engine_(config_.fftSize, config_.getHopSize())
    , builder_(config_.minFrequency, config_.maxFrequency, config_.residualCeilingDb,
               EnvelopeExtractor(config_.hullArea, config_.hullFloorDb))
    , classifier_(std::make_unique<HeuristicClassifier>())
{
    if (config_.usePretrainedModel) {
        if (std::filesystem::exists(config_.modelPath)) {
            loadModel(config_.modelPath);
        } else {
            std::cerr << "[FakeprintDetector] Model not found, using heuristic: "
                      << config_.modelPath << std::endl;
        }
    }
}

// ============================================================================
// Model lifecycle
// ============================================================================

bool FakeprintDetector::loadModel(const std::string& filepath) {
    if (mode_ == Mode::Trained) {
        std::cerr << "[FakeprintDetector] Model already loaded, ignoring: " << filepath << std::endl;
        return true;
    }

    try {
        model_ = std::make_shared<const LinearModel>(ModelStore::load(filepath));
    } catch (const ModelLoadError& e) {
        std::cerr << "[FakeprintDetector] " << e.what() << " (staying in heuristic mode)" << std::endl;
        return false;
    }

    classifier_ = std::make_unique<LinearModelClassifier>(model_);
    mode_ = Mode::Trained;
    return true;
}

// ============================================================================
// Analysis
// ============================================================================

FakeprintAnalysis FakeprintDetector::extract(const Core::AudioSignal& signal) const {
    DSP::Spectrogram spectrogram = engine_.compute(signal);

    FakeprintAnalysis analysis;
    analysis.fakeprint = builder_.build(spectrogram.timeAverage());
    analysis.features = extractor_.extract(
        analysis.fakeprint, spectrogram.meanMagnitudeAbove(config_.highFrequencyCutoff));
    return analysis;
}

ClassificationResult FakeprintDetector::classify(const FakeprintAnalysis& analysis) const {
    return classifier_->classify(analysis);
}

ClassificationResult FakeprintDetector::analyzeSignal(const Core::AudioSignal& signal) const {
    return classify(extract(signal));
}

FileAnalysis FakeprintDetector::analyzeFile(const std::string& filepath) const {
    if (!config_.isExtensionAllowed(filepath)) {
        throw DSP::DecodeError("File type not allowed: " + filepath);
    }

    DSP::AudioFile::DecodeOptions options;
    options.targetSampleRate = config_.sampleRate;
    options.mono = true;
    options.maxDurationSeconds = config_.maxDurationSeconds;

    DSP::AudioFile::FileInfo info;
    Core::AudioSignal signal = DSP::AudioFile::decode(filepath, options, &info);

    FileAnalysis analysis;
    analysis.filename = std::filesystem::path(filepath).filename().string();
    analysis.durationSeconds = info.durationSeconds;
    analysis.quality = classifyQuality(info.fileSizeBytes, info.durationSeconds);
    analysis.result = analyzeSignal(signal);
    return analysis;
}

BatchResult FakeprintDetector::analyzeBatch(const std::vector<std::string>& filepaths) const {
    BatchResult batch;
    batch.items.reserve(filepaths.size());

    for (const auto& path : filepaths) {
        BatchItem item;
        item.filename = std::filesystem::path(path).filename().string();

        try {
            item.analysis = analyzeFile(path);
            item.success = true;
        } catch (const std::exception& e) {
            std::cerr << "[FakeprintDetector] Failed: " << path << ": " << e.what() << std::endl;
            item.error = e.what();
        }

        batch.items.push_back(std::move(item));
    }

    return batch;
}

DetectorInfo FakeprintDetector::getInfo() const {
    std::ostringstream range;
    range << config_.minFrequency << "-" << config_.maxFrequency << " Hz";

    DetectorInfo info;
    info.name = kName;
    info.version = kVersion;
    info.method = isTrained() ? "Fakeprint analysis + logistic regression"
                              : "Fakeprint analysis + heuristic rules";
    info.frequencyRange = range.str();
    info.modelStatus = classifier_->getName();
    info.supportedFormats = config_.allowedExtensions;
    info.maxDurationSeconds = config_.maxDurationSeconds;
    return info;
}

std::string FakeprintDetector::classifyQuality(uint64_t fileSizeBytes, double durationSeconds) {
    const double kbps = durationSeconds > 0.0
                        ? (static_cast<double>(fileSizeBytes) * 8.0) / (durationSeconds * 1000.0)
                        : 0.0;

    if (kbps >= 320.0) {
        return "Lossless";
    } else if (kbps >= 192.0) {
        return "High";
    } else if (kbps >= 128.0) {
        return "Medium";
    }
    return "Low";
}

} // namespace Forensic
} // namespace SynthScan
