#include "core/DetectorConfig.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace SynthScan {
namespace Core {

static std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(toLower(item));
        }
    }
    return items;
}

bool DetectorConfig::isExtensionAllowed(const std::string& filepath) const {
    size_t dotPos = filepath.find_last_of('.');
    if (dotPos == std::string::npos) {
        return false;
    }

    std::string ext = toLower(filepath.substr(dotPos + 1));
    return std::find(allowedExtensions.begin(), allowedExtensions.end(), ext)
           != allowedExtensions.end();
}

void DetectorConfig::validate() const {
    if (sampleRate <= 0) {
        throw ConfigError("sample_rate must be positive");
    }
    if (fftSize < 8 || (fftSize & (fftSize - 1)) != 0) {
        throw ConfigError("fft_size must be a power of 2 (>= 8)");
    }
    if (maxDurationSeconds <= 0.0) {
        throw ConfigError("max_duration must be positive");
    }
    if (minFrequency < 0.0 || minFrequency >= maxFrequency) {
        throw ConfigError("fmin must be non-negative and below fmax");
    }
    if (hullArea < 1) {
        throw ConfigError("hull_area must be at least 1");
    }
    if (residualCeilingDb <= 0.0) {
        throw ConfigError("max_db must be positive");
    }
}

DetectorConfig DetectorConfig::fromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    DetectorConfig config;
    try {
        json j = json::parse(file);

        config.sampleRate = j.value("sample_rate", config.sampleRate);
        config.maxDurationSeconds = j.value("max_duration", config.maxDurationSeconds);
        config.fftSize = j.value("fft_size", config.fftSize);
        config.minFrequency = j.value("fmin", config.minFrequency);
        config.maxFrequency = j.value("fmax", config.maxFrequency);
        config.hullArea = j.value("hull_area", config.hullArea);
        config.hullFloorDb = j.value("min_db", config.hullFloorDb);
        config.residualCeilingDb = j.value("max_db", config.residualCeilingDb);
        config.highFrequencyCutoff = j.value("high_freq_cutoff", config.highFrequencyCutoff);
        config.modelPath = j.value("model_path", config.modelPath);
        config.usePretrainedModel = j.value("use_pretrained_model", config.usePretrainedModel);
        config.verbose = j.value("verbose", config.verbose);

        if (j.contains("allowed_extensions")) {
            config.allowedExtensions.clear();
            for (const auto& ext : j["allowed_extensions"]) {
                config.allowedExtensions.push_back(toLower(ext.get<std::string>()));
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError("Invalid config file " + path + ": " + e.what());
    }

    return config;
}

void DetectorConfig::applyEnvironment() {
    if (const char* value = std::getenv("SYNTHSCAN_MODEL_PATH")) {
        modelPath = value;
    }
    if (const char* value = std::getenv("SYNTHSCAN_USE_PRETRAINED_MODEL")) {
        std::string flag = toLower(value);
        usePretrainedModel = (flag == "true" || flag == "1" || flag == "yes");
    }
    if (const char* value = std::getenv("SYNTHSCAN_ALLOWED_EXTENSIONS")) {
        allowedExtensions = splitList(value);
    }
    if (const char* value = std::getenv("SYNTHSCAN_SAMPLE_RATE")) {
        const std::string text(value);
        size_t parsed = 0;
        int rate = 0;
        try {
            rate = std::stoi(text, &parsed);
        } catch (const std::exception&) {
            throw ConfigError("SYNTHSCAN_SAMPLE_RATE is not a number: " + text);
        }
        // stoi stops at the first non-digit
        if (parsed != text.size()) {
            throw ConfigError("SYNTHSCAN_SAMPLE_RATE is not a number: " + text);
        }
        sampleRate = rate;
    }
}

} // namespace Core
} // namespace SynthScan
