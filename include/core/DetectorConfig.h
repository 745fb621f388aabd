#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace SynthScan {
namespace Core {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Detector settings
 *
 * Defaults reproduce the calibrated analysis path. Values can come from a JSON
 * file and be overridden by SYNTHSCAN_* environment variables.
 */
struct DetectorConfig {
    // ============================================
    // Decoding
    // ============================================

    int sampleRate{16000};           ///< Target rate the decoder resamples to
    double maxDurationSeconds{180.0};
    std::vector<std::string> allowedExtensions{"mp3", "wav", "ogg", "flac"};

    // ============================================
    // Spectral analysis
    // ============================================

    int fftSize{16384};              ///< Window length, hop is fftSize / 4
    double minFrequency{5000.0};     ///< Fakeprint band, exclusive
    double maxFrequency{16000.0};    ///< Fakeprint band, exclusive
    int hullArea{10};                ///< Lower-hull window width in bins
    double hullFloorDb{-45.0};
    double residualCeilingDb{5.0};
    double highFrequencyCutoff{8000.0};

    // ============================================
    // Classifier
    // ============================================

    std::string modelPath{"./models/detector.bin"};
    bool usePretrainedModel{false};

    bool verbose{false};

    int getHopSize() const { return fftSize / 4; }

    bool isExtensionAllowed(const std::string& filepath) const;

    /**
     * @throws ConfigError describing the first invalid field
     */
    void validate() const;

    /**
     * @brief Load settings from a JSON file; missing keys keep their defaults
     * @throws ConfigError if the file cannot be read or parsed
     */
    static DetectorConfig fromJsonFile(const std::string& path);

    /**
     * @brief Overlay SYNTHSCAN_* environment variables onto this config
     */
    void applyEnvironment();
};

} // namespace Core
} // namespace SynthScan
