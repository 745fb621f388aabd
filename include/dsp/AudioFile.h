#pragma once

#include "core/AudioBuffer.h"
#include "core/AudioSignal.h"
#include <cstdint>
#include <string>
#include <memory>
#include <vector>
#include <stdexcept>

namespace SynthScan {
namespace DSP {

/**
 * @brief Raised when a file cannot be opened, parsed or is in an unsupported format
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Audio file reader/writer
 *
 * Reads RIFF/WAVE (PCM and IEEE float) directly and MP3, FLAC and Ogg Vorbis
 * through CompressedDecoder. Writes WAV only.
 */
class AudioFile {
public:
    enum class Format {
        WAV,
        AIFF,
        FLAC,
        MP3,
        OGG,
        Unknown
    };

    struct FileInfo {
        Format format = Format::Unknown;
        int sampleRate = 0;
        int numChannels = 0;
        int bitDepth = 0;              ///< 0 for lossy formats
        int64_t numSamples = 0;        ///< Frames loaded (after duration cap)
        double durationSeconds = 0.0;  ///< Duration of the loaded frames
        uint64_t fileSizeBytes = 0;
    };

    struct DecodeOptions {
        int targetSampleRate = 16000;
        bool mono = true;                 ///< Average channels; otherwise keep channel 0
        double maxDurationSeconds = 180.0; ///< <= 0 loads everything
    };

    AudioFile() = default;
    ~AudioFile() = default;

    /**
     * @brief Load an audio file at its native rate
     * @param filepath Path to audio file
     * @param maxDurationSeconds Frames beyond this duration are not read (<= 0: no cap)
     * @throws DecodeError on any read or format failure
     */
    void load(const std::string& filepath, double maxDurationSeconds = 0.0);

    /**
     * @brief Save audio buffer to a WAV file
     * @param bitDepth 16, 24 (PCM) or 32 (float)
     * @return true if successful
     */
    bool save(const std::string& filepath,
              const Core::AudioBuffer& buffer,
              int sampleRate,
              int bitDepth = 24);

    const FileInfo& getInfo() const { return info_; }
    const Core::AudioBuffer& getBuffer() const { return *buffer_; }
    bool isLoaded() const { return buffer_ != nullptr; }

    /**
     * @brief Fold the loaded audio into a signal at the requested rate
     */
    Core::AudioSignal toSignal(int targetSampleRate, bool mono = true) const;

    /**
     * @brief Load, cap, downmix and resample in one step
     * @param info Receives the native file information when non-null
     * @throws DecodeError
     */
    static Core::AudioSignal decode(const std::string& filepath,
                                    const DecodeOptions& options,
                                    FileInfo* info = nullptr);

    /**
     * @brief Linear-interpolation resampler; output has ceil(n * target / source) samples
     */
    static std::vector<float> resample(const std::vector<float>& input,
                                       int sourceRate, int targetRate);

    static Format detectFormat(const std::string& filepath);

private:
    FileInfo info_;
    std::unique_ptr<Core::AudioBuffer> buffer_;

    void loadWAV(const std::string& filepath, double maxDurationSeconds);
    void loadCompressed(const std::string& filepath, Format format, double maxDurationSeconds);
    bool saveWAV(const std::string& filepath, const Core::AudioBuffer& buffer, int sampleRate, int bitDepth);
};

} // namespace DSP
} // namespace SynthScan
