#include "dsp/AudioFile.h"
#include "dsp/CompressedDecoder.h"
#include "core/ByteOrder.h"
#include <fstream>
#include <iostream>
#include <cstring>
#include <cmath>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace SynthScan {
namespace DSP {

namespace {

constexpr uint16_t kFormatPCM = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

constexpr size_t kWavHeaderSize = 44;
constexpr size_t kChunkHeaderSize = 8;
// WAVE_FORMAT_EXTENSIBLE, the largest standard fmt chunk, is 40 bytes
constexpr uint32_t kMaxFormatChunkSize = 1024;

struct FormatChunk {
    uint16_t audioFormat = 0;
    uint16_t numChannels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
};

using Core::ByteOrder::readLE16;
using Core::ByteOrder::readLE32;

float decodeSample(const uint8_t* p, uint16_t audioFormat, int bytesPerSample) {
    if (audioFormat == kFormatFloat) {
        if (bytesPerSample == 4) {
            return Core::ByteOrder::readLEFloat(p);
        }
        return static_cast<float>(Core::ByteOrder::readLEDouble(p));
    }

    switch (bytesPerSample) {
        case 1:
            // 8-bit WAV is unsigned
            return (static_cast<int>(p[0]) - 128) / 128.0f;
        case 2:
            return static_cast<int16_t>(readLE16(p)) / 32768.0f;
        case 3: {
            int32_t sample = (p[2] << 16) | (p[1] << 8) | p[0];
            // Sign extend
            if (sample & 0x800000) {
                sample |= ~0xFFFFFF;
            }
            return sample / 8388608.0f;
        }
        default:
            return static_cast<int32_t>(readLE32(p)) / 2147483648.0f;
    }
}

} // namespace

void AudioFile::load(const std::string& filepath, double maxDurationSeconds) {
    buffer_.reset();
    info_ = FileInfo();

    Format format = detectFormat(filepath);
    switch (format) {
        case Format::WAV:
            loadWAV(filepath, maxDurationSeconds);
            break;
        case Format::MP3:
        case Format::FLAC:
        case Format::OGG:
            loadCompressed(filepath, format, maxDurationSeconds);
            break;
        default:
            std::cerr << "[AudioFile] Unsupported format: " << filepath << std::endl;
            throw DecodeError("Unsupported audio format: " + filepath);
    }
}

bool AudioFile::save(const std::string& filepath,
                     const Core::AudioBuffer& buffer,
                     int sampleRate,
                     int bitDepth) {
    if (detectFormat(filepath) == Format::WAV) {
        return saveWAV(filepath, buffer, sampleRate, bitDepth);
    }

    std::cerr << "[AudioFile] Unsupported format: " << filepath << std::endl;
    return false;
}

AudioFile::Format AudioFile::detectFormat(const std::string& filepath) {
    size_t dotPos = filepath.find_last_of('.');
    if (dotPos == std::string::npos) {
        return Format::Unknown;
    }

    std::string ext = filepath.substr(dotPos + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "wav" || ext == "wave") return Format::WAV;
    if (ext == "aif" || ext == "aiff") return Format::AIFF;
    if (ext == "flac") return Format::FLAC;
    if (ext == "mp3") return Format::MP3;
    if (ext == "ogg" || ext == "oga") return Format::OGG;

    return Format::Unknown;
}

void AudioFile::loadWAV(const std::string& filepath, double maxDurationSeconds) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[AudioFile] Failed to open: " << filepath << std::endl;
        throw DecodeError("Failed to open audio file: " + filepath);
    }

    char riff[12];
    if (!file.read(riff, sizeof(riff)) ||
        std::strncmp(riff, "RIFF", 4) != 0 ||
        std::strncmp(riff + 8, "WAVE", 4) != 0) {
        std::cerr << "[AudioFile] Invalid WAV file: " << filepath << std::endl;
        throw DecodeError("Invalid WAV file (missing RIFF/WAVE header): " + filepath);
    }

    FormatChunk fmt;
    bool haveFormat = false;
    bool haveData = false;
    uint32_t dataSize = 0;

    // Walk chunks until "data"; "fmt " must precede it
    uint8_t chunkHeader[kChunkHeaderSize];
    while (file.read(reinterpret_cast<char*>(chunkHeader), sizeof(chunkHeader))) {
        const char* chunkId = reinterpret_cast<const char*>(chunkHeader);
        const uint32_t chunkSize = readLE32(chunkHeader + 4);

        if (std::strncmp(chunkId, "fmt ", 4) == 0) {
            if (chunkSize < 16 || chunkSize > kMaxFormatChunkSize) {
                std::cerr << "[AudioFile] Bad fmt chunk size " << chunkSize << ": " << filepath << std::endl;
                throw DecodeError("Corrupt WAV format chunk: " + filepath);
            }
            std::vector<uint8_t> raw(chunkSize);
            if (!file.read(reinterpret_cast<char*>(raw.data()), chunkSize)) {
                throw DecodeError("Truncated WAV format chunk: " + filepath);
            }
            fmt.audioFormat = readLE16(&raw[0]);
            fmt.numChannels = readLE16(&raw[2]);
            fmt.sampleRate = readLE32(&raw[4]);
            fmt.bitsPerSample = readLE16(&raw[14]);
            if (fmt.audioFormat == kFormatExtensible && chunkSize >= 26) {
                fmt.audioFormat = readLE16(&raw[24]);
            }
            haveFormat = true;
        } else if (std::strncmp(chunkId, "data", 4) == 0) {
            dataSize = chunkSize;
            haveData = true;
            break;
        } else {
            file.seekg(chunkSize, std::ios::cur);
        }

        // Chunks are word aligned
        if (chunkSize & 1) {
            file.seekg(1, std::ios::cur);
        }
    }

    if (!haveFormat || !haveData) {
        throw DecodeError("Invalid WAV file (missing fmt or data chunk): " + filepath);
    }

    const int bytesPerSample = fmt.bitsPerSample / 8;
    const bool pcmOk = fmt.audioFormat == kFormatPCM &&
                       (fmt.bitsPerSample == 8 || fmt.bitsPerSample == 16 ||
                        fmt.bitsPerSample == 24 || fmt.bitsPerSample == 32);
    const bool floatOk = fmt.audioFormat == kFormatFloat &&
                         (fmt.bitsPerSample == 32 || fmt.bitsPerSample == 64);
    if (!pcmOk && !floatOk) {
        throw DecodeError("Unsupported WAV encoding (format " + std::to_string(fmt.audioFormat) +
                          ", " + std::to_string(fmt.bitsPerSample) + " bit): " + filepath);
    }
    if (fmt.numChannels == 0 || fmt.sampleRate == 0) {
        throw DecodeError("Corrupt WAV format chunk: " + filepath);
    }

    const size_t frameBytes = static_cast<size_t>(bytesPerSample) * fmt.numChannels;
    int64_t numFrames = dataSize / frameBytes;
    if (maxDurationSeconds > 0.0) {
        int64_t maxFrames = static_cast<int64_t>(maxDurationSeconds * fmt.sampleRate);
        numFrames = std::min(numFrames, maxFrames);
    }

    std::vector<uint8_t> raw(static_cast<size_t>(numFrames) * frameBytes);
    file.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
    // Streamed WAVs often over-report the data size; keep what is actually there
    numFrames = file.gcount() / static_cast<std::streamsize>(frameBytes);

    info_.format = Format::WAV;
    info_.sampleRate = static_cast<int>(fmt.sampleRate);
    info_.numChannels = fmt.numChannels;
    info_.bitDepth = fmt.bitsPerSample;
    info_.numSamples = numFrames;
    info_.durationSeconds = static_cast<double>(numFrames) / fmt.sampleRate;

    std::error_code ec;
    auto size = std::filesystem::file_size(filepath, ec);
    info_.fileSizeBytes = ec ? 0 : static_cast<uint64_t>(size);

    std::vector<float> interleaved(static_cast<size_t>(numFrames) * info_.numChannels);
    for (size_t i = 0; i < interleaved.size(); ++i) {
        interleaved[i] = decodeSample(raw.data() + i * bytesPerSample, fmt.audioFormat, bytesPerSample);
    }
    buffer_ = std::make_unique<Core::AudioBuffer>(
        Core::AudioBuffer::fromInterleaved(interleaved, info_.numChannels));

    std::cout << "[AudioFile] Loaded: " << filepath << " ("
              << info_.numChannels << " ch, "
              << info_.sampleRate << " Hz, "
              << info_.bitDepth << " bit, "
              << info_.durationSeconds << " sec)" << std::endl;
}

void AudioFile::loadCompressed(const std::string& filepath, Format format, double maxDurationSeconds) {
    if (!std::filesystem::exists(filepath)) {
        std::cerr << "[AudioFile] Failed to open: " << filepath << std::endl;
        throw DecodeError("Failed to open audio file: " + filepath);
    }

    DecodedAudio decoded;
    switch (format) {
        case Format::MP3:
            decoded = CompressedDecoder::decodeMP3(filepath, maxDurationSeconds);
            break;
        case Format::FLAC:
            decoded = CompressedDecoder::decodeFLAC(filepath, maxDurationSeconds);
            break;
        case Format::OGG:
            decoded = CompressedDecoder::decodeVorbis(filepath, maxDurationSeconds);
            break;
        default:
            throw DecodeError("Unsupported audio format: " + filepath);
    }

    const int64_t numFrames = static_cast<int64_t>(decoded.interleaved.size()) / decoded.numChannels;

    info_.format = format;
    info_.sampleRate = decoded.sampleRate;
    info_.numChannels = decoded.numChannels;
    info_.bitDepth = decoded.bitDepth;
    info_.numSamples = numFrames;
    info_.durationSeconds = static_cast<double>(numFrames) / decoded.sampleRate;

    std::error_code ec;
    auto size = std::filesystem::file_size(filepath, ec);
    info_.fileSizeBytes = ec ? 0 : static_cast<uint64_t>(size);

    buffer_ = std::make_unique<Core::AudioBuffer>(
        Core::AudioBuffer::fromInterleaved(decoded.interleaved, info_.numChannels));

    std::cout << "[AudioFile] Loaded: " << filepath << " ("
              << info_.numChannels << " ch, "
              << info_.sampleRate << " Hz, "
              << info_.durationSeconds << " sec)" << std::endl;
}

Core::AudioSignal AudioFile::toSignal(int targetSampleRate, bool mono) const {
    if (!buffer_) {
        throw DecodeError("No audio loaded");
    }

    std::vector<float> samples = mono ? buffer_->mixToMono() : buffer_->getChannel(0);

    return Core::AudioSignal(resample(samples, info_.sampleRate, targetSampleRate),
                             targetSampleRate);
}

Core::AudioSignal AudioFile::decode(const std::string& filepath,
                                    const DecodeOptions& options,
                                    FileInfo* info) {
    AudioFile audioFile;
    audioFile.load(filepath, options.maxDurationSeconds);
    if (info) {
        *info = audioFile.getInfo();
    }
    return audioFile.toSignal(options.targetSampleRate, options.mono);
}

std::vector<float> AudioFile::resample(const std::vector<float>& input,
                                       int sourceRate, int targetRate) {
    if (sourceRate <= 0 || targetRate <= 0) {
        throw std::invalid_argument("Sample rates must be positive");
    }
    if (sourceRate == targetRate || input.empty()) {
        return input;
    }

    double ratio = static_cast<double>(targetRate) / sourceRate;
    // ceil(n * target / source) in integers so exact ratios do not round up
    const uint64_t scaled = static_cast<uint64_t>(input.size()) * static_cast<uint64_t>(targetRate);
    size_t newSize = static_cast<size_t>((scaled + sourceRate - 1) / sourceRate);
    std::vector<float> resampled(newSize);

    for (size_t i = 0; i < newSize; ++i) {
        double srcPos = i / ratio;
        size_t idx = static_cast<size_t>(srcPos);
        double frac = srcPos - idx;

        if (idx + 1 < input.size()) {
            resampled[i] = static_cast<float>(input[idx] * (1.0 - frac) + input[idx + 1] * frac);
        } else {
            resampled[i] = input[std::min(idx, input.size() - 1)];
        }
    }

    return resampled;
}

bool AudioFile::saveWAV(const std::string& filepath,
                        const Core::AudioBuffer& buffer,
                        int sampleRate,
                        int bitDepth) {
    if (bitDepth != 16 && bitDepth != 24 && bitDepth != 32) {
        std::cerr << "[AudioFile] Unsupported bit depth: " << bitDepth << std::endl;
        return false;
    }

    std::ofstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[AudioFile] Failed to create: " << filepath << std::endl;
        return false;
    }

    int numChannels = buffer.getNumChannels();
    int numSamples = buffer.getNumSamples();
    int bytesPerSample = bitDepth / 8;
    uint32_t dataSize = static_cast<uint32_t>(numSamples) * numChannels * bytesPerSample;

    using namespace Core::ByteOrder;
    uint8_t header[kWavHeaderSize];
    std::memcpy(header, "RIFF", 4);
    writeLE32(header + 4, static_cast<uint32_t>(kWavHeaderSize - 8) + dataSize);
    std::memcpy(header + 8, "WAVE", 4);
    std::memcpy(header + 12, "fmt ", 4);
    writeLE32(header + 16, 16);
    writeLE16(header + 20, (bitDepth == 32) ? kFormatFloat : kFormatPCM);
    writeLE16(header + 22, static_cast<uint16_t>(numChannels));
    writeLE32(header + 24, static_cast<uint32_t>(sampleRate));
    writeLE32(header + 28, static_cast<uint32_t>(sampleRate * numChannels * bytesPerSample));
    writeLE16(header + 32, static_cast<uint16_t>(numChannels * bytesPerSample));
    writeLE16(header + 34, static_cast<uint16_t>(bitDepth));
    std::memcpy(header + 36, "data", 4);
    writeLE32(header + 40, dataSize);

    file.write(reinterpret_cast<const char*>(header), sizeof(header));

    // Interleave
    std::vector<uint8_t> interleaved(dataSize);
    for (int i = 0; i < numSamples; ++i) {
        for (int ch = 0; ch < numChannels; ++ch) {
            float sample = buffer.getReadPointer(ch)[i];
            uint8_t* out = interleaved.data() + (static_cast<size_t>(i) * numChannels + ch) * bytesPerSample;

            if (bitDepth == 16) {
                int16_t value = static_cast<int16_t>(std::clamp(sample, -1.0f, 1.0f) * 32767.0f);
                writeLE16(out, static_cast<uint16_t>(value));
            } else if (bitDepth == 24) {
                int32_t value = static_cast<int32_t>(std::clamp(sample, -1.0f, 1.0f) * 8388607.0f);
                out[0] = value & 0xFF;
                out[1] = (value >> 8) & 0xFF;
                out[2] = (value >> 16) & 0xFF;
            } else {
                writeLEFloat(out, sample);
            }
        }
    }

    file.write(reinterpret_cast<const char*>(interleaved.data()), dataSize);
    if (!file) {
        std::cerr << "[AudioFile] Write failed: " << filepath << std::endl;
        return false;
    }

    std::cout << "[AudioFile] Saved: " << filepath << " ("
              << numChannels << " ch, "
              << sampleRate << " Hz, "
              << bitDepth << " bit)" << std::endl;

    return true;
}

} // namespace DSP
} // namespace SynthScan
