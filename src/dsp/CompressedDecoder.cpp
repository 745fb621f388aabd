#include "dsp/CompressedDecoder.h"
#include "dsp/AudioFile.h"
#include <FLAC++/decoder.h>
#include <mpg123.h>
#include <vorbis/vorbisfile.h>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <utility>

namespace SynthScan {
namespace DSP {

namespace {

constexpr size_t kMp3ReadBytes = 16384;
constexpr int kVorbisReadFrames = 4096;

int64_t frameLimit(double maxDurationSeconds, long sampleRate) {
    if (maxDurationSeconds <= 0.0) {
        return -1;
    }
    return static_cast<int64_t>(maxDurationSeconds * sampleRate);
}

// ============================================================================
// libmpg123
// ============================================================================

void ensureMpg123() {
    static const int initResult = mpg123_init();
    if (initResult != MPG123_OK) {
        throw DecodeError(std::string("mpg123_init() failed: ") + mpg123_plain_strerror(initResult));
    }
}

struct Mpg123Deleter {
    void operator()(mpg123_handle* handle) const {
        mpg123_close(handle);
        mpg123_delete(handle);
    }
};

using Mpg123Handle = std::unique_ptr<mpg123_handle, Mpg123Deleter>;

// ============================================================================
// FLAC++
// ============================================================================

class FlacReader : public FLAC::Decoder::File {
public:
    explicit FlacReader(double maxDurationSeconds) : maxDurationSeconds_(maxDurationSeconds) {}

    DecodedAudio audio;
    int64_t frames = 0;
    bool hasStreamInfo = false;
    bool limitReached = false;
    bool streamError = false;
    ::FLAC__StreamDecoderErrorStatus lastError = FLAC__STREAM_DECODER_ERROR_STATUS_LOST_SYNC;

protected:
    ::FLAC__StreamDecoderWriteStatus write_callback(const ::FLAC__Frame* frame,
                                                    const FLAC__int32* const buffer[]) override {
        const unsigned channels = frame->header.channels;
        const unsigned bits = frame->header.bits_per_sample;
        if (!hasStreamInfo || channels != static_cast<unsigned>(audio.numChannels) || bits == 0) {
            return FLAC__STREAM_DECODER_WRITE_STATUS_ABORT;
        }

        const float scale = 1.0f / static_cast<float>(int64_t(1) << (bits - 1));
        for (unsigned i = 0; i < frame->header.blocksize; ++i) {
            if (maxFrames_ >= 0 && frames >= maxFrames_) {
                limitReached = true;
                return FLAC__STREAM_DECODER_WRITE_STATUS_ABORT;
            }
            for (unsigned ch = 0; ch < channels; ++ch) {
                audio.interleaved.push_back(static_cast<float>(buffer[ch][i]) * scale);
            }
            ++frames;
        }
        return FLAC__STREAM_DECODER_WRITE_STATUS_CONTINUE;
    }

    void metadata_callback(const ::FLAC__StreamMetadata* metadata) override {
        if (metadata->type == FLAC__METADATA_TYPE_STREAMINFO) {
            const auto& info = metadata->data.stream_info;
            audio.sampleRate = static_cast<int>(info.sample_rate);
            audio.numChannels = static_cast<int>(info.channels);
            audio.bitDepth = static_cast<int>(info.bits_per_sample);
            maxFrames_ = frameLimit(maxDurationSeconds_, info.sample_rate);
            hasStreamInfo = true;
        }
    }

    void error_callback(::FLAC__StreamDecoderErrorStatus status) override {
        std::cerr << "[CompressedDecoder] FLAC error: "
                  << FLAC__StreamDecoderErrorStatusString[status] << std::endl;
        streamError = true;
        lastError = status;
    }

private:
    double maxDurationSeconds_;
    int64_t maxFrames_ = -1;
};

// ============================================================================
// libvorbisfile
// ============================================================================

std::string vorbisError(int code) {
    switch (code) {
        case OV_EREAD:      return "read error";
        case OV_ENOTVORBIS: return "not Vorbis data";
        case OV_EVERSION:   return "Vorbis version mismatch";
        case OV_EBADHEADER: return "invalid Vorbis header";
        case OV_EFAULT:     return "internal decoder fault";
        case OV_EBADLINK:   return "corrupt link in stream";
        default:            return "error " + std::to_string(code);
    }
}

struct VorbisFileCloser {
    void operator()(OggVorbis_File* vf) const {
        ov_clear(vf);
        delete vf;
    }
};

} // namespace

DecodedAudio CompressedDecoder::decodeMP3(const std::string& filepath, double maxDurationSeconds) {
    ensureMpg123();

    int err = MPG123_OK;
    Mpg123Handle handle(mpg123_new(nullptr, &err));
    if (!handle) {
        throw DecodeError(std::string("mpg123_new() failed: ") + mpg123_plain_strerror(err));
    }
    mpg123_param(handle.get(), MPG123_ADD_FLAGS, MPG123_QUIET, 0);

    err = mpg123_open(handle.get(), filepath.c_str());
    if (err != MPG123_OK) {
        throw DecodeError("Failed to open MP3 file: " + filepath + " (" +
                          mpg123_strerror(handle.get()) + ")");
    }

    long rate = 0;
    int channels = 0;
    int encoding = 0;
    err = mpg123_getformat(handle.get(), &rate, &channels, &encoding);
    if (err != MPG123_OK || rate <= 0 || channels <= 0) {
        throw DecodeError("Invalid MP3 stream: " + filepath);
    }
    // Pin the output format so the stream cannot switch mid-decode
    if (mpg123_format_none(handle.get()) != MPG123_OK ||
        mpg123_format(handle.get(), rate, channels, MPG123_ENC_SIGNED_16) != MPG123_OK) {
        throw DecodeError(std::string("Failed to set MP3 output format: ") +
                          mpg123_strerror(handle.get()));
    }

    DecodedAudio audio;
    audio.sampleRate = static_cast<int>(rate);
    audio.numChannels = channels;

    const int64_t maxFrames = frameLimit(maxDurationSeconds, rate);
    const size_t maxSamples = maxFrames >= 0 ? static_cast<size_t>(maxFrames) * channels : SIZE_MAX;

    std::vector<unsigned char> block(kMp3ReadBytes);
    while (audio.interleaved.size() < maxSamples) {
        size_t done = 0;
        err = mpg123_read(handle.get(), block.data(), block.size(), &done);
        if (err != MPG123_OK && err != MPG123_DONE && err != MPG123_NEW_FORMAT) {
            throw DecodeError("MP3 decode failed: " + filepath + " (" +
                              mpg123_plain_strerror(err) + ")");
        }

        const size_t count = done / sizeof(int16_t);
        for (size_t i = 0; i < count && audio.interleaved.size() < maxSamples; ++i) {
            // MPG123_ENC_SIGNED_16 is native byte order
            int16_t value;
            std::memcpy(&value, block.data() + i * sizeof(int16_t), sizeof(value));
            audio.interleaved.push_back(value / 32768.0f);
        }

        if (err == MPG123_DONE) {
            break;
        }
    }

    audio.interleaved.resize(audio.interleaved.size() - audio.interleaved.size() % channels);
    if (audio.interleaved.empty()) {
        throw DecodeError("MP3 stream has no audio: " + filepath);
    }
    return audio;
}

DecodedAudio CompressedDecoder::decodeFLAC(const std::string& filepath, double maxDurationSeconds) {
    FlacReader reader(maxDurationSeconds);

    ::FLAC__StreamDecoderInitStatus status = reader.init(filepath);
    if (status != FLAC__STREAM_DECODER_INIT_STATUS_OK) {
        throw DecodeError("Failed to open FLAC file: " + filepath + " (" +
                          FLAC__StreamDecoderInitStatusString[status] + ")");
    }

    const bool finished = reader.process_until_end_of_stream();
    reader.finish();

    if (!reader.hasStreamInfo) {
        throw DecodeError("Invalid FLAC stream (no STREAMINFO): " + filepath);
    }
    if (!finished && !reader.limitReached) {
        throw DecodeError("FLAC decode failed: " + filepath);
    }
    if (reader.streamError && reader.frames == 0) {
        throw DecodeError("FLAC decode failed: " + filepath + " (" +
                          FLAC__StreamDecoderErrorStatusString[reader.lastError] + ")");
    }
    if (reader.frames == 0) {
        throw DecodeError("FLAC stream has no audio: " + filepath);
    }
    return std::move(reader.audio);
}

DecodedAudio CompressedDecoder::decodeVorbis(const std::string& filepath, double maxDurationSeconds) {
    std::unique_ptr<OggVorbis_File, VorbisFileCloser> vf;
    {
        auto* file = new OggVorbis_File();
        const int err = ov_fopen(filepath.c_str(), file);
        if (err != 0) {
            delete file;
            throw DecodeError("Failed to open Ogg Vorbis file: " + filepath + " (" + vorbisError(err) + ")");
        }
        vf.reset(file);
    }

    vorbis_info* info = ov_info(vf.get(), -1);
    if (!info || info->channels <= 0 || info->rate <= 0) {
        throw DecodeError("Invalid Ogg Vorbis stream: " + filepath);
    }

    DecodedAudio audio;
    audio.sampleRate = static_cast<int>(info->rate);
    audio.numChannels = info->channels;

    const int64_t maxFrames = frameLimit(maxDurationSeconds, info->rate);
    int64_t frames = 0;
    int section = 0;
    while (maxFrames < 0 || frames < maxFrames) {
        float** pcm = nullptr;
        const long got = ov_read_float(vf.get(), &pcm, kVorbisReadFrames, &section);
        if (got == 0) {
            break;
        }
        if (got == OV_HOLE) {
            continue;
        }
        if (got < 0) {
            throw DecodeError("Ogg Vorbis decode failed: " + filepath + " (" +
                              vorbisError(static_cast<int>(got)) + ")");
        }

        // Chained streams may change layout; only the first one is read
        vorbis_info* current = ov_info(vf.get(), section);
        if (!current || current->channels != audio.numChannels) {
            break;
        }

        for (long i = 0; i < got && (maxFrames < 0 || frames < maxFrames); ++i, ++frames) {
            for (int ch = 0; ch < audio.numChannels; ++ch) {
                audio.interleaved.push_back(pcm[ch][i]);
            }
        }
    }

    if (frames == 0) {
        throw DecodeError("Ogg Vorbis stream has no audio: " + filepath);
    }
    return audio;
}

} // namespace DSP
} // namespace SynthScan
