#pragma once

#include <string>
#include <vector>

namespace SynthScan {
namespace DSP {

/**
 * @brief PCM decoded from a compressed container, interleaved, in [-1, 1]
 */
struct DecodedAudio {
    std::vector<float> interleaved;
    int sampleRate = 0;
    int numChannels = 0;
    int bitDepth = 0;  ///< Source resolution; 0 for lossy streams
};

/**
 * @brief Compressed-format front ends (libmpg123, FLAC++, libvorbisfile)
 *
 * Each decoder stops once maxDurationSeconds of audio is available
 * (<= 0: decode everything) and throws DecodeError on failure.
 */
class CompressedDecoder {
public:
    static DecodedAudio decodeMP3(const std::string& filepath, double maxDurationSeconds);
    static DecodedAudio decodeFLAC(const std::string& filepath, double maxDurationSeconds);
    static DecodedAudio decodeVorbis(const std::string& filepath, double maxDurationSeconds);
};

} // namespace DSP
} // namespace SynthScan
