#pragma once

#include <cstdint>
#include <cstring>

namespace SynthScan {
namespace Core {

/**
 * @brief Little-endian field access for the RIFF and model file formats
 *
 * Independent of host byte order.
 */
namespace ByteOrder {

inline uint16_t readLE16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline uint64_t readLE64(const uint8_t* p) {
    return static_cast<uint64_t>(readLE32(p)) | (static_cast<uint64_t>(readLE32(p + 4)) << 32);
}

inline double readLEDouble(const uint8_t* p) {
    uint64_t bits = readLE64(p);
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline float readLEFloat(const uint8_t* p) {
    uint32_t bits = readLE32(p);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline void writeLE16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

inline void writeLE32(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

inline void writeLE64(uint8_t* p, uint64_t v) {
    writeLE32(p, static_cast<uint32_t>(v & 0xFFFFFFFFu));
    writeLE32(p + 4, static_cast<uint32_t>(v >> 32));
}

inline void writeLEDouble(uint8_t* p, double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    writeLE64(p, bits);
}

inline void writeLEFloat(uint8_t* p, float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    writeLE32(p, bits);
}

} // namespace ByteOrder

} // namespace Core
} // namespace SynthScan
