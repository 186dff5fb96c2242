#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace chunklog {

// Chunk layout, all integers big-endian:
//
//   0        cookie    4 bytes  (0x24716296)
//   4        length    2 bytes  (0..kMaxChunkSize)
//   6        payload   length bytes
//   6+len    checksum  4 bytes  (CRC-32 over bytes [0, 6+len))
//
// The cookie bytes are pairwise distinct, so a sliding byte-wise match can
// never overlap itself.
constexpr uint32_t kCookie = 0x24716296u;
constexpr size_t kMaxChunkSize = 1024;

constexpr size_t kCookieSize = 4;
constexpr size_t kLengthSize = 2;
constexpr size_t kChecksumSize = 4;
constexpr size_t kChunkOverhead = kCookieSize + kLengthSize + kChecksumSize;

constexpr mode_t kFileMode = 0600;

inline void encodeU16(uint16_t value, unsigned char out[2]) {
    out[0] = static_cast<unsigned char>((value >> 8) & 0xFFu);
    out[1] = static_cast<unsigned char>(value & 0xFFu);
}

inline void encodeU32(uint32_t value, unsigned char out[4]) {
    out[0] = static_cast<unsigned char>((value >> 24) & 0xFFu);
    out[1] = static_cast<unsigned char>((value >> 16) & 0xFFu);
    out[2] = static_cast<unsigned char>((value >> 8) & 0xFFu);
    out[3] = static_cast<unsigned char>(value & 0xFFu);
}

// Decoders return false when fewer bytes are available than the field needs.
inline bool decodeU16(std::string_view data, uint16_t& value) {
    if (data.size() < 2) return false;
    value = static_cast<uint16_t>(
        (static_cast<uint16_t>(static_cast<unsigned char>(data[0])) << 8) |
        static_cast<uint16_t>(static_cast<unsigned char>(data[1])));
    return true;
}

inline bool decodeU32(std::string_view data, uint32_t& value) {
    if (data.size() < 4) return false;
    value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value = (value << 8) | static_cast<uint32_t>(static_cast<unsigned char>(data[i]));
    }
    return true;
}

// Full on-disk bytes of one chunk. Caller guarantees payload.size() <= kMaxChunkSize.
std::string encodeChunk(std::string_view payload);

} // namespace chunklog
