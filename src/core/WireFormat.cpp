#include "chunklog/WireFormat.hpp"

#include "chunklog/Checksum.hpp"

namespace chunklog {

std::string encodeChunk(std::string_view payload) {
    unsigned char cookie[kCookieSize];
    unsigned char length[kLengthSize];
    unsigned char checksum[kChecksumSize];
    encodeU32(kCookie, cookie);
    encodeU16(static_cast<uint16_t>(payload.size()), length);

    Crc32 crc;
    crc.update(cookie, sizeof(cookie));
    crc.update(length, sizeof(length));
    crc.update(payload);
    encodeU32(crc.value(), checksum);

    std::string out;
    out.reserve(kChunkOverhead + payload.size());
    out.append(reinterpret_cast<const char*>(cookie), sizeof(cookie));
    out.append(reinterpret_cast<const char*>(length), sizeof(length));
    out.append(payload.data(), payload.size());
    out.append(reinterpret_cast<const char*>(checksum), sizeof(checksum));
    return out;
}

} // namespace chunklog
