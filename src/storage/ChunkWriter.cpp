#include "chunklog/ChunkWriter.hpp"

#include "chunklog/Checksum.hpp"
#include "chunklog/Errors.hpp"
#include "chunklog/WireFormat.hpp"

namespace chunklog {

void ChunkWriter::append(std::string_view payload) {
    if (payload.size() > kMaxChunkSize) {
        throw SizeLimitExceeded(payload.size());
    }

    unsigned char cookie[kCookieSize];
    unsigned char length[kLengthSize];
    unsigned char checksum[kChecksumSize];
    encodeU32(kCookie, cookie);
    encodeU16(static_cast<uint16_t>(payload.size()), length);

    // The stream is append-only, so each field lands after the previous one.
    Crc32 crc;
    crc.update(cookie, sizeof(cookie));
    out_.append(reinterpret_cast<const char*>(cookie), sizeof(cookie));

    crc.update(length, sizeof(length));
    out_.append(reinterpret_cast<const char*>(length), sizeof(length));

    crc.update(payload);
    if (!payload.empty()) {
        out_.append(payload.data(), payload.size());
    }

    encodeU32(crc.value(), checksum);
    out_.append(reinterpret_cast<const char*>(checksum), sizeof(checksum));
}

} // namespace chunklog
