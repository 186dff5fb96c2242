#include "chunklog/ChunkScanner.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string_view>
#include <vector>
#include "chunklog/Checksum.hpp"
#include "chunklog/Errors.hpp"
#include "chunklog/WireFormat.hpp"

namespace chunklog {

namespace {

// Forward cursor over a RandomReader with a private read-ahead window.
// Seeking back inside the window does not touch storage again.
class ReadAhead {
public:
    ReadAhead(RandomReader& in, size_t capacity)
        : in_(in), buf_(std::clamp(capacity, Options::kMinReadBuffer, Options::kMaxReadBuffer)) {}

    void seek(int64_t pos) { pos_ = pos; }
    int64_t position() const { return pos_; }

    bool readByte(unsigned char& out) {
        if (!available() && !fill()) return false;
        out = static_cast<unsigned char>(buf_[static_cast<size_t>(pos_ - bufStart_)]);
        ++pos_;
        return true;
    }

    // False if the data ends before n bytes; out is then partially filled.
    bool read(char* out, size_t n) {
        while (n > 0) {
            if (!available() && !fill()) return false;
            size_t at = static_cast<size_t>(pos_ - bufStart_);
            size_t take = std::min(n, bufLen_ - at);
            std::memcpy(out, buf_.data() + at, take);
            out += take;
            n -= take;
            pos_ += static_cast<int64_t>(take);
        }
        return true;
    }

private:
    RandomReader& in_;
    std::vector<char> buf_;
    int64_t bufStart_ = 0;
    size_t bufLen_ = 0;
    int64_t pos_ = 0;

    bool available() const {
        return pos_ >= bufStart_ && pos_ < bufStart_ + static_cast<int64_t>(bufLen_);
    }

    bool fill() {
        bufStart_ = pos_;
        bufLen_ = in_.readAt(pos_, buf_.data(), buf_.size());
        return bufLen_ > 0;
    }
};

} // namespace

std::optional<Chunk> ChunkScanner::lookup(int64_t offset) const {
    if (offset < 0) {
        throw IoError("lookup at offset " + std::to_string(offset), EINVAL);
    }

    unsigned char cookieBytes[kCookieSize];
    encodeU32(kCookie, cookieBytes);

    ReadAhead cursor(in_, options_.readBufferSize);
    int64_t searchStart = offset;

    // Every failed candidate restarts the search one byte past its cookie, so
    // the loop always moves forward and ends at a valid chunk or end of data.
    for (;;) {
        cursor.seek(searchStart);

        uint32_t window = 0;
        size_t filled = 0;
        int64_t cookiePos = -1;
        unsigned char byte = 0;
        while (cursor.readByte(byte)) {
            window = (window << 8) | byte;
            if (filled < kCookieSize) ++filled;
            if (filled == kCookieSize && window == kCookie) {
                cookiePos = cursor.position() - static_cast<int64_t>(kCookieSize);
                break;
            }
        }
        if (cookiePos < 0) {
            int64_t scanned = cursor.position() - offset;
            if (options_.logResync && scanned > 0) {
                std::cerr << "ChunkScanner: no valid chunk at or after offset " << offset
                          << " (" << scanned << " bytes scanned)\n";
            }
            return std::nullopt;
        }

        // Running out of data past a cookie means a torn chunk, which is
        // treated like any other invalid candidate.
        char lengthBytes[kLengthSize];
        if (!cursor.read(lengthBytes, sizeof(lengthBytes))) {
            searchStart = cookiePos + 1;
            continue;
        }
        uint16_t length = 0;
        decodeU16(std::string_view(lengthBytes, sizeof(lengthBytes)), length);

        // Reject before allocating so a corrupt length cannot drive the size.
        if (length > kMaxChunkSize) {
            searchStart = cookiePos + 1;
            continue;
        }

        std::string payload(length, '\0');
        if (!cursor.read(payload.data(), payload.size())) {
            searchStart = cookiePos + 1;
            continue;
        }

        char checksumBytes[kChecksumSize];
        if (!cursor.read(checksumBytes, sizeof(checksumBytes))) {
            searchStart = cookiePos + 1;
            continue;
        }
        uint32_t stored = 0;
        decodeU32(std::string_view(checksumBytes, sizeof(checksumBytes)), stored);

        Crc32 crc;
        crc.update(cookieBytes, sizeof(cookieBytes));
        crc.update(reinterpret_cast<const unsigned char*>(lengthBytes), sizeof(lengthBytes));
        crc.update(payload);
        if (crc.value() != stored) {
            searchStart = cookiePos + 1;
            continue;
        }

        if (options_.logResync && cookiePos > offset) {
            std::cerr << "ChunkScanner: resynchronized at offset " << cookiePos << " after skipping "
                      << (cookiePos - offset) << " bytes from offset " << offset << "\n";
        }

        Chunk chunk;
        chunk.payload = std::move(payload);
        chunk.offset = cookiePos;
        chunk.nextOffset = cookiePos + static_cast<int64_t>(kChunkOverhead) + length;
        return chunk;
    }
}

} // namespace chunklog
