#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace chunklog {

// CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320), fed incrementally.
class Crc32 {
public:
    void update(const unsigned char* data, size_t n) {
        for (size_t i = 0; i < n; ++i) {
            crc_ ^= data[i];
            for (int k = 0; k < 8; ++k) {
                uint32_t mask = (crc_ & 1u) ? 0xFFFFFFFFu : 0u;
                crc_ = (crc_ >> 1) ^ (0xEDB88320u & mask);
            }
        }
    }

    void update(std::string_view data) {
        update(reinterpret_cast<const unsigned char*>(data.data()), data.size());
    }

    uint32_t value() const { return ~crc_; }

private:
    uint32_t crc_ = 0xFFFFFFFFu;
};

inline uint32_t crc32(std::string_view data) {
    Crc32 crc;
    crc.update(data);
    return crc.value();
}

} // namespace chunklog
