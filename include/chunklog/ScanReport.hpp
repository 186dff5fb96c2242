#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace chunklog {

// Result of replaying a whole log from offset 0.
struct ScanReport {
    uint64_t chunks = 0;
    uint64_t payloadBytes = 0;
    uint64_t skippedBytes = 0;  // bytes passed over between valid chunks
    int64_t endOffset = 0;      // next offset after the last valid chunk

    nlohmann::json toJson() const;
};

} // namespace chunklog
