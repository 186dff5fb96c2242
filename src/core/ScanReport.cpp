#include "chunklog/ScanReport.hpp"

using json = nlohmann::json;

namespace chunklog {

json ScanReport::toJson() const {
    return json{
        {"chunks", chunks},
        {"payload_bytes", payloadBytes},
        {"skipped_bytes", skippedBytes},
        {"end_offset", endOffset}
    };
}

} // namespace chunklog
