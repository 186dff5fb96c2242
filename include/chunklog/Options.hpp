#pragma once

#include <cstddef>

namespace chunklog {

struct Options {
    // Emit a diagnostic line when a lookup has to skip corrupt bytes.
    bool logResync = true;

    // Read-ahead used by the scanner for each lookup, kept within
    // [kMinReadBuffer, kMaxReadBuffer].
    static constexpr size_t kMinReadBuffer = 16;
    static constexpr size_t kMaxReadBuffer = 1 << 20;
    size_t readBufferSize = 4096;

    // Defaults overridden by CHUNKLOG_LOG_RESYNC and CHUNKLOG_READ_BUFFER.
    static Options fromEnv();
};

} // namespace chunklog
