#include "chunklog/Options.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace chunklog {

Options Options::fromEnv() {
    Options opts;
    if (const char* envResync = std::getenv("CHUNKLOG_LOG_RESYNC")) {
        std::string v(envResync);
        opts.logResync = !(v == "0" || v == "false" || v == "off");
    }
    if (const char* envBuf = std::getenv("CHUNKLOG_READ_BUFFER")) {
        // std::stoull wraps a leading '-' around to a huge value.
        std::string v(envBuf);
        size_t first = v.find_first_not_of(" \t");
        if (first != std::string::npos && v[first] == '-') {
            std::cerr << "Options: ignoring CHUNKLOG_READ_BUFFER=" << envBuf << "\n";
        } else {
            try {
                unsigned long long parsed = std::stoull(v);
                opts.readBufferSize = static_cast<size_t>(std::clamp<unsigned long long>(parsed, kMinReadBuffer, kMaxReadBuffer));
            } catch (const std::logic_error&) {
                std::cerr << "Options: ignoring CHUNKLOG_READ_BUFFER=" << envBuf << "\n";
            }
        }
    }
    return opts;
}

} // namespace chunklog
