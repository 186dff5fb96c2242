#include "chunklog/Errors.hpp"

#include <system_error>
#include "chunklog/WireFormat.hpp"

namespace chunklog {

SizeLimitExceeded::SizeLimitExceeded(size_t size)
    : Error("payload of " + std::to_string(size) + " bytes exceeds the maximum chunk size of " +
            std::to_string(kMaxChunkSize)),
      size_(size) {}

IoError::IoError(const std::string& what, int code)
    : Error(what + ": " + std::generic_category().message(code)), code_(code) {}

} // namespace chunklog
