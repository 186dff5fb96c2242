#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chunklog {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Payload larger than kMaxChunkSize; nothing was written.
class SizeLimitExceeded : public Error {
public:
    explicit SizeLimitExceeded(size_t size);

    size_t size() const { return size_; }

private:
    size_t size_;
};

// Failure reported by the storage target, carrying its errno value.
class IoError : public Error {
public:
    IoError(const std::string& what, int code);

    int code() const { return code_; }

private:
    int code_;
};

} // namespace chunklog
