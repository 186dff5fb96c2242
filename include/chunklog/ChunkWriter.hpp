#pragma once

#include <string_view>
#include "chunklog/FileHandles.hpp"

namespace chunklog {

// Frames payloads as chunks and hands them to an append-only stream.
class ChunkWriter {
public:
    explicit ChunkWriter(WriteAppender& out) : out_(out) {}

    // Throws SizeLimitExceeded (nothing written) or IoError. The four field
    // writes are not atomic; a failure part way leaves a torn chunk that
    // ChunkScanner skips.
    void append(std::string_view payload);

private:
    WriteAppender& out_;
};

} // namespace chunklog
