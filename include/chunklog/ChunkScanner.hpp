#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "chunklog/FileHandles.hpp"
#include "chunklog/Options.hpp"

namespace chunklog {

struct Chunk {
    std::string payload;
    int64_t offset = 0;      // position of the chunk's cookie
    int64_t nextOffset = 0;  // first byte after the checksum
};

// Locates the next valid chunk at or after an offset, skipping over
// corrupt, spurious and torn chunks by byte-wise cookie resynchronization.
class ChunkScanner {
public:
    ChunkScanner(RandomReader& in, const Options& options) : in_(in), options_(options) {}

    // Empty result means no valid chunk exists at or after offset in the
    // data currently available. Throws IoError on storage failure or a
    // negative offset.
    std::optional<Chunk> lookup(int64_t offset) const;

private:
    RandomReader& in_;
    Options options_;
};

} // namespace chunklog
