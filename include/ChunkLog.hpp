//ChunkLog.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "chunklog/ChunkScanner.hpp"
#include "chunklog/ChunkWriter.hpp"
#include "chunklog/Errors.hpp"
#include "chunklog/FileHandles.hpp"
#include "chunklog/Options.hpp"
#include "chunklog/ScanReport.hpp"

namespace chunklog {

// Append-only log of checksummed chunks over one file, with an append-only
// write handle and an independent random-access read handle.
class ChunkLog {
public:
    // Opens or creates the file at path (mode 0600). Throws IoError.
    static std::unique_ptr<ChunkLog> open(const std::string& path, const Options& options = Options::fromEnv());

    ChunkLog(std::string path, std::unique_ptr<RandomReader> reader, std::unique_ptr<WriteAppender> writer, const Options& options);
    ~ChunkLog();

    ChunkLog(const ChunkLog&) = delete;
    ChunkLog& operator=(const ChunkLog&) = delete;

    // Append one payload of at most kMaxChunkSize bytes.
    void append(std::string_view payload);

    // Next valid chunk at or after offset; std::nullopt at end of stream.
    std::optional<Chunk> lookup(int64_t offset) const;

    // Replay every chunk from offset 0 and summarize.
    ScanReport verify() const;

    // Releases both handles. The read handle's failure wins if both fail.
    void close();

    const std::string& path() const { return path_; }
    bool isOpen() const { return reader_ != nullptr || writer_ != nullptr; }

private:
    std::string path_;
    Options options_;
    std::unique_ptr<RandomReader> reader_;
    std::unique_ptr<WriteAppender> writer_;

    void ensureOpen() const;
};

} // namespace chunklog
