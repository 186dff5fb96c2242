//ChunkLog.cpp
#include "ChunkLog.hpp"

#include <cerrno>
#include <iostream>
#include <optional>
#include <utility>

namespace chunklog {

// -----------------------------------------------------------
// CTOR/DTOR
// -----------------------------------------------------------
std::unique_ptr<ChunkLog> ChunkLog::open(const std::string& path, const Options& options) {
    // Reader first; if the writer fails the reader is released on unwind.
    auto reader = std::make_unique<FileReader>(path);
    auto writer = std::make_unique<FileAppender>(path);
    std::cerr << "ChunkLog: opened " << path << " readBuffer=" << options.readBufferSize
              << " logResync=" << (options.logResync ? "on" : "off") << "\n";
    return std::make_unique<ChunkLog>(path, std::move(reader), std::move(writer), options);
}

ChunkLog::ChunkLog(std::string path,
                   std::unique_ptr<RandomReader> reader,
                   std::unique_ptr<WriteAppender> writer,
                   const Options& options)
    : path_(std::move(path)), options_(options), reader_(std::move(reader)), writer_(std::move(writer)) {}

ChunkLog::~ChunkLog() {
    try {
        close();
    } catch (const Error& e) {
        std::cerr << "ChunkLog: close failed for " << path_ << ": " << e.what() << "\n";
    }
}

// -----------------------------------------------------------
// PUBLIC: Append / lookup
// -----------------------------------------------------------
void ChunkLog::append(std::string_view payload) {
    if (!writer_) throw IoError("append to closed log " + path_, EBADF);
    ChunkWriter(*writer_).append(payload);
}

std::optional<Chunk> ChunkLog::lookup(int64_t offset) const {
    ensureOpen();
    return ChunkScanner(*reader_, options_).lookup(offset);
}

ScanReport ChunkLog::verify() const {
    ensureOpen();
    // Replay is quiet; the report carries the skipped byte count instead.
    Options quiet = options_;
    quiet.logResync = false;
    ChunkScanner scanner(*reader_, quiet);

    ScanReport report;
    int64_t offset = 0;
    while (auto chunk = scanner.lookup(offset)) {
        report.chunks += 1;
        report.payloadBytes += chunk->payload.size();
        report.skippedBytes += static_cast<uint64_t>(chunk->offset - offset);
        offset = chunk->nextOffset;
    }
    report.endOffset = offset;
    return report;
}

// -----------------------------------------------------------
// PUBLIC: Close
// -----------------------------------------------------------
void ChunkLog::close() {
    std::optional<IoError> readFailure;
    if (reader_) {
        std::unique_ptr<RandomReader> reader = std::move(reader_);
        try {
            reader->close();
        } catch (const IoError& e) {
            readFailure = e;
        }
    }
    if (writer_) {
        std::unique_ptr<WriteAppender> writer = std::move(writer_);
        try {
            writer->close();
        } catch (const IoError& e) {
            if (!readFailure) throw;
            std::cerr << "ChunkLog: " << e.what() << "\n";
        }
    }
    if (readFailure) throw *readFailure;
}

// -----------------------------------------------------------
// PRIVATE
// -----------------------------------------------------------
void ChunkLog::ensureOpen() const {
    if (!reader_) throw IoError("read from closed log " + path_, EBADF);
}

} // namespace chunklog
