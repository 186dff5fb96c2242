#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace chunklog {

// Sequential, append-only write capability. Never seeks.
class WriteAppender {
public:
    virtual ~WriteAppender() = default;

    // Writes all n bytes at the current end of the stream or throws IoError.
    virtual void append(const char* data, size_t n) = 0;
    virtual void close() = 0;
};

// Random-access read capability. Each call names its own position, so
// readers never share a cursor.
class RandomReader {
public:
    virtual ~RandomReader() = default;

    // Reads up to n bytes at offset; a short count means end of data.
    virtual size_t readAt(int64_t offset, char* out, size_t n) = 0;
    virtual void close() = 0;
};

class FileAppender : public WriteAppender {
public:
    explicit FileAppender(const std::string& path);
    ~FileAppender() override;

    FileAppender(const FileAppender&) = delete;
    FileAppender& operator=(const FileAppender&) = delete;

    void append(const char* data, size_t n) override;
    void close() override;

private:
    std::string path_;
    int fd_ = -1;
};

class FileReader : public RandomReader {
public:
    explicit FileReader(const std::string& path);
    ~FileReader() override;

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    size_t readAt(int64_t offset, char* out, size_t n) override;
    void close() override;

private:
    std::string path_;
    int fd_ = -1;
};

} // namespace chunklog
