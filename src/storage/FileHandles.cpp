#include "chunklog/FileHandles.hpp"

#include <cerrno>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>
#include "chunklog/Errors.hpp"
#include "chunklog/WireFormat.hpp"

namespace chunklog {

namespace {

int openOrThrow(const std::string& path, int flags) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, kFileMode);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        throw IoError("open " + path, errno);
    }
    return fd;
}

// Close once; EINTR is not retried since the descriptor is already released.
void closeOrThrow(int& fd, const std::string& path) {
    if (fd < 0) return;
    int rc = ::close(fd);
    fd = -1;
    if (rc != 0 && errno != EINTR) {
        throw IoError("close " + path, errno);
    }
}

} // namespace

// -----------------------------------------------------------
// FileAppender
// -----------------------------------------------------------
FileAppender::FileAppender(const std::string& path)
    : path_(path), fd_(openOrThrow(path, O_WRONLY | O_APPEND | O_CREAT)) {}

FileAppender::~FileAppender() {
    try {
        close();
    } catch (const IoError& e) {
        std::cerr << "FileAppender: " << e.what() << "\n";
    }
}

void FileAppender::append(const char* data, size_t n) {
    if (fd_ < 0) throw IoError("write " + path_, EBADF);
    while (n > 0) {
        ssize_t written = ::write(fd_, data, n);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw IoError("write " + path_, errno);
        }
        data += written;
        n -= static_cast<size_t>(written);
    }
}

void FileAppender::close() {
    closeOrThrow(fd_, path_);
}

// -----------------------------------------------------------
// FileReader
// -----------------------------------------------------------
FileReader::FileReader(const std::string& path)
    : path_(path), fd_(openOrThrow(path, O_RDONLY | O_CREAT)) {}

FileReader::~FileReader() {
    try {
        close();
    } catch (const IoError& e) {
        std::cerr << "FileReader: " << e.what() << "\n";
    }
}

size_t FileReader::readAt(int64_t offset, char* out, size_t n) {
    if (fd_ < 0) throw IoError("read " + path_, EBADF);
    if (offset < 0) throw IoError("read " + path_, EINVAL);
    size_t total = 0;
    while (total < n) {
        ssize_t got = ::pread(fd_, out + total, n - total, static_cast<off_t>(offset + static_cast<int64_t>(total)));
        if (got < 0) {
            if (errno == EINTR) continue;
            throw IoError("read " + path_, errno);
        }
        if (got == 0) break; // end of file
        total += static_cast<size_t>(got);
    }
    return total;
}

void FileReader::close() {
    closeOrThrow(fd_, path_);
}

} // namespace chunklog
