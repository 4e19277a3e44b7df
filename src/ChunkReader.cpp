#include "ChunkReader.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <system_error>

ChunkReader::ChunkReader(const std::string& path, std::uint64_t fileSize, std::size_t chunkSize)
    : path(path),
      fd(-1),
      totalSize(fileSize),
      offset(0),
      chunkSize(chunkSize),
      chunkLength(0) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be a positive integer");
    }
    fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }
    buffer.resize(static_cast<std::size_t>(std::min<std::uint64_t>(chunkSize, totalSize)));
}

ChunkReader::~ChunkReader() {
    if (fd >= 0) {
        ::close(fd);
    }
}

bool ChunkReader::next() {
    chunkLength = 0;
    if (offset >= totalSize) {
        return false;
    }
    std::size_t len = static_cast<std::size_t>(std::min<std::uint64_t>(chunkSize, totalSize - offset));
    std::size_t filled = 0;
    while (filled < len) {
        ssize_t n = ::pread(fd, buffer.data() + filled, len - filled,
                            static_cast<off_t>(offset + filled));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "read " + path);
        }
        if (n == 0) {
            // Shrunk since it was sized
            throw std::runtime_error("file changed during read: expected " + std::to_string(totalSize) +
                                     " bytes, ended at " + std::to_string(offset + filled));
        }
        filled += static_cast<std::size_t>(n);
    }
    chunkLength = len;
    offset += len;
    return true;
}

const char* ChunkReader::data() const {
    return buffer.data();
}

std::size_t ChunkReader::size() const {
    return chunkLength;
}

std::uint64_t ChunkReader::fileSize() const {
    return totalSize;
}

std::uint64_t ChunkReader::position() const {
    return offset;
}
