#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Sequential reader that fills one buffer per chunk with pread(). A read
// error, or the file ending before the size it was opened with, throws; the
// descriptor is closed when the reader is destroyed.
class ChunkReader {
public:
    ChunkReader(const std::string& path, std::uint64_t fileSize, std::size_t chunkSize);
    ~ChunkReader();

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    // Reads the next chunk. Returns false at end of file.
    bool next();

    const char* data() const;
    std::size_t size() const;

    std::uint64_t fileSize() const;
    std::uint64_t position() const;

private:
    std::string path;
    int fd;
    std::vector<char> buffer;
    std::uint64_t totalSize;
    std::uint64_t offset;
    std::size_t chunkSize;
    std::size_t chunkLength;
};
