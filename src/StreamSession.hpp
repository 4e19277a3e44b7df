#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include "ChunkReader.hpp"
#include "LineUtils.hpp"
#include "ProgressReporter.hpp"
#include "StreamEvents.hpp"

// One file-read request as a lazy, pull-based event sequence.
//
// Each call to next() yields the next event in file order: for every raw chunk
// an optional LineChunkBatch followed by one ProgressEvent, then exactly one
// terminal event (StreamCompletion or StreamFailure). After the terminal event
// next() returns std::nullopt. Work happens only while the caller pulls, so a
// consumer that stops pulling holds at most one chunk of buffered events; the
// file is closed once the terminal event is produced or the session is
// destroyed, whichever comes first.
class StreamSession {
public:
    static constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

    explicit StreamSession(std::string path, std::size_t chunkSize = kDefaultChunkSize);
    ~StreamSession();

    std::optional<StreamEvent> next();

    bool finished() const;
    bool isOpen() const;

    const std::string& path() const;
    std::size_t chunkSize() const;
    std::uint64_t totalBytes() const;
    std::uint64_t bytesRead() const;
    std::uint64_t lineCount() const;

private:
    void readChunk();
    void fail(const std::string& error);
    void close();

    std::string path_;
    std::size_t chunkSize_;
    std::unique_ptr<ChunkReader> reader_;
    LineAssembler assembler_;
    ProgressReporter progress_;
    std::deque<StreamEvent> pending_;
    bool exhausted_ = false;
};
