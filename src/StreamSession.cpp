#include "StreamSession.hpp"
#include <filesystem>
#include <system_error>
#include <utility>

namespace {

std::uint64_t stat_size(const std::string& path, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        error = ec ? ec.message() : std::string("not a regular file");
        return 0;
    }
    std::uint64_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        error = ec.message();
        return 0;
    }
    return size;
}

}

StreamSession::StreamSession(std::string path, std::size_t chunkSize)
    : path_(std::move(path)), chunkSize_(chunkSize), progress_(0) {
    if (chunkSize_ == 0) {
        fail("chunk size must be a positive integer");
        return;
    }
    std::string error;
    std::uint64_t size = stat_size(path_, error);
    if (!error.empty()) {
        fail("Cannot read file info for " + path_ + ": " + error);
        return;
    }
    progress_ = ProgressReporter(size);
    try {
        reader_ = std::make_unique<ChunkReader>(path_, size, chunkSize_);
    } catch (const std::exception& e) {
        fail("Cannot open " + path_ + ": " + e.what());
    }
}

StreamSession::~StreamSession() {}

std::optional<StreamEvent> StreamSession::next() {
    while (pending_.empty() && !exhausted_) {
        readChunk();
    }
    if (pending_.empty()) {
        return std::nullopt;
    }
    StreamEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

void StreamSession::readChunk() {
    try {
        if (reader_->next()) {
            auto lines = assembler_.feed(reader_->data(), reader_->size());
            if (!lines.empty()) {
                pending_.push_back(LineChunkBatch{std::move(lines), assembler_.lineCount()});
            }
            pending_.push_back(progress_.advance(reader_->size()));
            return;
        }
        if (auto last = assembler_.finish()) {
            LineChunkBatch batch;
            batch.lines.push_back(std::move(*last));
            batch.lineCount = assembler_.lineCount();
            pending_.push_back(std::move(batch));
        }
        pending_.push_back(StreamCompletion{assembler_.lineCount(), progress_.bytesRead()});
        close();
    } catch (const std::exception& e) {
        fail("Read error on " + path_ + ": " + e.what());
    }
}

void StreamSession::fail(const std::string& error) {
    pending_.push_back(StreamFailure{error});
    close();
}

void StreamSession::close() {
    reader_.reset();
    exhausted_ = true;
}

bool StreamSession::finished() const {
    return exhausted_ && pending_.empty();
}

bool StreamSession::isOpen() const {
    return reader_ != nullptr;
}

const std::string& StreamSession::path() const {
    return path_;
}

std::size_t StreamSession::chunkSize() const {
    return chunkSize_;
}

std::uint64_t StreamSession::totalBytes() const {
    return progress_.totalBytes();
}

std::uint64_t StreamSession::bytesRead() const {
    return progress_.bytesRead();
}

std::uint64_t StreamSession::lineCount() const {
    return assembler_.lineCount();
}
