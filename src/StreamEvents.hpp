#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

struct LineChunkBatch {
    std::vector<std::string> lines;
    std::uint64_t lineCount = 0; // running total including this batch
};

struct ProgressEvent {
    int percent = 0;
    std::uint64_t bytesRead = 0;
    std::uint64_t totalBytes = 0;
};

struct StreamCompletion {
    std::uint64_t totalLines = 0;
    std::uint64_t totalBytes = 0;
};

struct StreamFailure {
    std::string error;
};

using StreamEvent = std::variant<LineChunkBatch, ProgressEvent, StreamCompletion, StreamFailure>;

inline bool is_terminal(const StreamEvent& event) {
    return std::holds_alternative<StreamCompletion>(event) || std::holds_alternative<StreamFailure>(event);
}
