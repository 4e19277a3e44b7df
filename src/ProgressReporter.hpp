#pragma once
#include <cstdint>
#include "StreamEvents.hpp"

class ProgressReporter {
public:
    explicit ProgressReporter(std::uint64_t totalBytes);

    // Records consumed bytes and returns the new snapshot. Consumption is
    // clamped to the total so the percentage never passes 100.
    ProgressEvent advance(std::uint64_t bytes);
    ProgressEvent snapshot() const;

    int percent() const;
    std::uint64_t bytesRead() const;
    std::uint64_t totalBytes() const;

private:
    std::uint64_t total_;
    std::uint64_t consumed_ = 0;
};
