#include "ProgressReporter.hpp"

ProgressReporter::ProgressReporter(std::uint64_t totalBytes) : total_(totalBytes) {
}

ProgressEvent ProgressReporter::advance(std::uint64_t bytes) {
    std::uint64_t room = total_ - consumed_;
    consumed_ += (bytes < room) ? bytes : room;
    return snapshot();
}

ProgressEvent ProgressReporter::snapshot() const {
    ProgressEvent event;
    event.percent = percent();
    event.bytesRead = consumed_;
    event.totalBytes = total_;
    return event;
}

int ProgressReporter::percent() const {
    if (total_ == 0) return 100;
    // integer rounding, half up
    return static_cast<int>((consumed_ * 100 + total_ / 2) / total_);
}

std::uint64_t ProgressReporter::bytesRead() const {
    return consumed_;
}

std::uint64_t ProgressReporter::totalBytes() const {
    return total_;
}
