#include "LineUtils.hpp"
#include <cctype>
#include <cstring>

bool is_blank(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

std::vector<std::string> LineAssembler::feed(const char* data, std::size_t len) {
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos < len) {
        const void* hit = std::memchr(data + pos, '\n', len - pos);
        if (!hit) break;
        std::size_t end = static_cast<std::size_t>(static_cast<const char*>(hit) - data);
        if (carry_.empty()) {
            lines.emplace_back(data + pos, end - pos);
        } else {
            // first line of the chunk completes the carry-over
            carry_.append(data + pos, end - pos);
            lines.push_back(std::move(carry_));
            carry_.clear();
        }
        pos = end + 1;
    }
    if (pos < len) {
        carry_.append(data + pos, len - pos);
    }
    lineCount_ += lines.size();
    return lines;
}

std::optional<std::string> LineAssembler::finish() {
    std::string tail;
    tail.swap(carry_);
    if (is_blank(tail)) {
        return std::nullopt;
    }
    ++lineCount_;
    return tail;
}

std::uint64_t LineAssembler::lineCount() const {
    return lineCount_;
}

const std::string& LineAssembler::carry() const {
    return carry_;
}
