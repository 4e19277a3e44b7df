#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// True when the text is empty or holds only whitespace.
bool is_blank(const std::string& text);

// Reassembles raw chunks into '\n'-terminated lines. The terminator is dropped,
// a '\r' before it is kept. The unterminated tail of the last chunk is carried
// over until more data or end of input completes it.
class LineAssembler {
public:
    // Returns the lines completed by this chunk, in order.
    std::vector<std::string> feed(const char* data, std::size_t len);

    // End of input: returns the carry-over as a final line unless it is blank.
    std::optional<std::string> finish();

    std::uint64_t lineCount() const;
    const std::string& carry() const;

private:
    std::string carry_;
    std::uint64_t lineCount_ = 0;
};
