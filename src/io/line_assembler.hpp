#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace fastaio {

class ChunkedByteSource;

// Splits a chunked byte stream into logical lines: "\n" or "\r\n"
// terminated, last line may be unterminated, empty lines skipped.
// Lines containing only whitespace are returned as-is.
class LineAssembler {
public:
    explicit LineAssembler(ChunkedByteSource& source);

    // Assemble the next non-empty line. Returns false when the stream is
    // exhausted and no further line exists.
    bool next_line();

    // Current line, valid until the next call to next_line() or reset().
    std::string_view line() const {
        return std::string_view(reinterpret_cast<const char*>(buf_.data()), size_);
    }
    const uint8_t* data() const { return buf_.data(); }
    size_t size() const { return size_; }

    // Capacity of the reused line buffer (grows, never shrinks).
    size_t capacity() const { return buf_.size(); }

    void reset() { size_ = 0; }

private:
    ChunkedByteSource& source_;
    std::vector<uint8_t> buf_;
    size_t size_ = 0;

    void append(const uint8_t* p, size_t n);
};

} // namespace fastaio
