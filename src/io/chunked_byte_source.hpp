#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fastaio {

class ByteStream;

// Serves the underlying stream in FASTA_CHUNK_SIZE pieces and tracks the
// unread window of the current chunk.
class ChunkedByteSource {
public:
    explicit ChunkedByteSource(ByteStream& stream);

    // Replace the current chunk with up to FASTA_CHUNK_SIZE fresh bytes.
    // Returns the number read; 0 at end of stream, and on every later
    // call until reset().
    size_t fill();

    const uint8_t* cursor() const { return buffer_.data() + pos_; }
    size_t remaining() const { return size_ - pos_; }
    void advance(size_t n) { pos_ += n; }

    bool exhausted() const { return exhausted_; }

    // Drop buffered bytes and the end-of-stream flag (after a seek).
    void reset();

private:
    ByteStream& stream_;
    std::vector<uint8_t> buffer_;
    size_t size_ = 0;
    size_t pos_ = 0;
    bool exhausted_ = false;
};

} // namespace fastaio
