#include "io/chunked_byte_source.hpp"
#include "io/byte_stream.hpp"
#include "core/config.hpp"

namespace fastaio {

ChunkedByteSource::ChunkedByteSource(ByteStream& stream)
    : stream_(stream), buffer_(FASTA_CHUNK_SIZE) {}

size_t ChunkedByteSource::fill() {
    pos_ = 0;
    size_ = 0;
    if (exhausted_) return 0;

    size_ = stream_.read(buffer_.data(), buffer_.size());
    if (size_ == 0) exhausted_ = true;
    return size_;
}

void ChunkedByteSource::reset() {
    size_ = 0;
    pos_ = 0;
    exhausted_ = false;
}

} // namespace fastaio
