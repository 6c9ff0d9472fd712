#include "io/line_assembler.hpp"
#include "io/chunked_byte_source.hpp"
#include "core/config.hpp"

#include <cstring>

namespace fastaio {

LineAssembler::LineAssembler(ChunkedByteSource& source)
    : source_(source), buf_(FASTA_CHUNK_SIZE) {}

void LineAssembler::append(const uint8_t* p, size_t n) {
    if (n == 0) return;
    if (size_ + n > buf_.size())
        buf_.resize(grow_capacity(buf_.size(), size_ + n));
    std::memcpy(buf_.data() + size_, p, n);
    size_ += n;
}

bool LineAssembler::next_line() {
    for (;;) {
        size_ = 0;
        bool found = false;

        while (!found) {
            if (source_.remaining() == 0 && source_.fill() == 0) break;

            const uint8_t* begin = source_.cursor();
            size_t avail = source_.remaining();
            const void* nl = std::memchr(begin, '\n', avail);
            size_t len = nl ? static_cast<size_t>(static_cast<const uint8_t*>(nl) - begin)
                            : avail;

            append(begin, len);
            source_.advance(nl ? len + 1 : len);
            found = (nl != nullptr);
        }

        // CRLF, possibly split across chunks, or a final line ending in '\r'
        if (size_ > 0 && buf_[size_ - 1] == '\r') --size_;

        if (size_ > 0) return true;
        if (!found) return false;
        // empty line: skip
    }
}

} // namespace fastaio
