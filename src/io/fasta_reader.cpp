#include "io/fasta_reader.hpp"
#include "core/config.hpp"
#include "core/fasta_error.hpp"

#include <cstring>

namespace fastaio {

FastaReaderBase::FastaReaderBase(const std::string& path)
    : holder_(open_input_stream(path)),
      stream_(holder_.get()),
      own_stream_(true),
      source_(*stream_),
      lines_(source_),
      record_(FASTA_CHUNK_SIZE) {}

FastaReaderBase::FastaReaderBase(ByteStream& stream)
    : stream_(&stream),
      own_stream_(false),
      source_(*stream_),
      lines_(source_),
      record_(FASTA_CHUNK_SIZE) {}

FastaReaderBase::FastaReaderBase(std::istream& in)
    : holder_(std::make_unique<StdStreamAdapter>(in)),
      stream_(holder_.get()),
      own_stream_(false),
      source_(*stream_),
      lines_(source_),
      record_(FASTA_CHUNK_SIZE) {}

FastaReaderBase::~FastaReaderBase() {
    // Closing a read-only stream does not report errors.
    if (!closed_ && own_stream_) stream_->close();
}

void FastaReaderBase::close() {
    if (closed_) return;
    closed_ = true;
    if (own_stream_) stream_->close();
}

void FastaReaderBase::check_open() const {
    if (closed_) {
        throw FastaError(FastaErrc::kClosed,
                         "FastaReader used after close (" + stream_->name() + ")");
    }
}

void FastaReaderBase::rewind() {
    check_open();
    stream_->seek(0);
    source_.reset();
    lines_.reset();
    record_size_ = 0;
    num_parsed_ = 0;
    eof_ = false;
    primed_ = false;
}

void FastaReaderBase::prime() {
    check_open();
    primed_ = true;
    if (!lines_.next_line()) {
        eof_ = true;
        throw FastaError(FastaErrc::kEmptyFile,
                         "empty FASTA file: " + stream_->name());
    }
}

void FastaReaderBase::append_record(const uint8_t* p, size_t n) {
    if (record_size_ + n > record_.size())
        record_.resize(grow_capacity(record_.size(), record_size_ + n));
    std::memcpy(record_.data() + record_size_, p, n);
    record_size_ += n;
}

std::string FastaReaderBase::next_step() {
    check_open();
    size_t entry = num_parsed_ + 1;

    if (lines_.line()[0] != '>') {
        throw FastaError(FastaErrc::kMalformedRecord,
                         entry_message("invalid FASTA file: description does not start with '>'",
                                       entry));
    }
    if (lines_.size() == 1) {
        throw FastaError(FastaErrc::kEmptyDescription,
                         entry_message("invalid FASTA file: empty description", entry));
    }

    std::string description(lines_.line().substr(1));
    if (!is_ascii(description)) {
        throw FastaError(FastaErrc::kNonAsciiDescription,
                         entry_message("invalid FASTA file: non-ASCII description", entry));
    }

    record_size_ = 0;
    for (;;) {
        if (!lines_.next_line()) {
            eof_ = true;
            break;
        }
        if (lines_.line()[0] == '>') break;
        append_record(lines_.data(), lines_.size());
    }
    return description;
}

void FastaReaderBase::print(std::ostream& os, const char* out_type) const {
    os << "FastaReader(input=\"" << input_name()
       << "\", out_type=" << out_type
       << ", num_parsed=" << num_parsed_
       << ", eof=" << (eof_ ? "true" : "false") << ")";
}

} // namespace fastaio
