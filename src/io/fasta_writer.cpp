#include "io/fasta_writer.hpp"
#include "core/fasta_error.hpp"

#include <cctype>
#include <iostream>

namespace fastaio {

FastaWriter::FastaWriter(Logger logger)
    : holder_(std::make_unique<StdStreamAdapter>(std::cout, "<stdout>")),
      stream_(holder_.get()),
      own_stream_(false),
      logger_(logger) {}

FastaWriter::FastaWriter(const std::string& path, WriteMode mode, Logger logger)
    : holder_(open_output_stream(path, mode)),
      stream_(holder_.get()),
      own_stream_(true),
      logger_(logger) {}

FastaWriter::FastaWriter(ByteStream& stream, Logger logger)
    : stream_(&stream), own_stream_(false), logger_(logger) {}

FastaWriter::FastaWriter(std::ostream& out, Logger logger)
    : holder_(std::make_unique<StdStreamAdapter>(out)),
      stream_(holder_.get()),
      own_stream_(false),
      logger_(logger) {}

FastaWriter::~FastaWriter() {
    if (closed_) return;
    try {
        close();
    } catch (const std::exception& e) {
        logger_.error("FastaWriter: closing '%s' failed: %s",
                      stream_->name().c_str(), e.what());
    }
}

void FastaWriter::check_open() const {
    if (closed_) {
        throw FastaError(FastaErrc::kClosed,
                         "FastaWriter used after close (" + stream_->name() + ")");
    }
}

FastaWriter::State FastaWriter::state() const {
    if (at_start_) return State::kAtStart;
    return in_seq_ ? State::kInSequence : State::kInDescription;
}

void FastaWriter::write(char c) {
    check_open();
    unsigned char ch = static_cast<unsigned char>(c);
    if (!is_ascii(ch)) {
        throw FastaError(FastaErrc::kNonAsciiCharacter,
                         entry_message("invalid (non-ASCII) character", entry_));
    }

    if (ch == '\n' && !at_start_) {
        parsed_nl_ = true;
        if (!in_seq_) {
            if (desc_chars_ <= 1) {
                throw FastaError(FastaErrc::kEmptyDescription,
                                 entry_message("empty description", entry_));
            }
            stream_->put('\n');
            pos_ = 0;
            in_seq_ = true;
        }
    }

    if (std::isspace(ch) && (at_start_ || in_seq_ || desc_chars_ <= 1)) return;

    if (at_start_ && ch != '>') {
        throw FastaError(FastaErrc::kMissingDescriptionMarker,
                         entry_message("no description given", entry_));
    }
    at_start_ = false;

    if (parsed_nl_) {
        if (ch == '>') {
            if (entry_chars_ == 0) {
                throw FastaError(FastaErrc::kSingleLineDescriptionViolation,
                                 entry_message("description must span a single line", entry_));
            }
            stream_->put('\n');
            in_seq_ = false;
            pos_ = 0;
            ++entry_;
            entry_chars_ = 0;
            desc_chars_ = 0;
        }
    } else if (in_seq_ && ch == '>') {
        throw FastaError(FastaErrc::kStrayMarkerInSequence,
                         entry_message("character '>' not allowed in sequence data", entry_));
    }

    if (pos_ == FASTA_LINE_WIDTH) {
        if (!in_seq_) {
            logger_.warn("description line longer than %zu characters (entry %zu of FASTA input)",
                         FASTA_LINE_WIDTH, entry_);
        } else {
            stream_->put('\n');
            pos_ = 0;
        }
    }

    stream_->put(static_cast<char>(ch));
    ++pos_;
    if (in_seq_)
        ++entry_chars_;
    else
        ++desc_chars_;
    parsed_nl_ = false;
}

void FastaWriter::write(std::string_view line) {
    for (char c : line) write(c);
    write('\n');
}

void FastaWriter::finish_entry(size_t seq_chars) {
    entry_chars_ = seq_chars;
    in_seq_ = true;
    parsed_nl_ = false;
    // Column of the last emitted sequence line
    pos_ = seq_chars == 0 ? 0 : (seq_chars - 1) % FASTA_LINE_WIDTH + 1;
    if (seq_chars == 0) {
        throw FastaError(FastaErrc::kEmptySequence,
                         entry_message("empty sequence data", entry_));
    }
}

void FastaWriter::close() {
    if (closed_) return;
    closed_ = true;

    try {
        stream_->put('\n');
        stream_->flush();
    } catch (const FastaError& e) {
        // The stream already ended: nothing left to terminate.
        if (e.code() != FastaErrc::kEndOfFile) throw;
    }
    pos_ = 0;
    parsed_nl_ = true;

    if (own_stream_) stream_->close();
}

std::ostream& operator<<(std::ostream& os, const FastaWriter& writer) {
    os << "FastaWriter(output=\"" << writer.output_name()
       << "\", entry=" << writer.entry() << ")";
    return os;
}

} // namespace fastaio
