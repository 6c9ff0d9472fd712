#pragma once

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "core/config.hpp"
#include "io/byte_stream.hpp"
#include "io/fasta_format.hpp"
#include "util/logger.hpp"

namespace fastaio {

// Character-stream FASTA writer. Input may arrive one character at a
// time, one line at a time, or as whole entries; record boundaries are
// recovered from '>' at the start of a line and sequence data is
// re-wrapped at FASTA_LINE_WIDTH columns.
//
// Leading whitespace of a description is dropped, but once the
// description has content any further whitespace (including a trailing
// space before the newline) is written as-is.
class FastaWriter {
public:
    enum class State { kAtStart, kInDescription, kInSequence };

    // Write to stdout.
    explicit FastaWriter(Logger logger = Logger());

    // Create (or append to) a file; a ".gz" suffix compresses. "-" is stdout.
    explicit FastaWriter(const std::string& path,
                         WriteMode mode = WriteMode::kTruncate,
                         Logger logger = Logger());

    // Write to a caller-owned stream; close() flushes but leaves it open.
    explicit FastaWriter(ByteStream& stream, Logger logger = Logger());
    explicit FastaWriter(std::ostream& out, Logger logger = Logger());

    // Closes if close() was not called; failures are logged, not thrown.
    ~FastaWriter();

    FastaWriter(const FastaWriter&) = delete;
    FastaWriter& operator=(const FastaWriter&) = delete;

    // Single character.
    void write(char c);
    void write(unsigned char c) { write(static_cast<char>(c)); }

    // Whole line: its characters followed by a newline.
    void write(std::string_view line);
    void write(const std::string& line) { write(std::string_view(line)); }
    void write(const char* line) { write(std::string_view(line)); }

    // Each element in order (characters, lines, or nested containers).
    template <typename Container>
    void write(const Container& items) {
        for (const auto& item : items) write(item);
    }

    // Write a complete entry. The description is validated before
    // anything is written.
    template <typename Seq>
    void write_entry(const std::string& description, const Seq& sequence) {
        check_open();
        std::string desc = normalize_description(description, at_start_ ? entry_ : entry_ + 1);
        if (!at_start_) write('\n');
        write('>');
        write(desc);
        finish_entry(write_fasta_sequence(*stream_, sequence, entry_, false));
    }

    void write_entry(const std::string& description, const char* sequence) {
        write_entry(description, std::string_view(sequence));
    }

    // Emit the final newline, flush, and close the stream if owned.
    void close();

    // 1-based number of the entry being written.
    size_t entry() const { return entry_; }
    State state() const;
    size_t num_warnings() const { return logger_.num_warnings(); }
    bool is_closed() const { return closed_; }

    std::string output_name() const { return stream_->name(); }

private:
    std::unique_ptr<ByteStream> holder_;
    ByteStream* stream_;
    bool own_stream_;
    Logger logger_;

    bool in_seq_ = false;
    size_t entry_chars_ = 0;
    size_t desc_chars_ = 0; // includes the '>'
    bool parsed_nl_ = false;
    size_t pos_ = 0;
    size_t entry_ = 1;
    bool at_start_ = true;
    bool closed_ = false;

    void check_open() const;
    void finish_entry(size_t seq_chars);
};

std::ostream& operator<<(std::ostream& os, const FastaWriter& writer);

} // namespace fastaio
