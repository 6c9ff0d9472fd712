#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <iterator>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "core/fasta_error.hpp"
#include "core/types.hpp"
#include "io/byte_stream.hpp"
#include "io/chunked_byte_source.hpp"
#include "io/line_assembler.hpp"

namespace fastaio {

// Untyped part of the reader: stream ownership, line assembly and the
// record grammar. Holds at most one record in memory.
class FastaReaderBase {
public:
    // Open a file (gzip auto-detected). "-" reads stdin.
    explicit FastaReaderBase(const std::string& path);

    // Read from a caller-owned stream; close() leaves it open.
    explicit FastaReaderBase(ByteStream& stream);
    explicit FastaReaderBase(std::istream& in);

    ~FastaReaderBase();

    FastaReaderBase(const FastaReaderBase&) = delete;
    FastaReaderBase& operator=(const FastaReaderBase&) = delete;

    // Seek back to offset 0 and forget all parse state.
    void rewind();

    // True once the stream is exhausted and no further record exists.
    bool eof() const { return eof_; }

    // Records returned since construction or the last rewind().
    size_t num_parsed() const { return num_parsed_; }

    void close();
    bool is_closed() const { return closed_; }

    std::string input_name() const { return stream_->name(); }

    // FastaReader(input="...", out_type=..., num_parsed=N, eof=B)
    void print(std::ostream& os, const char* out_type) const;

protected:
    void check_open() const;

    // Fetch the first line; throws kEmptyFile if there is none.
    void prime();
    bool primed() const { return primed_; }

    // Parse the record at the current description line. Returns the
    // description; the sequence bytes are left in the record buffer.
    std::string next_step();

    const uint8_t* record_data() const { return record_.data(); }
    size_t record_size() const { return record_size_; }

    void count_record() { ++num_parsed_; }

private:
    std::unique_ptr<ByteStream> holder_;
    ByteStream* stream_;
    bool own_stream_;
    ChunkedByteSource source_;
    LineAssembler lines_;
    std::vector<uint8_t> record_;
    size_t record_size_ = 0;
    size_t num_parsed_ = 0;
    bool eof_ = false;
    bool primed_ = false;
    bool closed_ = false;

    void append_record(const uint8_t* p, size_t n);
};

// Streaming FASTA reader yielding FastaRecord<Seq>. Seq is any type
// SequenceConverter can build from the accumulated bytes: std::string,
// std::vector<uint8_t>, std::vector<char>, ...
//
// Two ways to consume it:
//   for (const auto& rec : reader)   always starts from the beginning
//   while (!reader.eof()) reader.read_entry();   continues where it is
template <typename Seq = std::string>
class FastaReader : public FastaReaderBase {
public:
    using record_type = FastaRecord<Seq>;

    using FastaReaderBase::FastaReaderBase;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = record_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const record_type*;
        using reference = const record_type&;

        iterator() = default;
        explicit iterator(FastaReader* reader) : reader_(reader) { advance(); }

        reference operator*() const { return record_; }
        pointer operator->() const { return &record_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return reader_ == other.reader_; }
        bool operator!=(const iterator& other) const { return reader_ != other.reader_; }

    private:
        FastaReader* reader_ = nullptr;
        record_type record_;

        void advance() {
            if (reader_->eof()) {
                reader_ = nullptr;
                return;
            }
            record_ = reader_->next_record();
        }
    };

    // Rewinds, primes, and yields the first record.
    iterator begin() {
        rewind();
        prime();
        return iterator(this);
    }
    iterator end() { return iterator(); }

    // Next record from the current position. Throws kEndOfFile when
    // eof() is already true.
    record_type read_entry() {
        check_open();
        if (eof()) {
            throw FastaError(FastaErrc::kEndOfFile,
                             "end of FASTA input reached in " + input_name());
        }
        if (!primed()) prime();
        return next_record();
    }

    // All records, via iteration (so from the beginning).
    std::vector<record_type> read_all() {
        std::vector<record_type> out;
        for (const auto& rec : *this) out.push_back(rec);
        return out;
    }

private:
    record_type next_record() {
        record_type rec;
        rec.description = next_step();
        rec.sequence = SequenceConverter<Seq>::convert(record_data(), record_size());
        count_record();
        return rec;
    }
};

template <typename Seq>
std::ostream& operator<<(std::ostream& os, const FastaReader<Seq>& reader) {
    reader.print(os, SequenceConverter<Seq>::name());
    return os;
}

} // namespace fastaio
