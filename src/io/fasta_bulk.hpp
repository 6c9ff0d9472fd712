#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "io/byte_stream.hpp"
#include "io/fasta_format.hpp"
#include "io/fasta_reader.hpp"
#include "util/logger.hpp"

namespace fastaio {

// Read all records of a FASTA file (gzip auto-detected, "-" for stdin).
template <typename Seq = std::string>
std::vector<FastaRecord<Seq>> read_fasta(const std::string& path) {
    FastaReader<Seq> reader(path);
    auto records = reader.read_all();
    reader.close();
    return records;
}

template <typename Seq = std::string>
std::vector<FastaRecord<Seq>> read_fasta(ByteStream& in) {
    FastaReader<Seq> reader(in);
    return reader.read_all();
}

template <typename Seq = std::string>
std::vector<FastaRecord<Seq>> read_fasta(std::istream& in) {
    FastaReader<Seq> reader(in);
    return reader.read_all();
}

// Write (description, sequence) pairs: any iterable whose elements
// decompose into two parts (std::pair, std::map entries, FastaRecord).
// A record failing validation writes nothing. Returns the number of
// warnings issued.
template <typename Data>
size_t write_fasta(ByteStream& out, const Data& data, Logger logger = Logger()) {
    size_t warnings_before = logger.num_warnings();
    size_t entry = 0;
    for (const auto& [description, sequence] : data) {
        ++entry;
        std::string desc = normalize_description(description, entry);
        if (desc.size() > FASTA_MAX_DESCRIPTION) {
            logger.warn("description line longer than %zu characters (entry %zu of FASTA input)",
                        FASTA_LINE_WIDTH, entry);
        }
        desc.insert(desc.begin(), '>');
        desc += '\n';
        out.write(desc.data(), desc.size());

        if (write_fasta_sequence(out, sequence, entry) == 0) {
            throw FastaError(FastaErrc::kEmptySequenceData,
                             entry_message("empty sequence data", entry));
        }
    }
    return logger.num_warnings() - warnings_before;
}

template <typename Data>
size_t write_fasta(std::ostream& out, const Data& data, Logger logger = Logger()) {
    StdStreamAdapter stream(out);
    size_t warnings = write_fasta(stream, data, logger);
    stream.flush();
    return warnings;
}

// Create (or append to) a file; a ".gz" suffix compresses.
template <typename Data>
size_t write_fasta(const std::string& path, const Data& data,
                   WriteMode mode = WriteMode::kTruncate,
                   Logger logger = Logger()) {
    auto stream = open_output_stream(path, mode);
    size_t warnings = write_fasta(*stream, data, logger);
    stream->close();
    return warnings;
}

} // namespace fastaio
