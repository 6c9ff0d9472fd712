#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

#include "core/config.hpp"
#include "core/fasta_error.hpp"
#include "core/types.hpp"
#include "io/byte_stream.hpp"

namespace fastaio {

// Trim outer whitespace and validate a description for output.
// Throws kNonAsciiDescription, kEmptyDescription or kEmbeddedNewline.
std::string normalize_description(const std::string& description, size_t entry);

// Write sequence data wrapped at FASTA_LINE_WIDTH columns. Whitespace is
// dropped; '>' and non-ASCII characters are rejected. Returns the number
// of characters written, not counting newlines.
template <typename Seq>
size_t write_fasta_sequence(ByteStream& out, const Seq& seq, size_t entry,
                            bool trailing_newline = true) {
    std::string line;
    line.reserve(FASTA_LINE_WIDTH + 1);
    size_t count = 0;

    for (const auto& c : seq) {
        unsigned char ch = static_cast<unsigned char>(c);
        if (!is_ascii(ch)) {
            throw FastaError(FastaErrc::kNonAsciiCharacter,
                             entry_message("invalid (non-ASCII) character in sequence data",
                                           entry));
        }
        if (std::isspace(ch)) continue;
        if (ch == '>') {
            throw FastaError(FastaErrc::kStrayMarkerInSequenceData,
                             entry_message("character '>' not allowed in sequence data",
                                           entry));
        }
        if (line.size() == FASTA_LINE_WIDTH) {
            line += '\n';
            out.write(line.data(), line.size());
            line.clear();
        }
        line += static_cast<char>(ch);
        ++count;
    }

    if (trailing_newline) line += '\n';
    if (!line.empty()) out.write(line.data(), line.size());
    return count;
}

inline size_t write_fasta_sequence(ByteStream& out, const char* seq, size_t entry,
                                   bool trailing_newline = true) {
    return write_fasta_sequence(out, std::string_view(seq), entry, trailing_newline);
}

} // namespace fastaio
