#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace fastaio {

enum class FastaErrc {
    kOpenFailure,
    kReadFailure,
    kWriteFailure,
    kNotSeekable,
    kClosed,
    kEmptyFile,
    kEndOfFile,
    kMalformedRecord,
    kEmptyDescription,
    kNonAsciiDescription,
    kNonAsciiCharacter,
    kEmbeddedNewline,
    kMissingDescriptionMarker,
    kSingleLineDescriptionViolation,
    kStrayMarkerInSequence,
    kStrayMarkerInSequenceData,
    kEmptySequence,
    kEmptySequenceData,
};

// Symbolic name of an error code, e.g. "EmptyDescription".
const char* errc_name(FastaErrc code);

// Thrown for every fatal reader, writer or stream condition.
class FastaError : public std::runtime_error {
public:
    FastaError(FastaErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    FastaErrc code() const { return code_; }

private:
    FastaErrc code_;
};

// "<msg> (entry N of FASTA input)"
std::string entry_message(const std::string& msg, size_t entry);

} // namespace fastaio
