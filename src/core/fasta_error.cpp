#include "core/fasta_error.hpp"

namespace fastaio {

const char* errc_name(FastaErrc code) {
    switch (code) {
        case FastaErrc::kOpenFailure:                    return "OpenFailure";
        case FastaErrc::kReadFailure:                    return "ReadFailure";
        case FastaErrc::kWriteFailure:                   return "WriteFailure";
        case FastaErrc::kNotSeekable:                    return "NotSeekable";
        case FastaErrc::kClosed:                         return "Closed";
        case FastaErrc::kEmptyFile:                      return "EmptyFile";
        case FastaErrc::kEndOfFile:                      return "EndOfFile";
        case FastaErrc::kMalformedRecord:                return "MalformedRecord";
        case FastaErrc::kEmptyDescription:               return "EmptyDescription";
        case FastaErrc::kNonAsciiDescription:            return "NonAsciiDescription";
        case FastaErrc::kNonAsciiCharacter:              return "NonAsciiCharacter";
        case FastaErrc::kEmbeddedNewline:                return "EmbeddedNewline";
        case FastaErrc::kMissingDescriptionMarker:       return "MissingDescriptionMarker";
        case FastaErrc::kSingleLineDescriptionViolation: return "SingleLineDescriptionViolation";
        case FastaErrc::kStrayMarkerInSequence:          return "StrayMarkerInSequence";
        case FastaErrc::kStrayMarkerInSequenceData:      return "StrayMarkerInSequenceData";
        case FastaErrc::kEmptySequence:                  return "EmptySequence";
        case FastaErrc::kEmptySequenceData:              return "EmptySequenceData";
    }
    return "Unknown";
}

std::string entry_message(const std::string& msg, size_t entry) {
    return msg + " (entry " + std::to_string(entry) + " of FASTA input)";
}

} // namespace fastaio
