#include "io/fasta_format.hpp"

namespace fastaio {

std::string normalize_description(const std::string& description, size_t entry) {
    if (!is_ascii(description)) {
        throw FastaError(FastaErrc::kNonAsciiDescription,
                         entry_message("invalid (non-ASCII) description", entry));
    }

    size_t start = 0;
    size_t end = description.size();
    while (start < end && std::isspace(static_cast<unsigned char>(description[start])))
        start++;
    while (end > start && std::isspace(static_cast<unsigned char>(description[end - 1])))
        end--;

    if (start == end) {
        throw FastaError(FastaErrc::kEmptyDescription,
                         entry_message("empty description", entry));
    }
    std::string desc = description.substr(start, end - start);
    if (desc.find('\n') != std::string::npos) {
        throw FastaError(FastaErrc::kEmbeddedNewline,
                         entry_message("newlines are not allowed within description", entry));
    }
    return desc;
}

} // namespace fastaio
