#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fastaio {

template <typename Seq = std::string>
struct FastaRecord {
    std::string description; // header text after '>'
    Seq sequence;            // concatenated sequence lines

    bool operator==(const FastaRecord& other) const {
        return description == other.description && sequence == other.sequence;
    }
    bool operator!=(const FastaRecord& other) const { return !(*this == other); }
};

// Conversion of the reader's byte accumulator into the requested
// sequence type. Any type constructible from a byte range works.
template <typename Seq>
struct SequenceConverter {
    static const char* name() { return "sequence"; }
    static Seq convert(const uint8_t* data, size_t size) {
        return Seq(data, data + size);
    }
};

// Raw bytes, passed through unchanged.
template <>
struct SequenceConverter<std::vector<uint8_t>> {
    static const char* name() { return "bytes"; }
    static std::vector<uint8_t> convert(const uint8_t* data, size_t size) {
        return std::vector<uint8_t>(data, data + size);
    }
};

template <>
struct SequenceConverter<std::string> {
    static const char* name() { return "string"; }
    static std::string convert(const uint8_t* data, size_t size) {
        return std::string(reinterpret_cast<const char*>(data), size);
    }
};

inline bool is_ascii(unsigned char c) { return c < 0x80; }

inline bool is_ascii(const std::string& s) {
    for (char c : s)
        if (!is_ascii(static_cast<unsigned char>(c))) return false;
    return true;
}

} // namespace fastaio
