#pragma once

#include <cstddef>

namespace fastaio {

// Bytes requested from the underlying stream per read, and the initial
// capacity of the line and record buffers.
inline constexpr size_t FASTA_CHUNK_SIZE = 4096;

// Output column at which sequence data is wrapped.
inline constexpr size_t FASTA_LINE_WIDTH = 80;

// Longest description the bulk writer accepts without a warning
// ('>' plus description fits in one FASTA_LINE_WIDTH line).
inline constexpr size_t FASTA_MAX_DESCRIPTION = FASTA_LINE_WIDTH - 1;

// Grow a buffer capacity geometrically until it holds at least `needed`.
inline constexpr size_t grow_capacity(size_t current, size_t needed) {
    size_t cap = current > 0 ? current : FASTA_CHUNK_SIZE;
    while (cap < needed) cap *= 2;
    return cap;
}

} // namespace fastaio
