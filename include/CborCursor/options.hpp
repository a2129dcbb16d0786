#pragma once

#include <cstddef>
#include <cstdint>

// Maximum nesting of containers and tags accepted by the recursive
// consumers (DiagnosticRenderer, Cursor::skip_item, CopyItem).
#ifndef CBORCURSOR_MAX_NESTING_DEPTH
#define CBORCURSOR_MAX_NESTING_DEPTH 64
#endif

// Largest definite-length byte/text payload the event decoder materialises.
#ifndef CBORCURSOR_MAX_CHUNK_LENGTH
#define CBORCURSOR_MAX_CHUNK_LENGTH (std::uint64_t{1} << 31)
#endif

namespace CborCursor {

namespace options {

inline constexpr std::size_t DefaultMaxNestingDepth = CBORCURSOR_MAX_NESTING_DEPTH;
inline constexpr std::uint64_t MaxChunkLength = CBORCURSOR_MAX_CHUNK_LENGTH;

static_assert(DefaultMaxNestingDepth > 0, "CBORCURSOR_MAX_NESTING_DEPTH must be positive");

} // namespace options

} // namespace CborCursor
