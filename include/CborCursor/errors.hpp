#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace CborCursor {

enum class CborError {
    NO_ERROR,

    NOT_WELL_FORMED,
    INVALID_UTF8,

    INCORRECT_MAJOR_TYPE,
    INCORRECT_LOGICAL_TYPE,
    INCORRECT_ADDITIONAL_INFO_FORMAT,

    ARITHMETIC_OVERFLOW,

    UNEXPECTED_BREAK,
    UNEXPECTED_EVENT_IN_CHUNKS,

    NO_ELEMENT,
    INVALID_ARGUMENT,

    NESTING_DEPTH_EXCEEDED,
    PAYLOAD_TOO_LARGE,

    SINK_ERROR
};

constexpr std::string_view error_to_string(CborError e) {
    switch(e) {
    case CborError::NO_ERROR: return "NO_ERROR"; break;
    case CborError::NOT_WELL_FORMED: return "NOT_WELL_FORMED"; break;
    case CborError::INVALID_UTF8: return "INVALID_UTF8"; break;
    case CborError::INCORRECT_MAJOR_TYPE: return "INCORRECT_MAJOR_TYPE"; break;
    case CborError::INCORRECT_LOGICAL_TYPE: return "INCORRECT_LOGICAL_TYPE"; break;
    case CborError::INCORRECT_ADDITIONAL_INFO_FORMAT: return "INCORRECT_ADDITIONAL_INFO_FORMAT"; break;
    case CborError::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW"; break;
    case CborError::UNEXPECTED_BREAK: return "UNEXPECTED_BREAK"; break;
    case CborError::UNEXPECTED_EVENT_IN_CHUNKS: return "UNEXPECTED_EVENT_IN_CHUNKS"; break;
    case CborError::NO_ELEMENT: return "NO_ELEMENT"; break;
    case CborError::INVALID_ARGUMENT: return "INVALID_ARGUMENT"; break;
    case CborError::NESTING_DEPTH_EXCEEDED: return "NESTING_DEPTH_EXCEEDED"; break;
    case CborError::PAYLOAD_TOO_LARGE: return "PAYLOAD_TOO_LARGE"; break;
    case CborError::SINK_ERROR: return "SINK_ERROR"; break;
    }
    return "N/A";
}

// ============================================================================
// Error categories
// ============================================================================

enum class ErrorCategory {
    none,
    malformed_input,   // the byte stream violates RFC 7049
    type_mismatch,     // well-formed, but not what the caller asked for; nothing consumed
    numeric_overflow,  // value does not fit the requested width; nothing consumed
    structural,        // event sequence does not nest correctly
    misuse,            // caller error (empty cursor, invalid factory argument)
    resource_limit,    // nesting ceiling or payload cap reached
    sink               // output could not be written
};

constexpr ErrorCategory error_category(CborError e) {
    switch(e) {
    case CborError::NO_ERROR:
        return ErrorCategory::none;
    case CborError::NOT_WELL_FORMED:
    case CborError::INVALID_UTF8:
        return ErrorCategory::malformed_input;
    case CborError::INCORRECT_MAJOR_TYPE:
    case CborError::INCORRECT_LOGICAL_TYPE:
    case CborError::INCORRECT_ADDITIONAL_INFO_FORMAT:
        return ErrorCategory::type_mismatch;
    case CborError::ARITHMETIC_OVERFLOW:
        return ErrorCategory::numeric_overflow;
    case CborError::UNEXPECTED_BREAK:
    case CborError::UNEXPECTED_EVENT_IN_CHUNKS:
        return ErrorCategory::structural;
    case CborError::NO_ELEMENT:
    case CborError::INVALID_ARGUMENT:
        return ErrorCategory::misuse;
    case CborError::NESTING_DEPTH_EXCEEDED:
    case CborError::PAYLOAD_TOO_LARGE:
        return ErrorCategory::resource_limit;
    case CborError::SINK_ERROR:
        return ErrorCategory::sink;
    }
    return ErrorCategory::none;
}

constexpr std::string_view category_to_string(ErrorCategory c) {
    switch(c) {
    case ErrorCategory::none: return "none"; break;
    case ErrorCategory::malformed_input: return "malformed input"; break;
    case ErrorCategory::type_mismatch: return "type mismatch"; break;
    case ErrorCategory::numeric_overflow: return "numeric overflow"; break;
    case ErrorCategory::structural: return "structural"; break;
    case ErrorCategory::misuse: return "misuse"; break;
    case ErrorCategory::resource_limit: return "resource limit"; break;
    case ErrorCategory::sink: return "sink"; break;
    }
    return "N/A";
}

/// Type mismatches and overflows leave the offending event in place; every
/// other error leaves the stream position undefined.
constexpr bool is_recoverable(CborError e) {
    const ErrorCategory c = error_category(e);
    return c == ErrorCategory::type_mismatch || c == ErrorCategory::numeric_overflow;
}

// ============================================================================
// Error detail
// ============================================================================

/// Which enumeration `ErrorDetail::expected` is a bitmask over.
enum class ExpectationKind : std::uint8_t {
    none,
    major,
    logical_type,
    format
};

/// Error code plus the context a type mismatch needs: the header byte that was
/// actually seen and the set of accepted alternatives (bit i set means
/// enumerator i of Major / LogicalType / AdditionalInfoFormat was accepted).
struct ErrorDetail {
    CborError code = CborError::NO_ERROR;
    std::optional<std::uint8_t> header_byte{};
    ExpectationKind expectation = ExpectationKind::none;
    std::uint32_t expected = 0;

    constexpr bool operator==(const ErrorDetail&) const = default;
};

constexpr ErrorDetail make_error(CborError code) {
    return ErrorDetail{code, std::nullopt, ExpectationKind::none, 0};
}

constexpr ErrorDetail make_error(CborError code, std::uint8_t header_byte) {
    return ErrorDetail{code, header_byte, ExpectationKind::none, 0};
}

} // namespace CborCursor
