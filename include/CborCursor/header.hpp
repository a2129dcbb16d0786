#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <type_traits>

#include "errors.hpp"
#include "io.hpp"
#include "result.hpp"

namespace CborCursor {

// ============================================================================
// Header vocabulary
// ============================================================================

enum class Major : std::uint8_t {
    UNSIGNED_INTEGER = 0,
    NEGATIVE_INTEGER = 1,
    BYTE_STRING      = 2,
    TEXT_STRING      = 3,
    ARRAY            = 4,
    MAP              = 5,
    TAG              = 6,
    ETC              = 7
};

enum class AdditionalInfoFormat : std::uint8_t {
    IMMEDIATE,   // low bits 0..23 are the value
    BYTE,        // 24: one trailing byte
    SHORT,       // 25: two trailing bytes
    INT,         // 26: four trailing bytes
    LONG,        // 27: eight trailing bytes
    INDEFINITE   // 31: indefinite length, or break for major 7
};

enum class LogicalType : std::uint8_t {
    INTEGRAL,
    BOOLEAN,
    NULL_VALUE,
    UNDEFINED,
    OTHER_SIMPLE,
    TAG,
    HALF_FLOAT,
    FLOAT,
    DOUBLE,
    BINARY_CHUNK,
    TEXT_CHUNK,
    START_BINARY_CHUNKS,
    START_TEXT_CHUNKS,
    START_ARRAY,
    START_INDEFINITE_ARRAY,
    START_MAP,
    START_INDEFINITE_MAP,
    BREAK
};

constexpr std::string_view to_string(Major m) {
    switch(m) {
    case Major::UNSIGNED_INTEGER: return "UNSIGNED_INTEGER"; break;
    case Major::NEGATIVE_INTEGER: return "NEGATIVE_INTEGER"; break;
    case Major::BYTE_STRING: return "BYTE_STRING"; break;
    case Major::TEXT_STRING: return "TEXT_STRING"; break;
    case Major::ARRAY: return "ARRAY"; break;
    case Major::MAP: return "MAP"; break;
    case Major::TAG: return "TAG"; break;
    case Major::ETC: return "ETC"; break;
    }
    return "N/A";
}

constexpr std::string_view to_string(AdditionalInfoFormat f) {
    switch(f) {
    case AdditionalInfoFormat::IMMEDIATE: return "IMMEDIATE"; break;
    case AdditionalInfoFormat::BYTE: return "BYTE"; break;
    case AdditionalInfoFormat::SHORT: return "SHORT"; break;
    case AdditionalInfoFormat::INT: return "INT"; break;
    case AdditionalInfoFormat::LONG: return "LONG"; break;
    case AdditionalInfoFormat::INDEFINITE: return "INDEFINITE"; break;
    }
    return "N/A";
}

constexpr std::string_view to_string(LogicalType t) {
    switch(t) {
    case LogicalType::INTEGRAL: return "INTEGRAL"; break;
    case LogicalType::BOOLEAN: return "BOOLEAN"; break;
    case LogicalType::NULL_VALUE: return "NULL"; break;
    case LogicalType::UNDEFINED: return "UNDEFINED"; break;
    case LogicalType::OTHER_SIMPLE: return "OTHER_SIMPLE"; break;
    case LogicalType::TAG: return "TAG"; break;
    case LogicalType::HALF_FLOAT: return "HALF_FLOAT"; break;
    case LogicalType::FLOAT: return "FLOAT"; break;
    case LogicalType::DOUBLE: return "DOUBLE"; break;
    case LogicalType::BINARY_CHUNK: return "BINARY_CHUNK"; break;
    case LogicalType::TEXT_CHUNK: return "TEXT_CHUNK"; break;
    case LogicalType::START_BINARY_CHUNKS: return "START_BINARY_CHUNKS"; break;
    case LogicalType::START_TEXT_CHUNKS: return "START_TEXT_CHUNKS"; break;
    case LogicalType::START_ARRAY: return "START_ARRAY"; break;
    case LogicalType::START_INDEFINITE_ARRAY: return "START_INDEFINITE_ARRAY"; break;
    case LogicalType::START_MAP: return "START_MAP"; break;
    case LogicalType::START_INDEFINITE_MAP: return "START_INDEFINITE_MAP"; break;
    case LogicalType::BREAK: return "BREAK"; break;
    }
    return "N/A";
}

constexpr bool is_simple(LogicalType t) {
    return t == LogicalType::BOOLEAN || t == LogicalType::NULL_VALUE
        || t == LogicalType::UNDEFINED || t == LogicalType::OTHER_SIMPLE;
}

constexpr bool is_container(LogicalType t) {
    switch(t) {
    case LogicalType::TAG:
    case LogicalType::START_BINARY_CHUNKS:
    case LogicalType::START_TEXT_CHUNKS:
    case LogicalType::START_ARRAY:
    case LogicalType::START_INDEFINITE_ARRAY:
    case LogicalType::START_MAP:
    case LogicalType::START_INDEFINITE_MAP:
        return true;
    default:
        return false;
    }
}

constexpr bool is_followed_by_payload(LogicalType t) {
    return t == LogicalType::BINARY_CHUNK || t == LogicalType::TEXT_CHUNK;
}

constexpr bool is_start_of_indefinite(LogicalType t) {
    return t == LogicalType::START_BINARY_CHUNKS || t == LogicalType::START_TEXT_CHUNKS
        || t == LogicalType::START_INDEFINITE_ARRAY || t == LogicalType::START_INDEFINITE_MAP;
}

/// Majors that may carry the indefinite marker (31).
constexpr bool allows_indefinite(Major m) {
    return m == Major::BYTE_STRING || m == Major::TEXT_STRING
        || m == Major::ARRAY || m == Major::MAP || m == Major::ETC;
}

/// Number of argument bytes following the header byte.
constexpr std::size_t argument_length(AdditionalInfoFormat f) {
    switch(f) {
    case AdditionalInfoFormat::BYTE: return 1;
    case AdditionalInfoFormat::SHORT: return 2;
    case AdditionalInfoFormat::INT: return 4;
    case AdditionalInfoFormat::LONG: return 8;
    default: return 0;
    }
}

/// Smallest format able to hold `value` as an unsigned argument.
constexpr AdditionalInfoFormat canonical_format(std::uint64_t value) {
    if (value < 24u) {
        return AdditionalInfoFormat::IMMEDIATE;
    } else if (value <= 0xFFu) {
        return AdditionalInfoFormat::BYTE;
    } else if (value <= 0xFFFFu) {
        return AdditionalInfoFormat::SHORT;
    } else if (value <= 0xFFFFFFFFu) {
        return AdditionalInfoFormat::INT;
    }
    return AdditionalInfoFormat::LONG;
}

// ============================================================================
// Expected-alternative masks for type mismatch errors
// ============================================================================

template <class E>
constexpr std::uint32_t expectation_bit(E e) {
    return std::uint32_t{1} << static_cast<std::uint32_t>(e);
}

template <class E>
constexpr std::uint32_t expectation_mask(std::initializer_list<E> alternatives) {
    std::uint32_t mask = 0;
    for (E e : alternatives) {
        mask |= expectation_bit(e);
    }
    return mask;
}

template <class E>
constexpr ExpectationKind expectation_kind_of() {
    if constexpr (std::is_same_v<E, Major>) {
        return ExpectationKind::major;
    } else if constexpr (std::is_same_v<E, LogicalType>) {
        return ExpectationKind::logical_type;
    } else {
        static_assert(std::is_same_v<E, AdditionalInfoFormat>);
        return ExpectationKind::format;
    }
}

/// True if `detail` lists `e` among its accepted alternatives.
template <class E>
constexpr bool expects(const ErrorDetail& detail, E e) {
    return detail.expectation == expectation_kind_of<E>()
        && (detail.expected & expectation_bit(e)) != 0;
}

// ============================================================================
// Header traits table
// ============================================================================

namespace header_detail {

struct HeaderTraits {
    bool well_formed = false;
    Major major = Major::UNSIGNED_INTEGER;
    AdditionalInfoFormat format = AdditionalInfoFormat::IMMEDIATE;
    LogicalType logical_type = LogicalType::INTEGRAL;
};

constexpr std::optional<AdditionalInfoFormat> format_of_low_bits(std::uint8_t bits) {
    if (bits < 24) return AdditionalInfoFormat::IMMEDIATE;
    switch (bits) {
    case 24: return AdditionalInfoFormat::BYTE;
    case 25: return AdditionalInfoFormat::SHORT;
    case 26: return AdditionalInfoFormat::INT;
    case 27: return AdditionalInfoFormat::LONG;
    case 31: return AdditionalInfoFormat::INDEFINITE;
    default: return std::nullopt; // 28..30 reserved
    }
}

constexpr std::uint8_t low_bits_of(AdditionalInfoFormat f) {
    switch (f) {
    case AdditionalInfoFormat::BYTE: return 24;
    case AdditionalInfoFormat::SHORT: return 25;
    case AdditionalInfoFormat::INT: return 26;
    case AdditionalInfoFormat::LONG: return 27;
    case AdditionalInfoFormat::INDEFINITE: return 31;
    default: return 0;
    }
}

constexpr LogicalType classify(Major major, AdditionalInfoFormat format, std::uint8_t bits) {
    const bool indefinite = format == AdditionalInfoFormat::INDEFINITE;
    switch (major) {
    case Major::UNSIGNED_INTEGER:
    case Major::NEGATIVE_INTEGER:
        return LogicalType::INTEGRAL;
    case Major::BYTE_STRING:
        return indefinite ? LogicalType::START_BINARY_CHUNKS : LogicalType::BINARY_CHUNK;
    case Major::TEXT_STRING:
        return indefinite ? LogicalType::START_TEXT_CHUNKS : LogicalType::TEXT_CHUNK;
    case Major::ARRAY:
        return indefinite ? LogicalType::START_INDEFINITE_ARRAY : LogicalType::START_ARRAY;
    case Major::MAP:
        return indefinite ? LogicalType::START_INDEFINITE_MAP : LogicalType::START_MAP;
    case Major::TAG:
        return LogicalType::TAG;
    case Major::ETC:
        switch (format) {
        case AdditionalInfoFormat::IMMEDIATE:
            switch (bits) {
            case 20:
            case 21: return LogicalType::BOOLEAN;
            case 22: return LogicalType::NULL_VALUE;
            case 23: return LogicalType::UNDEFINED;
            default: return LogicalType::OTHER_SIMPLE;
            }
        case AdditionalInfoFormat::BYTE: return LogicalType::OTHER_SIMPLE;
        case AdditionalInfoFormat::SHORT: return LogicalType::HALF_FLOAT;
        case AdditionalInfoFormat::INT: return LogicalType::FLOAT;
        case AdditionalInfoFormat::LONG: return LogicalType::DOUBLE;
        case AdditionalInfoFormat::INDEFINITE: return LogicalType::BREAK;
        }
    }
    return LogicalType::INTEGRAL;
}

constexpr HeaderTraits traits_of(std::uint8_t byte) {
    const Major major = static_cast<Major>(byte >> 5);
    const std::uint8_t bits = byte & 0x1F;
    const auto format = format_of_low_bits(bits);
    if (!format) {
        return HeaderTraits{};
    }
    if (*format == AdditionalInfoFormat::INDEFINITE && !allows_indefinite(major)) {
        return HeaderTraits{};
    }
    return HeaderTraits{true, major, *format, classify(major, *format, bits)};
}

inline constexpr std::array<HeaderTraits, 256> kHeaderTable = [] {
    std::array<HeaderTraits, 256> table{};
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = traits_of(static_cast<std::uint8_t>(i));
    }
    return table;
}();

} // namespace header_detail

// ============================================================================
// Header
// ============================================================================

/// The leading byte of a CBOR data item. Only well-formed headers can be
/// constructed.
class Header {
    std::uint8_t m_byte = 0;

    constexpr explicit Header(std::uint8_t byte): m_byte(byte) {}

    constexpr const header_detail::HeaderTraits& traits() const {
        return header_detail::kHeaderTable[m_byte];
    }

public:
    static const Header FALSE_VALUE;
    static const Header TRUE_VALUE;
    static const Header NULL_VALUE;
    static const Header UNDEFINED;
    static const Header BREAK;

    /// The default header is 0x00 (unsigned integer 0).
    constexpr Header() = default;

    // ========== Construction ==========

    static constexpr std::optional<Header> from_byte(std::uint8_t byte) {
        if (!header_detail::kHeaderTable[byte].well_formed) {
            return std::nullopt;
        }
        return Header(byte);
    }

    static constexpr Result<Header> immediate(Major major, std::uint8_t value) {
        if (value > 23) {
            return make_error(CborError::INVALID_ARGUMENT);
        }
        return Header(static_cast<std::uint8_t>((static_cast<std::uint8_t>(major) << 5) | value));
    }

    /// Non-immediate header of the given format; INDEFINITE only where the
    /// major allows it.
    static constexpr Result<Header> from_major_and_format(Major major, AdditionalInfoFormat format) {
        if (format == AdditionalInfoFormat::IMMEDIATE) {
            return make_error(CborError::INVALID_ARGUMENT);
        }
        if (format == AdditionalInfoFormat::INDEFINITE && !allows_indefinite(major)) {
            return make_error(CborError::INVALID_ARGUMENT);
        }
        return Header(static_cast<std::uint8_t>((static_cast<std::uint8_t>(major) << 5)
                                                | header_detail::low_bits_of(format)));
    }

    static constexpr Result<Header> indefinite(Major major) {
        return from_major_and_format(major, AdditionalInfoFormat::INDEFINITE);
    }

    /// Header with the minimal format able to carry `value`. For ETC the value
    /// is a simple value: 0..23 or 32..255.
    static constexpr Result<Header> for_canonical_value(Major major, std::uint64_t value) {
        if (major == Major::ETC && (value > 0xFFu || (value >= 24u && value < 32u))) {
            return make_error(CborError::INVALID_ARGUMENT);
        }
        const AdditionalInfoFormat format = canonical_format(value);
        if (format == AdditionalInfoFormat::IMMEDIATE) {
            return immediate(major, static_cast<std::uint8_t>(value));
        }
        return from_major_and_format(major, format);
    }

    // ========== Introspection ==========

    constexpr std::uint8_t byte() const { return m_byte; }
    constexpr Major major() const { return traits().major; }
    constexpr AdditionalInfoFormat format() const { return traits().format; }
    constexpr LogicalType logical_type() const { return traits().logical_type; }

    /// Low five bits; the value itself for IMMEDIATE headers.
    constexpr std::uint8_t low_bits() const { return m_byte & 0x1F; }

    constexpr std::size_t argument_length() const {
        return CborCursor::argument_length(format());
    }
    constexpr bool is_indefinite() const {
        return format() == AdditionalInfoFormat::INDEFINITE;
    }
    constexpr bool is_break() const { return m_byte == 0xFF; }
    constexpr bool is_simple() const { return CborCursor::is_simple(logical_type()); }
    constexpr bool is_container() const { return CborCursor::is_container(logical_type()); }
    constexpr bool is_followed_by_payload() const {
        return CborCursor::is_followed_by_payload(logical_type());
    }
    constexpr bool is_start_of_indefinite() const {
        return CborCursor::is_start_of_indefinite(logical_type());
    }

    // ========== Assertions ==========

    constexpr Result<void> assert_major(std::initializer_list<Major> accepted) const {
        for (Major m : accepted) {
            if (m == major()) return {};
        }
        return mismatch(CborError::INCORRECT_MAJOR_TYPE, ExpectationKind::major, expectation_mask(accepted));
    }

    constexpr Result<void> assert_logical_type(std::initializer_list<LogicalType> accepted) const {
        for (LogicalType t : accepted) {
            if (t == logical_type()) return {};
        }
        return mismatch(CborError::INCORRECT_LOGICAL_TYPE, ExpectationKind::logical_type, expectation_mask(accepted));
    }

    constexpr Result<void> assert_format(std::initializer_list<AdditionalInfoFormat> accepted) const {
        for (AdditionalInfoFormat f : accepted) {
            if (f == format()) return {};
        }
        return mismatch(CborError::INCORRECT_ADDITIONAL_INFO_FORMAT, ExpectationKind::format, expectation_mask(accepted));
    }

    constexpr ErrorDetail mismatch(CborError code, ExpectationKind kind, std::uint32_t expected) const {
        return ErrorDetail{code, m_byte, kind, expected};
    }

    // ========== Wire codec ==========

    /// Reads one header byte. An empty optional means end of stream at an item
    /// boundary.
    template <class It, class Sent>
        requires ByteSentinelFor<It, Sent>
    static constexpr Result<std::optional<Header>> decode(It& cur, const Sent& end) {
        if (cur == end) {
            return std::optional<Header>{};
        }
        const std::uint8_t byte = io_detail::read_byte(cur);
        ++cur;
        auto header = from_byte(byte);
        if (!header) {
            return make_error(CborError::NOT_WELL_FORMED, byte);
        }
        return std::optional<Header>{*header};
    }

    /// Reads the big-endian argument that follows this header.
    template <class It, class Sent>
        requires ByteSentinelFor<It, Sent>
    constexpr Result<std::uint64_t> read_argument(It& cur, const Sent& end) const {
        switch (format()) {
        case AdditionalInfoFormat::IMMEDIATE:
            return std::uint64_t{low_bits()};
        case AdditionalInfoFormat::INDEFINITE:
            return std::uint64_t{0};
        default:
            break;
        }
        std::uint64_t v = 0;
        const std::size_t n = argument_length();
        for (std::size_t i = 0; i < n; ++i) {
            if (cur == end) {
                return make_error(CborError::NOT_WELL_FORMED, m_byte);
            }
            v = (v << 8) | io_detail::read_byte(cur);
            ++cur;
        }
        return v;
    }

    template <class It, class Sent>
    constexpr bool encode(It& out, const Sent& end) const {
        return io_detail::write_byte(out, end, m_byte);
    }

    /// Writes the argument bytes for this header; `value` must fit the format.
    template <class It, class Sent>
    constexpr bool write_argument(std::uint64_t value, It& out, const Sent& end) const {
        const std::size_t n = argument_length();
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t shift = 8 * (n - 1 - i);
            if (!io_detail::write_byte(out, end, static_cast<std::uint8_t>((value >> shift) & 0xFFu))) {
                return false;
            }
        }
        return true;
    }

    /// Largest argument this header's format can carry.
    constexpr std::uint64_t max_argument() const {
        switch (format()) {
        case AdditionalInfoFormat::IMMEDIATE: return low_bits();
        case AdditionalInfoFormat::BYTE: return 0xFFu;
        case AdditionalInfoFormat::SHORT: return 0xFFFFu;
        case AdditionalInfoFormat::INT: return 0xFFFFFFFFu;
        case AdditionalInfoFormat::LONG: return ~std::uint64_t{0};
        case AdditionalInfoFormat::INDEFINITE: return 0;
        }
        return 0;
    }

    constexpr auto operator<=>(const Header&) const = default;
};

inline constexpr Header Header::FALSE_VALUE{0xF4};
inline constexpr Header Header::TRUE_VALUE{0xF5};
inline constexpr Header Header::NULL_VALUE{0xF6};
inline constexpr Header Header::UNDEFINED{0xF7};
inline constexpr Header Header::BREAK{0xFF};

/// Header recorded in an error, if any.
constexpr std::optional<Header> actual_header(const ErrorDetail& detail) {
    if (!detail.header_byte) {
        return std::nullopt;
    }
    return Header::from_byte(*detail.header_byte);
}

} // namespace CborCursor
