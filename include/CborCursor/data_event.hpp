#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "big_integer.hpp"
#include "bytes.hpp"
#include "errors.hpp"
#include "header.hpp"
#include "io.hpp"
#include "options.hpp"
#include "result.hpp"

namespace CborCursor {

class DataEvent;

/// Events are immutable and shared; single-byte-complete events are process-wide
/// singletons, so two of them are equal iff they are the same pointer.
using Event = std::shared_ptr<const DataEvent>;

/// `as_count()` of an indefinite-length container.
inline constexpr std::size_t kIndefiniteCount = std::numeric_limits<std::size_t>::max();

namespace half_float {
inline constexpr std::uint16_t POSITIVE_INFINITY = 0x7C00;
inline constexpr std::uint16_t NEGATIVE_INFINITY = 0xFC00;
inline constexpr std::uint16_t NOT_A_NUMBER      = 0x7E00;
} // namespace half_float

/// One CBOR header event: the header, its unsigned argument and, for definite
/// byte/text strings, the payload. Children of containers are separate events.
class DataEvent {
    struct Token {
        explicit Token() = default;
    };

    Header m_header;
    std::uint64_t m_raw = 0;
    std::optional<Bytes> m_payload;

public:
    DataEvent(Token, Header header, std::uint64_t raw, std::optional<Bytes> payload)
        : m_header(header), m_raw(raw), m_payload(std::move(payload)) {}

    // ========================================================================
    // Factories
    // ========================================================================

    static Event of_boolean(bool value) {
        return singleton(value ? Header::TRUE_VALUE.byte() : Header::FALSE_VALUE.byte());
    }
    static Event of_null() { return singleton(Header::NULL_VALUE.byte()); }
    static Event of_undefined() { return singleton(Header::UNDEFINED.byte()); }
    static Event of_break() { return singleton(Header::BREAK.byte()); }

    static Event empty_bytes() { return singleton(0x40); }
    static Event empty_text() { return singleton(0x60); }
    static Event empty_array() { return singleton(0x80); }
    static Event empty_map() { return singleton(0xA0); }

    static Event start_indefinite_bytes() { return singleton(0x5F); }
    static Event start_indefinite_text() { return singleton(0x7F); }
    static Event start_indefinite_array() { return singleton(0x9F); }
    static Event start_indefinite_map() { return singleton(0xBF); }

    static Event of_unsigned(std::uint64_t value) {
        return make(canonical_header(Major::UNSIGNED_INTEGER, value), value);
    }

    /// Negative integer -(argument + 1).
    static Event of_negative_argument(std::uint64_t argument) {
        return make(canonical_header(Major::NEGATIVE_INTEGER, argument), argument);
    }

    static Event of_integer(std::int64_t value) {
        if (value >= 0) {
            return of_unsigned(static_cast<std::uint64_t>(value));
        }
        return of_negative_argument(static_cast<std::uint64_t>(-(value + 1)));
    }

    static Event of_big_integer(const BigInteger& value) {
        return value.is_negative() ? of_negative_argument(value.argument())
                                   : of_unsigned(value.argument());
    }

    /// Simple values 0..23 and 32..255; 24..31 are reserved.
    static Result<Event> of_simple_value(std::uint8_t value) {
        auto header = Header::for_canonical_value(Major::ETC, value);
        if (!header) {
            return header.detail();
        }
        return make(*header, value);
    }

    static Event of_bytes(Bytes bytes) {
        return of_string(Major::BYTE_STRING, std::move(bytes));
    }

    static Event of_text(std::string_view text) {
        return of_string(Major::TEXT_STRING, Bytes::from_utf8(text));
    }

    static Event of_tag(std::uint64_t tag) {
        return make(canonical_header(Major::TAG, tag), tag);
    }

    static Event start_array(std::uint64_t count) {
        return make(canonical_header(Major::ARRAY, count), count);
    }

    static Event start_map(std::uint64_t pairs) {
        return make(canonical_header(Major::MAP, pairs), pairs);
    }

    static Event of_half_float_bits(std::uint16_t bits) {
        return make(float_header(AdditionalInfoFormat::SHORT), bits);
    }

    static Event of_float(float value) {
        return make(float_header(AdditionalInfoFormat::INT), std::bit_cast<std::uint32_t>(value));
    }

    static Event of_double(double value) {
        return make(float_header(AdditionalInfoFormat::LONG), std::bit_cast<std::uint64_t>(value));
    }

    static Event half_infinity() { return of_half_float_bits(half_float::POSITIVE_INFINITY); }
    static Event half_negative_infinity() { return of_half_float_bits(half_float::NEGATIVE_INFINITY); }
    static Event half_nan() { return of_half_float_bits(half_float::NOT_A_NUMBER); }

    /// Canonical event for majors whose whole meaning is the argument
    /// (integers, tag, array and map starts).
    static Result<Event> canonical_of_major_and_value(Major major, std::uint64_t value) {
        switch (major) {
        case Major::BYTE_STRING:
        case Major::TEXT_STRING:
        case Major::ETC:
            return make_error(CborError::INVALID_ARGUMENT);
        default:
            return make(canonical_header(major, value), value);
        }
    }

    /// Builds an event from explicit parts, checking every invariant. Allows
    /// non-canonical argument widths.
    static Result<Event> from_parts(Header header, std::uint64_t raw, std::optional<Bytes> payload) {
        switch (header.format()) {
        case AdditionalInfoFormat::IMMEDIATE:
            if (raw != header.low_bits()) {
                return make_error(CborError::INVALID_ARGUMENT, header.byte());
            }
            break;
        case AdditionalInfoFormat::INDEFINITE:
            if (raw != 0) {
                return make_error(CborError::INVALID_ARGUMENT, header.byte());
            }
            break;
        default:
            if (raw > header.max_argument()) {
                return make_error(CborError::INVALID_ARGUMENT, header.byte());
            }
            break;
        }
        if (header.major() == Major::ETC && header.format() == AdditionalInfoFormat::BYTE && raw < 32) {
            return make_error(CborError::INVALID_ARGUMENT, header.byte());
        }
        if (header.is_followed_by_payload() != payload.has_value()) {
            return make_error(CborError::INVALID_ARGUMENT, header.byte());
        }
        if (payload && payload->size() != raw) {
            return make_error(CborError::INVALID_ARGUMENT, header.byte());
        }
        return make(header, raw, std::move(payload));
    }

    // ========================================================================
    // Wire codec
    // ========================================================================

    /// Decodes one event. An empty optional means the stream ended exactly at an
    /// item boundary; running out of bytes anywhere else is NOT_WELL_FORMED.
    template <class It, class Sent>
        requires ByteSentinelFor<It, Sent>
    static Result<std::optional<Event>> decode(It& cur, const Sent& end) {
        auto decoded = Header::decode(cur, end);
        if (!decoded) {
            return decoded.detail();
        }
        if (!decoded.value()) {
            return std::optional<Event>{};
        }
        const Header header = *decoded.value();
        if (const Event& shared = singletons()[header.byte()]) {
            return std::optional<Event>{shared};
        }

        auto argument = header.read_argument(cur, end);
        if (!argument) {
            return argument.detail();
        }
        const std::uint64_t raw = argument.value();

        if (header.major() == Major::ETC && header.format() == AdditionalInfoFormat::BYTE && raw < 32) {
            return make_error(CborError::NOT_WELL_FORMED, header.byte());
        }
        if (!header.is_followed_by_payload()) {
            return std::optional<Event>{make(header, raw)};
        }

        if (raw > options::MaxChunkLength) {
            return make_error(CborError::PAYLOAD_TOO_LARGE, header.byte());
        }
        std::vector<std::uint8_t> data;
        data.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(raw, 4096)));
        for (std::uint64_t i = 0; i < raw; ++i) {
            if (cur == end) {
                return make_error(CborError::NOT_WELL_FORMED, header.byte());
            }
            data.push_back(io_detail::read_byte(cur));
            ++cur;
        }
        return std::optional<Event>{make(header, raw, Bytes(std::move(data)))};
    }

    /// Header, 0/1/2/4/8 argument bytes, payload.
    template <class It, class Sent>
    bool write(It& out, const Sent& end) const {
        if (!m_header.encode(out, end)) return false;
        if (!m_header.write_argument(m_raw, out, end)) return false;
        if (m_payload && !m_payload->write_to(out, end)) return false;
        return true;
    }

    std::size_t encoded_size() const {
        return 1 + m_header.argument_length() + (m_payload ? m_payload->size() : 0);
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    const Header& header() const { return m_header; }
    Major major() const { return m_header.major(); }
    AdditionalInfoFormat format() const { return m_header.format(); }
    LogicalType logical_type() const { return m_header.logical_type(); }
    std::uint64_t raw_value() const { return m_raw; }
    const std::optional<Bytes>& payload() const { return m_payload; }

    bool is_null() const { return m_header == Header::NULL_VALUE; }
    bool is_undefined() const { return m_header == Header::UNDEFINED; }
    bool is_break() const { return m_header == Header::BREAK; }
    bool is_indefinite_start() const { return m_header.is_start_of_indefinite(); }

    /// Integers, negative integers, tags and simple values.
    Result<BigInteger> as_big_integer() const {
        if (auto ok = check_integral(); !ok) {
            return ok.detail();
        }
        if (major() == Major::NEGATIVE_INTEGER) {
            return BigInteger::from_negative_argument(m_raw);
        }
        return BigInteger::from_unsigned(m_raw);
    }

    Result<std::int64_t> as_int64() const {
        auto big = as_big_integer();
        if (!big) {
            return big.detail();
        }
        auto v = big->to_int64();
        if (!v) {
            return make_error(CborError::ARITHMETIC_OVERFLOW, m_header.byte());
        }
        return *v;
    }

    Result<std::int32_t> as_int32() const {
        auto v = as_int64();
        if (!v) {
            return v.detail();
        }
        if (v.value() < std::numeric_limits<std::int32_t>::min()
            || v.value() > std::numeric_limits<std::int32_t>::max()) {
            return make_error(CborError::ARITHMETIC_OVERFLOW, m_header.byte());
        }
        return static_cast<std::int32_t>(v.value());
    }

    Result<std::uint64_t> as_uint64() const {
        if (auto ok = check_integral(); !ok) {
            return ok.detail();
        }
        if (major() == Major::NEGATIVE_INTEGER) {
            return make_error(CborError::ARITHMETIC_OVERFLOW, m_header.byte());
        }
        return m_raw;
    }

    /// Element count of strings/arrays, pair count of maps, 1 for tags;
    /// kIndefiniteCount for indefinite containers.
    Result<std::size_t> as_count() const {
        if (auto ok = m_header.assert_major({Major::BYTE_STRING, Major::TEXT_STRING,
                                             Major::ARRAY, Major::MAP, Major::TAG}); !ok) {
            return ok.detail();
        }
        if (major() == Major::TAG) {
            return std::size_t{1};
        }
        if (m_header.is_indefinite()) {
            return kIndefiniteCount;
        }
        if (m_raw >= kIndefiniteCount) {
            return make_error(CborError::ARITHMETIC_OVERFLOW, m_header.byte());
        }
        return static_cast<std::size_t>(m_raw);
    }

    Result<std::uint16_t> as_half_float_bits() const {
        if (auto ok = check_float(AdditionalInfoFormat::SHORT); !ok) {
            return ok.detail();
        }
        return static_cast<std::uint16_t>(m_raw);
    }

    Result<float> as_float() const {
        if (auto ok = check_float(AdditionalInfoFormat::INT); !ok) {
            return ok.detail();
        }
        return std::bit_cast<float>(static_cast<std::uint32_t>(m_raw));
    }

    Result<double> as_double() const {
        if (auto ok = check_float(AdditionalInfoFormat::LONG); !ok) {
            return ok.detail();
        }
        return std::bit_cast<double>(m_raw);
    }

    Result<bool> as_boolean() const {
        if (auto ok = m_header.assert_logical_type({LogicalType::BOOLEAN}); !ok) {
            return ok.detail();
        }
        return m_header == Header::TRUE_VALUE;
    }

    /// Any simple value, including false/true/null/undefined (20..23).
    Result<std::uint8_t> as_simple_value() const {
        if (auto ok = m_header.assert_major({Major::ETC}); !ok) {
            return ok.detail();
        }
        if (auto ok = m_header.assert_format({AdditionalInfoFormat::IMMEDIATE,
                                              AdditionalInfoFormat::BYTE}); !ok) {
            return ok.detail();
        }
        return static_cast<std::uint8_t>(m_raw);
    }

    /// Payload of a definite byte or text string.
    Result<Bytes> as_bytes() const {
        if (auto ok = m_header.assert_logical_type({LogicalType::BINARY_CHUNK,
                                                    LogicalType::TEXT_CHUNK}); !ok) {
            return ok.detail();
        }
        return *m_payload;
    }

    Result<std::string> as_text() const {
        if (auto ok = m_header.assert_logical_type({LogicalType::TEXT_CHUNK}); !ok) {
            return ok.detail();
        }
        return m_payload->as_utf8();
    }

    bool operator==(const DataEvent&) const = default;

    /// Header byte, then unsigned argument, then payload bytes.
    auto operator<=>(const DataEvent&) const = default;

private:
    static Header canonical_header(Major major, std::uint64_t value) {
        // Cannot fail for majors other than ETC.
        return Header::for_canonical_value(major, value).value();
    }

    static Header float_header(AdditionalInfoFormat format) {
        return Header::from_major_and_format(Major::ETC, format).value();
    }

    static Event of_string(Major major, Bytes bytes) {
        const std::uint64_t size = bytes.size();
        return make(canonical_header(major, size), size, std::move(bytes));
    }

    /// Reuses the singleton for single-byte-complete events.
    static Event make(Header header, std::uint64_t raw, std::optional<Bytes> payload = std::nullopt) {
        const bool empty_payload = !payload || payload->empty();
        if (empty_payload) {
            if (const Event& shared = singletons()[header.byte()]) {
                return shared;
            }
        }
        return std::make_shared<const DataEvent>(Token{}, header, raw, std::move(payload));
    }

    static Event singleton(std::uint8_t byte) {
        return singletons()[byte];
    }

    /// One shared instance per header byte that is complete on its own: every
    /// IMMEDIATE or INDEFINITE header except non-empty definite strings.
    static const std::array<Event, 256>& singletons() {
        static const std::array<Event, 256> table = [] {
            std::array<Event, 256> t{};
            for (std::size_t i = 0; i < t.size(); ++i) {
                const auto header = Header::from_byte(static_cast<std::uint8_t>(i));
                if (!header) {
                    continue;
                }
                const AdditionalInfoFormat format = header->format();
                if (format == AdditionalInfoFormat::INDEFINITE) {
                    t[i] = std::make_shared<const DataEvent>(Token{}, *header, 0, std::nullopt);
                } else if (format == AdditionalInfoFormat::IMMEDIATE) {
                    if (!header->is_followed_by_payload()) {
                        t[i] = std::make_shared<const DataEvent>(Token{}, *header, header->low_bits(), std::nullopt);
                    } else if (header->low_bits() == 0) {
                        t[i] = std::make_shared<const DataEvent>(Token{}, *header, 0, Bytes{});
                    }
                }
            }
            return t;
        }();
        return table;
    }

    Result<void> check_integral() const {
        if (auto ok = m_header.assert_major({Major::UNSIGNED_INTEGER, Major::NEGATIVE_INTEGER,
                                             Major::TAG, Major::ETC}); !ok) {
            return ok;
        }
        if (major() == Major::ETC) {
            return m_header.assert_format({AdditionalInfoFormat::IMMEDIATE, AdditionalInfoFormat::BYTE});
        }
        return {};
    }

    Result<void> check_float(AdditionalInfoFormat format) const {
        if (auto ok = m_header.assert_major({Major::ETC}); !ok) {
            return ok;
        }
        return m_header.assert_format({format});
    }
};

} // namespace CborCursor
