#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace CborCursor {

/// Exact value of any CBOR integer, -2^64 .. 2^64-1. Stored the way the wire
/// stores it: a sign and the unsigned argument, value = negative ? -(arg+1) : arg.
class BigInteger {
    bool m_negative = false;
    std::uint64_t m_argument = 0;

    constexpr BigInteger(bool negative, std::uint64_t argument)
        : m_negative(negative), m_argument(argument) {}

public:
    constexpr BigInteger() = default;

    static constexpr BigInteger from_unsigned(std::uint64_t value) {
        return BigInteger(false, value);
    }
    static constexpr BigInteger from_negative_argument(std::uint64_t argument) {
        return BigInteger(true, argument);
    }
    static constexpr BigInteger from_int64(std::int64_t value) {
        if (value >= 0) {
            return BigInteger(false, static_cast<std::uint64_t>(value));
        }
        return BigInteger(true, static_cast<std::uint64_t>(-(value + 1)));
    }

    constexpr bool is_negative() const { return m_negative; }
    constexpr std::uint64_t argument() const { return m_argument; }

    constexpr std::optional<std::int64_t> to_int64() const {
        constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (m_argument > max) {
            return std::nullopt;
        }
        const auto a = static_cast<std::int64_t>(m_argument);
        return m_negative ? -a - 1 : a;
    }

    std::string to_string() const {
        if (!m_negative) {
            return std::to_string(m_argument);
        }
        return "-" + argument_plus_one_to_string(m_argument);
    }

    /// Decimal text of n + 1 without overflowing at n = 2^64-1.
    static std::string argument_plus_one_to_string(std::uint64_t n) {
        if (n == std::numeric_limits<std::uint64_t>::max()) {
            return "18446744073709551616";
        }
        return std::to_string(n + 1);
    }

    constexpr bool operator==(const BigInteger&) const = default;

    constexpr std::strong_ordering operator<=>(const BigInteger& other) const {
        if (m_negative != other.m_negative) {
            return m_negative ? std::strong_ordering::less : std::strong_ordering::greater;
        }
        if (m_negative) {
            return other.m_argument <=> m_argument;
        }
        return m_argument <=> other.m_argument;
    }
};

} // namespace CborCursor
