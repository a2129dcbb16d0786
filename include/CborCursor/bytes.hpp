#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "io.hpp"
#include "result.hpp"

namespace CborCursor {

namespace bytes_detail {

constexpr int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

inline constexpr char kHexDigits[] = "0123456789abcdef";

/// Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF.
constexpr bool is_valid_utf8(std::span<const std::uint8_t> s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const std::uint8_t c = s[i];
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1; cp = c & 0x1F; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2; cp = c & 0x0F; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3; cp = c & 0x07; min_cp = 0x10000;
        } else {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const std::uint8_t cc = s[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace bytes_detail

/// Immutable byte sequence used for string payloads.
class Bytes {
    std::vector<std::uint8_t> m_data;

public:
    Bytes() = default;
    explicit Bytes(std::vector<std::uint8_t> data): m_data(std::move(data)) {}
    Bytes(std::initializer_list<std::uint8_t> data): m_data(data) {}
    explicit Bytes(std::span<const std::uint8_t> data): m_data(data.begin(), data.end()) {}

    static Bytes from_utf8(std::string_view text) {
        return Bytes(std::vector<std::uint8_t>(text.begin(), text.end()));
    }

    /// Parses hex digits, ignoring spaces: "bf 63 46" or "bf6346".
    static Result<Bytes> from_hex(std::string_view hex) {
        std::vector<std::uint8_t> out;
        out.reserve(hex.size() / 2);
        int high = -1;
        for (char c : hex) {
            if (c == ' ') {
                continue;
            }
            const int v = bytes_detail::hex_digit_value(c);
            if (v < 0) {
                return make_error(CborError::INVALID_ARGUMENT);
            }
            if (high < 0) {
                high = v;
            } else {
                out.push_back(static_cast<std::uint8_t>((high << 4) | v));
                high = -1;
            }
        }
        if (high >= 0) {
            return make_error(CborError::INVALID_ARGUMENT);
        }
        return Bytes(std::move(out));
    }

    std::size_t size() const { return m_data.size(); }
    bool empty() const { return m_data.empty(); }
    const std::uint8_t* data() const { return m_data.data(); }
    std::uint8_t operator[](std::size_t i) const { return m_data[i]; }

    std::vector<std::uint8_t>::const_iterator begin() const { return m_data.begin(); }
    std::vector<std::uint8_t>::const_iterator end() const { return m_data.end(); }

    std::span<const std::uint8_t> span() const { return m_data; }

    Bytes concat(const Bytes& other) const {
        std::vector<std::uint8_t> joined;
        joined.reserve(m_data.size() + other.m_data.size());
        joined.insert(joined.end(), m_data.begin(), m_data.end());
        joined.insert(joined.end(), other.m_data.begin(), other.m_data.end());
        return Bytes(std::move(joined));
    }

    std::string to_hex() const {
        std::string out;
        out.reserve(m_data.size() * 2);
        for (std::uint8_t b : m_data) {
            out.push_back(bytes_detail::kHexDigits[b >> 4]);
            out.push_back(bytes_detail::kHexDigits[b & 0x0F]);
        }
        return out;
    }

    /// Raw bytes as characters, without validation.
    std::string_view as_chars() const {
        return std::string_view(reinterpret_cast<const char*>(m_data.data()), m_data.size());
    }

    bool is_valid_utf8() const {
        return bytes_detail::is_valid_utf8(m_data);
    }

    Result<std::string> as_utf8() const {
        if (!is_valid_utf8()) {
            return make_error(CborError::INVALID_UTF8);
        }
        return std::string(as_chars());
    }

    template <class It, class Sent>
    bool write_to(It& out, const Sent& end) const {
        for (std::uint8_t b : m_data) {
            if (!io_detail::write_byte(out, end, b)) {
                return false;
            }
        }
        return true;
    }

    bool operator==(const Bytes&) const = default;
    auto operator<=>(const Bytes&) const = default;
};

} // namespace CborCursor
