#pragma once

#include <cstdint>
#include <format>
#include <iterator>
#include <string>
#include <string_view>

#include "data_event.hpp"
#include "errors.hpp"
#include "header.hpp"

namespace CborCursor {

namespace error_formatting_detail {

template <class E>
std::string alternatives_to_string(std::uint32_t mask, std::size_t count) {
    std::string out;
    for (std::size_t i = 0; i < count; ++i) {
        if (mask & (std::uint32_t{1} << i)) {
            if (!out.empty()) out += ", ";
            out += to_string(static_cast<E>(i));
        }
    }
    return out;
}

inline std::string expected_to_string(const ErrorDetail& detail) {
    switch (detail.expectation) {
    case ExpectationKind::major:
        return alternatives_to_string<Major>(detail.expected, 8);
    case ExpectationKind::logical_type:
        return alternatives_to_string<LogicalType>(detail.expected, static_cast<std::size_t>(LogicalType::BREAK) + 1);
    case ExpectationKind::format:
        return alternatives_to_string<AdditionalInfoFormat>(detail.expected, static_cast<std::size_t>(AdditionalInfoFormat::INDEFINITE) + 1);
    case ExpectationKind::none:
        break;
    }
    return {};
}

} // namespace error_formatting_detail

/// "INCORRECT_MAJOR_TYPE (type mismatch): header 0x1a UNSIGNED_INTEGER:INT, expected one of [TAG]"
inline std::string ErrorToString(const ErrorDetail& detail) {
    std::string out = std::format("{} ({})", error_to_string(detail.code),
                                  category_to_string(error_category(detail.code)));
    if (detail.header_byte) {
        std::format_to(std::back_inserter(out), ": header 0x{:02x}", *detail.header_byte);
        if (auto h = actual_header(detail)) {
            std::format_to(std::back_inserter(out), " {}:{}", to_string(h->major()), to_string(h->format()));
        }
    }
    if (detail.expectation != ExpectationKind::none) {
        std::format_to(std::back_inserter(out), ", expected one of [{}]",
                       error_formatting_detail::expected_to_string(detail));
    }
    return out;
}

/// Debug text of an event: "[DataEvent f5 ETC:IMMEDIATE TRUE]".
inline std::string EventToString(const DataEvent& event) {
    std::string value;
    switch (event.logical_type()) {
    case LogicalType::INTEGRAL:
        value = event.as_big_integer().value().to_string();
        break;
    case LogicalType::BOOLEAN:
        value = event.as_boolean().value() ? "TRUE" : "FALSE";
        break;
    case LogicalType::NULL_VALUE:
        value = "NULL";
        break;
    case LogicalType::UNDEFINED:
        value = "UNDEFINED";
        break;
    case LogicalType::BREAK:
        value = "BREAK";
        break;
    case LogicalType::BINARY_CHUNK:
    case LogicalType::TEXT_CHUNK:
        value = std::format("len={}", event.raw_value());
        break;
    default:
        if (event.header().is_indefinite()) {
            value = "INDEFINITE";
        } else {
            value = std::format("{}", event.raw_value());
        }
        break;
    }
    return std::format("[DataEvent {:02x} {}:{} {}]", event.header().byte(), to_string(event.major()),
                       to_string(event.format()), value);
}

} // namespace CborCursor
