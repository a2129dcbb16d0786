#pragma once

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "big_integer.hpp"
#include "bytes.hpp"
#include "cursor.hpp"
#include "data_event.hpp"
#include "errors.hpp"
#include "event_sequence.hpp"
#include "options.hpp"
#include "result.hpp"
#include "source_concept.hpp"

namespace CborCursor {

namespace diagnostic_detail {

/// Exact binary16 -> binary32 widening, used for display only.
inline float half_to_float(std::uint16_t h) {
    const bool negative = (h >> 15) & 0x1;
    const int exp = (h >> 10) & 0x1F;
    const int frac = h & 0x3FF;

    float result;
    if (exp == 0) {
        result = std::ldexp(static_cast<float>(frac), -24); // subnormal: frac * 2^-24
    } else if (exp == 0x1F) {
        result = frac == 0 ? std::numeric_limits<float>::infinity()
                           : std::numeric_limits<float>::quiet_NaN();
    } else {
        result = std::ldexp(static_cast<float>(frac | 0x400), exp - 25); // bias 15, 10 fraction bits
    }
    return negative ? -result : result;
}

/// Shortest round-trip text, always with a fraction: 1.5, 100000.0, 1.0e+20.
template <class F>
void append_floating(std::string& out, F value) {
    if (std::isnan(value)) {
        out += "NaN";
        return;
    }
    if (std::isinf(value)) {
        out += value < 0 ? "-Infinity" : "Infinity";
        return;
    }
    const F magnitude = std::fabs(value);
    const bool fixed = magnitude == 0 || (magnitude >= F(1e-3) && magnitude < F(1e7));

    char buf[64];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value,
                                         fixed ? std::chars_format::fixed : std::chars_format::scientific);
    if (ec != std::errc{}) {
        std::format_to(std::back_inserter(out), "{}", value);
        return;
    }
    const std::string_view text(buf, static_cast<std::size_t>(ptr - buf));
    const std::size_t exp = text.find('e');
    const std::string_view mantissa = text.substr(0, exp);
    out += mantissa;
    if (mantissa.find('.') == std::string_view::npos) {
        out += ".0";
    }
    if (exp != std::string_view::npos) {
        out += text.substr(exp);
    }
}

inline void append_text(std::string& out, const Bytes& payload) {
    out.push_back('"');
    for (std::uint8_t c : payload) {
        switch (c) {
        case 0x08: out += "\\b"; break;
        case 0x0C: out += "\\f"; break;
        case 0x0A: out += "\\n"; break;
        case 0x0D: out += "\\r"; break;
        case 0x09: out += "\\t"; break;
        case 0x22: out += "\\\""; break;
        default:
            if (c < 0x20) {
                std::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned>(c));
            } else {
                out.push_back(static_cast<char>(c));
            }
            break;
        }
    }
    out.push_back('"');
}

inline void append_hex(std::string& out, const Bytes& payload) {
    out += "h'";
    out += payload.to_hex();
    out.push_back('\'');
}

} // namespace diagnostic_detail

/// Rebuilds nested structure from a flat event source and writes it as
/// diagnostic notation.
template <class Source, std::size_t MaxDepth = options::DefaultMaxNestingDepth>
    requires source::EventSourceLike<Source>
class DiagnosticRenderer {
    Source& m_source;
    std::string m_out;

public:
    explicit DiagnosticRenderer(Source& source): m_source(source) {}

    /// Renders exactly one data item.
    Result<void> process() {
        return process_item(0);
    }

    /// Renders every remaining item, separated by ", ".
    Result<void> process_all() {
        bool first = true;
        while (true) {
            auto more = m_source.has_next();
            if (!more) {
                return more.detail();
            }
            if (!more.value()) {
                return {};
            }
            if (!first) {
                m_out += ", ";
            }
            first = false;
            if (auto ok = process_item(0); !ok) {
                return ok;
            }
        }
    }

    const std::string& text() const { return m_out; }
    std::string take_text() { return std::move(m_out); }

private:
    Result<Event> next_within_item() {
        auto event = m_source.next();
        if (!event && event.error() == CborError::NO_ELEMENT) {
            return make_error(CborError::NOT_WELL_FORMED);
        }
        return event;
    }

    Result<bool> at_break() {
        auto event = m_source.peek();
        if (!event) {
            if (event.error() == CborError::NO_ELEMENT) {
                return make_error(CborError::NOT_WELL_FORMED);
            }
            return event.detail();
        }
        if (event.value()->is_break()) {
            if (auto consumed = m_source.next(); !consumed) {
                return consumed.detail();
            }
            return true;
        }
        return false;
    }

    Result<void> process_item(std::size_t depth) {
        if (depth > MaxDepth) {
            return make_error(CborError::NESTING_DEPTH_EXCEEDED);
        }
        auto next = depth == 0 ? m_source.next() : next_within_item();
        if (!next) {
            if (next.error() == CborError::NO_ELEMENT) {
                return make_error(CborError::NOT_WELL_FORMED);
            }
            return next.detail();
        }
        const Event event = std::move(next).value();
        const DataEvent& e = *event;

        switch (e.logical_type()) {
        case LogicalType::INTEGRAL:
            if (e.major() == Major::UNSIGNED_INTEGER) {
                std::format_to(std::back_inserter(m_out), "{}", e.raw_value());
            } else {
                m_out.push_back('-');
                m_out += BigInteger::argument_plus_one_to_string(e.raw_value());
            }
            return {};

        case LogicalType::BOOLEAN:
            m_out += e.header() == Header::TRUE_VALUE ? "true" : "false";
            return {};
        case LogicalType::NULL_VALUE:
            m_out += "null";
            return {};
        case LogicalType::UNDEFINED:
            m_out += "undefined";
            return {};
        case LogicalType::OTHER_SIMPLE:
            std::format_to(std::back_inserter(m_out), "simple({})", e.raw_value());
            return {};

        case LogicalType::HALF_FLOAT:
            // float-shortest text of the widened value, not the exact binary16 digits
            diagnostic_detail::append_floating(m_out, diagnostic_detail::half_to_float(static_cast<std::uint16_t>(e.raw_value())));
            return {};
        case LogicalType::FLOAT:
            diagnostic_detail::append_floating(m_out, e.as_float().value());
            return {};
        case LogicalType::DOUBLE:
            diagnostic_detail::append_floating(m_out, e.as_double().value());
            return {};

        case LogicalType::TAG: {
            std::format_to(std::back_inserter(m_out), "{}(", e.raw_value());
            if (auto ok = process_item(depth + 1); !ok) return ok;
            m_out.push_back(')');
            return {};
        }

        case LogicalType::BINARY_CHUNK:
            diagnostic_detail::append_hex(m_out, *e.payload());
            return {};
        case LogicalType::TEXT_CHUNK:
            diagnostic_detail::append_text(m_out, *e.payload());
            return {};

        case LogicalType::START_BINARY_CHUNKS:
        case LogicalType::START_TEXT_CHUNKS:
            return process_chunks(e.major());

        case LogicalType::START_ARRAY: {
            m_out.push_back('[');
            for (std::uint64_t i = 0; i < e.raw_value(); ++i) {
                if (i != 0) m_out += ", ";
                if (auto ok = process_item(depth + 1); !ok) return ok;
            }
            m_out.push_back(']');
            return {};
        }

        case LogicalType::START_MAP: {
            m_out.push_back('{');
            for (std::uint64_t i = 0; i < e.raw_value(); ++i) {
                if (i != 0) m_out += ", ";
                if (auto ok = process_pair(depth + 1); !ok) return ok;
            }
            m_out.push_back('}');
            return {};
        }

        case LogicalType::START_INDEFINITE_ARRAY:
        case LogicalType::START_INDEFINITE_MAP: {
            const bool is_map = e.logical_type() == LogicalType::START_INDEFINITE_MAP;
            m_out += is_map ? "{_ " : "[_ ";
            for (bool first = true;; first = false) {
                auto done = at_break();
                if (!done) return done.detail();
                if (done.value()) break;
                if (!first) m_out += ", ";
                auto ok = is_map ? process_pair(depth + 1) : process_item(depth + 1);
                if (!ok) return ok;
            }
            m_out.push_back(is_map ? '}' : ']');
            return {};
        }

        case LogicalType::BREAK:
            return make_error(CborError::UNEXPECTED_BREAK, e.header().byte());
        }
        return {};
    }

    Result<void> process_pair(std::size_t depth) {
        if (auto ok = process_item(depth); !ok) return ok;
        m_out += ": ";
        return process_item(depth);
    }

    Result<void> process_chunks(Major major) {
        m_out += "(_ ";
        for (bool first = true;; first = false) {
            auto done = at_break();
            if (!done) return done.detail();
            if (done.value()) break;

            auto next = next_within_item();
            if (!next) return next.detail();
            const DataEvent& chunk = *next.value();
            if (chunk.major() != major || chunk.header().is_indefinite()) {
                return make_error(CborError::UNEXPECTED_EVENT_IN_CHUNKS, chunk.header().byte());
            }
            if (!first) m_out += ", ";
            if (major == Major::BYTE_STRING) {
                diagnostic_detail::append_hex(m_out, *chunk.payload());
            } else {
                diagnostic_detail::append_text(m_out, *chunk.payload());
            }
        }
        m_out.push_back(')');
        return {};
    }
};

/// Renders one data item from `source`.
template <class Source>
    requires source::EventSourceLike<Source>
Result<std::string> RenderDiagnostic(Source& source) {
    DiagnosticRenderer renderer(source);
    if (auto ok = renderer.process(); !ok) {
        return ok.detail();
    }
    return renderer.take_text();
}

/// Renders every data item encoded in `bytes`, separated by ", ".
inline Result<std::string> RenderDiagnostic(std::span<const std::uint8_t> bytes) {
    Cursor cursor(bytes.begin(), bytes.end());
    DiagnosticRenderer renderer(cursor);
    if (auto ok = renderer.process_all(); !ok) {
        return ok.detail();
    }
    return renderer.take_text();
}

/// Generator sink that collects events and renders them on finish().
class DiagnosticSink {
    EventSequence m_events;

public:
    bool next(const Event& event) { return m_events.next(event); }
    CborError getError() const { return m_events.getError(); }

    /// Renders everything pushed so far; the collected events are kept.
    Result<std::string> finish() {
        m_events.rewind();
        DiagnosticRenderer renderer(m_events);
        if (auto ok = renderer.process_all(); !ok) {
            return ok.detail();
        }
        return renderer.take_text();
    }
};

static_assert(sink::EventSinkLike<DiagnosticSink>);

} // namespace CborCursor
