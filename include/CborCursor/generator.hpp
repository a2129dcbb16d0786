#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <string_view>

#include "big_integer.hpp"
#include "bytes.hpp"
#include "data_event.hpp"
#include "errors.hpp"
#include "sink_concept.hpp"

namespace CborCursor {

/// Convenience writers over an event sink. Every writer builds the canonical
/// event and forwards it; nesting is the caller's business and is not checked.
/// Writers return false on failure and the first failure is kept in getError().
template <class Sink>
    requires sink::EventSinkLike<Sink>
class Generator {
    Sink& m_sink;
    CborError err_ = CborError::NO_ERROR;

    void setError(CborError e) {
        if (err_ == CborError::NO_ERROR) {
            err_ = e;
        }
    }

public:
    explicit Generator(Sink& sink): m_sink(sink) {}

    CborError getError() const {
        return err_ != CborError::NO_ERROR ? err_ : m_sink.getError();
    }

    Sink& output() { return m_sink; }

    bool next(const Event& event) {
        if (!m_sink.next(event)) {
            setError(m_sink.getError());
            return false;
        }
        return true;
    }

    // ========= Simple values =========

    bool write_boolean(bool value) { return next(DataEvent::of_boolean(value)); }
    bool write_null() { return next(DataEvent::of_null()); }
    bool write_undefined() { return next(DataEvent::of_undefined()); }

    bool write_simple_value(std::uint8_t value) {
        auto event = DataEvent::of_simple_value(value);
        if (!event) {
            setError(event.error());
            return false;
        }
        return next(event.value());
    }

    // ========= Integers =========

    bool write_integer(std::int64_t value) { return next(DataEvent::of_integer(value)); }
    bool write_unsigned_long(std::uint64_t value) { return next(DataEvent::of_unsigned(value)); }

    /// Writes -(argument + 1).
    bool write_negative_argument(std::uint64_t argument) {
        return next(DataEvent::of_negative_argument(argument));
    }

    bool write_big_integer(const BigInteger& value) { return next(DataEvent::of_big_integer(value)); }

    // ========= Floating point =========

    bool write_half_float(std::uint16_t bits) { return next(DataEvent::of_half_float_bits(bits)); }
    bool write_float(float value) { return next(DataEvent::of_float(value)); }
    bool write_double(double value) { return next(DataEvent::of_double(value)); }

    // ========= Strings =========

    bool write_bytes(const Bytes& bytes) { return next(DataEvent::of_bytes(bytes)); }

    /// One chunk per element, between a start-indefinite marker and a break.
    template <std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, const Bytes&>
    bool write_bytes(R&& chunks) {
        if (!next(DataEvent::start_indefinite_bytes())) return false;
        for (const Bytes& chunk : chunks) {
            if (!write_bytes(chunk)) return false;
        }
        return write_break();
    }

    bool write_text(std::string_view text) { return next(DataEvent::of_text(text)); }

    template <std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, std::string_view>
    bool write_text_stream(R&& chunks) {
        if (!next(DataEvent::start_indefinite_text())) return false;
        for (auto&& chunk : chunks) {
            if (!write_text(std::string_view(chunk))) return false;
        }
        return write_break();
    }

    // ========= Containers =========

    bool write_tag(std::uint64_t tag) { return next(DataEvent::of_tag(tag)); }

    bool write_start_array(std::uint64_t count) { return next(DataEvent::start_array(count)); }
    bool write_start_indefinite_array() { return next(DataEvent::start_indefinite_array()); }

    bool write_start_map(std::uint64_t pairs) { return next(DataEvent::start_map(pairs)); }
    bool write_start_indefinite_map() { return next(DataEvent::start_indefinite_map()); }

    bool write_break() { return next(DataEvent::of_break()); }
};

} // namespace CborCursor
