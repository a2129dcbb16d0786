#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "data_event.hpp"

namespace CborCursor {

/// Null-tolerant view over an event: every accessor yields an empty optional
/// when the event is null and otherwise delegates to DataEvent.
class OptionalView {
    Event m_event;

    template <class T>
    Result<std::optional<T>> lift(Result<T> (DataEvent::*accessor)() const) const {
        if (m_event->is_null()) {
            return std::optional<T>{};
        }
        auto r = ((*m_event).*accessor)();
        if (!r) {
            return r.detail();
        }
        return std::optional<T>{std::move(r).value()};
    }

public:
    explicit OptionalView(Event event): m_event(std::move(event)) {}

    const Event& event() const { return m_event; }
    bool is_null() const { return m_event->is_null(); }

    Result<std::optional<bool>> as_boolean() const { return lift(&DataEvent::as_boolean); }
    Result<std::optional<std::int32_t>> as_int32() const { return lift(&DataEvent::as_int32); }
    Result<std::optional<std::int64_t>> as_int64() const { return lift(&DataEvent::as_int64); }
    Result<std::optional<std::uint64_t>> as_uint64() const { return lift(&DataEvent::as_uint64); }
    Result<std::optional<BigInteger>> as_big_integer() const { return lift(&DataEvent::as_big_integer); }
    Result<std::optional<std::size_t>> as_count() const { return lift(&DataEvent::as_count); }
    Result<std::optional<std::uint8_t>> as_simple_value() const { return lift(&DataEvent::as_simple_value); }
    Result<std::optional<std::uint16_t>> as_half_float_bits() const { return lift(&DataEvent::as_half_float_bits); }
    Result<std::optional<float>> as_float() const { return lift(&DataEvent::as_float); }
    Result<std::optional<double>> as_double() const { return lift(&DataEvent::as_double); }
    Result<std::optional<Bytes>> as_bytes() const { return lift(&DataEvent::as_bytes); }
    Result<std::optional<std::string>> as_text() const { return lift(&DataEvent::as_text); }
};

} // namespace CborCursor
