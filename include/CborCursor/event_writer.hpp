#pragma once

#include <cstddef>
#include <iterator>
#include <utility>

#include "data_event.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "sink_concept.hpp"

namespace CborCursor {

/// Event sink that encodes every event it receives to an output iterator.
/// Bounded buffers pass their end as the sentinel; growing sinks such as
/// std::back_inserter leave it unreachable.
template <class It, class Sent = std::unreachable_sentinel_t>
class EventWriter {
public:
    using iterator_type = It;
    using error_type    = CborError;

    explicit EventWriter(It first, Sent last = Sent{})
        : m_current(std::move(first)), end_(std::move(last))
    {}

    // ========= Introspection =========

    error_type getError() const { return err_; }

    iterator_type& current() { return m_current; }

    std::size_t bytesWritten() const { return m_bytesWritten; }

    // ========= Events =========

    bool next(const Event& event) {
        if (!event) {
            setError(CborError::INVALID_ARGUMENT);
            return false;
        }
        return next(*event);
    }

    bool next(const DataEvent& event) {
        if (err_ != CborError::NO_ERROR) {
            return false;
        }
        if (!event.write(m_current, end_)) {
            setError(CborError::SINK_ERROR);
            return false;
        }
        m_bytesWritten += event.encoded_size();
        return true;
    }

private:
    It m_current;
    Sent end_;
    CborError err_ = CborError::NO_ERROR;
    std::size_t m_bytesWritten = 0;

    void setError(CborError e) {
        if (err_ == CborError::NO_ERROR) {
            err_ = e;
        }
    }
};

static_assert(sink::EventSinkLike<EventWriter<std::uint8_t*, std::uint8_t*>>);

} // namespace CborCursor
