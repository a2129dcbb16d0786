#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "data_event.hpp"
#include "errors.hpp"
#include "result.hpp"
#include "sink_concept.hpp"
#include "source_concept.hpp"

namespace CborCursor {

/// In-memory event list. As a sink it records what a Generator pushes; as a
/// source it replays the recorded events in order.
class EventSequence {
    std::vector<Event> m_events;
    std::size_t m_position = 0;
    CborError err_ = CborError::NO_ERROR;

public:
    EventSequence() = default;
    explicit EventSequence(std::vector<Event> events): m_events(std::move(events)) {}

    // ========= Sink =========

    bool next(const Event& event) {
        if (!event) {
            if (err_ == CborError::NO_ERROR) {
                err_ = CborError::INVALID_ARGUMENT;
            }
            return false;
        }
        m_events.push_back(event);
        return true;
    }

    CborError getError() const { return err_; }

    // ========= Source =========

    Result<bool> has_next() {
        return m_position < m_events.size();
    }

    Result<Event> peek() {
        if (m_position >= m_events.size()) {
            return make_error(CborError::NO_ELEMENT);
        }
        return m_events[m_position];
    }

    Result<Event> next() {
        auto event = peek();
        if (event) {
            ++m_position;
        }
        return event;
    }

    /// Restarts replay from the first event.
    void rewind() { m_position = 0; }

    const std::vector<Event>& events() const { return m_events; }
    std::size_t size() const { return m_events.size(); }
    bool empty() const { return m_events.empty(); }
};

static_assert(sink::EventSinkLike<EventSequence>);
static_assert(source::EventSourceLike<EventSequence>);

} // namespace CborCursor
