#pragma once

#include <concepts>

#include "data_event.hpp"
#include "result.hpp"

namespace CborCursor {

namespace source {

/// EventSourceLike is the pull interface shared by Cursor and EventSequence:
/// anything that can stage one event of lookahead and hand events out in order.
/// The renderer and the transcoder are written against it.
template <typename S>
concept EventSourceLike = requires(S& source) {
    // true while another event is available; decode errors propagate
    { source.has_next() } -> std::same_as<Result<bool>>;

    // staged event, not consumed
    { source.peek() } -> std::same_as<Result<Event>>;

    // staged event, consumed
    { source.next() } -> std::same_as<Result<Event>>;
};

} // namespace source

} // namespace CborCursor
