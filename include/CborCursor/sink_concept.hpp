#pragma once

#include <concepts>

#include "data_event.hpp"
#include "errors.hpp"

namespace CborCursor {

namespace sink {

/// EventSinkLike is the push interface a Generator writes to: one call per
/// event, false on failure with the first failure kept in getError().
template <typename S>
concept EventSinkLike = requires(S& sink, const Event& event) {
    { sink.next(event) } -> std::same_as<bool>;
    { sink.getError() } -> std::same_as<CborError>;
};

} // namespace sink

} // namespace CborCursor
