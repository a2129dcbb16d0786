#pragma once

#include <cstddef>
#include <cstdint>

#include "data_event.hpp"
#include "errors.hpp"
#include "generator.hpp"
#include "options.hpp"
#include "result.hpp"
#include "sink_concept.hpp"
#include "source_concept.hpp"

namespace CborCursor {

namespace transcode_detail {

template <class Source>
Result<Event> next_within_item(Source& source) {
    auto event = source.next();
    if (!event && event.error() == CborError::NO_ELEMENT) {
        return make_error(CborError::NOT_WELL_FORMED);
    }
    return event;
}

template <std::size_t MaxDepth, class Source, class Sink>
Result<void> copy_one(Source& source, Generator<Sink>& out, std::size_t depth) {
    if (depth > MaxDepth) {
        return make_error(CborError::NESTING_DEPTH_EXCEEDED);
    }
    auto next = depth == 0 ? source.next() : next_within_item(source);
    if (!next) {
        return next.detail();
    }
    const Event item = std::move(next).value();
    if (item->is_break()) {
        return make_error(CborError::UNEXPECTED_BREAK, item->header().byte());
    }
    if (!out.next(item)) {
        return make_error(out.getError());
    }

    switch (item->logical_type()) {
    case LogicalType::TAG:
        return copy_one<MaxDepth>(source, out, depth + 1);

    case LogicalType::START_ARRAY:
    case LogicalType::START_MAP: {
        const std::uint64_t per_entry = item->logical_type() == LogicalType::START_MAP ? 2 : 1;
        for (std::uint64_t i = 0; i < item->raw_value(); ++i) {
            for (std::uint64_t k = 0; k < per_entry; ++k) {
                if (auto ok = copy_one<MaxDepth>(source, out, depth + 1); !ok) return ok;
            }
        }
        return {};
    }

    case LogicalType::START_INDEFINITE_ARRAY:
    case LogicalType::START_INDEFINITE_MAP:
    case LogicalType::START_BINARY_CHUNKS:
    case LogicalType::START_TEXT_CHUNKS:
        while (true) {
            auto peeked = source.peek();
            if (!peeked) {
                if (peeked.error() == CborError::NO_ELEMENT) {
                    return make_error(CborError::NOT_WELL_FORMED);
                }
                return peeked.detail();
            }
            if (peeked.value()->is_break()) {
                if (auto consumed = source.next(); !consumed) return consumed.detail();
                if (!out.write_break()) return make_error(out.getError());
                return {};
            }
            if (item->major() == Major::BYTE_STRING || item->major() == Major::TEXT_STRING) {
                const DataEvent& chunk = *peeked.value();
                if (chunk.major() != item->major() || chunk.header().is_indefinite()) {
                    return make_error(CborError::NOT_WELL_FORMED, chunk.header().byte());
                }
            }
            if (auto ok = copy_one<MaxDepth>(source, out, depth + 1); !ok) return ok;
        }

    default:
        return {};
    }
}

} // namespace transcode_detail

/// Copies exactly one data item, children included, from `source` to `out`.
template <std::size_t MaxDepth = options::DefaultMaxNestingDepth, class Source, class Sink>
    requires source::EventSourceLike<Source> && sink::EventSinkLike<Sink>
Result<void> CopyItem(Source& source, Generator<Sink>& out) {
    return transcode_detail::copy_one<MaxDepth>(source, out, 0);
}

/// Forwards every event of `source` to `target` without interpreting structure.
template <class Source, class Sink>
    requires source::EventSourceLike<Source> && sink::EventSinkLike<Sink>
Result<void> CopyAll(Source& source, Sink& target) {
    while (true) {
        auto more = source.has_next();
        if (!more) {
            return more.detail();
        }
        if (!more.value()) {
            return {};
        }
        auto event = source.next();
        if (!event) {
            return event.detail();
        }
        if (!target.next(event.value())) {
            return make_error(target.getError());
        }
    }
}

} // namespace CborCursor
