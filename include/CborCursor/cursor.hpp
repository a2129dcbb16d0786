#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "data_event.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "options.hpp"
#include "result.hpp"
#include "source_concept.hpp"

namespace CborCursor {

/// Pull parser over a byte range with exactly one event of lookahead.
///
/// Typed readers peek, check, extract and only then advance: on a type
/// mismatch or an overflow nothing is consumed and the same event is still
/// staged. Any other error is sticky: it is recorded in getError() and every
/// later call returns it.
template <class It, class Sent = It, std::size_t MaxDepth = options::DefaultMaxNestingDepth>
    requires ByteSentinelFor<It, Sent>
class Cursor {
public:
    using iterator_type = It;

    Cursor(It first, Sent last)
        : m_cur(std::move(first)), m_end(std::move(last)) {}

    // ========== Introspection ==========

    /// Position of the next undecoded byte (past the staged event, if any).
    iterator_type current() const {
        return m_cur;
    }

    CborError getError() const {
        return m_error.code;
    }

    const ErrorDetail& errorDetail() const {
        return m_error;
    }

    // ========== Event access ==========

    Result<bool> has_next() {
        if (failed()) {
            return m_error;
        }
        if (m_staged) {
            return true;
        }
        auto decoded = DataEvent::decode(m_cur, m_end);
        if (!decoded) {
            return fail(decoded.detail());
        }
        if (!decoded.value()) {
            return false;
        }
        m_staged = std::move(*decoded.value());
        return true;
    }

    /// Staged event, decoding one if needed; NO_ELEMENT at end of stream.
    Result<Event> peek() {
        auto more = has_next();
        if (!more) {
            return more.detail();
        }
        if (!more.value()) {
            return make_error(CborError::NO_ELEMENT);
        }
        return *m_staged;
    }

    Result<Event> next() {
        auto event = peek();
        if (event) {
            m_staged.reset();
        }
        return event;
    }

    // ========== Simple values ==========

    Result<bool> read_boolean() {
        return read_typed<bool>([](const DataEvent& e) { return e.as_boolean(); });
    }

    Result<void> read_null() {
        return read_marker(LogicalType::NULL_VALUE);
    }

    Result<void> read_undefined() {
        return read_marker(LogicalType::UNDEFINED);
    }

    Result<std::uint8_t> read_simple_value() {
        return read_typed<std::uint8_t>([](const DataEvent& e) { return e.as_simple_value(); });
    }

    // ========== Integers ==========

    Result<std::int32_t> read_integer() {
        return read_typed<std::int32_t>([](const DataEvent& e) -> Result<std::int32_t> {
            if (auto ok = assert_integer(e); !ok) return ok.detail();
            return e.as_int32();
        });
    }

    Result<std::int64_t> read_long() {
        return read_typed<std::int64_t>([](const DataEvent& e) -> Result<std::int64_t> {
            if (auto ok = assert_integer(e); !ok) return ok.detail();
            return e.as_int64();
        });
    }

    Result<BigInteger> read_big_integer() {
        return read_typed<BigInteger>([](const DataEvent& e) -> Result<BigInteger> {
            if (auto ok = assert_integer(e); !ok) return ok.detail();
            return e.as_big_integer();
        });
    }

    /// Argument of a major-0 integer.
    Result<std::uint64_t> read_unsigned_long() {
        return read_raw(Major::UNSIGNED_INTEGER);
    }

    /// Argument n of a major-1 integer whose value is -(n+1).
    Result<std::uint64_t> read_negative_argument() {
        return read_raw(Major::NEGATIVE_INTEGER);
    }

    Result<std::uint64_t> read_tag() {
        return read_raw(Major::TAG);
    }

    // ========== Floating point ==========

    Result<std::uint16_t> read_half_float() {
        return read_typed<std::uint16_t>([](const DataEvent& e) { return e.as_half_float_bits(); });
    }

    Result<float> read_float() {
        return read_typed<float>([](const DataEvent& e) { return e.as_float(); });
    }

    Result<double> read_double() {
        return read_typed<double>([](const DataEvent& e) { return e.as_double(); });
    }

    // ========== Containers ==========

    Result<std::size_t> read_start_array() {
        return read_definite_count(LogicalType::START_ARRAY);
    }

    Result<void> read_start_indefinite_array() {
        return read_marker(LogicalType::START_INDEFINITE_ARRAY);
    }

    /// Definite count, or an empty optional for an indefinite array.
    Result<std::optional<std::size_t>> read_array_count() {
        return read_possibly_indefinite_count(LogicalType::START_ARRAY, LogicalType::START_INDEFINITE_ARRAY);
    }

    Result<std::size_t> read_start_map() {
        return read_definite_count(LogicalType::START_MAP);
    }

    Result<void> read_start_indefinite_map() {
        return read_marker(LogicalType::START_INDEFINITE_MAP);
    }

    Result<std::optional<std::size_t>> read_map_count() {
        return read_possibly_indefinite_count(LogicalType::START_MAP, LogicalType::START_INDEFINITE_MAP);
    }

    Result<void> read_break() {
        return read_marker(LogicalType::BREAK);
    }

    // ========== Strings ==========

    /// Calls `visit(const Bytes&)` for a definite string of `major`, or for each
    /// chunk of an indefinite one, consuming up to and including the break.
    template <class Visitor>
    Result<void> consume_chunks(Major major, Visitor&& visit) {
        if (major != Major::BYTE_STRING && major != Major::TEXT_STRING) {
            return make_error(CborError::INVALID_ARGUMENT);
        }
        auto first = peek();
        if (!first) {
            return first.detail();
        }
        const Event start = first.value();
        if (auto ok = start->header().assert_major({major}); !ok) {
            return ok;
        }
        m_staged.reset();
        if (!start->header().is_indefinite()) {
            std::invoke(visit, *start->payload());
            return {};
        }
        while (true) {
            auto more = has_next();
            if (!more) {
                return more.detail();
            }
            if (!more.value()) {
                return fail(make_error(CborError::NOT_WELL_FORMED, start->header().byte()));
            }
            const Event chunk = *m_staged;
            if (chunk->is_break()) {
                m_staged.reset();
                return {};
            }
            if (chunk->major() != major || chunk->header().is_indefinite()) {
                return fail(make_error(CborError::NOT_WELL_FORMED, chunk->header().byte()));
            }
            m_staged.reset();
            std::invoke(visit, *chunk->payload());
        }
    }

    /// Left fold over the chunks of a string: acc = fold(std::move(acc), chunk).
    template <class T, class Fold>
    Result<T> collect_chunks(Major major, T seed, Fold&& fold) {
        T acc = std::move(seed);
        auto consumed = consume_chunks(major, [&](const Bytes& chunk) {
            acc = std::invoke(fold, std::move(acc), chunk);
        });
        if (!consumed) {
            return consumed.detail();
        }
        return acc;
    }

    Result<Bytes> read_bytes() {
        auto data = collect_chunks(Major::BYTE_STRING, std::vector<std::uint8_t>{}, append_chunk);
        if (!data) {
            return data.detail();
        }
        return Bytes(std::move(data).value());
    }

    /// Concatenated text; INVALID_UTF8 is reported after the whole string has
    /// been consumed.
    Result<std::string> read_text() {
        auto data = collect_chunks(Major::TEXT_STRING, std::vector<std::uint8_t>{}, append_chunk);
        if (!data) {
            return data.detail();
        }
        return Bytes(std::move(data).value()).as_utf8();
    }

    // ========== Utility Operations ==========

    /// Consumes one complete data item, children included.
    Result<void> skip_item() {
        return skip_one(0);
    }

private:
    It m_cur;
    Sent m_end;

    std::optional<Event> m_staged;
    ErrorDetail m_error{};

    // ---- Helpers ----

    bool failed() const {
        return m_error.code != CborError::NO_ERROR;
    }

    ErrorDetail fail(ErrorDetail e) {
        if (!failed()) {
            m_error = e;
        }
        return e;
    }

    static std::vector<std::uint8_t> append_chunk(std::vector<std::uint8_t> acc, const Bytes& chunk) {
        acc.insert(acc.end(), chunk.begin(), chunk.end());
        return acc;
    }

    static Result<void> assert_integer(const DataEvent& e) {
        return e.header().assert_major({Major::UNSIGNED_INTEGER, Major::NEGATIVE_INTEGER});
    }

    template <class T, class Extract>
    Result<T> read_typed(Extract&& extract) {
        auto event = peek();
        if (!event) {
            return event.detail();
        }
        Result<T> r = std::invoke(extract, *event.value());
        if (r) {
            m_staged.reset();
        }
        return r;
    }

    Result<void> read_marker(LogicalType type) {
        auto event = peek();
        if (!event) {
            return event.detail();
        }
        if (auto ok = event.value()->header().assert_logical_type({type}); !ok) {
            return ok;
        }
        m_staged.reset();
        return {};
    }

    Result<std::uint64_t> read_raw(Major major) {
        return read_typed<std::uint64_t>([major](const DataEvent& e) -> Result<std::uint64_t> {
            if (auto ok = e.header().assert_major({major}); !ok) return ok.detail();
            return e.raw_value();
        });
    }

    Result<std::size_t> read_definite_count(LogicalType type) {
        return read_typed<std::size_t>([type](const DataEvent& e) -> Result<std::size_t> {
            if (auto ok = e.header().assert_logical_type({type}); !ok) return ok.detail();
            return e.as_count();
        });
    }

    Result<std::optional<std::size_t>> read_possibly_indefinite_count(LogicalType definite, LogicalType indefinite) {
        using Count = std::optional<std::size_t>;
        return read_typed<Count>([definite, indefinite](const DataEvent& e) -> Result<Count> {
            if (auto ok = e.header().assert_logical_type({definite, indefinite}); !ok) return ok.detail();
            if (e.logical_type() == indefinite) {
                return Count{};
            }
            auto count = e.as_count();
            if (!count) return count.detail();
            return Count{count.value()};
        });
    }

    /// next() inside an item: running out of events there is malformed input.
    Result<Event> next_within_item() {
        auto event = next();
        if (!event && event.error() == CborError::NO_ELEMENT) {
            return fail(make_error(CborError::NOT_WELL_FORMED));
        }
        return event;
    }

    Result<bool> at_break() {
        auto event = peek();
        if (!event) {
            if (event.error() == CborError::NO_ELEMENT) {
                return fail(make_error(CborError::NOT_WELL_FORMED));
            }
            return event.detail();
        }
        return event.value()->is_break();
    }

    Result<void> skip_one(std::size_t depth) {
        if (depth > MaxDepth) {
            return fail(make_error(CborError::NESTING_DEPTH_EXCEEDED));
        }
        auto event = depth == 0 ? next() : next_within_item();
        if (!event) {
            return event.detail();
        }
        const Event item = std::move(event).value();

        switch (item->logical_type()) {
        case LogicalType::BREAK:
            return fail(make_error(CborError::UNEXPECTED_BREAK, item->header().byte()));

        case LogicalType::TAG:
            return skip_one(depth + 1);

        case LogicalType::START_ARRAY:
            for (std::uint64_t i = 0; i < item->raw_value(); ++i) {
                if (auto ok = skip_one(depth + 1); !ok) return ok;
            }
            return {};

        case LogicalType::START_MAP:
            for (std::uint64_t i = 0; i < item->raw_value(); ++i) {
                if (auto ok = skip_one(depth + 1); !ok) return ok; // key
                if (auto ok = skip_one(depth + 1); !ok) return ok; // value
            }
            return {};

        case LogicalType::START_INDEFINITE_ARRAY:
        case LogicalType::START_INDEFINITE_MAP:
            while (true) {
                auto done = at_break();
                if (!done) return done.detail();
                if (done.value()) {
                    m_staged.reset();
                    return {};
                }
                if (auto ok = skip_one(depth + 1); !ok) return ok;
                if (item->logical_type() == LogicalType::START_INDEFINITE_MAP) {
                    if (auto ok = skip_one(depth + 1); !ok) return ok;
                }
            }

        case LogicalType::START_BINARY_CHUNKS:
        case LogicalType::START_TEXT_CHUNKS:
            while (true) {
                auto chunk = next_within_item();
                if (!chunk) return chunk.detail();
                const DataEvent& c = *chunk.value();
                if (c.is_break()) {
                    return {};
                }
                if (c.major() != item->major() || c.header().is_indefinite()) {
                    return fail(make_error(CborError::NOT_WELL_FORMED, c.header().byte()));
                }
            }

        default:
            return {};
        }
    }
};

static_assert(source::EventSourceLike<Cursor<const std::uint8_t*, const std::uint8_t*>>);

} // namespace CborCursor
