#pragma once

#include <cstdint>
#include <iterator>

namespace CborCursor {

// 1) Iterator you can:
//    - read as *it   (a byte: char, unsigned char, std::uint8_t or std::byte)
//    - advance as it++ / ++it
template <class It>
concept ByteInputIterator =
    std::input_iterator<It> &&
    requires(It it) { static_cast<std::uint8_t>(*it); };

// 2) Matching "end" type you can:
//    - compare as it == end / it != end
template <class It, class Sent>
concept ByteSentinelFor =
    ByteInputIterator<It> &&
    std::sentinel_for<Sent, It>;

// 1) Iterator you can:
//    - write a byte as *it = b
//    - advance as it++ / ++it
template <class It>
concept ByteOutputIterator =
    std::output_iterator<It, std::uint8_t>;

// 2) Matching "end" type for bounded output buffers;
//    std::unreachable_sentinel_t for growing sinks such as back_inserter.
template <class Sent, class It>
concept ByteSentinelForOut =
    std::sentinel_for<Sent, It>;

namespace io_detail {

template <class It>
constexpr std::uint8_t read_byte(It& it) {
    return static_cast<std::uint8_t>(*it);
}

template <class It, class Sent>
constexpr bool write_byte(It& it, const Sent& end, std::uint8_t b) {
    if (it == end) {
        return false;
    }
    *it = b;
    ++it;
    return true;
}

} // namespace io_detail

} // namespace CborCursor
