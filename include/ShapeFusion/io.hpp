#pragma once

#include <cstdint>
#include <cstddef>
#include <iterator>
#include <memory>
#include <type_traits>

namespace ShapeFusion {

// 1) Iterator you can:
//    - read as *it   (convertible to a byte)
//    - advance as it++ / ++it
template <class It>
concept ByteInputIterator =
    std::input_iterator<It> &&
    std::convertible_to<std::iter_reference_t<It>, std::uint8_t> &&
    sizeof(std::iter_value_t<It>) == 1;

// 2) Matching "end" type you can:
//    - compare as it == end / it != end
template <class It, class Sent>
concept ByteSentinelFor =
    ByteInputIterator<It> &&
    std::sentinel_for<Sent, It>;

// Iterator over a byte container that keeps all bytes in place for its whole
// lifetime. Only such input may hand out borrowed strings and byte arrays.
template <class It>
concept BorrowableByteIterator =
    ByteInputIterator<It> &&
    std::contiguous_iterator<It>;

template <class It>
concept ByteOutputIterator =
    std::output_iterator<It, std::uint8_t>;

template <class Sent, class It>
concept ByteSentinelForOut =
    std::sentinel_for<Sent, It>;

/// Unbounded output: a back_insert_iterator never runs out of room.
struct unbounded_sentinel {
    template<class It>
    friend constexpr bool operator==(const It&, unbounded_sentinel) {
        return false;
    }
};

namespace io_detail {

template<BorrowableByteIterator It>
constexpr const char * char_address(It it) {
    return reinterpret_cast<const char*>(std::to_address(it));
}

template<BorrowableByteIterator It>
constexpr const std::uint8_t * byte_address(It it) {
    return reinterpret_cast<const std::uint8_t*>(std::to_address(it));
}

} // namespace io_detail

} // namespace ShapeFusion
