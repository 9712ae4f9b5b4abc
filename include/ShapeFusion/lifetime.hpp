#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

#include "io.hpp"

namespace ShapeFusion {

/// How a string or byte array extracted from the input may be used.
///
/// transient - valid only during the visitor call that receives it; copy to keep
/// owned     - moved into the visitor, which now owns an independent copy
/// borrowed  - points into the input buffer and stays valid as long as that
///             buffer does; zero copy
///
/// A deserializer offers borrowed only when the bytes are contiguous and
/// immutable in a buffer the caller keeps alive for the whole decode and for as
/// long as the decoded value is used.
enum class Flavor : std::uint8_t {
    transient,
    owned,
    borrowed
};

class FlavorSet {
    std::uint8_t m_bits = 0;
public:
    constexpr FlavorSet() = default;
    constexpr FlavorSet(std::initializer_list<Flavor> flavors) {
        for(Flavor f: flavors) insert(f);
    }
    constexpr FlavorSet& insert(Flavor f) {
        m_bits |= static_cast<std::uint8_t>(1u << static_cast<unsigned>(f));
        return *this;
    }
    constexpr bool contains(Flavor f) const {
        return (m_bits & (1u << static_cast<unsigned>(f))) != 0;
    }
    constexpr bool empty() const {
        return m_bits == 0;
    }
    constexpr bool operator==(const FlavorSet&) const = default;
};

/// Flavor a byte-iterator based deserializer can offer for in-place data.
template<class It>
constexpr Flavor in_place_flavor() {
    if constexpr (BorrowableByteIterator<It>) {
        return Flavor::borrowed;
    } else {
        return Flavor::transient;
    }
}

/// Owned byte array. Maps to the bytes shape, where a std::vector<std::uint8_t>
/// maps to a seq of u8.
class ByteBuf {
public:
    std::vector<std::uint8_t> data;

    constexpr ByteBuf() = default;
    constexpr explicit ByteBuf(std::vector<std::uint8_t> d): data(std::move(d)) {}
    constexpr ByteBuf(std::initializer_list<std::uint8_t> il): data(il) {}
    constexpr explicit ByteBuf(std::span<const std::uint8_t> s): data(s.begin(), s.end()) {}

    constexpr std::span<const std::uint8_t> view() const {
        return std::span<const std::uint8_t>(data.data(), data.size());
    }
    constexpr std::size_t size() const {
        return data.size();
    }
    constexpr bool operator==(const ByteBuf&) const = default;
};

} // namespace ShapeFusion
