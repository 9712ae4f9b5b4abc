#pragma once

#include <concepts>
#include <cstdint>
#include <cstddef>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "io.hpp"
#include "lifetime.hpp"

namespace ShapeFusion {


/// Forward-only byte reader shared by the binary formats. Every method returns
/// false when the input runs out; the caller decides which error that is.
template<class It, class Sent>
class ByteSource {
public:
    constexpr ByteSource(It first, Sent last): m_cur(first), m_end(last) {}

    /// Borrowing needs both a contiguous buffer and a way to check the
    /// remaining size before handing out a view.
    static constexpr bool can_borrow = BorrowableByteIterator<It> && std::sized_sentinel_for<Sent, It>;

    constexpr std::size_t pos() const {
        return m_pos;
    }
    constexpr bool at_end() const {
        return m_cur == m_end;
    }
    constexpr bool peek(std::uint8_t & b) const {
        if(m_cur == m_end) return false;
        b = static_cast<std::uint8_t>(*m_cur);
        return true;
    }
    constexpr bool read(std::uint8_t & b) {
        if(m_cur == m_end) return false;
        b = static_cast<std::uint8_t>(*m_cur);
        ++ m_cur;
        ++ m_pos;
        return true;
    }
    constexpr bool skip(std::uint64_t n) {
        std::uint8_t b;
        for(std::uint64_t i = 0; i < n; i ++) {
            if(!read(b)) return false;
        }
        return true;
    }

    template<class U>
    constexpr bool read_le(U & out, std::size_t n = sizeof(U)) {
        U v = 0;
        for(std::size_t i = 0; i < n; i ++) {
            std::uint8_t b;
            if(!read(b)) return false;
            v |= static_cast<U>(static_cast<U>(b) << (8 * i));
        }
        out = v;
        return true;
    }

    template<class U>
    constexpr bool read_be(U & out, std::size_t n = sizeof(U)) {
        U v = 0;
        for(std::size_t i = 0; i < n; i ++) {
            std::uint8_t b;
            if(!read(b)) return false;
            v = static_cast<U>((v << 8) | b);
        }
        out = v;
        return true;
    }

    /// Hands the next len bytes to f(std::string_view, Flavor). The view points
    /// into the input when it can be borrowed, into a private copy otherwise.
    template<class F>
    constexpr bool take_str(std::uint64_t len, F && f) {
        if constexpr (can_borrow) {
            if(!std::is_constant_evaluated() || std::same_as<std::iter_value_t<It>, char>) {
                if(static_cast<std::uint64_t>(m_end - m_cur) < len) return false;
                std::string_view view(in_place_chars(), static_cast<std::size_t>(len));
                m_cur += static_cast<std::iter_difference_t<It>>(len);
                m_pos += static_cast<std::size_t>(len);
                return f(view, Flavor::borrowed);
            }
        }
        if(!copy_out(len)) return false;
        m_text.assign(m_bytes.begin(), m_bytes.end());
        return f(std::string_view(m_text), Flavor::transient);
    }

    /// Same for byte arrays, f(std::span<const std::uint8_t>, Flavor).
    template<class F>
    constexpr bool take_bytes(std::uint64_t len, F && f) {
        if constexpr (can_borrow) {
            if(!std::is_constant_evaluated() || std::same_as<std::iter_value_t<It>, std::uint8_t>) {
                if(static_cast<std::uint64_t>(m_end - m_cur) < len) return false;
                std::span<const std::uint8_t> view(in_place_bytes(), static_cast<std::size_t>(len));
                m_cur += static_cast<std::iter_difference_t<It>>(len);
                m_pos += static_cast<std::size_t>(len);
                return f(view, Flavor::borrowed);
            }
        }
        if(!copy_out(len)) return false;
        return f(std::span<const std::uint8_t>(m_bytes), Flavor::transient);
    }

    /// Appends the next len bytes to out.
    constexpr bool append(std::uint64_t len, std::vector<std::uint8_t> & out) {
        for(std::uint64_t i = 0; i < len; i ++) {
            std::uint8_t b;
            if(!read(b)) return false;
            out.push_back(b);
        }
        return true;
    }

private:
    It          m_cur;
    Sent        m_end;
    std::size_t m_pos = 0;
    std::vector<std::uint8_t> m_bytes;
    std::string m_text;

    constexpr bool copy_out(std::uint64_t len) {
        m_bytes.clear();
        return append(len, m_bytes);
    }

    constexpr const char * in_place_chars() const {
        if constexpr (std::same_as<std::iter_value_t<It>, char>) {
            return std::to_address(m_cur);
        } else {
            return io_detail::char_address(m_cur);
        }
    }
    constexpr const std::uint8_t * in_place_bytes() const {
        if constexpr (std::same_as<std::iter_value_t<It>, std::uint8_t>) {
            return std::to_address(m_cur);
        } else {
            return io_detail::byte_address(m_cur);
        }
    }
};


/// Byte writer shared by the binary formats; counts what it wrote.
template<class It, class Sent>
class ByteSink {
public:
    constexpr ByteSink(It first, Sent last): m_cur(first), m_end(last) {}

    constexpr std::size_t pos() const {
        return m_pos;
    }
    constexpr It current() const {
        return m_cur;
    }
    constexpr bool put(std::uint8_t b) {
        if(m_cur == m_end) return false;
        *m_cur = b;
        ++ m_cur;
        ++ m_pos;
        return true;
    }
    constexpr bool put(std::span<const std::uint8_t> data) {
        for(std::uint8_t b: data) {
            if(!put(b)) return false;
        }
        return true;
    }
    constexpr bool put(std::string_view data) {
        for(char c: data) {
            if(!put(static_cast<std::uint8_t>(c))) return false;
        }
        return true;
    }
    template<class U>
    constexpr bool put_le(U v, std::size_t n = sizeof(U)) {
        for(std::size_t i = 0; i < n; i ++) {
            if(!put(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu))) return false;
        }
        return true;
    }
    template<class U>
    constexpr bool put_be(U v, std::size_t n = sizeof(U)) {
        for(std::size_t i = 0; i < n; i ++) {
            if(!put(static_cast<std::uint8_t>((v >> (8 * (n - 1 - i))) & 0xFFu))) return false;
        }
        return true;
    }

private:
    It          m_cur;
    Sent        m_end;
    std::size_t m_pos = 0;
};

} // namespace ShapeFusion
