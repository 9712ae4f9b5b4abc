#pragma once

#include <cstddef>
#include <string_view>

namespace ShapeFusion {

/// Compile-time string usable as a template argument: field keys, variant
/// names, struct names.
template <std::size_t N>
struct ConstString {
    char chars[N + 1] = {};

    constexpr ConstString(const char (&literal)[N + 1]) {
        for(std::size_t i = 0; i <= N; i ++) {
            chars[i] = literal[i];
        }
    }

    constexpr std::size_t size() const {
        return N;
    }
    constexpr std::string_view view() const {
        return std::string_view(chars, N);
    }
    /// No control characters; keys end up verbatim in text formats.
    constexpr bool printable() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(static_cast<unsigned char>(chars[i]) < 0x20) return false;
        }
        return true;
    }
};

template <std::size_t N>
ConstString(const char (&)[N]) -> ConstString<N - 1>;

} // namespace ShapeFusion
