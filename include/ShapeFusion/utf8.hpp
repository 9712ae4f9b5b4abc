#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace ShapeFusion {
namespace utf8 {

constexpr bool is_scalar_value(char32_t c) {
    return c <= 0x10FFFF && !(c >= 0xD800 && c <= 0xDFFF);
}

/// Encodes one scalar value; returns the number of bytes written (0 if c is not a scalar value).
constexpr std::size_t encode(char32_t c, char (&out)[4]) {
    if(!is_scalar_value(c)) {
        return 0;
    }
    if(c < 0x80) {
        out[0] = static_cast<char>(c);
        return 1;
    } else if(c < 0x800) {
        out[0] = static_cast<char>(0xC0 | (c >> 6));
        out[1] = static_cast<char>(0x80 | (c & 0x3F));
        return 2;
    } else if(c < 0x10000) {
        out[0] = static_cast<char>(0xE0 | (c >> 12));
        out[1] = static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out[2] = static_cast<char>(0x80 | (c & 0x3F));
        return 3;
    } else {
        out[0] = static_cast<char>(0xF0 | (c >> 18));
        out[1] = static_cast<char>(0x80 | ((c >> 12) & 0x3F));
        out[2] = static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out[3] = static_cast<char>(0x80 | (c & 0x3F));
        return 4;
    }
}

/// Decodes the scalar value starting at s[pos]; advances pos. Returns false on
/// malformed, overlong or surrogate sequences.
constexpr bool decode_one(std::string_view s, std::size_t & pos, char32_t & out) {
    if(pos >= s.size()) return false;
    const std::uint8_t b0 = static_cast<std::uint8_t>(s[pos]);
    std::size_t n;
    char32_t cp;
    if(b0 < 0x80) {
        out = b0;
        pos ++;
        return true;
    } else if((b0 & 0xE0) == 0xC0) {
        n = 1; cp = b0 & 0x1F;
    } else if((b0 & 0xF0) == 0xE0) {
        n = 2; cp = b0 & 0x0F;
    } else if((b0 & 0xF8) == 0xF0) {
        n = 3; cp = b0 & 0x07;
    } else {
        return false;
    }
    if(pos + n >= s.size()) {
        return false;
    }
    for(std::size_t i = 1; i <= n; i ++) {
        const std::uint8_t b = static_cast<std::uint8_t>(s[pos + i]);
        if((b & 0xC0) != 0x80) return false;
        cp = (cp << 6) | (b & 0x3F);
    }
    constexpr char32_t minByLength[4] = {0, 0x80, 0x800, 0x10000};
    if(cp < minByLength[n] || !is_scalar_value(cp)) {
        return false;
    }
    out = cp;
    pos += n + 1;
    return true;
}

constexpr bool validate(std::string_view s) {
    std::size_t pos = 0;
    char32_t c{};
    while(pos < s.size()) {
        if(!decode_one(s, pos, c)) return false;
    }
    return true;
}

/// True if s holds exactly one scalar value; stores it in out.
constexpr bool single_char(std::string_view s, char32_t & out) {
    std::size_t pos = 0;
    return decode_one(s, pos, out) && pos == s.size();
}

} // namespace utf8
} // namespace ShapeFusion
