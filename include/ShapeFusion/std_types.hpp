#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "mapping.hpp"
#include "containers.hpp"
#include "lifetime.hpp"
#include "utf8.hpp"

namespace ShapeFusion {

namespace std_types_detail {

template<class T>
concept CharacterType = std::same_as<T, char> || std::same_as<T, wchar_t> ||
                        std::same_as<T, char8_t> || std::same_as<T, char16_t> ||
                        std::same_as<T, char32_t>;

template<class T>
concept SignedInteger = std::signed_integral<T> && !CharacterType<T> && sizeof(T) <= 8;

template<class T>
concept UnsignedInteger = std::unsigned_integral<T> && !CharacterType<T> &&
                          !std::same_as<T, bool> && sizeof(T) <= 8;

template<class T>
constexpr Shape integer_shape() {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return Shape::I8;
        else if constexpr (sizeof(T) == 2) return Shape::I16;
        else if constexpr (sizeof(T) == 4) return Shape::I32;
        else return Shape::I64;
    } else {
        if constexpr (sizeof(T) == 1) return Shape::U8;
        else if constexpr (sizeof(T) == 2) return Shape::U16;
        else if constexpr (sizeof(T) == 4) return Shape::U32;
        else return Shape::U64;
    }
}

template<class T>
struct IntegerVisitor {
    static constexpr std::string_view expecting = "an integer that fits the target type";
    T & out;

    template<class X>
    constexpr bool store(X x, Shape got, DeserializationContext & ctx) {
        if(std::in_range<T>(x)) {
            out = static_cast<T>(x);
            return true;
        }
        return ctx.invalidValue(got, expecting);
    }
    constexpr bool visit_i64(std::int64_t x, DeserializationContext & ctx) {
        return store(x, Shape::I64, ctx);
    }
    constexpr bool visit_u64(std::uint64_t x, DeserializationContext & ctx) {
        return store(x, Shape::U64, ctx);
    }
};

template<class T>
struct WideIntegerVisitor {
    static constexpr std::string_view expecting = "a 128-bit integer";
    T & out;

    constexpr bool visit_i64(std::int64_t x, DeserializationContext & ctx) {
        if constexpr (std::same_as<T, u128>) {
            if(x < 0) return ctx.invalidValue(Shape::I64, expecting);
        }
        out = static_cast<T>(x);
        return true;
    }
    constexpr bool visit_u64(std::uint64_t x, DeserializationContext &) {
        out = static_cast<T>(x);
        return true;
    }
    constexpr bool visit_i128(i128 x, DeserializationContext & ctx) {
        if constexpr (std::same_as<T, u128>) {
            if(x < 0) return ctx.invalidValue(Shape::I128, expecting);
        }
        out = static_cast<T>(x);
        return true;
    }
    constexpr bool visit_u128(u128 x, DeserializationContext & ctx) {
        if constexpr (std::same_as<T, i128>) {
            if((x >> 127) != 0) {
                return ctx.invalidValue(Shape::U128, expecting);
            }
        }
        out = static_cast<T>(x);
        return true;
    }
};

template<class T>
struct FloatVisitor {
    static constexpr std::string_view expecting = "a floating point number";
    T & out;

    constexpr bool visit_f64(double x, DeserializationContext &) {
        out = static_cast<T>(x);
        return true;
    }
    constexpr bool visit_i64(std::int64_t x, DeserializationContext &) {
        out = static_cast<T>(x);
        return true;
    }
    constexpr bool visit_u64(std::uint64_t x, DeserializationContext &) {
        out = static_cast<T>(x);
        return true;
    }
};

struct BoolVisitor {
    static constexpr std::string_view expecting = "a boolean";
    bool & out;
    constexpr bool visit_bool(bool b, DeserializationContext &) {
        out = b;
        return true;
    }
};

struct CharVisitor {
    static constexpr std::string_view expecting = "a character";
    char32_t & out;
    constexpr bool visit_char(char32_t c, DeserializationContext &) {
        out = c;
        return true;
    }
    constexpr bool visit_str(std::string_view s, DeserializationContext & ctx) {
        if(!utf8::single_char(s, out)) {
            return ctx.invalidValue(Shape::String, expecting);
        }
        return true;
    }
};

struct StringVisitor {
    static constexpr std::string_view expecting = "a string";
    std::string & out;
    constexpr bool visit_str(std::string_view s, DeserializationContext &) {
        out.assign(s.begin(), s.end());
        return true;
    }
    constexpr bool visit_string(std::string && s, DeserializationContext &) {
        out = std::move(s);
        return true;
    }
};

struct BorrowedStrVisitor {
    static constexpr std::string_view expecting = "a borrowed string";
    std::string_view & out;
    constexpr bool visit_borrowed_str(std::string_view s, DeserializationContext &) {
        out = s;
        return true;
    }
};

struct ByteBufVisitor {
    static constexpr std::string_view expecting = "a byte array";
    ByteBuf & out;
    constexpr bool visit_bytes(std::span<const std::uint8_t> b, DeserializationContext &) {
        out.data.assign(b.begin(), b.end());
        return true;
    }
    constexpr bool visit_byte_buf(std::vector<std::uint8_t> && b, DeserializationContext &) {
        out.data = std::move(b);
        return true;
    }
    // formats without a native byte string write them as a seq of u8
    template<class A>
    constexpr bool visit_seq(A & seq, DeserializationContext &) {
        out.data.clear();
        std::uint8_t b = 0;
        while(true) {
            switch(seq.next_element(b)) {
            case stream_read_result::value: out.data.push_back(b); break;
            case stream_read_result::end: return true;
            case stream_read_result::error: return false;
            }
        }
    }
};

struct BorrowedBytesVisitor {
    static constexpr std::string_view expecting = "a borrowed byte array";
    std::span<const std::uint8_t> & out;
    constexpr bool visit_borrowed_bytes(std::span<const std::uint8_t> b, DeserializationContext &) {
        out = b;
        return true;
    }
};

template<class T>
struct OptionalVisitor {
    static constexpr std::string_view expecting = "an optional value";
    std::optional<T> & out;

    constexpr bool visit_none(DeserializationContext &) {
        out.reset();
        return true;
    }
    template<class D>
    constexpr bool visit_some(D & d, DeserializationContext &) {
        out.emplace();
        return ShapeFusion::deserialize(*out, d);
    }
};

template<class T>
struct UniquePtrVisitor {
    static constexpr std::string_view expecting = "an optional value";
    std::unique_ptr<T> & out;

    constexpr bool visit_none(DeserializationContext &) {
        out.reset();
        return true;
    }
    template<class D>
    constexpr bool visit_some(D & d, DeserializationContext &) {
        out = std::make_unique<T>();
        return ShapeFusion::deserialize(*out, d);
    }
};

struct UnitVisitor {
    static constexpr std::string_view expecting = "unit";
    constexpr bool visit_unit(DeserializationContext &) {
        return true;
    }
};

template<class C>
struct SeqVisitor {
    static constexpr std::string_view expecting = "a sequence";
    static constexpr ShapeSet shapes{Shape::Seq};
    C & out;

    template<class A>
    constexpr bool visit_seq(A & seq, DeserializationContext &) {
        containers::seq_write_cursor<C> cursor{out};
        cursor.reset();
        cursor.reserve(seq.size_hint());
        while(true) {
            switch(seq.next_element(cursor.get_slot())) {
            case stream_read_result::value: break;
            case stream_read_result::end: return true;
            case stream_read_result::error: return false;
            }
            if(cursor.finalize_item() == stream_write_result::error) {
                return false;
            }
        }
    }
};

template<class M>
struct MapVisitor {
    static constexpr std::string_view expecting = "a map";
    static constexpr ShapeSet shapes{Shape::Map};
    M & out;

    template<class A>
    constexpr bool visit_map(A & map, DeserializationContext & ctx) {
        containers::map_write_cursor<M> cursor{out};
        cursor.reset();
        while(true) {
            switch(map.next_key(cursor.key_ref())) {
            case stream_read_result::value: break;
            case stream_read_result::end: return true;
            case stream_read_result::error: return false;
            }
            if(!map.next_value(cursor.value_ref())) {
                return false;
            }
            if(cursor.finalize_pair() != stream_write_result::value_processed) {
                return ctx.withError(DeserializeError::DUPLICATE_KEY);
            }
        }
    }
};

/// Pulls exactly N elements; fewer is an INVALID_LENGTH error, leftovers are
/// rejected by the deserializer once the visitor returns.
template<std::size_t N, class ElementFn>
constexpr bool pull_fixed(auto & seq, DeserializationContext & ctx, std::string_view expecting, ElementFn && fn) {
    for(std::size_t i = 0; i < N; i ++) {
        switch(fn(seq, i)) {
        case stream_read_result::value: break;
        case stream_read_result::end: return ctx.invalidLength(i, expecting);
        case stream_read_result::error: return false;
        }
    }
    return true;
}

template<class T, std::size_t N>
struct ArrayVisitor {
    static constexpr std::string_view expecting = "a fixed-size array";
    static constexpr ShapeSet shapes{Shape::Tuple};
    T (&out)[N];

    template<class A>
    constexpr bool visit_seq(A & seq, DeserializationContext & ctx) {
        return pull_fixed<N>(seq, ctx, expecting, [this](auto & s, std::size_t i) {
            return s.next_element(out[i]);
        });
    }
};

template<class Tup>
struct TupleVisitor {
    static constexpr std::string_view expecting = "a tuple";
    static constexpr ShapeSet shapes{Shape::Tuple, Shape::TupleVariant};
    Tup & out;

    template<class A, std::size_t... I>
    constexpr bool pull(A & seq, DeserializationContext & ctx, std::index_sequence<I...>) {
        std::size_t got = 0;
        stream_read_result r = stream_read_result::value;
        // stops at the first element that is not produced
        auto step = [&]<std::size_t J>() {
            if(r == stream_read_result::value) {
                r = seq.next_element(std::get<J>(out));
                if(r == stream_read_result::value) got ++;
            }
        };
        (step.template operator()<I>(), ...);
        if(r == stream_read_result::error) return false;
        if(got != sizeof...(I)) return ctx.invalidLength(got, expecting);
        return true;
    }

    template<class A>
    constexpr bool visit_seq(A & seq, DeserializationContext & ctx) {
        return pull(seq, ctx, std::make_index_sequence<std::tuple_size_v<Tup>>{});
    }
};

template<class Tup, class S, std::size_t... I>
constexpr bool serialize_tuple_elements(const Tup & t, S & s, typename S::SeqFrame & fr, std::index_sequence<I...>) {
    return (s.serialize_element(fr, std::get<I>(t)) && ...);
}

} // namespace std_types_detail


// ========== Primitives ==========

template<>
struct Mapping<bool> {
    static constexpr Shape shape = Shape::Bool;
    template<class S>
    static constexpr bool serialize(const bool & v, S & s) {
        return s.serialize_bool(v);
    }
    template<class D>
    static constexpr bool deserialize(bool & v, D & d) {
        std_types_detail::BoolVisitor vis{v};
        return d.deserialize_bool(vis);
    }
};

template<class T>
    requires std_types_detail::SignedInteger<T> || std_types_detail::UnsignedInteger<T>
struct Mapping<T> {
    static constexpr Shape shape = std_types_detail::integer_shape<T>();

    template<class S>
    static constexpr bool serialize(const T & v, S & s) {
        if constexpr (shape == Shape::I8) return s.serialize_i8(static_cast<std::int8_t>(v));
        else if constexpr (shape == Shape::I16) return s.serialize_i16(static_cast<std::int16_t>(v));
        else if constexpr (shape == Shape::I32) return s.serialize_i32(static_cast<std::int32_t>(v));
        else if constexpr (shape == Shape::I64) return s.serialize_i64(static_cast<std::int64_t>(v));
        else if constexpr (shape == Shape::U8) return s.serialize_u8(static_cast<std::uint8_t>(v));
        else if constexpr (shape == Shape::U16) return s.serialize_u16(static_cast<std::uint16_t>(v));
        else if constexpr (shape == Shape::U32) return s.serialize_u32(static_cast<std::uint32_t>(v));
        else return s.serialize_u64(static_cast<std::uint64_t>(v));
    }
    template<class D>
    static constexpr bool deserialize(T & v, D & d) {
        std_types_detail::IntegerVisitor<T> vis{v};
        if constexpr (shape == Shape::I8) return d.deserialize_i8(vis);
        else if constexpr (shape == Shape::I16) return d.deserialize_i16(vis);
        else if constexpr (shape == Shape::I32) return d.deserialize_i32(vis);
        else if constexpr (shape == Shape::I64) return d.deserialize_i64(vis);
        else if constexpr (shape == Shape::U8) return d.deserialize_u8(vis);
        else if constexpr (shape == Shape::U16) return d.deserialize_u16(vis);
        else if constexpr (shape == Shape::U32) return d.deserialize_u32(vis);
        else return d.deserialize_u64(vis);
    }
};

template<>
struct Mapping<i128> {
    static constexpr Shape shape = Shape::I128;
    template<class S>
    static constexpr bool serialize(const i128 & v, S & s) {
        return s.serialize_i128(v);
    }
    template<class D>
    static constexpr bool deserialize(i128 & v, D & d) {
        std_types_detail::WideIntegerVisitor<i128> vis{v};
        return d.deserialize_i128(vis);
    }
};

template<>
struct Mapping<u128> {
    static constexpr Shape shape = Shape::U128;
    template<class S>
    static constexpr bool serialize(const u128 & v, S & s) {
        return s.serialize_u128(v);
    }
    template<class D>
    static constexpr bool deserialize(u128 & v, D & d) {
        std_types_detail::WideIntegerVisitor<u128> vis{v};
        return d.deserialize_u128(vis);
    }
};

template<>
struct Mapping<float> {
    static constexpr Shape shape = Shape::F32;
    template<class S>
    static constexpr bool serialize(const float & v, S & s) {
        return s.serialize_f32(v);
    }
    template<class D>
    static constexpr bool deserialize(float & v, D & d) {
        std_types_detail::FloatVisitor<float> vis{v};
        return d.deserialize_f32(vis);
    }
};

template<>
struct Mapping<double> {
    static constexpr Shape shape = Shape::F64;
    template<class S>
    static constexpr bool serialize(const double & v, S & s) {
        return s.serialize_f64(v);
    }
    template<class D>
    static constexpr bool deserialize(double & v, D & d) {
        std_types_detail::FloatVisitor<double> vis{v};
        return d.deserialize_f64(vis);
    }
};

template<>
struct Mapping<char32_t> {
    static constexpr Shape shape = Shape::Char;
    template<class S>
    static constexpr bool serialize(const char32_t & v, S & s) {
        return s.serialize_char(v);
    }
    template<class D>
    static constexpr bool deserialize(char32_t & v, D & d) {
        std_types_detail::CharVisitor vis{v};
        return d.deserialize_char(vis);
    }
};


// ========== Text and binary ==========

template<>
struct Mapping<std::string> {
    static constexpr Shape shape = Shape::String;
    template<class S>
    static constexpr bool serialize(const std::string & v, S & s) {
        return s.serialize_str(std::string_view(v));
    }
    template<class D>
    static constexpr bool deserialize(std::string & v, D & d) {
        std_types_detail::StringVisitor vis{v};
        return d.deserialize_string(vis);
    }
};

/// Zero-copy: only decodes from input that can lend its bytes.
template<>
struct Mapping<std::string_view> {
    static constexpr Shape shape = Shape::String;
    template<class S>
    static constexpr bool serialize(const std::string_view & v, S & s) {
        return s.serialize_str(v);
    }
    template<class D>
    static constexpr bool deserialize(std::string_view & v, D & d) {
        std_types_detail::BorrowedStrVisitor vis{v};
        return d.deserialize_str(vis);
    }
};

template<>
struct Mapping<ByteBuf> {
    static constexpr Shape shape = Shape::Bytes;
    template<class S>
    static constexpr bool serialize(const ByteBuf & v, S & s) {
        return s.serialize_bytes(v.view());
    }
    template<class D>
    static constexpr bool deserialize(ByteBuf & v, D & d) {
        std_types_detail::ByteBufVisitor vis{v};
        return d.deserialize_byte_buf(vis);
    }
};

/// Zero-copy: only decodes from input that can lend its bytes.
template<>
struct Mapping<std::span<const std::uint8_t>> {
    static constexpr Shape shape = Shape::Bytes;
    template<class S>
    static constexpr bool serialize(const std::span<const std::uint8_t> & v, S & s) {
        return s.serialize_bytes(v);
    }
    template<class D>
    static constexpr bool deserialize(std::span<const std::uint8_t> & v, D & d) {
        std_types_detail::BorrowedBytesVisitor vis{v};
        return d.deserialize_bytes(vis);
    }
};

/// Paths are UTF-8 strings on every supported platform; no per-platform
/// representation is used.
template<>
struct Mapping<std::filesystem::path> {
    static constexpr Shape shape = Shape::String;
    template<class S>
    static bool serialize(const std::filesystem::path & v, S & s) {
        const std::string str = v.generic_string();
        return s.serialize_str(std::string_view(str));
    }
    template<class D>
    static bool deserialize(std::filesystem::path & v, D & d) {
        std::string str;
        std_types_detail::StringVisitor vis{str};
        if(!d.deserialize_string(vis)) {
            return false;
        }
        v = std::filesystem::path(str);
        return true;
    }
};


// ========== Option and unit ==========

template<class T>
struct Mapping<std::optional<T>> {
    static constexpr Shape shape = Shape::Option;
    template<class S>
    static constexpr bool serialize(const std::optional<T> & v, S & s) {
        if(v) {
            return s.serialize_some(*v);
        }
        return s.serialize_none();
    }
    template<class D>
    static constexpr bool deserialize(std::optional<T> & v, D & d) {
        std_types_detail::OptionalVisitor<T> vis{v};
        return d.deserialize_option(vis);
    }
};

template<class T>
struct Mapping<std::unique_ptr<T>> {
    static constexpr Shape shape = Shape::Option;
    template<class S>
    static constexpr bool serialize(const std::unique_ptr<T> & v, S & s) {
        if(v) {
            return s.serialize_some(*v);
        }
        return s.serialize_none();
    }
    template<class D>
    static constexpr bool deserialize(std::unique_ptr<T> & v, D & d) {
        std_types_detail::UniquePtrVisitor<T> vis{v};
        return d.deserialize_option(vis);
    }
};

template<>
struct Mapping<std::monostate> {
    static constexpr Shape shape = Shape::Unit;
    template<class S>
    static constexpr bool serialize(const std::monostate &, S & s) {
        return s.serialize_unit();
    }
    template<class D>
    static constexpr bool deserialize(std::monostate &, D & d) {
        std_types_detail::UnitVisitor vis;
        return d.deserialize_unit(vis);
    }
};


// ========== Variable sequences ==========

template<class C>
    requires containers::SeqReadable<C> && containers::SeqWritable<C> &&
             (!containers::StringLike<C>) && (!containers::MapLike<C>)
struct Mapping<C> {
    static constexpr Shape shape = Shape::Seq;

    template<class S>
    static constexpr bool serialize(const C & v, S & s) {
        containers::seq_read_cursor<C> cursor{v};
        typename S::SeqFrame fr;
        if(!s.begin_seq(cursor.size_hint(), fr)) {
            return false;
        }
        while(cursor.read_more() == stream_read_result::value) {
            if(!s.serialize_element(fr, cursor.get())) {
                return false;
            }
        }
        return s.end(fr);
    }
    template<class D>
    static constexpr bool deserialize(C & v, D & d) {
        std_types_detail::SeqVisitor<C> vis{v};
        return d.deserialize_seq(vis);
    }
};

template<class M>
    requires containers::MapLike<M> && requires(M& m) {
        containers::map_write_cursor<M>{m};
    }
struct Mapping<M> {
    static constexpr Shape shape = Shape::Map;

    template<class S>
    static constexpr bool serialize(const M & v, S & s) {
        containers::map_read_cursor<M> cursor{v};
        typename S::MapFrame fr;
        if(!s.begin_map(cursor.size(), fr)) {
            return false;
        }
        while(cursor.read_more() == stream_read_result::value) {
            if(!serializer::serialize_entry(s, fr, cursor.get_key(), cursor.get_value())) {
                return false;
            }
        }
        return s.end(fr);
    }
    template<class D>
    static constexpr bool deserialize(M & v, D & d) {
        std_types_detail::MapVisitor<M> vis{v};
        return d.deserialize_map(vis);
    }
};


// ========== Fixed sequences ==========

template<class T, std::size_t N>
struct Mapping<T[N]> {
    static constexpr Shape shape = Shape::Tuple;

    template<class S>
    static constexpr bool serialize(const T (&v)[N], S & s) {
        typename S::SeqFrame fr;
        if(!s.begin_tuple(N, fr)) {
            return false;
        }
        for(std::size_t i = 0; i < N; i ++) {
            if(!s.serialize_element(fr, v[i])) {
                return false;
            }
        }
        return s.end(fr);
    }
    template<class D>
    static constexpr bool deserialize(T (&v)[N], D & d) {
        std_types_detail::ArrayVisitor<T, N> vis{v};
        return d.deserialize_tuple(N, vis);
    }
};

template<class T, std::size_t N>
struct Mapping<std::array<T, N>> {
    static constexpr Shape shape = Shape::Tuple;

    template<class S>
    static constexpr bool serialize(const std::array<T, N> & v, S & s) {
        typename S::SeqFrame fr;
        if(!s.begin_tuple(N, fr)) {
            return false;
        }
        for(const T & e: v) {
            if(!s.serialize_element(fr, e)) {
                return false;
            }
        }
        return s.end(fr);
    }
    template<class D>
    static constexpr bool deserialize(std::array<T, N> & v, D & d) {
        std_types_detail::TupleVisitor<std::array<T, N>> vis{v};
        return d.deserialize_tuple(N, vis);
    }
};

template<class... Ts>
struct Mapping<std::tuple<Ts...>> {
    static constexpr Shape shape = Shape::Tuple;

    template<class S>
    static constexpr bool serialize(const std::tuple<Ts...> & v, S & s) {
        typename S::SeqFrame fr;
        if(!s.begin_tuple(sizeof...(Ts), fr)) {
            return false;
        }
        if(!std_types_detail::serialize_tuple_elements(v, s, fr, std::index_sequence_for<Ts...>{})) {
            return false;
        }
        return s.end(fr);
    }
    template<class D>
    static constexpr bool deserialize(std::tuple<Ts...> & v, D & d) {
        std_types_detail::TupleVisitor<std::tuple<Ts...>> vis{v};
        return d.deserialize_tuple(sizeof...(Ts), vis);
    }
};

template<class A, class B>
struct Mapping<std::pair<A, B>> {
    static constexpr Shape shape = Shape::Tuple;

    template<class S>
    static constexpr bool serialize(const std::pair<A, B> & v, S & s) {
        typename S::SeqFrame fr;
        if(!s.begin_tuple(2, fr)) {
            return false;
        }
        if(!s.serialize_element(fr, v.first) || !s.serialize_element(fr, v.second)) {
            return false;
        }
        return s.end(fr);
    }
    template<class D>
    static constexpr bool deserialize(std::pair<A, B> & v, D & d) {
        std_types_detail::TupleVisitor<std::pair<A, B>> vis{v};
        return d.deserialize_tuple(2, vis);
    }
};

} // namespace ShapeFusion
