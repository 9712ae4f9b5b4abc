#pragma once

#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "shape.hpp"
#include "context.hpp"
#include "lifetime.hpp"
#include "utf8.hpp"

namespace ShapeFusion {

enum class stream_read_result : std::uint8_t {
    value,  // one value produced; keep going
    end,    // normal end-of-stream
    error   // unrecoverable error; abort
};

/// Archetypes stand in for format-specific session objects when the library
/// needs to ask "does this visitor handle shape X" without a concrete format.
/// Declared only, never defined.
namespace archetypes {

struct SeqAccess {
    template<class T> stream_read_result next_element(T & out);
    std::optional<std::size_t> size_hint() const;
};

struct MapAccess {
    template<class K> stream_read_result next_key(K & out);
    template<class V> bool next_value(V & out);
    std::optional<std::size_t> size_hint() const;
};

struct EnumAccess {
    template<class Id> bool variant(Id & out);
    bool unit_variant();
    template<class T> bool newtype_variant(T & out);
    template<class V> bool tuple_variant(std::size_t len, V & visitor);
    template<class V> bool struct_variant(std::span<const std::string_view> fields, V & visitor);
};

struct Deserializer {
    DeserializationContext & context();
};

} // namespace archetypes


namespace visitor {

using Ctx = DeserializationContext;

template<class V> concept HasBool = requires(V& v, Ctx& c) { { v.visit_bool(bool{}, c) } -> std::same_as<bool>; };
template<class V> concept HasI8   = requires(V& v, Ctx& c) { { v.visit_i8(std::int8_t{}, c) } -> std::same_as<bool>; };
template<class V> concept HasI16  = requires(V& v, Ctx& c) { { v.visit_i16(std::int16_t{}, c) } -> std::same_as<bool>; };
template<class V> concept HasI32  = requires(V& v, Ctx& c) { { v.visit_i32(std::int32_t{}, c) } -> std::same_as<bool>; };
template<class V> concept HasI64  = requires(V& v, Ctx& c) { { v.visit_i64(std::int64_t{}, c) } -> std::same_as<bool>; };
template<class V> concept HasI128 = requires(V& v, Ctx& c) { { v.visit_i128(i128{}, c) } -> std::same_as<bool>; };
template<class V> concept HasU8   = requires(V& v, Ctx& c) { { v.visit_u8(std::uint8_t{}, c) } -> std::same_as<bool>; };
template<class V> concept HasU16  = requires(V& v, Ctx& c) { { v.visit_u16(std::uint16_t{}, c) } -> std::same_as<bool>; };
template<class V> concept HasU32  = requires(V& v, Ctx& c) { { v.visit_u32(std::uint32_t{}, c) } -> std::same_as<bool>; };
template<class V> concept HasU64  = requires(V& v, Ctx& c) { { v.visit_u64(std::uint64_t{}, c) } -> std::same_as<bool>; };
template<class V> concept HasU128 = requires(V& v, Ctx& c) { { v.visit_u128(u128{}, c) } -> std::same_as<bool>; };
template<class V> concept HasF32  = requires(V& v, Ctx& c) { { v.visit_f32(float{}, c) } -> std::same_as<bool>; };
template<class V> concept HasF64  = requires(V& v, Ctx& c) { { v.visit_f64(double{}, c) } -> std::same_as<bool>; };
template<class V> concept HasChar = requires(V& v, Ctx& c) { { v.visit_char(char32_t{}, c) } -> std::same_as<bool>; };

template<class V> concept HasStr         = requires(V& v, Ctx& c, std::string_view s) { { v.visit_str(s, c) } -> std::same_as<bool>; };
template<class V> concept HasBorrowedStr = requires(V& v, Ctx& c, std::string_view s) { { v.visit_borrowed_str(s, c) } -> std::same_as<bool>; };
template<class V> concept HasString      = requires(V& v, Ctx& c, std::string s) { { v.visit_string(std::move(s), c) } -> std::same_as<bool>; };

template<class V> concept HasBytes         = requires(V& v, Ctx& c, std::span<const std::uint8_t> b) { { v.visit_bytes(b, c) } -> std::same_as<bool>; };
template<class V> concept HasBorrowedBytes = requires(V& v, Ctx& c, std::span<const std::uint8_t> b) { { v.visit_borrowed_bytes(b, c) } -> std::same_as<bool>; };
template<class V> concept HasByteBuf       = requires(V& v, Ctx& c, std::vector<std::uint8_t> b) { { v.visit_byte_buf(std::move(b), c) } -> std::same_as<bool>; };

template<class V> concept HasNone = requires(V& v, Ctx& c) { { v.visit_none(c) } -> std::same_as<bool>; };
template<class V> concept HasUnit = requires(V& v, Ctx& c) { { v.visit_unit(c) } -> std::same_as<bool>; };

template<class V, class D = archetypes::Deserializer>
concept HasSome = requires(V& v, D& d, Ctx& c) { { v.visit_some(d, c) } -> std::same_as<bool>; };
template<class V, class D = archetypes::Deserializer>
concept HasNewtypeStruct = requires(V& v, D& d, Ctx& c) { { v.visit_newtype_struct(d, c) } -> std::same_as<bool>; };
template<class V, class A = archetypes::SeqAccess>
concept HasSeq = requires(V& v, A& a, Ctx& c) { { v.visit_seq(a, c) } -> std::same_as<bool>; };
template<class V, class A = archetypes::MapAccess>
concept HasMap = requires(V& v, A& a, Ctx& c) { { v.visit_map(a, c) } -> std::same_as<bool>; };
template<class V, class A = archetypes::EnumAccess>
concept HasEnum = requires(V& v, A& a, Ctx& c) { { v.visit_enum(a, c) } -> std::same_as<bool>; };


/// A visitor may list the arriving shapes it builds from. Its visit_seq and
/// visit_map are then entered only for those: a vector is not built from a
/// tuple and a struct is not built from a map.
template<class V>
concept DeclaresShapes = requires { { V::shapes } -> std::convertible_to<ShapeSet>; };

/// The set of shapes a visitor declared it can build from, including those it
/// accepts through the widening defaults (i8 -> i64, f32 -> f64, char -> str, ...).
template<class V>
constexpr ShapeSet capabilities() {
    ShapeSet s;
    if constexpr (HasBool<V>) s.insert(Shape::Bool);
    if constexpr (HasI8<V>  || HasI64<V>) s.insert(Shape::I8);
    if constexpr (HasI16<V> || HasI64<V>) s.insert(Shape::I16);
    if constexpr (HasI32<V> || HasI64<V>) s.insert(Shape::I32);
    if constexpr (HasI64<V>) s.insert(Shape::I64);
    if constexpr (HasI128<V>) s.insert(Shape::I128);
    if constexpr (HasU8<V>  || HasU64<V>) s.insert(Shape::U8);
    if constexpr (HasU16<V> || HasU64<V>) s.insert(Shape::U16);
    if constexpr (HasU32<V> || HasU64<V>) s.insert(Shape::U32);
    if constexpr (HasU64<V>) s.insert(Shape::U64);
    if constexpr (HasU128<V>) s.insert(Shape::U128);
    if constexpr (HasF32<V> || HasF64<V>) s.insert(Shape::F32);
    if constexpr (HasF64<V>) s.insert(Shape::F64);
    if constexpr (HasChar<V> || HasStr<V> || HasString<V>) s.insert(Shape::Char);
    if constexpr (HasStr<V> || HasBorrowedStr<V> || HasString<V>) s.insert(Shape::String);
    if constexpr (HasBytes<V> || HasBorrowedBytes<V> || HasByteBuf<V>) s.insert(Shape::Bytes);
    if constexpr (HasNone<V> || HasSome<V>) s.insert(Shape::Option);
    if constexpr (HasUnit<V>) {
        s.insert(Shape::Unit);
        s.insert(Shape::UnitStruct);
    }
    if constexpr (HasNewtypeStruct<V>) s.insert(Shape::NewtypeStruct);
    if constexpr (HasSeq<V>) {
        s.insert(Shape::Seq);
        s.insert(Shape::Tuple);
        s.insert(Shape::TupleStruct);
    }
    if constexpr (HasMap<V>) {
        s.insert(Shape::Map);
        s.insert(Shape::Struct);
    }
    if constexpr (HasEnum<V>) {
        s.insert(Shape::UnitVariant);
        s.insert(Shape::NewtypeVariant);
        s.insert(Shape::TupleVariant);
        s.insert(Shape::StructVariant);
    }
    if constexpr (DeclaresShapes<V>) {
        s.retain(ShapeSet(V::shapes));
    }
    return s;
}

template<class V>
constexpr bool accepts_shape(Shape got) {
    if constexpr (DeclaresShapes<V>) return ShapeSet(V::shapes).contains(got);
    else return true;
}

/// String flavors the visitor accepts without failing.
template<class V>
constexpr FlavorSet string_flavors() {
    FlavorSet f;
    if constexpr (HasStr<V> || HasString<V>) {
        f.insert(Flavor::transient);
        f.insert(Flavor::owned);
        f.insert(Flavor::borrowed);
    } else if constexpr (HasBorrowedStr<V>) {
        f.insert(Flavor::borrowed);
    }
    return f;
}

template<class V>
constexpr FlavorSet bytes_flavors() {
    FlavorSet f;
    if constexpr (HasBytes<V> || HasByteBuf<V>) {
        f.insert(Flavor::transient);
        f.insert(Flavor::owned);
        f.insert(Flavor::borrowed);
    } else if constexpr (HasBorrowedBytes<V>) {
        f.insert(Flavor::borrowed);
    }
    return f;
}

template<class V>
constexpr std::string_view expecting() {
    if constexpr (requires { { V::expecting } -> std::convertible_to<std::string_view>; }) {
        return V::expecting;
    } else {
        return {};
    }
}

template<class V>
constexpr bool reject(Shape got, Ctx & ctx) {
    return ctx.invalidType(got, capabilities<V>(), expecting<V>());
}

namespace detail {

constexpr bool finish(bool ok, Ctx & ctx) {
    if(!ok && !ctx.failed()) {
        ctx.withError(DeserializeError::CUSTOM);
    }
    return ok;
}

template<class V>
constexpr bool signed_wide(V & v, std::int64_t x, Shape got, Ctx & ctx) {
    if constexpr (HasI64<V>) {
        return finish(v.visit_i64(x, ctx), ctx);
    } else {
        return reject<V>(got, ctx);
    }
}

template<class V>
constexpr bool unsigned_wide(V & v, std::uint64_t x, Shape got, Ctx & ctx) {
    if constexpr (HasU64<V>) {
        return finish(v.visit_u64(x, ctx), ctx);
    } else {
        return reject<V>(got, ctx);
    }
}

} // namespace detail


// ========== Primitive dispatch: one visitor call, defaults widen or fail ==========

template<class V>
constexpr bool visit_bool(V & v, bool x, Ctx & ctx) {
    if constexpr (HasBool<V>) return detail::finish(v.visit_bool(x, ctx), ctx);
    else return reject<V>(Shape::Bool, ctx);
}

template<class V>
constexpr bool visit_i8(V & v, std::int8_t x, Ctx & ctx) {
    if constexpr (HasI8<V>) return detail::finish(v.visit_i8(x, ctx), ctx);
    else return detail::signed_wide(v, x, Shape::I8, ctx);
}
template<class V>
constexpr bool visit_i16(V & v, std::int16_t x, Ctx & ctx) {
    if constexpr (HasI16<V>) return detail::finish(v.visit_i16(x, ctx), ctx);
    else return detail::signed_wide(v, x, Shape::I16, ctx);
}
template<class V>
constexpr bool visit_i32(V & v, std::int32_t x, Ctx & ctx) {
    if constexpr (HasI32<V>) return detail::finish(v.visit_i32(x, ctx), ctx);
    else return detail::signed_wide(v, x, Shape::I32, ctx);
}
template<class V>
constexpr bool visit_i64(V & v, std::int64_t x, Ctx & ctx) {
    return detail::signed_wide(v, x, Shape::I64, ctx);
}
template<class V>
constexpr bool visit_i128(V & v, i128 x, Ctx & ctx) {
    if constexpr (HasI128<V>) {
        return detail::finish(v.visit_i128(x, ctx), ctx);
    } else {
        if(x >= std::numeric_limits<std::int64_t>::lowest() && x <= std::numeric_limits<std::int64_t>::max()) {
            return detail::signed_wide(v, static_cast<std::int64_t>(x), Shape::I128, ctx);
        }
        return reject<V>(Shape::I128, ctx);
    }
}

template<class V>
constexpr bool visit_u8(V & v, std::uint8_t x, Ctx & ctx) {
    if constexpr (HasU8<V>) return detail::finish(v.visit_u8(x, ctx), ctx);
    else return detail::unsigned_wide(v, x, Shape::U8, ctx);
}
template<class V>
constexpr bool visit_u16(V & v, std::uint16_t x, Ctx & ctx) {
    if constexpr (HasU16<V>) return detail::finish(v.visit_u16(x, ctx), ctx);
    else return detail::unsigned_wide(v, x, Shape::U16, ctx);
}
template<class V>
constexpr bool visit_u32(V & v, std::uint32_t x, Ctx & ctx) {
    if constexpr (HasU32<V>) return detail::finish(v.visit_u32(x, ctx), ctx);
    else return detail::unsigned_wide(v, x, Shape::U32, ctx);
}
template<class V>
constexpr bool visit_u64(V & v, std::uint64_t x, Ctx & ctx) {
    return detail::unsigned_wide(v, x, Shape::U64, ctx);
}
template<class V>
constexpr bool visit_u128(V & v, u128 x, Ctx & ctx) {
    if constexpr (HasU128<V>) {
        return detail::finish(v.visit_u128(x, ctx), ctx);
    } else {
        if(x <= std::numeric_limits<std::uint64_t>::max()) {
            return detail::unsigned_wide(v, static_cast<std::uint64_t>(x), Shape::U128, ctx);
        }
        return reject<V>(Shape::U128, ctx);
    }
}

template<class V>
constexpr bool visit_f64(V & v, double x, Ctx & ctx) {
    if constexpr (HasF64<V>) return detail::finish(v.visit_f64(x, ctx), ctx);
    else return reject<V>(Shape::F64, ctx);
}
template<class V>
constexpr bool visit_f32(V & v, float x, Ctx & ctx) {
    if constexpr (HasF32<V>) return detail::finish(v.visit_f32(x, ctx), ctx);
    else if constexpr (HasF64<V>) return detail::finish(v.visit_f64(static_cast<double>(x), ctx), ctx);
    else return reject<V>(Shape::F32, ctx);
}


// ========== Strings and bytes: the lifetime classifier ==========
//
// The deserializer states which flavor it can supply; the visitor's declared
// methods state which it accepts. Borrowed may degrade to transient, and any
// flavor may be copied into an owned value. Nothing degrades to borrowed: a
// visitor that only accepts borrowed data fails when the input cannot provide it.

template<class V>
constexpr bool visit_str(V & v, std::string_view s, Flavor offered, Ctx & ctx) {
    if (offered == Flavor::borrowed) {
        if constexpr (HasBorrowedStr<V>) {
            return detail::finish(v.visit_borrowed_str(s, ctx), ctx);
        }
    }
    if constexpr (HasStr<V>) {
        return detail::finish(v.visit_str(s, ctx), ctx);
    } else if constexpr (HasString<V>) {
        return detail::finish(v.visit_string(std::string(s), ctx), ctx);
    } else if constexpr (HasBorrowedStr<V>) {
        return ctx.borrowUnavailable(Shape::String, expecting<V>());
    } else {
        return reject<V>(Shape::String, ctx);
    }
}

template<class V>
constexpr bool visit_string(V & v, std::string && s, Ctx & ctx) {
    if constexpr (HasString<V>) {
        return detail::finish(v.visit_string(std::move(s), ctx), ctx);
    } else if constexpr (HasStr<V>) {
        return detail::finish(v.visit_str(std::string_view(s), ctx), ctx);
    } else if constexpr (HasBorrowedStr<V>) {
        return ctx.borrowUnavailable(Shape::String, expecting<V>());
    } else {
        return reject<V>(Shape::String, ctx);
    }
}

template<class V>
constexpr bool visit_bytes(V & v, std::span<const std::uint8_t> b, Flavor offered, Ctx & ctx) {
    if (offered == Flavor::borrowed) {
        if constexpr (HasBorrowedBytes<V>) {
            return detail::finish(v.visit_borrowed_bytes(b, ctx), ctx);
        }
    }
    if constexpr (HasBytes<V>) {
        return detail::finish(v.visit_bytes(b, ctx), ctx);
    } else if constexpr (HasByteBuf<V>) {
        return detail::finish(v.visit_byte_buf(std::vector<std::uint8_t>(b.begin(), b.end()), ctx), ctx);
    } else if constexpr (HasBorrowedBytes<V>) {
        return ctx.borrowUnavailable(Shape::Bytes, expecting<V>());
    } else {
        return reject<V>(Shape::Bytes, ctx);
    }
}

template<class V>
constexpr bool visit_byte_buf(V & v, std::vector<std::uint8_t> && b, Ctx & ctx) {
    if constexpr (HasByteBuf<V>) {
        return detail::finish(v.visit_byte_buf(std::move(b), ctx), ctx);
    } else if constexpr (HasBytes<V>) {
        return detail::finish(v.visit_bytes(std::span<const std::uint8_t>(b.data(), b.size()), ctx), ctx);
    } else if constexpr (HasBorrowedBytes<V>) {
        return ctx.borrowUnavailable(Shape::Bytes, expecting<V>());
    } else {
        return reject<V>(Shape::Bytes, ctx);
    }
}

template<class V>
constexpr bool visit_char(V & v, char32_t c, Ctx & ctx) {
    if constexpr (HasChar<V>) {
        return detail::finish(v.visit_char(c, ctx), ctx);
    } else if constexpr (HasStr<V> || HasString<V>) {
        char buf[4] = {};
        std::size_t n = utf8::encode(c, buf);
        if(n == 0) {
            return ctx.invalidValue(Shape::Char, expecting<V>());
        }
        return visit_str(v, std::string_view(buf, n), Flavor::transient, ctx);
    } else {
        return reject<V>(Shape::Char, ctx);
    }
}


// ========== Option, unit, wrappers ==========

template<class V>
constexpr bool visit_none(V & v, Ctx & ctx) {
    if constexpr (HasNone<V>) return detail::finish(v.visit_none(ctx), ctx);
    else return reject<V>(Shape::Option, ctx);
}

template<class V, class D>
constexpr bool visit_some(V & v, D & de, Ctx & ctx) {
    if constexpr (HasSome<V, D>) return detail::finish(v.visit_some(de, ctx), ctx);
    else return reject<V>(Shape::Option, ctx);
}

template<class V>
constexpr bool visit_unit(V & v, Ctx & ctx) {
    if constexpr (HasUnit<V>) return detail::finish(v.visit_unit(ctx), ctx);
    else return reject<V>(Shape::Unit, ctx);
}

template<class V, class D>
constexpr bool visit_newtype_struct(V & v, D & de, Ctx & ctx) {
    if constexpr (HasNewtypeStruct<V, D>) return detail::finish(v.visit_newtype_struct(de, ctx), ctx);
    else return reject<V>(Shape::NewtypeStruct, ctx);
}


// ========== Composites: the visitor pulls from a session object ==========

template<class V, class A>
constexpr bool visit_seq(V & v, A & access, Shape got, Ctx & ctx) {
    if constexpr (HasSeq<V, A>) {
        if(!accepts_shape<V>(got)) return reject<V>(got, ctx);
        return detail::finish(v.visit_seq(access, ctx), ctx);
    }
    else return reject<V>(got, ctx);
}

template<class V, class A>
constexpr bool visit_map(V & v, A & access, Shape got, Ctx & ctx) {
    if constexpr (HasMap<V, A>) {
        if(!accepts_shape<V>(got)) return reject<V>(got, ctx);
        return detail::finish(v.visit_map(access, ctx), ctx);
    }
    else return reject<V>(got, ctx);
}

template<class V, class A>
constexpr bool visit_enum(V & v, A & access, Shape got, Ctx & ctx) {
    if constexpr (HasEnum<V, A>) return detail::finish(v.visit_enum(access, ctx), ctx);
    else return reject<V>(got, ctx);
}

} // namespace visitor

} // namespace ShapeFusion
