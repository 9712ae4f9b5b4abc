#pragma once

#include <concepts>
#include <cstdint>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "shape.hpp"
#include "context.hpp"
#include "visitor.hpp"

namespace ShapeFusion {

namespace archetypes {

/// A visitor accepting every shape; used only to state the deserializer contract.
struct Visitor {
    bool visit_bool(bool, DeserializationContext&);
    bool visit_i64(std::int64_t, DeserializationContext&);
    bool visit_i128(i128, DeserializationContext&);
    bool visit_u64(std::uint64_t, DeserializationContext&);
    bool visit_u128(u128, DeserializationContext&);
    bool visit_f64(double, DeserializationContext&);
    bool visit_char(char32_t, DeserializationContext&);
    bool visit_str(std::string_view, DeserializationContext&);
    bool visit_bytes(std::span<const std::uint8_t>, DeserializationContext&);
    bool visit_none(DeserializationContext&);
    bool visit_unit(DeserializationContext&);
    template<class D> bool visit_some(D&, DeserializationContext&);
    template<class D> bool visit_newtype_struct(D&, DeserializationContext&);
    template<class A> bool visit_seq(A&, DeserializationContext&);
    template<class A> bool visit_map(A&, DeserializationContext&);
    template<class A> bool visit_enum(A&, DeserializationContext&);
};

} // namespace archetypes

namespace deserializer {

/// DeserializerLike: the consumer side of the data model. Every deserialize_*
/// entry point drives exactly one visitor call (or records an error without
/// calling the visitor). Typed entry points are hints: a self-describing format
/// may ignore them and report what the input actually holds, a format that is
/// not self-describing relies on them to know what to read.
template<typename D>
concept DeserializerLike = requires(D& d,
                                    const D& cd,
                                    archetypes::Visitor& v,
                                    std::string_view name,
                                    std::size_t len,
                                    std::span<const std::string_view> names
                                   ) {
    { d.context() } -> std::same_as<DeserializationContext&>;
    { cd.is_self_describing() } -> std::same_as<bool>;
    { cd.string_flavor() } -> std::same_as<Flavor>;
    { cd.pos() } -> std::same_as<std::size_t>;

    { d.deserialize_any(v) } -> std::same_as<bool>;
    { d.deserialize_bool(v) } -> std::same_as<bool>;
    { d.deserialize_i8(v) } -> std::same_as<bool>;
    { d.deserialize_i16(v) } -> std::same_as<bool>;
    { d.deserialize_i32(v) } -> std::same_as<bool>;
    { d.deserialize_i64(v) } -> std::same_as<bool>;
    { d.deserialize_i128(v) } -> std::same_as<bool>;
    { d.deserialize_u8(v) } -> std::same_as<bool>;
    { d.deserialize_u16(v) } -> std::same_as<bool>;
    { d.deserialize_u32(v) } -> std::same_as<bool>;
    { d.deserialize_u64(v) } -> std::same_as<bool>;
    { d.deserialize_u128(v) } -> std::same_as<bool>;
    { d.deserialize_f32(v) } -> std::same_as<bool>;
    { d.deserialize_f64(v) } -> std::same_as<bool>;
    { d.deserialize_char(v) } -> std::same_as<bool>;
    { d.deserialize_str(v) } -> std::same_as<bool>;
    { d.deserialize_string(v) } -> std::same_as<bool>;
    { d.deserialize_bytes(v) } -> std::same_as<bool>;
    { d.deserialize_byte_buf(v) } -> std::same_as<bool>;
    { d.deserialize_option(v) } -> std::same_as<bool>;
    { d.deserialize_unit(v) } -> std::same_as<bool>;
    { d.deserialize_unit_struct(name, v) } -> std::same_as<bool>;
    { d.deserialize_newtype_struct(name, v) } -> std::same_as<bool>;
    { d.deserialize_seq(v) } -> std::same_as<bool>;
    { d.deserialize_tuple(len, v) } -> std::same_as<bool>;
    { d.deserialize_tuple_struct(name, len, v) } -> std::same_as<bool>;
    { d.deserialize_map(v) } -> std::same_as<bool>;
    { d.deserialize_struct(name, names, v) } -> std::same_as<bool>;
    { d.deserialize_enum(name, names, v) } -> std::same_as<bool>;
    { d.deserialize_identifier(v) } -> std::same_as<bool>;
    { d.deserialize_ignored_any(v) } -> std::same_as<bool>;

    // Input fully consumed; records TRAILING_DATA otherwise
    { d.finish() } -> std::same_as<bool>;
};

template<typename D>
constexpr bool is_deserializer_like_v = DeserializerLike<D>;

} // namespace deserializer

} // namespace ShapeFusion
