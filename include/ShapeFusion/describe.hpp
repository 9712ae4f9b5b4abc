#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

#include "shape.hpp"
#include "errors.hpp"
#include "serializer_concept.hpp"
#include "mapping.hpp"

namespace ShapeFusion {

/// Serializer that records which shape a value maps to instead of writing
/// it. Nested values are not visited: element, field and payload calls only
/// contribute counts and keys to the top-level descriptor.
class ShapeRecorder {
public:
    struct SeqFrame {};
    struct MapFrame {};
    struct StructFrame {};

    constexpr ShapeRecorder() = default;

    constexpr const ShapeDescriptor & descriptor() const {
        return m_desc;
    }
    constexpr SerializeError getError() const {
        return m_err.get();
    }
    constexpr std::size_t pos() const {
        return m_calls;
    }

    constexpr bool serialize_bool(bool)                 { return top(Shape::Bool); }
    constexpr bool serialize_i8(std::int8_t)            { return top(Shape::I8); }
    constexpr bool serialize_i16(std::int16_t)          { return top(Shape::I16); }
    constexpr bool serialize_i32(std::int32_t)          { return top(Shape::I32); }
    constexpr bool serialize_i64(std::int64_t)          { return top(Shape::I64); }
    constexpr bool serialize_i128(i128)                 { return top(Shape::I128); }
    constexpr bool serialize_u8(std::uint8_t)           { return top(Shape::U8); }
    constexpr bool serialize_u16(std::uint16_t)         { return top(Shape::U16); }
    constexpr bool serialize_u32(std::uint32_t)         { return top(Shape::U32); }
    constexpr bool serialize_u64(std::uint64_t)         { return top(Shape::U64); }
    constexpr bool serialize_u128(u128)                 { return top(Shape::U128); }
    constexpr bool serialize_f32(float)                 { return top(Shape::F32); }
    constexpr bool serialize_f64(double)                { return top(Shape::F64); }
    constexpr bool serialize_char(char32_t)             { return top(Shape::Char); }

    constexpr bool serialize_str(std::string_view s) {
        if(!top(Shape::String)) return false;
        m_desc.length = s.size();
        return true;
    }
    constexpr bool serialize_bytes(std::span<const std::uint8_t> b) {
        if(!top(Shape::Bytes)) return false;
        m_desc.length = b.size();
        return true;
    }
    constexpr bool serialize_none() {
        return top(Shape::Option);
    }
    template<class T>
    constexpr bool serialize_some(const T &) {
        return top(Shape::Option);
    }
    constexpr bool serialize_unit() {
        return top(Shape::Unit);
    }
    constexpr bool serialize_unit_struct(std::string_view name) {
        return top(Shape::UnitStruct, name);
    }
    constexpr bool serialize_unit_variant(std::string_view name, std::uint32_t idx, std::string_view variant) {
        return top(Shape::UnitVariant, name, variant, idx);
    }
    template<class T>
    constexpr bool serialize_newtype_struct(std::string_view name, const T &) {
        return top(Shape::NewtypeStruct, name);
    }
    template<class T>
    constexpr bool serialize_newtype_variant(std::string_view name, std::uint32_t idx, std::string_view variant, const T &) {
        return top(Shape::NewtypeVariant, name, variant, idx);
    }

    constexpr bool begin_seq(std::optional<std::size_t> len, SeqFrame &) {
        if(!top(Shape::Seq)) return false;
        m_desc.length = len;
        return true;
    }
    constexpr bool begin_tuple(std::size_t len, SeqFrame &) {
        if(!top(Shape::Tuple)) return false;
        m_desc.length = len;
        return true;
    }
    constexpr bool begin_tuple_struct(std::string_view name, std::size_t len, SeqFrame &) {
        if(!top(Shape::TupleStruct, name)) return false;
        m_desc.length = len;
        return true;
    }
    constexpr bool begin_tuple_variant(std::string_view name, std::uint32_t idx, std::string_view variant, std::size_t len, SeqFrame &) {
        if(!top(Shape::TupleVariant, name, variant, idx)) return false;
        m_desc.length = len;
        return true;
    }
    template<class T>
    constexpr bool serialize_element(SeqFrame &, const T &) {
        return true;
    }
    constexpr bool end(SeqFrame &) {
        return true;
    }

    constexpr bool begin_map(std::optional<std::size_t> len, MapFrame &) {
        if(!top(Shape::Map)) return false;
        m_desc.length = len;
        return true;
    }
    template<class K>
    constexpr bool serialize_key(MapFrame &, const K &) {
        return true;
    }
    template<class V>
    constexpr bool serialize_value(MapFrame &, const V &) {
        return true;
    }
    constexpr bool end(MapFrame &) {
        return true;
    }

    constexpr bool begin_struct(std::string_view name, std::size_t, StructFrame &) {
        return top(Shape::Struct, name);
    }
    constexpr bool begin_struct_variant(std::string_view name, std::uint32_t idx, std::string_view variant, std::size_t, StructFrame &) {
        return top(Shape::StructVariant, name, variant, idx);
    }
    template<class T>
    constexpr bool serialize_field(StructFrame &, std::string_view key, const T &) {
        m_desc.fields.push_back(key);
        return true;
    }
    constexpr bool skip_field(StructFrame &, std::string_view key) {
        m_desc.fields.push_back(key);
        return true;
    }
    constexpr bool end(StructFrame &) {
        // struct length is the declared field count, skipped ones included
        if(m_desc.shape == Shape::Struct || m_desc.shape == Shape::StructVariant) {
            m_desc.length = m_desc.fields.size();
        }
        return true;
    }

    constexpr bool fail(SerializeError e) {
        return m_err.setError(e);
    }
    constexpr bool finish() {
        return m_err.ok();
    }

private:
    ShapeDescriptor m_desc{};
    serializer::ErrorState m_err{};
    std::size_t m_calls = 0;

    constexpr bool top(Shape s, std::string_view name = {}, std::string_view variant = {}, std::uint32_t idx = 0) {
        if(m_calls ++ != 0) {
            return m_err.setError(SerializeError::SESSION_MISUSE);
        }
        m_desc.shape = s;
        m_desc.name = name;
        m_desc.variant = variant;
        m_desc.variant_index = idx;
        return true;
    }
};

static_assert(serializer::SerializerLike<ShapeRecorder>);


/// Classifies a value: the single shape it maps to plus the shape-specific
/// metadata (name, variant, length, declared fields). Empty when the mapping
/// refuses the value (an enum value with no declared variant).
template<Mapped T>
constexpr std::optional<ShapeDescriptor> describe(const T & value) {
    ShapeRecorder recorder;
    if(!ShapeFusion::serialize(value, recorder) || !recorder.finish()) {
        return std::nullopt;
    }
    return recorder.descriptor();
}

} // namespace ShapeFusion
