#pragma once

#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

namespace ShapeFusion {

__extension__ typedef __int128          i128;
__extension__ typedef unsigned __int128 u128;

/// The closed set of data model shapes. Every mapping between a C++ type and
/// the model picks exactly one of these.
enum class Shape : std::uint8_t {
    Bool,
    I8, I16, I32, I64, I128,
    U8, U16, U32, U64, U128,
    F32, F64,
    Char,

    String,
    Bytes,

    Option,

    Unit,
    UnitStruct,
    UnitVariant,

    NewtypeStruct,
    NewtypeVariant,

    Seq,
    Map,

    Tuple,
    TupleStruct,
    TupleVariant,

    Struct,
    StructVariant
};

inline constexpr std::size_t ShapesCount = static_cast<std::size_t>(Shape::StructVariant) + 1;
static_assert(ShapesCount == 29);

enum class ShapeGroup : std::uint8_t {
    Primitive,
    Text,
    Binary,
    Optional,
    EmptyMarker,
    SinglePayload,
    VariableSequence,
    FixedSequence,
    FixedKeyValue
};

constexpr std::string_view shape_to_string(Shape s) {
    switch(s) {
    case Shape::Bool: return "bool";
    case Shape::I8: return "i8";
    case Shape::I16: return "i16";
    case Shape::I32: return "i32";
    case Shape::I64: return "i64";
    case Shape::I128: return "i128";
    case Shape::U8: return "u8";
    case Shape::U16: return "u16";
    case Shape::U32: return "u32";
    case Shape::U64: return "u64";
    case Shape::U128: return "u128";
    case Shape::F32: return "f32";
    case Shape::F64: return "f64";
    case Shape::Char: return "char";
    case Shape::String: return "string";
    case Shape::Bytes: return "bytes";
    case Shape::Option: return "option";
    case Shape::Unit: return "unit";
    case Shape::UnitStruct: return "unit_struct";
    case Shape::UnitVariant: return "unit_variant";
    case Shape::NewtypeStruct: return "newtype_struct";
    case Shape::NewtypeVariant: return "newtype_variant";
    case Shape::Seq: return "seq";
    case Shape::Map: return "map";
    case Shape::Tuple: return "tuple";
    case Shape::TupleStruct: return "tuple_struct";
    case Shape::TupleVariant: return "tuple_variant";
    case Shape::Struct: return "struct";
    case Shape::StructVariant: return "struct_variant";
    }
    return "N/A";
}

constexpr ShapeGroup shape_group(Shape s) {
    switch(s) {
    case Shape::String:
        return ShapeGroup::Text;
    case Shape::Bytes:
        return ShapeGroup::Binary;
    case Shape::Option:
        return ShapeGroup::Optional;
    case Shape::Unit:
    case Shape::UnitStruct:
    case Shape::UnitVariant:
        return ShapeGroup::EmptyMarker;
    case Shape::NewtypeStruct:
    case Shape::NewtypeVariant:
        return ShapeGroup::SinglePayload;
    case Shape::Seq:
    case Shape::Map:
        return ShapeGroup::VariableSequence;
    case Shape::Tuple:
    case Shape::TupleStruct:
    case Shape::TupleVariant:
        return ShapeGroup::FixedSequence;
    case Shape::Struct:
    case Shape::StructVariant:
        return ShapeGroup::FixedKeyValue;
    default:
        return ShapeGroup::Primitive;
    }
}

// Fixed shapes know their element count from the type alone; variable
// shapes learn it from the data.
constexpr bool is_fixed_length(Shape s) {
    ShapeGroup g = shape_group(s);
    return g == ShapeGroup::FixedSequence || g == ShapeGroup::FixedKeyValue;
}

constexpr bool is_variable_length(Shape s) {
    return shape_group(s) == ShapeGroup::VariableSequence;
}

constexpr bool is_enum_variant(Shape s) {
    return s == Shape::UnitVariant || s == Shape::NewtypeVariant
        || s == Shape::TupleVariant || s == Shape::StructVariant;
}

constexpr bool is_named(Shape s) {
    return s == Shape::UnitStruct || s == Shape::NewtypeStruct
        || s == Shape::TupleStruct || s == Shape::Struct || is_enum_variant(s);
}


/// Bit set over Shape, used to describe what a visitor can build.
class ShapeSet {
    std::uint32_t m_bits = 0;
public:
    constexpr ShapeSet() = default;
    constexpr ShapeSet(std::initializer_list<Shape> shapes) {
        for(Shape s: shapes) {
            insert(s);
        }
    }

    constexpr ShapeSet& insert(Shape s) {
        m_bits |= (std::uint32_t{1} << static_cast<std::uint32_t>(s));
        return *this;
    }
    constexpr ShapeSet& insert(ShapeSet other) {
        m_bits |= other.m_bits;
        return *this;
    }
    constexpr ShapeSet& retain(ShapeSet other) {
        m_bits &= other.m_bits;
        return *this;
    }
    constexpr bool contains(Shape s) const {
        return (m_bits & (std::uint32_t{1} << static_cast<std::uint32_t>(s))) != 0;
    }
    constexpr bool empty() const {
        return m_bits == 0;
    }
    constexpr std::size_t size() const {
        std::size_t n = 0;
        for(std::uint32_t b = m_bits; b != 0; b &= b - 1) {
            n ++;
        }
        return n;
    }
    constexpr std::uint32_t bits() const {
        return m_bits;
    }
    constexpr bool operator==(const ShapeSet&) const = default;
};


/// Metadata reported by the registry for one classified value.
struct ShapeDescriptor {
    Shape                           shape = Shape::Unit;
    std::string_view                name;           // struct/enum name for named shapes
    std::string_view                variant;        // variant name for enum shapes
    std::uint32_t                   variant_index = 0;
    std::optional<std::size_t>      length;         // element count, or hint for seq/map
    std::vector<std::string_view>   fields;         // declared keys for struct shapes
};

} // namespace ShapeFusion
