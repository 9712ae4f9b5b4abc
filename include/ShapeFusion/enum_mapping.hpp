#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "mapping.hpp"
#include "std_types.hpp"
#include "struct_mapping.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace ShapeFusion {

/// One arm of a closed C++ enumeration.
template<auto Value, ConstString Name>
struct Variant {
    static constexpr auto value = Value;
    static constexpr ConstString name = Name;
};

template<class... V>
struct EnumVariants {
    using VariantsTuple = std::tuple<V...>;
};

/// Describes an enum class as a set of unit variants:
///
///     template<> struct ShapeFusion::EnumMeta<Color> {
///         using Variants = EnumVariants<Variant<Color::Red, "Red">, Variant<Color::Green, "Green">>;
///         using Options  = OptionsPack<options::name<"Color">>;   // optional
///     };
template<class E>
struct EnumMeta {};

/// Names the alternatives of a std::variant, in order. Each alternative picks
/// the variant shape from its own mapping: std::monostate or a unit struct is a
/// unit_variant, a tuple or as_array struct is a tuple_variant, a struct is a
/// struct_variant, anything else is a newtype_variant.
template<ConstString... Names>
struct VariantNames {
    static constexpr std::size_t Count = sizeof...(Names);
    static constexpr std::array<std::string_view, sizeof...(Names)> names = {Names.view()...};
};

template<class V>
struct VariantMeta {};


namespace enum_detail {

template<class T, class = void>
struct meta_name {
    static constexpr std::string_view value = {};
};

template<class T>
struct meta_name<T, std::void_t<typename T::Options>> {
    using O = options::detail::field_options<typename T::Options>;
    static constexpr std::string_view value = [] {
        if constexpr (O::template has_option<options::detail::name_tag>) {
            return O::template get_option<options::detail::name_tag>::desc.view();
        } else {
            return std::string_view{};
        }
    }();
};

template<class E>
concept DescribedEnum = std::is_enum_v<E> && requires {
    typename EnumMeta<E>::Variants::VariantsTuple;
};

template<class E>
struct EnumTable {
    using Tuple = typename EnumMeta<E>::Variants::VariantsTuple;
    static constexpr std::size_t Count = std::tuple_size_v<Tuple>;

    static constexpr std::array<std::string_view, Count> names =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            return std::array<std::string_view, Count>{std::tuple_element_t<I, Tuple>::name.view()...};
        }(std::make_index_sequence<Count>{});

    static constexpr std::array<E, Count> values =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            return std::array<E, Count>{static_cast<E>(std::tuple_element_t<I, Tuple>::value)...};
        }(std::make_index_sequence<Count>{});

    static constexpr std::size_t indexOf(E e) {
        for(std::size_t i = 0; i < Count; i ++) {
            if(values[i] == e) return i;
        }
        return Identifier::unknown;
    }
};

template<class E>
struct EnumVisitor {
    static constexpr std::string_view expecting = "a unit variant";
    E & out;

    template<class A>
    constexpr bool visit_enum(A & data, DeserializationContext &) {
        Identifier id{std::span<const std::string_view>(EnumTable<E>::names), IdentifierKind::variant};
        if(!data.variant(id)) {
            return false;
        }
        if(!data.unit_variant()) {
            return false;
        }
        out = EnumTable<E>::values[id.index];
        return true;
    }
};


enum class VariantKind : std::uint8_t {
    unit,
    newtype,
    tuple,
    structure
};

template<class A>
constexpr VariantKind variant_kind() {
    if constexpr (std::same_as<A, std::monostate>) {
        return VariantKind::unit;
    } else if constexpr (Mapped<A>) {
        constexpr Shape s = Mapping<A>::shape;
        if constexpr (s == Shape::UnitStruct) return VariantKind::unit;
        else if constexpr (s == Shape::Tuple || s == Shape::TupleStruct) return VariantKind::tuple;
        else if constexpr (s == Shape::Struct) return VariantKind::structure;
        else return VariantKind::newtype;
    } else {
        return VariantKind::newtype;
    }
}

/// Element count and pull-visitor for an alternative used as a tuple variant.
template<class A>
struct TupleBody {
    static constexpr std::size_t len = std::tuple_size_v<A>;
    using visitor = std_types_detail::TupleVisitor<A>;

    template<class S>
    static constexpr bool serialize_elements(const A & a, S & s, typename S::SeqFrame & fr) {
        return std_types_detail::serialize_tuple_elements(a, s, fr, std::make_index_sequence<len>{});
    }
};

template<class A>
    requires struct_detail::AggregateStruct<A>
struct TupleBody<A> {
    static constexpr std::size_t len = struct_detail::Helper<A>::fieldsCount;
    using visitor = struct_detail::StructVisitor<A>;

    template<class S>
    static constexpr bool serialize_elements(const A & a, S & s, typename S::SeqFrame & fr) {
        return struct_detail::serialize_elements(a, s, fr);
    }
};

template<class V>
concept DescribedVariant = requires {
    VariantMeta<V>::Alternatives::Count;
};

template<class V>
struct VariantVisitor;

template<class... Ts>
struct VariantVisitor<std::variant<Ts...>> {
    using V = std::variant<Ts...>;
    using Names = typename VariantMeta<V>::Alternatives;
    static constexpr std::string_view expecting = "an enum variant";
    V & out;

    template<std::size_t I, class A>
    constexpr bool read_alternative(A & data) {
        using Alt = std::variant_alternative_t<I, V>;
        Alt & alt = out.template emplace<I>();
        constexpr VariantKind kind = variant_kind<Alt>();
        if constexpr (kind == VariantKind::unit) {
            return data.unit_variant();
        } else if constexpr (kind == VariantKind::newtype) {
            return data.newtype_variant(alt);
        } else if constexpr (kind == VariantKind::tuple) {
            typename TupleBody<Alt>::visitor v{alt};
            return data.tuple_variant(TupleBody<Alt>::len, v);
        } else {
            struct_detail::StructVisitor<Alt> v{alt};
            return data.struct_variant(std::span<const std::string_view>(struct_detail::Helper<Alt>::names), v);
        }
    }

    template<class A>
    constexpr bool visit_enum(A & data, DeserializationContext &) {
        Identifier id{std::span<const std::string_view>(Names::names), IdentifierKind::variant};
        if(!data.variant(id)) {
            return false;
        }
        bool ok = false;
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            ((id.index == I ? (ok = read_alternative<I>(data), true) : false) || ...);
        }(std::index_sequence_for<Ts...>{});
        return ok;
    }
};

} // namespace enum_detail


template<class E>
    requires enum_detail::DescribedEnum<E>
struct Mapping<E> {
    using Table = enum_detail::EnumTable<E>;
    static constexpr Shape shape = Shape::UnitVariant;
    static constexpr std::string_view name = enum_detail::meta_name<EnumMeta<E>>::value;

    template<class S>
    static constexpr bool serialize(const E & v, S & s) {
        const std::size_t idx = Table::indexOf(v);
        if(idx == Identifier::unknown) {
            return s.fail(SerializeError::UNKNOWN_VARIANT);
        }
        return s.serialize_unit_variant(name, static_cast<std::uint32_t>(idx), Table::names[idx]);
    }
    template<class D>
    static constexpr bool deserialize(E & v, D & d) {
        enum_detail::EnumVisitor<E> vis{v};
        return d.deserialize_enum(name, std::span<const std::string_view>(Table::names), vis);
    }
};

/// A std::variant described by VariantMeta is a closed enumeration whose
/// alternatives carry payloads.
template<class... Ts>
    requires enum_detail::DescribedVariant<std::variant<Ts...>>
struct Mapping<std::variant<Ts...>> {
    using V = std::variant<Ts...>;
    using Names = typename VariantMeta<V>::Alternatives;
    static_assert(Names::Count == sizeof...(Ts), "[[[ ShapeFusion ]]] VariantMeta must name every alternative");

    // the shape of a variant value depends on the active alternative; this is
    // the shape of the first one
    static constexpr Shape shape = [] {
        using First = std::variant_alternative_t<0, V>;
        switch(enum_detail::variant_kind<First>()) {
        case enum_detail::VariantKind::unit: return Shape::UnitVariant;
        case enum_detail::VariantKind::newtype: return Shape::NewtypeVariant;
        case enum_detail::VariantKind::tuple: return Shape::TupleVariant;
        case enum_detail::VariantKind::structure: return Shape::StructVariant;
        }
        return Shape::NewtypeVariant;
    }();
    static constexpr std::string_view name = enum_detail::meta_name<VariantMeta<V>>::value;

    template<std::size_t I, class S>
    static constexpr bool serialize_alternative(const V & v, S & s) {
        using Alt = std::variant_alternative_t<I, V>;
        const Alt & alt = std::get<I>(v);
        constexpr std::uint32_t idx = static_cast<std::uint32_t>(I);
        constexpr std::string_view variant = Names::names[I];
        constexpr enum_detail::VariantKind kind = enum_detail::variant_kind<Alt>();

        if constexpr (kind == enum_detail::VariantKind::unit) {
            return s.serialize_unit_variant(name, idx, variant);
        } else if constexpr (kind == enum_detail::VariantKind::newtype) {
            return s.serialize_newtype_variant(name, idx, variant, alt);
        } else if constexpr (kind == enum_detail::VariantKind::tuple) {
            using Body = enum_detail::TupleBody<Alt>;
            typename S::SeqFrame fr;
            if(!s.begin_tuple_variant(name, idx, variant, Body::len, fr)) {
                return false;
            }
            if(!Body::serialize_elements(alt, s, fr)) {
                return false;
            }
            return s.end(fr);
        } else {
            typename S::StructFrame fr;
            if(!s.begin_struct_variant(name, idx, variant, struct_detail::emitted_count(alt), fr)) {
                return false;
            }
            if(!struct_detail::serialize_fields(alt, s, fr)) {
                return false;
            }
            return s.end(fr);
        }
    }

    template<class S>
    static constexpr bool serialize(const V & v, S & s) {
        if(v.valueless_by_exception()) {
            return s.fail(SerializeError::UNKNOWN_VARIANT);
        }
        bool ok = false;
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            ((v.index() == I ? (ok = serialize_alternative<I>(v, s), true) : false) || ...);
        }(std::index_sequence_for<Ts...>{});
        return ok;
    }

    template<class D>
    static constexpr bool deserialize(V & v, D & d) {
        enum_detail::VariantVisitor<V> vis{v};
        return d.deserialize_enum(name, std::span<const std::string_view>(Names::names), vis);
    }
};

} // namespace ShapeFusion
