#pragma once

#include <concepts>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include "shape.hpp"
#include "errors.hpp"
#include "results.hpp"
#include "context.hpp"
#include "visitor.hpp"
#include "serializer_concept.hpp"
#include "deserializer_concept.hpp"

namespace ShapeFusion {

/// Glue between one C++ type and the data model. A specialization provides
///
///     static constexpr Shape shape;                       // the single shape T maps to
///     template<class S> static constexpr bool serialize(const T&, S&);
///     template<class D> static constexpr bool deserialize(T&, D&);
///
/// serialize() calls the serializer operations for `shape` only; deserialize()
/// builds a visitor, hands it to the matching deserialize_* entry point and
/// writes the result into the target in place.
template<class T>
struct Mapping;

template<class T>
concept Mapped = requires {
    { Mapping<T>::shape } -> std::convertible_to<Shape>;
};

template<Mapped T>
inline constexpr Shape shape_of_v = Mapping<T>::shape;

namespace detail {
template<class T>
struct always_false : std::false_type {};
}

template<class T, class S>
constexpr bool serialize(const T & obj, S & s) {
    static_assert(Mapped<T>, "[[[ ShapeFusion ]]] T has no Mapping specialization");
    return Mapping<T>::serialize(obj, s);
}

template<class T, class D>
constexpr bool deserialize(T & obj, D & d) {
    static_assert(Mapped<T>, "[[[ ShapeFusion ]]] T has no Mapping specialization");
    return Mapping<T>::deserialize(obj, d);
}


// ========== Field and variant identifiers ==========

enum class IdentifierKind : std::uint8_t {
    field,
    variant
};

/// Resolves a struct key or enum variant tag against a fixed list of names.
/// Accepts the name as a string (or bytes) or its index as an unsigned integer.
struct Identifier {
    static constexpr std::size_t unknown = std::numeric_limits<std::size_t>::max();

    std::span<const std::string_view> names;
    IdentifierKind kind = IdentifierKind::field;
    bool allowUnknown = false;
    std::size_t index = unknown;

    constexpr bool resolve(std::string_view name, DeserializationContext & ctx) {
        for(std::size_t i = 0; i < names.size(); i ++) {
            if(names[i] == name) {
                index = i;
                return true;
            }
        }
        index = unknown;
        if(allowUnknown) {
            return true;
        }
        return kind == IdentifierKind::field ? ctx.unknownField(name) : ctx.unknownVariant(name);
    }
};

namespace identifier_detail {

struct IdentifierVisitor {
    static constexpr std::string_view expecting = "field or variant identifier";
    Identifier & id;

    constexpr bool visit_str(std::string_view s, DeserializationContext & ctx) {
        return id.resolve(s, ctx);
    }
    constexpr bool visit_bytes(std::span<const std::uint8_t> b, DeserializationContext & ctx) {
        std::string name(b.begin(), b.end());
        return id.resolve(name, ctx);
    }
    constexpr bool visit_u64(std::uint64_t i, DeserializationContext & ctx) {
        if(i < id.names.size()) {
            id.index = static_cast<std::size_t>(i);
            return true;
        }
        id.index = Identifier::unknown;
        if(id.allowUnknown) {
            return true;
        }
        if(id.kind == IdentifierKind::field) {
            return ctx.invalidValue(Shape::U64, "field index");
        }
        return ctx.invalidValue(Shape::U64, "variant index");
    }
};

} // namespace identifier_detail

template<>
struct Mapping<Identifier> {
    static constexpr Shape shape = Shape::String;

    template<class S>
    static constexpr bool serialize(const Identifier & id, S & s) {
        if(id.index >= id.names.size()) {
            return s.serialize_unit();
        }
        return s.serialize_str(id.names[id.index]);
    }
    template<class D>
    static constexpr bool deserialize(Identifier & id, D & d) {
        identifier_detail::IdentifierVisitor v{id};
        return d.deserialize_identifier(v);
    }
};


// ========== IgnoredAny ==========

/// Consumes one value of any shape and discards it.
struct IgnoredAny {
    constexpr bool operator==(const IgnoredAny&) const = default;
};

namespace ignored_detail {

struct IgnoringVisitor {
    static constexpr std::string_view expecting = "anything";

    constexpr bool visit_bool(bool, DeserializationContext&) { return true; }
    constexpr bool visit_i64(std::int64_t, DeserializationContext&) { return true; }
    constexpr bool visit_i128(i128, DeserializationContext&) { return true; }
    constexpr bool visit_u64(std::uint64_t, DeserializationContext&) { return true; }
    constexpr bool visit_u128(u128, DeserializationContext&) { return true; }
    constexpr bool visit_f64(double, DeserializationContext&) { return true; }
    constexpr bool visit_char(char32_t, DeserializationContext&) { return true; }
    constexpr bool visit_str(std::string_view, DeserializationContext&) { return true; }
    constexpr bool visit_bytes(std::span<const std::uint8_t>, DeserializationContext&) { return true; }
    constexpr bool visit_none(DeserializationContext&) { return true; }
    constexpr bool visit_unit(DeserializationContext&) { return true; }

    template<class A>
    constexpr bool visit_seq(A & seq, DeserializationContext&) {
        IgnoredAny elem;
        while(true) {
            switch(seq.next_element(elem)) {
            case stream_read_result::value: break;
            case stream_read_result::end: return true;
            case stream_read_result::error: return false;
            }
        }
    }
    template<class A>
    constexpr bool visit_map(A & map, DeserializationContext&) {
        IgnoredAny item;
        while(true) {
            switch(map.next_key(item)) {
            case stream_read_result::value: break;
            case stream_read_result::end: return true;
            case stream_read_result::error: return false;
            }
            if(!map.next_value(item)) {
                return false;
            }
        }
    }
};

} // namespace ignored_detail

template<>
struct Mapping<IgnoredAny> {
    static constexpr Shape shape = Shape::Unit;

    template<class S>
    static constexpr bool serialize(const IgnoredAny &, S & s) {
        return s.serialize_unit();
    }
    template<class D>
    static constexpr bool deserialize(IgnoredAny &, D & d) {
        ignored_detail::IgnoringVisitor v;
        return d.deserialize_ignored_any(v);
    }
};


// ========== Entry points ==========

template <Mapped T, serializer::SerializerLike S>
constexpr SerializeResult SerializeWith(const T & obj, S & s) {
    const bool ok = ShapeFusion::serialize(obj, s) && s.finish();
    SerializeError err = s.getError();
    if(!ok && err == SerializeError::NO_ERROR) {
        err = SerializeError::CUSTOM;
    }
    return SerializeResult(err, s.pos());
}

template <Mapped T, deserializer::DeserializerLike D>
constexpr DeserializeResult DeserializeWith(T & obj, D & d) {
    DeserializationContext & ctx = d.context();
    if(ShapeFusion::deserialize(obj, d)) {
        d.finish();
    } else if(!ctx.failed()) {
        ctx.withError(DeserializeError::CUSTOM);
    }
    ctx.stampPosition(d.pos());
    return ctx.result();
}

template <class T>
    requires (!Mapped<T>)
constexpr auto SerializeWith(const T &, auto &) {
    static_assert(detail::always_false<T>::value,
                  "[[[ ShapeFusion ]]] T is not mapped to a data model shape.\n"
                  "specialize ShapeFusion::Mapping<T> or describe it with StructMeta / EnumMeta");
}

template <class T>
    requires (!Mapped<T>)
constexpr auto DeserializeWith(T &, auto &) {
    static_assert(detail::always_false<T>::value,
                  "[[[ ShapeFusion ]]] T is not mapped to a data model shape.\n"
                  "specialize ShapeFusion::Mapping<T> or describe it with StructMeta / EnumMeta");
}

} // namespace ShapeFusion
