#pragma once

#include <array>
#include <cstddef>
#include <ranges>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "mapping.hpp"
#include "std_types.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "struct_fields_helper.hpp"

namespace ShapeFusion {

namespace struct_detail {

template<class T>
concept AggregateStruct =
    std::is_class_v<T> && std::is_aggregate_v<T> && !std::is_union_v<T> &&
    !std::ranges::range<T> && !requires { std::tuple_size<T>::value; } &&
    !is_annotated<T>::value;

template<class T>
using Helper = struct_fields_helper::FieldsHelper<T>;

template<class T>
constexpr Shape struct_shape() {
    using O = introspection::struct_options<T>;
    if constexpr (O::template has_option<options::detail::as_array_tag>) {
        return Shape::TupleStruct;
    } else if constexpr (O::template has_option<options::detail::newtype_tag>) {
        static_assert(Helper<T>::fieldsCount == 1, "[[[ ShapeFusion ]]] newtype struct must have exactly one field");
        return Shape::NewtypeStruct;
    } else if constexpr (Helper<T>::fieldsCount == 0) {
        return Shape::UnitStruct;
    } else {
        return Shape::Struct;
    }
}

template<class T>
constexpr std::string_view struct_name() {
    using O = introspection::struct_options<T>;
    if constexpr (O::template has_option<options::detail::name_tag>) {
        return O::template get_option<options::detail::name_tag>::desc.view();
    } else {
        return {};
    }
}

template<class T>
constexpr bool allows_excess_fields() {
    return introspection::struct_options<T>::template has_option<options::detail::allow_excess_fields_tag>;
}

/// Model field M of obj, with Annotated<> unwrapped.
template<std::size_t M, class T>
constexpr decltype(auto) field_ref(T & obj) {
    constexpr std::size_t Raw = Helper<std::remove_const_t<T>>::rawIndexes[M];
    using Meta = struct_fields_helper::field_meta<std::remove_const_t<T>, Raw>;
    return (Meta::getRef(introspection::getStructElementByIndex<Raw>(obj)));
}

template<std::size_t M, class T>
constexpr bool field_omitted(const T & obj) {
    constexpr std::size_t Raw = Helper<T>::rawIndexes[M];
    using Opts = struct_fields_helper::field_opts<T, Raw>;
    if constexpr (Opts::template has_option<options::detail::omit_if_none_tag>) {
        return !static_cast<bool>(field_ref<M>(obj));
    } else {
        return false;
    }
}

/// Number of fields actually written for obj.
template<class T>
constexpr std::size_t emitted_count(const T & obj) {
    return [&]<std::size_t... M>(std::index_sequence<M...>) {
        return (std::size_t{0} + ... + (field_omitted<M>(obj) ? 0 : 1));
    }(std::make_index_sequence<Helper<T>::fieldsCount>{});
}

template<class T, class S>
constexpr bool serialize_fields(const T & obj, S & s, typename S::StructFrame & fr) {
    return [&]<std::size_t... M>(std::index_sequence<M...>) {
        auto one = [&]<std::size_t J>() {
            constexpr std::string_view key = Helper<T>::names[J];
            if(field_omitted<J>(obj)) {
                return s.skip_field(fr, key);
            }
            return s.serialize_field(fr, key, field_ref<J>(obj));
        };
        return (one.template operator()<M>() && ...);
    }(std::make_index_sequence<Helper<T>::fieldsCount>{});
}

template<class T, class S>
constexpr bool serialize_elements(const T & obj, S & s, typename S::SeqFrame & fr) {
    return [&]<std::size_t... M>(std::index_sequence<M...>) {
        return (s.serialize_element(fr, field_ref<M>(obj)) && ...);
    }(std::make_index_sequence<Helper<T>::fieldsCount>{});
}

/// Builds a struct from its keyed fields (self-describing input) or from its
/// fields in declaration order (positional input). A tuple struct arrives as a
/// tuple struct or tuple variant, any other struct as a struct or struct variant.
template<class T>
struct StructVisitor {
    static constexpr std::string_view expecting = "a struct";
    static constexpr std::size_t N = Helper<T>::fieldsCount;
    static constexpr ShapeSet shapes = struct_shape<T>() == Shape::TupleStruct
        ? ShapeSet{Shape::TupleStruct, Shape::TupleVariant}
        : ShapeSet{Shape::Struct, Shape::StructVariant};
    T & out;

    template<class A>
    constexpr bool read_field(A & map, std::size_t index) {
        bool ok = false;
        [&]<std::size_t... M>(std::index_sequence<M...>) {
            ((index == M ? (ok = map.next_value(field_ref<M>(out)), true) : false) || ...);
        }(std::make_index_sequence<N>{});
        return ok;
    }

    template<class A>
    constexpr bool visit_map(A & map, DeserializationContext & ctx) {
        std::array<bool, N> seen{};
        while(true) {
            Identifier id{std::span<const std::string_view>(Helper<T>::names), IdentifierKind::field, allows_excess_fields<T>()};
            switch(map.next_key(id)) {
            case stream_read_result::value: break;
            case stream_read_result::end: return check_missing(seen, ctx);
            case stream_read_result::error: return false;
            }
            if(id.index == Identifier::unknown) {
                IgnoredAny skipped;
                if(!map.next_value(skipped)) return false;
                continue;
            }
            if(seen[id.index]) {
                return ctx.duplicateField(Helper<T>::names[id.index]);
            }
            seen[id.index] = true;
            if(!read_field(map, id.index)) {
                return false;
            }
        }
    }

    constexpr bool check_missing(const std::array<bool, N> & seen, DeserializationContext & ctx) {
        bool ok = true;
        [&]<std::size_t... M>(std::index_sequence<M...>) {
            auto one = [&]<std::size_t J>() {
                if(!ok || seen[J]) return;
                if constexpr (!Helper<T>::template fieldIsOptional<Helper<T>::rawIndexes[J]>()) {
                    ok = ctx.missingField(Helper<T>::names[J]);
                }
            };
            (one.template operator()<M>(), ...);
        }(std::make_index_sequence<N>{});
        return ok;
    }

    template<class A>
    constexpr bool visit_seq(A & seq, DeserializationContext & ctx) {
        std::size_t got = 0;
        stream_read_result r = stream_read_result::value;
        [&]<std::size_t... M>(std::index_sequence<M...>) {
            auto one = [&]<std::size_t J>() {
                if(r != stream_read_result::value) return;
                r = seq.next_element(field_ref<J>(out));
                if(r == stream_read_result::value) got ++;
            };
            (one.template operator()<M>(), ...);
        }(std::make_index_sequence<N>{});
        if(r == stream_read_result::error) return false;
        if(got != N) return ctx.invalidLength(got, expecting);
        return true;
    }
};

template<class T>
struct NewtypeVisitor {
    static constexpr std::string_view expecting = "a newtype struct";
    T & out;

    template<class D>
    constexpr bool visit_newtype_struct(D & d, DeserializationContext &) {
        return ShapeFusion::deserialize(field_ref<0>(out), d);
    }
};

} // namespace struct_detail


template<class T>
    requires struct_detail::AggregateStruct<T>
struct Mapping<T> {
    using H = struct_detail::Helper<T>;
    static_assert(H::fieldsAreUnique, "[[[ ShapeFusion ]]] struct field names must be unique");

    static constexpr Shape shape = struct_detail::struct_shape<T>();
    static constexpr std::string_view name = struct_detail::struct_name<T>();

    template<class S>
    static constexpr bool serialize(const T & obj, S & s) {
        if constexpr (shape == Shape::UnitStruct) {
            return s.serialize_unit_struct(name);
        } else if constexpr (shape == Shape::NewtypeStruct) {
            return s.serialize_newtype_struct(name, struct_detail::field_ref<0>(obj));
        } else if constexpr (shape == Shape::TupleStruct) {
            typename S::SeqFrame fr;
            if(!s.begin_tuple_struct(name, H::fieldsCount, fr)) {
                return false;
            }
            if(!struct_detail::serialize_elements(obj, s, fr)) {
                return false;
            }
            return s.end(fr);
        } else {
            typename S::StructFrame fr;
            if(!s.begin_struct(name, struct_detail::emitted_count(obj), fr)) {
                return false;
            }
            if(!struct_detail::serialize_fields(obj, s, fr)) {
                return false;
            }
            return s.end(fr);
        }
    }

    template<class D>
    static constexpr bool deserialize(T & obj, D & d) {
        if constexpr (shape == Shape::UnitStruct) {
            std_types_detail::UnitVisitor v;
            return d.deserialize_unit_struct(name, v);
        } else if constexpr (shape == Shape::NewtypeStruct) {
            struct_detail::NewtypeVisitor<T> v{obj};
            return d.deserialize_newtype_struct(name, v);
        } else if constexpr (shape == Shape::TupleStruct) {
            struct_detail::StructVisitor<T> v{obj};
            return d.deserialize_tuple_struct(name, H::fieldsCount, v);
        } else {
            struct_detail::StructVisitor<T> v{obj};
            return d.deserialize_struct(name, std::span<const std::string_view>(H::names), v);
        }
    }
};

/// Options on a member are consumed by the enclosing struct; the value maps as T.
template<class T, class... Opts>
struct Mapping<Annotated<T, Opts...>> {
    static constexpr Shape shape = Mapping<T>::shape;

    template<class S>
    static constexpr bool serialize(const Annotated<T, Opts...> & v, S & s) {
        return Mapping<T>::serialize(v.value, s);
    }
    template<class D>
    static constexpr bool deserialize(Annotated<T, Opts...> & v, D & d) {
        return Mapping<T>::deserialize(v.value, d);
    }
};

} // namespace ShapeFusion
