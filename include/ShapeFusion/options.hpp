#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <optional>
#include <memory>
#include "annotated.hpp"
#include "const_string.hpp"

namespace ShapeFusion {


namespace options {

namespace detail {

struct key_tag{};
struct exclude_tag{};
struct not_required_tag{};
struct omit_if_none_tag{};
struct allow_excess_fields_tag{};
struct as_array_tag{};
struct newtype_tag{};
struct name_tag{};
}

/// Field rename.
template<ConstString Desc>
struct key {
    static_assert(Desc.printable(), "[[[ ShapeFusion ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

/// Member is not part of the struct shape: never written, never read.
struct exclude {
    using tag = detail::exclude_tag;
    static constexpr std::string_view to_string() {
        return "exclude";
    }
};

/// Field may be absent from the input; it keeps its prior value.
struct not_required {
    using tag = detail::not_required_tag;
    static constexpr std::string_view to_string() {
        return "not_required";
    }
};

/// An empty optional field is skipped on output instead of written as none.
struct omit_if_none {
    using tag = detail::omit_if_none_tag;
    static constexpr std::string_view to_string() {
        return "omit_if_none";
    }
};

// ========== Struct-level options (StructMeta<T>::Options) ==========

/// Unknown keys are skipped instead of rejected.
struct allow_excess_fields {
    using tag = detail::allow_excess_fields_tag;
    static constexpr std::string_view to_string() {
        return "allow_excess_fields";
    }
};

/// Struct maps to tuple_struct: fields by position, no keys.
struct as_array {
    using tag = detail::as_array_tag;
    static constexpr std::string_view to_string() {
        return "as_array";
    }
};

/// Single-field struct maps to newtype_struct.
struct newtype {
    using tag = detail::newtype_tag;
    static constexpr std::string_view to_string() {
        return "newtype";
    }
};

/// Struct name passed to the serializer for named shapes.
template<ConstString Desc>
struct name {
    using tag = detail::name_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "name";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


// === find_option_by_tag ===

template<class Tag, class... Opts>
struct find_option_by_tag;

// Base case: no options -> void
template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

// Recursive case: check First::tag (if present), otherwise continue
template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

};

using no_options = field_options<OptionsPack<>>;


template<class T>
struct is_options_pack : std::false_type {};

template<class... Opts>
struct is_options_pack<OptionsPack<Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_options_pack_v = is_options_pack<T>::value;


// Base: non-annotated
template<class T>
struct annotation_meta {
    using value_t = T;
    using OptionsP = OptionsPack<>;
    using options  = no_options;
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ ShapeFusion ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ ShapeFusion ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};


template <class P1, class P2> struct merge_options;
template <class ... Opts1, class ... Opts2> struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};


// Annotated<T, Opts...>
template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t = T;
    using OptionsP = OptionsPack<Opts...>;
    using options  = field_options<OptionsPack<Opts...>>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }

    // StructMeta fields: the member itself is passed, options come from Field<>
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

// Entry point with decay
template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

template<class T>
struct is_optional_like : std::false_type {};

template<class T>
struct is_optional_like<std::optional<T>> : std::true_type {};

template<class T>
struct is_optional_like<std::unique_ptr<T>> : std::true_type {};

} // namespace detail


} //namespace options


} // namespace ShapeFusion
