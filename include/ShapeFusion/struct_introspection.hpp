#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/core_name.hpp>

#include "const_string.hpp"
#include "annotated.hpp"
#include "options.hpp"

namespace ShapeFusion {

/// External description of a struct. Specialize with
///   using Fields = StructFields<Field<&T::member, "key", Opts...>, ...>;
/// to list members explicitly (renaming or reordering without touching the
/// type), and/or
///   using Options = OptionsPack<options::name<"T">, options::as_array, ...>;
/// for struct-level options. Without Fields the members are found by pfr.
template <class T>
struct StructMeta {};

template <auto MPtr, ConstString Key, class... Opts>
struct Field;

template <class C, class T, T C::*MPtr, ConstString Key, class... Opts>
struct Field<MPtr, Key, Opts...> {
    using ClassT   = C;
    using ValueT   = T;
    // the key travels with the other options so lookups treat both alike
    using OptionsP = OptionsPack<options::key<Key>, Opts...>;
    static constexpr T C::* member = MPtr;
    static constexpr std::string_view name = Key.view();
};

template <class... F>
struct StructFields {
    using List = std::tuple<F...>;
};


namespace introspection {

namespace detail {

template<class T>
struct is_field_list : std::false_type {};

template<class... F>
struct is_field_list<StructFields<F...>> : std::true_type {};

template<class T>
concept ListsFields = requires { typename StructMeta<T>::Fields; } &&
                      is_field_list<typename StructMeta<T>::Fields>::value;

template <class T, class Pack> struct annotate;
template <class T, class... Opts> struct annotate<T, OptionsPack<Opts...>> {
    using type = Annotated<T, Opts...>;
};

/// Members of a plain aggregate, in declaration order, named by pfr.
template<class T>
struct Members {
    static constexpr std::size_t count = pfr::tuple_size_v<T>;

    template<std::size_t I>
    using type = pfr::tuple_element_t<I, T>;

    template<std::size_t I>
    static constexpr std::string_view name = pfr::get_name<I, T>();

    template<std::size_t I, class Obj>
    static constexpr decltype(auto) get(Obj & obj) {
        return (pfr::get<I>(obj));
    }
};

/// Members listed by StructMeta<T>::Fields. The reported type wraps the
/// member in Annotated<> carrying the Field options, while get() still
/// returns the member itself.
template<ListsFields T>
struct Members<T> {
    using List = typename StructMeta<T>::Fields::List;
    static constexpr std::size_t count = std::tuple_size_v<List>;

    template<std::size_t I>
    using field = std::tuple_element_t<I, List>;

    template<std::size_t I>
    using type = typename annotate<typename field<I>::ValueT, typename field<I>::OptionsP>::type;

    template<std::size_t I>
    static constexpr std::string_view name = field<I>::name;

    template<std::size_t I, class Obj>
    static constexpr decltype(auto) get(Obj & obj) {
        static_assert(std::is_same_v<std::remove_const_t<Obj>, typename field<I>::ClassT>,
                      "[[[ ShapeFusion ]]] StructMeta field points into another type");
        return (obj.*(field<I>::member));
    }
};

template<class T>
struct options_of {
    using type = OptionsPack<>;
};

template<class T>
    requires requires { typename StructMeta<T>::Options; }
struct options_of<T> {
    using type = typename StructMeta<T>::Options;
    static_assert(options::detail::is_options_pack_v<type>,
                  "[[[ ShapeFusion ]]] StructMeta<T>::Options must be an OptionsPack");
};

} // namespace detail

template<class T>
using members = detail::Members<std::remove_cv_t<T>>;

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT & s) {
    return (members<StructT>::template get<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = members<StructT>::count;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename members<StructT>::template type<Index>;

template<std::size_t Index, class StructT>
inline constexpr std::string_view structureElementNameByIndex = members<StructT>::template name<Index>;

/// Struct-level options from StructMeta<T>::Options (none if absent).
template<class StructT>
using struct_options = options::detail::field_options<typename detail::options_of<std::remove_cv_t<StructT>>::type>;

} // namespace introspection
} // namespace ShapeFusion
