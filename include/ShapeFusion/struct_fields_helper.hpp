#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace ShapeFusion {

namespace struct_fields_helper {

template<class T, std::size_t I>
using field_meta = options::detail::annotation_meta_getter<introspection::structureElementTypeByIndex<I, T>>;

template<class T, std::size_t I>
using field_opts = typename field_meta<T, I>::options;

template<class T, std::size_t I>
static consteval bool fieldIsExcluded() {
    return field_opts<T, I>::template has_option<options::detail::exclude_tag>;
}


template<class T>
struct FieldsHelper {
    static constexpr std::size_t rawFieldsCount = introspection::structureElementsCount<T>;

    static constexpr std::size_t fieldsCount = []<std::size_t... I>(std::index_sequence<I...>) consteval{
        return (std::size_t{0} + ... + (!fieldIsExcluded<T, I>() ? 1: 0));
    }(std::make_index_sequence<rawFieldsCount>{});


    template<std::size_t I>
    static consteval std::string_view fieldName() {
        using Opts    = field_opts<T, I>;
        if constexpr (Opts::template has_option<options::detail::key_tag>) {
            using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
            return KeyOpt::desc.view();
        } else {
            return introspection::structureElementNameByIndex<I, T>;
        }
    }

    /// Field may be missing from the input.
    template<std::size_t I>
    static consteval bool fieldIsOptional() {
        using Opts  = field_opts<T, I>;
        using Value = typename field_meta<T, I>::value_t;
        return Opts::template has_option<options::detail::not_required_tag> ||
               options::detail::is_optional_like<std::remove_cvref_t<Value>>::value;
    }

    /// Model index (excluded members skipped) -> raw member index.
    static constexpr std::array<std::size_t, fieldsCount> rawIndexes =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<std::size_t, fieldsCount> arr{};
            std::size_t index = 0;
            auto add_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (!fieldIsExcluded<T, J>()) {
                    arr[index++] = J;
                }
            };
            (add_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr std::array<std::string_view, fieldsCount> names =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<std::string_view, fieldsCount> arr{};
            std::size_t index = 0;
            auto add_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (!fieldIsExcluded<T, J>()) {
                    arr[index++] = fieldName<J>();
                }
            };
            (add_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr bool fieldsAreUnique = [](std::array<std::string_view, fieldsCount> inputArr) consteval{
        auto sortedArr = inputArr;
        std::ranges::sort(sortedArr);
        return std::ranges::adjacent_find(sortedArr) == sortedArr.end();
    }(names);
};

} // namespace struct_fields_helper
} // namespace ShapeFusion
