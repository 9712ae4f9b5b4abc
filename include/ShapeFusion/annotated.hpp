#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

namespace ShapeFusion {

template<class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

/// Attaches mapping options to a struct member without changing how the
/// member is used: Annotated<std::string, key<"id">> behaves like std::string.
template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;
    constexpr Annotated(const Annotated&) = default;
    constexpr Annotated(Annotated&&) = default;
    constexpr Annotated& operator=(const Annotated&) = default;
    constexpr Annotated& operator=(Annotated&&) = default;

    // construct from T or anything convertible to T
    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }

    constexpr bool operator==(const Annotated&) const = default;
};

template<class T>
struct is_annotated : std::false_type {};

template<class T, class... Opts>
struct is_annotated<Annotated<T, Opts...>> : std::true_type {};

template<class T, class... Opts, class U>
    requires (!is_annotated<U>::value) && requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Annotated<T, Opts...>& lhs,
                const U& rhs)
{
    return lhs.value == rhs;
}

} // namespace ShapeFusion
