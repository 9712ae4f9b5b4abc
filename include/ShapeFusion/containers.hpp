#pragma once

#include <concepts>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "visitor.hpp"

namespace ShapeFusion {

enum class stream_write_result : std::uint8_t {
    slot_allocated,  // one value produced; keep going
    overflow,        // no room, or key already present
    error,           // unrecoverable error; abort
    value_processed, // normal state
};

namespace containers {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;

/// Text containers map to the string shape, never to a seq of char.
template<class C>
concept StringLike = std::same_as<C, std::string> || std::same_as<C, std::string_view>;

template<class C>
concept MapLike = requires(const C& m) {
    typename C::key_type;
    typename C::mapped_type;
    { m.begin() } -> std::same_as<typename C::const_iterator>;
    { m.end() } -> std::same_as<typename C::const_iterator>;
};


// ========== Reading (serialize side) ==========

template<class C>
struct seq_read_cursor;

template<class C>
    requires std::ranges::input_range<const C>
struct seq_read_cursor<C> {
    using element_type = std::ranges::range_value_t<C>;
    const C& c;
    decltype(std::ranges::begin(c)) it = std::ranges::begin(c);
    bool first = true;

    constexpr std::optional<std::size_t> size_hint() const {
        if constexpr (std::ranges::sized_range<const C>) {
            return static_cast<std::size_t>(std::ranges::size(c));
        } else {
            return std::nullopt;
        }
    }
    constexpr const element_type& get() const {
        return *it;
    }
    constexpr stream_read_result read_more() {
        if(first) {
            first = false;
        } else {
            ++ it;
        }
        if(it != std::ranges::end(c)) return stream_read_result::value;
        else return stream_read_result::end;
    }
};

template<class M>
struct map_read_cursor {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    const M& m;
    typename M::const_iterator it = m.begin();
    bool first = true;

    constexpr std::size_t size() const {
        return m.size();
    }
    constexpr stream_read_result read_more() {
        if (first) {
            first = false;
        } else {
            ++it;
        }
        return (it != m.end()) ? stream_read_result::value
                               : stream_read_result::end;
    }
    constexpr const key_type& get_key() const {
        return it->first;
    }
    constexpr const mapped_type& get_value() const {
        return it->second;
    }
};


// ========== Writing (deserialize side) ==========

template<class C>
struct seq_write_cursor;

// vector, deque, list
template<class C>
    requires requires(C& c) {
        { c.emplace_back() } -> std::same_as<typename C::value_type & >;
        c.clear();
    }
struct seq_write_cursor<C> {
    using element_type = typename C::value_type;
    C& c;
    element_type slot{};

    constexpr void reserve(std::optional<std::size_t> hint) {
        if constexpr (requires { c.reserve(std::size_t{}); }) {
            // cap untrusted hints
            if(hint) c.reserve(*hint < 4096 ? *hint : 4096);
        }
    }
    constexpr element_type & get_slot() {
        slot = element_type{};
        return slot;
    }
    constexpr stream_write_result finalize_item() {
        c.emplace_back(std::move(slot));
        return stream_write_result::value_processed;
    }
    constexpr void reset() {
        c.clear();
    }
};

// set, unordered_set: duplicates collapse
template<class C>
    requires (!requires(C& c) { c.emplace_back(); }) && requires(C& c) {
        typename C::key_type;
        c.insert(std::declval<typename C::value_type>());
        c.clear();
    } && (!requires { typename C::mapped_type; })
struct seq_write_cursor<C> {
    using element_type = typename C::value_type;
    C& c;
    element_type slot{};

    constexpr void reserve(std::optional<std::size_t>) {}
    constexpr element_type & get_slot() {
        slot = element_type{};
        return slot;
    }
    constexpr stream_write_result finalize_item() {
        c.insert(std::move(slot));
        return stream_write_result::value_processed;
    }
    constexpr void reset() {
        c.clear();
    }
};

template<class C>
concept SeqWritable = requires(C& c) {
    typename seq_write_cursor<C>::element_type;
    { seq_write_cursor<C>{c}.get_slot() } -> std::same_as<typename seq_write_cursor<C>::element_type&>;
    { seq_write_cursor<C>{c}.finalize_item() } -> std::same_as<stream_write_result>;
};

template<class C>
concept SeqReadable = requires(const C& c) {
    typename seq_read_cursor<C>::element_type;
    { seq_read_cursor<C>{c}.read_more() } -> std::same_as<stream_read_result>;
};

template<class M>
    requires requires(M& m) {
        typename M::key_type;
        typename M::mapped_type;
        { m.try_emplace(std::declval<typename M::key_type>(), std::declval<typename M::mapped_type>()) };
        m.clear();
    }
struct map_write_cursor {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    M& m;
    key_type current_key{};
    mapped_type current_value{};

    constexpr key_type& key_ref() {
        current_key = key_type{};
        return current_key;
    }
    constexpr mapped_type& value_ref() {
        current_value = mapped_type{};
        return current_value;
    }
    constexpr stream_write_result finalize_pair() {
        auto [it, inserted] = m.try_emplace(
            std::move(current_key),
            std::move(current_value)
        );
        return inserted ? stream_write_result::value_processed
                        : stream_write_result::overflow;  // duplicate key
    }
    constexpr void reset() {
        m.clear();
    }
};

} // namespace containers

} // namespace ShapeFusion
