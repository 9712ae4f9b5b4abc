#pragma once

#include <concepts>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

#include "shape.hpp"
#include "errors.hpp"

namespace ShapeFusion {

namespace serializer {

/// Bookkeeping every format keeps for one open seq/tuple/map/struct session:
/// which shape it is, the declared length (if any) and how many entries have
/// been emitted so far.
struct Session {
    Shape                      shape = Shape::Seq;
    std::optional<std::size_t> declared;
    std::size_t                count = 0;
    bool                       keyPending = false; // map: key written, value not yet
    bool                       open = false;

    constexpr void start(Shape s, std::optional<std::size_t> len) {
        shape = s;
        declared = len;
        count = 0;
        keyPending = false;
        open = true;
    }

    /// Error to report on end(); NO_ERROR when the session was closed properly.
    constexpr SerializeError closeError() const {
        if(!open || keyPending) {
            return SerializeError::SESSION_MISUSE;
        }
        if(declared && *declared != count) {
            return SerializeError::LENGTH_MISMATCH;
        }
        return SerializeError::NO_ERROR;
    }

    /// Too many entries for a declared length is caught before they are written.
    constexpr bool roomForOneMore() const {
        return !declared || count < *declared;
    }
};

/// First-error-wins state shared by format serializers.
class ErrorState {
    SerializeError m_error = SerializeError::NO_ERROR;
public:
    constexpr bool setError(SerializeError e) {
        if(m_error == SerializeError::NO_ERROR) {
            m_error = e;
        }
        return false;
    }
    constexpr bool ok() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr SerializeError get() const {
        return m_error;
    }
};

template<typename S>
concept SerializerLike = requires(S& s,
                                  const S& cs,
                                  std::string_view name,
                                  std::uint32_t idx,
                                  std::size_t len,
                                  std::optional<std::size_t> hint,
                                  std::span<const std::uint8_t> bytes,
                                  const int & elem,
                                  typename S::SeqFrame & seqFrame,
                                  typename S::MapFrame & mapFrame,
                                  typename S::StructFrame & structFrame
                                 ) {
    // ========== Type Requirements ==========
    typename S::SeqFrame;     // seq, tuple, tuple_struct, tuple_variant
    typename S::MapFrame;     // map
    typename S::StructFrame;  // struct, struct_variant

    { cs.getError() } -> std::same_as<SerializeError>;
    { cs.pos() } -> std::same_as<std::size_t>;

    // ========== Single-call shapes ==========
    { s.serialize_bool(true) } -> std::same_as<bool>;
    { s.serialize_i8(std::int8_t{}) } -> std::same_as<bool>;
    { s.serialize_i16(std::int16_t{}) } -> std::same_as<bool>;
    { s.serialize_i32(std::int32_t{}) } -> std::same_as<bool>;
    { s.serialize_i64(std::int64_t{}) } -> std::same_as<bool>;
    { s.serialize_i128(i128{}) } -> std::same_as<bool>;
    { s.serialize_u8(std::uint8_t{}) } -> std::same_as<bool>;
    { s.serialize_u16(std::uint16_t{}) } -> std::same_as<bool>;
    { s.serialize_u32(std::uint32_t{}) } -> std::same_as<bool>;
    { s.serialize_u64(std::uint64_t{}) } -> std::same_as<bool>;
    { s.serialize_u128(u128{}) } -> std::same_as<bool>;
    { s.serialize_f32(float{}) } -> std::same_as<bool>;
    { s.serialize_f64(double{}) } -> std::same_as<bool>;
    { s.serialize_char(char32_t{}) } -> std::same_as<bool>;
    { s.serialize_str(name) } -> std::same_as<bool>;
    { s.serialize_bytes(bytes) } -> std::same_as<bool>;
    { s.serialize_none() } -> std::same_as<bool>;
    { s.serialize_some(elem) } -> std::same_as<bool>;
    { s.serialize_unit() } -> std::same_as<bool>;
    { s.serialize_unit_struct(name) } -> std::same_as<bool>;
    { s.serialize_unit_variant(name, idx, name) } -> std::same_as<bool>;
    { s.serialize_newtype_struct(name, elem) } -> std::same_as<bool>;
    { s.serialize_newtype_variant(name, idx, name, elem) } -> std::same_as<bool>;

    // ========== Sessions ==========
    { s.begin_seq(hint, seqFrame) } -> std::same_as<bool>;
    { s.begin_tuple(len, seqFrame) } -> std::same_as<bool>;
    { s.begin_tuple_struct(name, len, seqFrame) } -> std::same_as<bool>;
    { s.begin_tuple_variant(name, idx, name, len, seqFrame) } -> std::same_as<bool>;
    { s.serialize_element(seqFrame, elem) } -> std::same_as<bool>;
    { s.end(seqFrame) } -> std::same_as<bool>;

    { s.begin_map(hint, mapFrame) } -> std::same_as<bool>;
    { s.serialize_key(mapFrame, elem) } -> std::same_as<bool>;
    { s.serialize_value(mapFrame, elem) } -> std::same_as<bool>;
    { s.end(mapFrame) } -> std::same_as<bool>;

    { s.begin_struct(name, len, structFrame) } -> std::same_as<bool>;
    { s.begin_struct_variant(name, idx, name, len, structFrame) } -> std::same_as<bool>;
    { s.serialize_field(structFrame, name, elem) } -> std::same_as<bool>;
    { s.skip_field(structFrame, name) } -> std::same_as<bool>;
    { s.end(structFrame) } -> std::same_as<bool>;

    // ========== Utility Operations ==========
    // Records an error raised by mapping logic; always returns false
    { s.fail(SerializeError::CUSTOM) } -> std::same_as<bool>;
    { s.finish() } -> std::same_as<bool>;
};

template<typename S>
constexpr bool is_serializer_like_v = SerializerLike<S>;

/// Key then value in one call.
template<class S, class K, class V>
constexpr bool serialize_entry(S & s, typename S::MapFrame & fr, const K & key, const V & value) {
    return s.serialize_key(fr, key) && s.serialize_value(fr, value);
}

} // namespace serializer

} // namespace ShapeFusion
