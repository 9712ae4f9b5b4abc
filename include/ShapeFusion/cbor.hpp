#pragma once

#include <bit>
#include <cstdint>
#include <cstddef>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "shape.hpp"
#include "errors.hpp"
#include "results.hpp"
#include "context.hpp"
#include "io.hpp"
#include "byte_stream.hpp"
#include "lifetime.hpp"
#include "utf8.hpp"
#include "visitor.hpp"
#include "serializer_concept.hpp"
#include "deserializer_concept.hpp"
#include "mapping.hpp"

namespace ShapeFusion {

// CBOR (RFC 8949), self-describing.
//
//   integers          major 0/1; 128-bit values outside the 64-bit range are
//                     not representable
//   string, char      text string (major 3)
//   bytes             byte string (major 2)
//   seq, tuple        array; a seq of unknown length is written indefinite
//   map, struct       map; struct keys are the field names
//   option, unit      none and unit are null, some is the bare value
//   unit_variant      the variant name
//   other variants    map of one entry {variant name: payload}
//   newtype_struct    the bare payload
//
// In packed mode struct keys and variant names are replaced by their indexes.

struct CborConfig {
    bool packed = false;
};

namespace cbor_detail {

inline constexpr std::uint8_t MAJOR_UNSIGNED = 0;
inline constexpr std::uint8_t MAJOR_NEGATIVE = 1;
inline constexpr std::uint8_t MAJOR_BYTES    = 2;
inline constexpr std::uint8_t MAJOR_TEXT     = 3;
inline constexpr std::uint8_t MAJOR_ARRAY    = 4;
inline constexpr std::uint8_t MAJOR_MAP      = 5;
inline constexpr std::uint8_t MAJOR_TAG      = 6;
inline constexpr std::uint8_t MAJOR_SIMPLE   = 7;

inline constexpr std::uint8_t AI_INDEFINITE  = 31;

inline constexpr std::uint8_t FALSE_BYTE     = 0xF4;
inline constexpr std::uint8_t TRUE_BYTE      = 0xF5;
inline constexpr std::uint8_t NULL_BYTE      = 0xF6;
inline constexpr std::uint8_t UNDEFINED_BYTE = 0xF7;
inline constexpr std::uint8_t HALF_BYTE      = 0xF9;
inline constexpr std::uint8_t FLOAT_BYTE     = 0xFA;
inline constexpr std::uint8_t DOUBLE_BYTE    = 0xFB;
inline constexpr std::uint8_t BREAK_BYTE     = 0xFF;

constexpr double half_to_double(std::uint16_t h) {
    const bool sign = ((h >> 15) & 0x1) != 0;
    const int exp   = (h >> 10) & 0x1F;
    const int frac  = h & 0x3FF;

    double result;
    if(exp == 0) {
        // subnormal: frac * 2^-24
        result = static_cast<double>(frac) / 16777216.0;
    } else if(exp == 0x1F) {
        result = frac == 0 ? std::numeric_limits<double>::infinity()
                           : std::numeric_limits<double>::quiet_NaN();
    } else {
        result = 1.0 + static_cast<double>(frac) / 1024.0;
        int e = exp - 15;
        for(; e > 0; e --) result *= 2.0;
        for(; e < 0; e ++) result /= 2.0;
    }
    return sign ? -result : result;
}

constexpr Shape shape_of_major(std::uint8_t major) {
    switch(major) {
    case MAJOR_UNSIGNED: return Shape::U64;
    case MAJOR_NEGATIVE: return Shape::I64;
    case MAJOR_BYTES: return Shape::Bytes;
    case MAJOR_TEXT: return Shape::String;
    case MAJOR_ARRAY: return Shape::Seq;
    case MAJOR_MAP: return Shape::Map;
    default: return Shape::Unit;
    }
}

} // namespace cbor_detail


template<class It, class Sent>
class CborSerializer {
public:
    struct SeqFrame {
        serializer::Session session;
        bool indefinite = false;
    };
    struct MapFrame {
        serializer::Session session;
        bool indefinite = false;
    };
    struct StructFrame {
        serializer::Session session;
        std::uint64_t fieldIndex = 0;   // declared position, skipped fields included
    };

    constexpr CborSerializer(It first, Sent last, CborConfig config = {}):
        m_out(first, last), m_config(config)
    {}

    constexpr SerializeError getError() const {
        return m_err.get();
    }
    constexpr std::size_t pos() const {
        return m_out.pos();
    }

    constexpr bool serialize_bool(bool v)          { return put(v ? cbor_detail::TRUE_BYTE : cbor_detail::FALSE_BYTE); }
    constexpr bool serialize_i8(std::int8_t v)     { return write_signed(v); }
    constexpr bool serialize_i16(std::int16_t v)   { return write_signed(v); }
    constexpr bool serialize_i32(std::int32_t v)   { return write_signed(v); }
    constexpr bool serialize_i64(std::int64_t v)   { return write_signed(v); }
    constexpr bool serialize_u8(std::uint8_t v)    { return write_head(cbor_detail::MAJOR_UNSIGNED, v); }
    constexpr bool serialize_u16(std::uint16_t v)  { return write_head(cbor_detail::MAJOR_UNSIGNED, v); }
    constexpr bool serialize_u32(std::uint32_t v)  { return write_head(cbor_detail::MAJOR_UNSIGNED, v); }
    constexpr bool serialize_u64(std::uint64_t v)  { return write_head(cbor_detail::MAJOR_UNSIGNED, v); }

    constexpr bool serialize_i128(i128 v) {
        if(v >= 0) {
            return serialize_u128(static_cast<u128>(v));
        }
        const u128 n = static_cast<u128>(-1 - v);
        if(n > std::numeric_limits<std::uint64_t>::max()) {
            return unsupported();
        }
        return write_head(cbor_detail::MAJOR_NEGATIVE, static_cast<std::uint64_t>(n));
    }
    constexpr bool serialize_u128(u128 v) {
        if(v > std::numeric_limits<std::uint64_t>::max()) {
            return unsupported();
        }
        return write_head(cbor_detail::MAJOR_UNSIGNED, static_cast<std::uint64_t>(v));
    }

    constexpr bool serialize_f32(float v) {
        return put(cbor_detail::FLOAT_BYTE) && put_be(std::bit_cast<std::uint32_t>(v));
    }
    constexpr bool serialize_f64(double v) {
        return put(cbor_detail::DOUBLE_BYTE) && put_be(std::bit_cast<std::uint64_t>(v));
    }
    constexpr bool serialize_char(char32_t v) {
        char buf[4] = {};
        const std::size_t n = utf8::encode(v, buf);
        if(n == 0) {
            return unsupported();
        }
        return serialize_str(std::string_view(buf, n));
    }
    constexpr bool serialize_str(std::string_view v) {
        return write_head(cbor_detail::MAJOR_TEXT, v.size()) && sink(m_out.put(v));
    }
    constexpr bool serialize_bytes(std::span<const std::uint8_t> v) {
        return write_head(cbor_detail::MAJOR_BYTES, v.size()) && sink(m_out.put(v));
    }
    constexpr bool serialize_none() {
        return put(cbor_detail::NULL_BYTE);
    }
    template<class T>
    constexpr bool serialize_some(const T & v) {
        return ok() && ShapeFusion::serialize(v, *this);
    }
    constexpr bool serialize_unit() {
        return put(cbor_detail::NULL_BYTE);
    }
    constexpr bool serialize_unit_struct(std::string_view) {
        return put(cbor_detail::NULL_BYTE);
    }
    constexpr bool serialize_unit_variant(std::string_view, std::uint32_t idx, std::string_view variant) {
        return write_variant_tag(idx, variant);
    }
    template<class T>
    constexpr bool serialize_newtype_struct(std::string_view, const T & v) {
        return ok() && ShapeFusion::serialize(v, *this);
    }
    template<class T>
    constexpr bool serialize_newtype_variant(std::string_view, std::uint32_t idx, std::string_view variant, const T & v) {
        return write_head(cbor_detail::MAJOR_MAP, 1)
            && write_variant_tag(idx, variant)
            && ShapeFusion::serialize(v, *this);
    }

    // ========== Sequences ==========

    constexpr bool begin_seq(std::optional<std::size_t> len, SeqFrame & fr) {
        if(!open_container(cbor_detail::MAJOR_ARRAY, len)) return false;
        fr.indefinite = !len.has_value();
        fr.session.start(Shape::Seq, len);
        return true;
    }
    constexpr bool begin_tuple(std::size_t len, SeqFrame & fr) {
        if(!write_head(cbor_detail::MAJOR_ARRAY, len)) return false;
        fr.session.start(Shape::Tuple, len);
        return true;
    }
    constexpr bool begin_tuple_struct(std::string_view, std::size_t len, SeqFrame & fr) {
        if(!write_head(cbor_detail::MAJOR_ARRAY, len)) return false;
        fr.session.start(Shape::TupleStruct, len);
        return true;
    }
    constexpr bool begin_tuple_variant(std::string_view, std::uint32_t idx, std::string_view variant, std::size_t len, SeqFrame & fr) {
        if(!write_head(cbor_detail::MAJOR_MAP, 1)) return false;
        if(!write_variant_tag(idx, variant)) return false;
        if(!write_head(cbor_detail::MAJOR_ARRAY, len)) return false;
        fr.session.start(Shape::TupleVariant, len);
        return true;
    }
    template<class T>
    constexpr bool serialize_element(SeqFrame & fr, const T & v) {
        return entry(fr.session) && ShapeFusion::serialize(v, *this);
    }
    constexpr bool end(SeqFrame & fr) {
        if(!close(fr.session)) return false;
        return fr.indefinite ? put(cbor_detail::BREAK_BYTE) : true;
    }

    // ========== Maps ==========

    constexpr bool begin_map(std::optional<std::size_t> len, MapFrame & fr) {
        if(!open_container(cbor_detail::MAJOR_MAP, len)) return false;
        fr.indefinite = !len.has_value();
        fr.session.start(Shape::Map, len);
        return true;
    }
    template<class K>
    constexpr bool serialize_key(MapFrame & fr, const K & k) {
        if(!ok()) return false;
        if(!fr.session.open || fr.session.keyPending) {
            return m_err.setError(SerializeError::SESSION_MISUSE);
        }
        if(!fr.session.roomForOneMore()) {
            return m_err.setError(SerializeError::LENGTH_MISMATCH);
        }
        fr.session.keyPending = true;
        return ShapeFusion::serialize(k, *this);
    }
    template<class V>
    constexpr bool serialize_value(MapFrame & fr, const V & v) {
        if(!ok()) return false;
        if(!fr.session.open || !fr.session.keyPending) {
            return m_err.setError(SerializeError::SESSION_MISUSE);
        }
        fr.session.keyPending = false;
        fr.session.count ++;
        return ShapeFusion::serialize(v, *this);
    }
    constexpr bool end(MapFrame & fr) {
        if(!close(fr.session)) return false;
        return fr.indefinite ? put(cbor_detail::BREAK_BYTE) : true;
    }

    // ========== Structs ==========

    constexpr bool begin_struct(std::string_view, std::size_t len, StructFrame & fr) {
        if(!write_head(cbor_detail::MAJOR_MAP, len)) return false;
        fr.session.start(Shape::Struct, len);
        return true;
    }
    constexpr bool begin_struct_variant(std::string_view, std::uint32_t idx, std::string_view variant, std::size_t len, StructFrame & fr) {
        if(!write_head(cbor_detail::MAJOR_MAP, 1)) return false;
        if(!write_variant_tag(idx, variant)) return false;
        if(!write_head(cbor_detail::MAJOR_MAP, len)) return false;
        fr.session.start(Shape::StructVariant, len);
        return true;
    }
    template<class T>
    constexpr bool serialize_field(StructFrame & fr, std::string_view key, const T & v) {
        if(!entry(fr.session)) return false;
        const std::uint64_t index = fr.fieldIndex ++;
        const bool keyWritten = m_config.packed
            ? write_head(cbor_detail::MAJOR_UNSIGNED, index)
            : serialize_str(key);
        return keyWritten && ShapeFusion::serialize(v, *this);
    }
    constexpr bool skip_field(StructFrame & fr, std::string_view) {
        if(!ok()) return false;
        if(!fr.session.open) {
            return m_err.setError(SerializeError::SESSION_MISUSE);
        }
        fr.fieldIndex ++;
        return true;
    }
    constexpr bool end(StructFrame & fr) {
        return close(fr.session);
    }

    constexpr bool fail(SerializeError e) {
        return m_err.setError(e);
    }
    constexpr bool finish() {
        return ok();
    }

private:
    ByteSink<It, Sent> m_out;
    CborConfig m_config;
    serializer::ErrorState m_err{};

    constexpr bool ok() const {
        return m_err.ok();
    }
    constexpr bool unsupported() {
        return m_err.setError(SerializeError::UNSUPPORTED_SHAPE);
    }
    constexpr bool sink(bool written) {
        return written ? true : m_err.setError(SerializeError::WRITER_ERROR);
    }
    constexpr bool put(std::uint8_t b) {
        return ok() && sink(m_out.put(b));
    }
    template<class U>
    constexpr bool put_be(U v) {
        return ok() && sink(m_out.put_be(v));
    }

    // Encode "major type N, argument v" as per RFC 8949, shortest form.
    constexpr bool write_head(std::uint8_t major, std::uint64_t v) {
        const std::uint8_t mt = static_cast<std::uint8_t>(major << 5);
        if(v <= 23u) {
            return put(static_cast<std::uint8_t>(mt | static_cast<std::uint8_t>(v)));
        } else if(v <= 0xFFu) {
            return put(static_cast<std::uint8_t>(mt | 24u)) && put(static_cast<std::uint8_t>(v));
        } else if(v <= 0xFFFFu) {
            return put(static_cast<std::uint8_t>(mt | 25u)) && put_be(static_cast<std::uint16_t>(v));
        } else if(v <= 0xFFFFFFFFu) {
            return put(static_cast<std::uint8_t>(mt | 26u)) && put_be(static_cast<std::uint32_t>(v));
        } else {
            return put(static_cast<std::uint8_t>(mt | 27u)) && put_be(v);
        }
    }

    template<class Int>
    constexpr bool write_signed(Int value) {
        if(value >= 0) {
            return write_head(cbor_detail::MAJOR_UNSIGNED, static_cast<std::uint64_t>(value));
        }
        // -1 - n encoded in major type 1
        const std::int64_t v = value;
        return write_head(cbor_detail::MAJOR_NEGATIVE, static_cast<std::uint64_t>(-1 - v));
    }

    constexpr bool open_container(std::uint8_t major, std::optional<std::size_t> len) {
        if(len) {
            return write_head(major, *len);
        }
        return put(static_cast<std::uint8_t>((major << 5) | cbor_detail::AI_INDEFINITE));
    }

    constexpr bool write_variant_tag(std::uint32_t idx, std::string_view variant) {
        if(m_config.packed) {
            return write_head(cbor_detail::MAJOR_UNSIGNED, idx);
        }
        return serialize_str(variant);
    }

    constexpr bool entry(serializer::Session & s) {
        if(!ok()) return false;
        if(!s.open) {
            return m_err.setError(SerializeError::SESSION_MISUSE);
        }
        if(!s.roomForOneMore()) {
            return m_err.setError(SerializeError::LENGTH_MISMATCH);
        }
        s.count ++;
        return true;
    }
    constexpr bool close(serializer::Session & s) {
        if(!ok()) return false;
        SerializeError e = s.closeError();
        if(e != SerializeError::NO_ERROR) {
            return m_err.setError(e);
        }
        s.open = false;
        return true;
    }
};

static_assert(serializer::SerializerLike<CborSerializer<std::uint8_t*, std::uint8_t*>>);


template<class It, class Sent>
class CborDeserializer {
public:
    constexpr CborDeserializer(It first, Sent last, std::size_t maxDepth = default_max_nesting_depth()):
        m_in(first, last), m_ctx(maxDepth)
    {}

    constexpr DeserializationContext & context() {
        return m_ctx;
    }
    constexpr bool is_self_describing() const {
        return true;
    }
    /// Definite-length strings are offered in place when the input allows it;
    /// indefinite-length ones are reassembled and offered owned.
    constexpr Flavor string_flavor() const {
        return ByteSource<It, Sent>::can_borrow ? Flavor::borrowed : Flavor::transient;
    }
    constexpr std::size_t pos() const {
        return m_in.pos();
    }
    constexpr bool finish() {
        if(m_ctx.failed()) return false;
        if(!m_in.at_end()) {
            return fail(DeserializeError::TRAILING_DATA);
        }
        return true;
    }

    // ========== Sessions ==========

    /// Elements of a definite array (counted) or an indefinite one (until break).
    class SeqAccess {
        CborDeserializer * m_de;
        std::uint64_t m_remaining;
        bool m_indefinite;
        bool m_ended = false;
    public:
        constexpr SeqAccess(CborDeserializer * de, std::uint64_t count, bool indefinite):
            m_de(de), m_remaining(count), m_indefinite(indefinite) {}

        template<class T>
        constexpr stream_read_result next_element(T & out) {
            if(m_de->m_ctx.failed()) return stream_read_result::error;
            switch(m_de->at_container_end(m_indefinite, m_remaining, m_ended)) {
            case stream_read_result::end: return stream_read_result::end;
            case stream_read_result::error: return stream_read_result::error;
            case stream_read_result::value: break;
            }
            return ShapeFusion::deserialize(out, *m_de) ? stream_read_result::value : stream_read_result::error;
        }
        constexpr std::optional<std::size_t> size_hint() const {
            if(m_indefinite) return std::nullopt;
            return static_cast<std::size_t>(m_remaining);
        }
        constexpr bool close() {
            return m_de->close_container(m_indefinite, m_remaining, m_ended);
        }
    };

    class MapAccess {
        CborDeserializer * m_de;
        std::uint64_t m_remaining;
        bool m_indefinite;
        bool m_ended = false;
    public:
        constexpr MapAccess(CborDeserializer * de, std::uint64_t count, bool indefinite):
            m_de(de), m_remaining(count), m_indefinite(indefinite) {}

        template<class K>
        constexpr stream_read_result next_key(K & out) {
            if(m_de->m_ctx.failed()) return stream_read_result::error;
            switch(m_de->at_container_end(m_indefinite, m_remaining, m_ended)) {
            case stream_read_result::end: return stream_read_result::end;
            case stream_read_result::error: return stream_read_result::error;
            case stream_read_result::value: break;
            }
            return ShapeFusion::deserialize(out, *m_de) ? stream_read_result::value : stream_read_result::error;
        }
        template<class V>
        constexpr bool next_value(V & out) {
            if(m_de->m_ctx.failed()) return false;
            return ShapeFusion::deserialize(out, *m_de);
        }
        constexpr std::optional<std::size_t> size_hint() const {
            if(m_indefinite) return std::nullopt;
            return static_cast<std::size_t>(m_remaining);
        }
        constexpr bool close() {
            return m_de->close_container(m_indefinite, m_remaining, m_ended);
        }
    };

    /// Either a bare variant tag (unit variant) or a one-entry map {tag: payload}.
    class EnumAccess {
        CborDeserializer * m_de;
        bool m_hasPayload;
    public:
        constexpr EnumAccess(CborDeserializer * de, bool hasPayload): m_de(de), m_hasPayload(hasPayload) {}

        template<class Id>
        constexpr bool variant(Id & id) {
            return ShapeFusion::deserialize(id, *m_de);
        }
        constexpr bool unit_variant() {
            if(!m_hasPayload) return !m_de->m_ctx.failed();
            // {tag: null} is accepted as a unit variant
            std::uint8_t b;
            if(!m_de->need(m_de->m_in.peek(b))) return false;
            if(b == cbor_detail::NULL_BYTE) {
                return m_de->need(m_de->m_in.read(b));
            }
            return m_de->payload_mismatch(Shape::UnitVariant);
        }
        template<class T>
        constexpr bool newtype_variant(T & out) {
            if(!m_hasPayload) return m_de->payload_mismatch(Shape::NewtypeVariant);
            return ShapeFusion::deserialize(out, *m_de);
        }
        template<class V>
        constexpr bool tuple_variant(std::size_t, V & visitor) {
            if(!m_hasPayload) return m_de->payload_mismatch(Shape::TupleVariant);
            return m_de->expect_container(cbor_detail::MAJOR_ARRAY, visitor, Shape::TupleVariant);
        }
        template<class V>
        constexpr bool struct_variant(std::span<const std::string_view>, V & visitor) {
            if(!m_hasPayload) return m_de->payload_mismatch(Shape::StructVariant);
            return m_de->expect_container(cbor_detail::MAJOR_MAP, visitor, Shape::StructVariant);
        }
    };

    // ========== Entry points ==========

    template<class V>
    constexpr bool deserialize_any(V & v) {
        std::uint8_t ib;
        if(!peek_item(ib)) return false;
        switch(ib >> 5) {
        case cbor_detail::MAJOR_UNSIGNED: {
            std::uint64_t x;
            if(!read_head(x)) return false;
            return done(visitor::visit_u64(v, x, m_ctx));
        }
        case cbor_detail::MAJOR_NEGATIVE: {
            std::uint64_t n;
            if(!read_head(n)) return false;
            if(n <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return done(visitor::visit_i64(v, -1 - static_cast<std::int64_t>(n), m_ctx));
            }
            return done(visitor::visit_i128(v, -1 - static_cast<i128>(n), m_ctx));
        }
        case cbor_detail::MAJOR_BYTES:
            return read_bytes(v);
        case cbor_detail::MAJOR_TEXT:
            return read_text(v);
        case cbor_detail::MAJOR_ARRAY:
            return read_array(v, Shape::Seq);
        case cbor_detail::MAJOR_MAP:
            return read_map(v, Shape::Map);
        default:
            break;
        }

        switch(ib) {
        case cbor_detail::FALSE_BYTE:
        case cbor_detail::TRUE_BYTE:
            if(!need(m_in.read(ib))) return false;
            return done(visitor::visit_bool(v, ib == cbor_detail::TRUE_BYTE, m_ctx));
        case cbor_detail::NULL_BYTE:
        case cbor_detail::UNDEFINED_BYTE:
            if(!need(m_in.read(ib))) return false;
            return done(visitor::visit_unit(v, m_ctx));
        case cbor_detail::HALF_BYTE: {
            std::uint16_t bits;
            if(!need(m_in.read(ib))) return false;
            if(!need(m_in.read_be(bits))) return false;
            return done(visitor::visit_f64(v, cbor_detail::half_to_double(bits), m_ctx));
        }
        case cbor_detail::FLOAT_BYTE: {
            std::uint32_t bits;
            if(!need(m_in.read(ib))) return false;
            if(!need(m_in.read_be(bits))) return false;
            return done(visitor::visit_f32(v, std::bit_cast<float>(bits), m_ctx));
        }
        case cbor_detail::DOUBLE_BYTE: {
            std::uint64_t bits;
            if(!need(m_in.read(ib))) return false;
            if(!need(m_in.read_be(bits))) return false;
            return done(visitor::visit_f64(v, std::bit_cast<double>(bits), m_ctx));
        }
        default:
            return fail(DeserializeError::ILLFORMED_INPUT);
        }
    }

    template<class V> constexpr bool deserialize_bool(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_i8(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_i16(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_i32(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_i64(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_i128(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_u8(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_u16(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_u32(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_u64(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_u128(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_f32(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_f64(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_char(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_str(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_string(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_bytes(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_byte_buf(V & v) { return deserialize_any(v); }

    /// null (or undefined) is none; anything else is the present value.
    template<class V>
    constexpr bool deserialize_option(V & v) {
        std::uint8_t ib;
        if(!peek_item(ib)) return false;
        if(ib == cbor_detail::NULL_BYTE || ib == cbor_detail::UNDEFINED_BYTE) {
            if(!need(m_in.read(ib))) return false;
            return done(visitor::visit_none(v, m_ctx));
        }
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        return done(visitor::visit_some(v, *this, m_ctx));
    }
    template<class V> constexpr bool deserialize_unit(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_unit_struct(std::string_view, V & v) { return deserialize_any(v); }

    template<class V>
    constexpr bool deserialize_newtype_struct(std::string_view, V & v) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        return done(visitor::visit_newtype_struct(v, *this, m_ctx));
    }
    template<class V> constexpr bool deserialize_seq(V & v) { return deserialize_any(v); }

    template<class V>
    constexpr bool deserialize_tuple(std::size_t, V & v) {
        return expect_container(cbor_detail::MAJOR_ARRAY, v, Shape::Tuple);
    }
    template<class V>
    constexpr bool deserialize_tuple_struct(std::string_view, std::size_t, V & v) {
        return expect_container(cbor_detail::MAJOR_ARRAY, v, Shape::TupleStruct);
    }
    template<class V> constexpr bool deserialize_map(V & v) { return deserialize_any(v); }

    template<class V>
    constexpr bool deserialize_struct(std::string_view, std::span<const std::string_view>, V & v) {
        std::uint8_t ib;
        if(!peek_item(ib)) return false;
        if((ib >> 5) == cbor_detail::MAJOR_MAP) {
            return read_map(v, Shape::Struct);
        }
        return deserialize_any(v);
    }

    template<class V>
    constexpr bool deserialize_enum(std::string_view, std::span<const std::string_view>, V & v) {
        std::uint8_t ib;
        if(!peek_item(ib)) return false;
        const std::uint8_t major = ib >> 5;

        auto guard = m_ctx.enter();
        if(!guard) return stamp();

        if(major == cbor_detail::MAJOR_TEXT || major == cbor_detail::MAJOR_UNSIGNED) {
            EnumAccess access(this, false);
            return done(visitor::visit_enum(v, access, Shape::UnitVariant, m_ctx));
        }
        if(major != cbor_detail::MAJOR_MAP) {
            return deserialize_any(v);
        }

        std::uint64_t count = 0;
        bool indefinite = false;
        if(!read_container_head(count, indefinite)) return false;
        if(!indefinite && count != 1) {
            m_ctx.invalidLength(static_cast<std::size_t>(count), "map with a single variant entry");
            return stamp();
        }
        EnumAccess access(this, true);
        if(!visitor::visit_enum(v, access, Shape::NewtypeVariant, m_ctx)) {
            return stamp();
        }
        if(indefinite) {
            std::uint8_t b;
            if(!need(m_in.read(b))) return false;
            if(b != cbor_detail::BREAK_BYTE) {
                return fail(DeserializeError::TRAILING_ENTRIES);
            }
        }
        return true;
    }

    /// Struct keys: field names, or their indexes in packed mode.
    template<class V> constexpr bool deserialize_identifier(V & v) { return deserialize_any(v); }
    template<class V> constexpr bool deserialize_ignored_any(V & v) { return deserialize_any(v); }

private:
    ByteSource<It, Sent> m_in;
    DeserializationContext m_ctx;

    constexpr bool stamp() {
        m_ctx.stampPosition(m_in.pos());
        return false;
    }
    constexpr bool fail(DeserializeError e) {
        m_ctx.withError(e);
        return stamp();
    }
    constexpr bool done(bool ok) {
        return ok ? true : stamp();
    }
    constexpr bool need(bool read) {
        if(m_ctx.failed()) return stamp();
        return read ? true : fail(DeserializeError::UNEXPECTED_END_OF_DATA);
    }

    // Semantic tags are not interpreted. However many precede an item, they are
    // consumed here and ib is the initial byte of the tagged item.
    constexpr bool peek_item(std::uint8_t & ib) {
        while(true) {
            if(!need(m_in.peek(ib))) return false;
            if((ib >> 5) != cbor_detail::MAJOR_TAG) return true;
            std::uint64_t tag;
            if(!read_head(tag)) return false;
        }
    }

    // Reads the initial byte and its argument (RFC 8949 section 3).
    constexpr bool read_head(std::uint64_t & out) {
        std::uint8_t ib;
        if(!need(m_in.read(ib))) return false;
        return read_argument(ib & 0x1F, out);
    }

    constexpr bool read_argument(std::uint8_t ai, std::uint64_t & out) {
        if(ai < 24) {
            out = ai;
            return true;
        }
        switch(ai) {
        case 24: {
            std::uint8_t v;
            if(!need(m_in.read(v))) return false;
            out = v;
            return true;
        }
        case 25: {
            std::uint16_t v;
            if(!need(m_in.read_be(v))) return false;
            out = v;
            return true;
        }
        case 26: {
            std::uint32_t v;
            if(!need(m_in.read_be(v))) return false;
            out = v;
            return true;
        }
        case 27:
            return need(m_in.read_be(out));
        default:
            return fail(DeserializeError::ILLFORMED_INPUT);
        }
    }

    constexpr bool read_container_head(std::uint64_t & count, bool & indefinite) {
        std::uint8_t ib;
        if(!need(m_in.read(ib))) return false;
        if((ib & 0x1F) == cbor_detail::AI_INDEFINITE) {
            indefinite = true;
            count = 0;
            return true;
        }
        indefinite = false;
        return read_argument(ib & 0x1F, count);
    }

    constexpr stream_read_result at_container_end(bool indefinite, std::uint64_t & remaining, bool & ended) {
        if(ended) return stream_read_result::end;
        if(indefinite) {
            std::uint8_t b;
            if(!need(m_in.peek(b))) return stream_read_result::error;
            if(b == cbor_detail::BREAK_BYTE) {
                if(!need(m_in.read(b))) return stream_read_result::error;
                ended = true;
                return stream_read_result::end;
            }
            return stream_read_result::value;
        }
        if(remaining == 0) {
            ended = true;
            return stream_read_result::end;
        }
        remaining --;
        return stream_read_result::value;
    }

    /// Entries the visitor left unread are rejected.
    constexpr bool close_container(bool indefinite, std::uint64_t remaining, bool ended) {
        if(ended) return true;
        if(indefinite) {
            std::uint8_t b;
            if(!need(m_in.peek(b))) return false;
            if(b != cbor_detail::BREAK_BYTE) {
                return fail(DeserializeError::TRAILING_ENTRIES);
            }
            return need(m_in.read(b));
        }
        if(remaining != 0) {
            return fail(DeserializeError::TRAILING_ENTRIES);
        }
        return true;
    }

    template<class V>
    constexpr bool read_array(V & v, Shape got) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        std::uint64_t count = 0;
        bool indefinite = false;
        if(!read_container_head(count, indefinite)) return false;
        SeqAccess access(this, count, indefinite);
        if(!visitor::visit_seq(v, access, got, m_ctx)) {
            return stamp();
        }
        return access.close();
    }

    template<class V>
    constexpr bool read_map(V & v, Shape got) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        std::uint64_t count = 0;
        bool indefinite = false;
        if(!read_container_head(count, indefinite)) return false;
        MapAccess access(this, count, indefinite);
        if(!visitor::visit_map(v, access, got, m_ctx)) {
            return stamp();
        }
        return access.close();
    }

    /// A fixed shape read from an array (or a map, for struct variants);
    /// any other item is handed to the visitor as what it is.
    template<class V>
    constexpr bool expect_container(std::uint8_t major, V & v, Shape got) {
        std::uint8_t ib;
        if(!peek_item(ib)) return false;
        if((ib >> 5) != major) {
            return deserialize_any(v);
        }
        return major == cbor_detail::MAJOR_ARRAY ? read_array(v, got) : read_map(v, got);
    }

    constexpr bool payload_mismatch(Shape expected) {
        std::uint8_t ib = 0;
        const Shape got = m_in.peek(ib) ? cbor_detail::shape_of_major(ib >> 5) : Shape::Unit;
        m_ctx.invalidType(got, ShapeSet{expected}, "enum payload");
        return stamp();
    }

    template<class V>
    constexpr bool read_text(V & v) {
        std::uint8_t ib;
        if(!need(m_in.peek(ib))) return false;
        if((ib & 0x1F) == cbor_detail::AI_INDEFINITE) {
            std::vector<std::uint8_t> joined;
            if(!read_chunks(cbor_detail::MAJOR_TEXT, joined)) return false;
            std::string s(joined.begin(), joined.end());
            if(!utf8::validate(s)) {
                return fail(DeserializeError::INVALID_UTF8);
            }
            return done(visitor::visit_string(v, std::move(s), m_ctx));
        }
        std::uint64_t len;
        if(!read_head(len)) return false;
        bool visited = false;
        const bool ok = m_in.take_str(len, [&](std::string_view s, Flavor flavor) {
            visited = true;
            if(!utf8::validate(s)) {
                return m_ctx.withError(DeserializeError::INVALID_UTF8);
            }
            return visitor::visit_str(v, s, flavor, m_ctx);
        });
        return visited ? done(ok) : need(ok);
    }

    template<class V>
    constexpr bool read_bytes(V & v) {
        std::uint8_t ib;
        if(!need(m_in.peek(ib))) return false;
        if((ib & 0x1F) == cbor_detail::AI_INDEFINITE) {
            std::vector<std::uint8_t> joined;
            if(!read_chunks(cbor_detail::MAJOR_BYTES, joined)) return false;
            return done(visitor::visit_byte_buf(v, std::move(joined), m_ctx));
        }
        std::uint64_t len;
        if(!read_head(len)) return false;
        bool visited = false;
        const bool ok = m_in.take_bytes(len, [&](std::span<const std::uint8_t> b, Flavor flavor) {
            visited = true;
            return visitor::visit_bytes(v, b, flavor, m_ctx);
        });
        return visited ? done(ok) : need(ok);
    }

    // Indefinite-length string: definite chunks of the same major type until break.
    constexpr bool read_chunks(std::uint8_t major, std::vector<std::uint8_t> & out) {
        std::uint8_t ib;
        if(!need(m_in.read(ib))) return false;
        while(true) {
            if(!need(m_in.peek(ib))) return false;
            if(ib == cbor_detail::BREAK_BYTE) {
                if(!need(m_in.read(ib))) return false;
                return true;
            }
            if((ib >> 5) != major || (ib & 0x1F) == cbor_detail::AI_INDEFINITE) {
                return fail(DeserializeError::ILLFORMED_INPUT);
            }
            std::uint64_t len;
            if(!read_head(len)) return false;
            if(!need(m_in.append(len, out))) return false;
        }
    }
};

static_assert(deserializer::DeserializerLike<CborDeserializer<const std::uint8_t*, const std::uint8_t*>>);


namespace Cbor {

template<Mapped T, ByteOutputIterator It, class Sent>
constexpr SerializeResult Serialize(const T & obj, It first, Sent last, CborConfig config = {}) {
    CborSerializer<It, Sent> s(first, last, config);
    return SerializeWith(obj, s);
}

/// Replaces the contents of out.
template<Mapped T>
constexpr SerializeResult Serialize(const T & obj, std::vector<std::uint8_t> & out, CborConfig config = {}) {
    out.clear();
    return Serialize(obj, std::back_inserter(out), unbounded_sentinel{}, config);
}

template<Mapped T, ByteInputIterator It, ByteSentinelFor<It> Sent>
constexpr DeserializeResult Deserialize(T & obj, It first, Sent last) {
    CborDeserializer<It, Sent> d(first, last);
    return DeserializeWith(obj, d);
}

/// Strings and byte arrays are borrowed from in when the target accepts that,
/// so in must outlive obj.
template<Mapped T, std::ranges::input_range R>
constexpr DeserializeResult Deserialize(T & obj, const R & in) {
    return Deserialize(obj, std::ranges::begin(in), std::ranges::end(in));
}

} // namespace Cbor

} // namespace ShapeFusion
