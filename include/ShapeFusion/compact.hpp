#pragma once

#include <bit>
#include <cstdint>
#include <cstddef>
#include <iterator>
#include <optional>
#include <ranges>
#include <span>
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

// Compact positional binary format.
//
//   bool            1 byte, 0 or 1
//   integers        fixed width little-endian, 128-bit as 16 bytes
//   f32 / f64       IEEE 754 bits, little-endian
//   char            u32 code point
//   string, bytes   u64 length, then the raw bytes
//   option          u8 tag 0 (none) or 1 (some) then the value
//   seq, map        u64 length, then elements / key-value pairs
//   tuple, struct   elements / field values in order, nothing else
//   variants        u32 variant index, then the payload as above
//   unit shapes     nothing
//
// Nothing in the bytes says which shape follows, so the reader must be told:
// deserialize_any and deserialize_ignored_any fail with NOT_SELF_DESCRIBING.

template<class It, class Sent>
class CompactSerializer {
public:
    struct SeqFrame    { serializer::Session session; };
    struct MapFrame    { serializer::Session session; };
    struct StructFrame { serializer::Session session; };

    constexpr CompactSerializer(It first, Sent last): m_out(first, last) {}

    constexpr SerializeError getError() const {
        return m_err.get();
    }
    constexpr std::size_t pos() const {
        return m_out.pos();
    }

    constexpr bool serialize_bool(bool v)          { return put(static_cast<std::uint8_t>(v ? 1 : 0)); }
    constexpr bool serialize_i8(std::int8_t v)     { return put_le(static_cast<std::uint8_t>(v)); }
    constexpr bool serialize_i16(std::int16_t v)   { return put_le(static_cast<std::uint16_t>(v)); }
    constexpr bool serialize_i32(std::int32_t v)   { return put_le(static_cast<std::uint32_t>(v)); }
    constexpr bool serialize_i64(std::int64_t v)   { return put_le(static_cast<std::uint64_t>(v)); }
    constexpr bool serialize_i128(i128 v)          { return put_le(static_cast<u128>(v)); }
    constexpr bool serialize_u8(std::uint8_t v)    { return put_le(v); }
    constexpr bool serialize_u16(std::uint16_t v)  { return put_le(v); }
    constexpr bool serialize_u32(std::uint32_t v)  { return put_le(v); }
    constexpr bool serialize_u64(std::uint64_t v)  { return put_le(v); }
    constexpr bool serialize_u128(u128 v)          { return put_le(v); }
    constexpr bool serialize_f32(float v)          { return put_le(std::bit_cast<std::uint32_t>(v)); }
    constexpr bool serialize_f64(double v)         { return put_le(std::bit_cast<std::uint64_t>(v)); }
    constexpr bool serialize_char(char32_t v)      { return put_le(static_cast<std::uint32_t>(v)); }

    constexpr bool serialize_str(std::string_view v) {
        if(!put_le(static_cast<std::uint64_t>(v.size()))) return false;
        return sink(m_out.put(v));
    }
    constexpr bool serialize_bytes(std::span<const std::uint8_t> v) {
        if(!put_le(static_cast<std::uint64_t>(v.size()))) return false;
        return sink(m_out.put(v));
    }
    constexpr bool serialize_none() {
        return put(std::uint8_t{0});
    }
    template<class T>
    constexpr bool serialize_some(const T & v) {
        return put(std::uint8_t{1}) && ShapeFusion::serialize(v, *this);
    }
    constexpr bool serialize_unit() {
        return ok();
    }
    constexpr bool serialize_unit_struct(std::string_view) {
        return ok();
    }
    constexpr bool serialize_unit_variant(std::string_view, std::uint32_t idx, std::string_view) {
        return put_le(idx);
    }
    template<class T>
    constexpr bool serialize_newtype_struct(std::string_view, const T & v) {
        return ok() && ShapeFusion::serialize(v, *this);
    }
    template<class T>
    constexpr bool serialize_newtype_variant(std::string_view, std::uint32_t idx, std::string_view, const T & v) {
        return put_le(idx) && ShapeFusion::serialize(v, *this);
    }

    // ========== Sequences ==========

    constexpr bool begin_seq(std::optional<std::size_t> len, SeqFrame & fr) {
        if(!ok()) return false;
        if(!len) {
            return m_err.setError(SerializeError::LENGTH_REQUIRED);
        }
        if(!put_le(static_cast<std::uint64_t>(*len))) return false;
        fr.session.start(Shape::Seq, len);
        return true;
    }
    constexpr bool begin_tuple(std::size_t len, SeqFrame & fr) {
        return open(fr.session, Shape::Tuple, len);
    }
    constexpr bool begin_tuple_struct(std::string_view, std::size_t len, SeqFrame & fr) {
        return open(fr.session, Shape::TupleStruct, len);
    }
    constexpr bool begin_tuple_variant(std::string_view, std::uint32_t idx, std::string_view, std::size_t len, SeqFrame & fr) {
        return put_le(idx) && open(fr.session, Shape::TupleVariant, len);
    }
    template<class T>
    constexpr bool serialize_element(SeqFrame & fr, const T & v) {
        return entry(fr.session) && ShapeFusion::serialize(v, *this);
    }
    constexpr bool end(SeqFrame & fr) {
        return close(fr.session);
    }

    // ========== Maps ==========

    constexpr bool begin_map(std::optional<std::size_t> len, MapFrame & fr) {
        if(!ok()) return false;
        if(!len) {
            return m_err.setError(SerializeError::LENGTH_REQUIRED);
        }
        if(!put_le(static_cast<std::uint64_t>(*len))) return false;
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
        return close(fr.session);
    }

    // ========== Structs ==========

    constexpr bool begin_struct(std::string_view, std::size_t len, StructFrame & fr) {
        return open(fr.session, Shape::Struct, len);
    }
    constexpr bool begin_struct_variant(std::string_view, std::uint32_t idx, std::string_view, std::size_t len, StructFrame & fr) {
        return put_le(idx) && open(fr.session, Shape::StructVariant, len);
    }
    template<class T>
    constexpr bool serialize_field(StructFrame & fr, std::string_view, const T & v) {
        return entry(fr.session) && ShapeFusion::serialize(v, *this);
    }
    // fields are positional: a hole would shift every later field
    constexpr bool skip_field(StructFrame &, std::string_view) {
        if(!ok()) return false;
        return m_err.setError(SerializeError::UNSUPPORTED_SHAPE);
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
    serializer::ErrorState m_err{};

    constexpr bool ok() const {
        return m_err.ok();
    }
    constexpr bool sink(bool written) {
        return written ? true : m_err.setError(SerializeError::WRITER_ERROR);
    }
    constexpr bool put(std::uint8_t b) {
        return ok() && sink(m_out.put(b));
    }
    template<class U>
    constexpr bool put_le(U v) {
        return ok() && sink(m_out.put_le(v));
    }
    constexpr bool open(serializer::Session & s, Shape shape, std::size_t len) {
        if(!ok()) return false;
        s.start(shape, len);
        return true;
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

static_assert(serializer::SerializerLike<CompactSerializer<std::uint8_t*, std::uint8_t*>>);


template<class It, class Sent>
class CompactDeserializer {
public:
    constexpr CompactDeserializer(It first, Sent last, std::size_t maxDepth = default_max_nesting_depth()):
        m_in(first, last), m_ctx(maxDepth)
    {}

    constexpr DeserializationContext & context() {
        return m_ctx;
    }
    constexpr bool is_self_describing() const {
        return false;
    }
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

    /// Elements of a seq, tuple or struct; the count is known before the first one.
    class SeqAccess {
        CompactDeserializer * m_de;
        std::uint64_t m_remaining;
        std::optional<std::size_t> m_hint;
    public:
        constexpr SeqAccess(CompactDeserializer * de, std::uint64_t count):
            m_de(de), m_remaining(count), m_hint(static_cast<std::size_t>(count)) {}

        template<class T>
        constexpr stream_read_result next_element(T & out) {
            if(m_de->m_ctx.failed()) return stream_read_result::error;
            if(m_remaining == 0) return stream_read_result::end;
            m_remaining --;
            return ShapeFusion::deserialize(out, *m_de) ? stream_read_result::value : stream_read_result::error;
        }
        constexpr std::optional<std::size_t> size_hint() const {
            return m_hint;
        }
        constexpr std::uint64_t remaining() const {
            return m_remaining;
        }
    };

    class MapAccess {
        CompactDeserializer * m_de;
        std::uint64_t m_remaining;
        std::optional<std::size_t> m_hint;
    public:
        constexpr MapAccess(CompactDeserializer * de, std::uint64_t count):
            m_de(de), m_remaining(count), m_hint(static_cast<std::size_t>(count)) {}

        template<class K>
        constexpr stream_read_result next_key(K & out) {
            if(m_de->m_ctx.failed()) return stream_read_result::error;
            if(m_remaining == 0) return stream_read_result::end;
            m_remaining --;
            return ShapeFusion::deserialize(out, *m_de) ? stream_read_result::value : stream_read_result::error;
        }
        template<class V>
        constexpr bool next_value(V & out) {
            if(m_de->m_ctx.failed()) return false;
            return ShapeFusion::deserialize(out, *m_de);
        }
        constexpr std::optional<std::size_t> size_hint() const {
            return m_hint;
        }
        constexpr std::uint64_t remaining() const {
            return m_remaining;
        }
    };

    class EnumAccess {
        CompactDeserializer * m_de;
    public:
        constexpr explicit EnumAccess(CompactDeserializer * de): m_de(de) {}

        template<class Id>
        constexpr bool variant(Id & id) {
            return ShapeFusion::deserialize(id, *m_de);
        }
        constexpr bool unit_variant() {
            return !m_de->m_ctx.failed();
        }
        template<class T>
        constexpr bool newtype_variant(T & out) {
            return ShapeFusion::deserialize(out, *m_de);
        }
        template<class V>
        constexpr bool tuple_variant(std::size_t len, V & visitor) {
            return m_de->run_seq(visitor, len, Shape::TupleVariant);
        }
        template<class V>
        constexpr bool struct_variant(std::span<const std::string_view> fields, V & visitor) {
            return m_de->run_seq(visitor, fields.size(), Shape::StructVariant);
        }
    };

    // ========== Entry points ==========

    template<class V>
    constexpr bool deserialize_any(V &) {
        return fail(DeserializeError::NOT_SELF_DESCRIBING);
    }
    template<class V>
    constexpr bool deserialize_ignored_any(V &) {
        return fail(DeserializeError::NOT_SELF_DESCRIBING);
    }

    template<class V>
    constexpr bool deserialize_bool(V & v) {
        std::uint8_t b;
        if(!need(m_in.read(b))) return false;
        if(b > 1) {
            return fail(DeserializeError::ILLFORMED_INPUT);
        }
        return done(visitor::visit_bool(v, b == 1, m_ctx));
    }

    template<class V> constexpr bool deserialize_i8(V & v)  { return read_int<std::uint8_t>(v, [&](std::uint8_t x) { return visitor::visit_i8(v, static_cast<std::int8_t>(x), m_ctx); }); }
    template<class V> constexpr bool deserialize_i16(V & v) { return read_int<std::uint16_t>(v, [&](std::uint16_t x) { return visitor::visit_i16(v, static_cast<std::int16_t>(x), m_ctx); }); }
    template<class V> constexpr bool deserialize_i32(V & v) { return read_int<std::uint32_t>(v, [&](std::uint32_t x) { return visitor::visit_i32(v, static_cast<std::int32_t>(x), m_ctx); }); }
    template<class V> constexpr bool deserialize_i64(V & v) { return read_int<std::uint64_t>(v, [&](std::uint64_t x) { return visitor::visit_i64(v, static_cast<std::int64_t>(x), m_ctx); }); }
    template<class V> constexpr bool deserialize_i128(V & v) { return read_int<u128>(v, [&](u128 x) { return visitor::visit_i128(v, static_cast<i128>(x), m_ctx); }); }
    template<class V> constexpr bool deserialize_u8(V & v)  { return read_int<std::uint8_t>(v, [&](std::uint8_t x) { return visitor::visit_u8(v, x, m_ctx); }); }
    template<class V> constexpr bool deserialize_u16(V & v) { return read_int<std::uint16_t>(v, [&](std::uint16_t x) { return visitor::visit_u16(v, x, m_ctx); }); }
    template<class V> constexpr bool deserialize_u32(V & v) { return read_int<std::uint32_t>(v, [&](std::uint32_t x) { return visitor::visit_u32(v, x, m_ctx); }); }
    template<class V> constexpr bool deserialize_u64(V & v) { return read_int<std::uint64_t>(v, [&](std::uint64_t x) { return visitor::visit_u64(v, x, m_ctx); }); }
    template<class V> constexpr bool deserialize_u128(V & v) { return read_int<u128>(v, [&](u128 x) { return visitor::visit_u128(v, x, m_ctx); }); }
    template<class V> constexpr bool deserialize_f32(V & v) { return read_int<std::uint32_t>(v, [&](std::uint32_t x) { return visitor::visit_f32(v, std::bit_cast<float>(x), m_ctx); }); }
    template<class V> constexpr bool deserialize_f64(V & v) { return read_int<std::uint64_t>(v, [&](std::uint64_t x) { return visitor::visit_f64(v, std::bit_cast<double>(x), m_ctx); }); }

    template<class V>
    constexpr bool deserialize_char(V & v) {
        std::uint32_t x;
        if(!need(m_in.read_le(x))) return false;
        if(!utf8::is_scalar_value(static_cast<char32_t>(x))) {
            return fail(DeserializeError::ILLFORMED_INPUT);
        }
        return done(visitor::visit_char(v, static_cast<char32_t>(x), m_ctx));
    }

    template<class V>
    constexpr bool deserialize_str(V & v) {
        std::uint64_t len;
        if(!need(m_in.read_le(len))) return false;
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
    constexpr bool deserialize_string(V & v) {
        return deserialize_str(v);
    }
    template<class V>
    constexpr bool deserialize_bytes(V & v) {
        std::uint64_t len;
        if(!need(m_in.read_le(len))) return false;
        bool visited = false;
        const bool ok = m_in.take_bytes(len, [&](std::span<const std::uint8_t> b, Flavor flavor) {
            visited = true;
            return visitor::visit_bytes(v, b, flavor, m_ctx);
        });
        return visited ? done(ok) : need(ok);
    }
    template<class V>
    constexpr bool deserialize_byte_buf(V & v) {
        return deserialize_bytes(v);
    }

    template<class V>
    constexpr bool deserialize_option(V & v) {
        std::uint8_t tag;
        if(!need(m_in.read(tag))) return false;
        if(tag == 0) {
            return done(visitor::visit_none(v, m_ctx));
        }
        if(tag != 1) {
            return fail(DeserializeError::ILLFORMED_INPUT);
        }
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        return done(visitor::visit_some(v, *this, m_ctx));
    }
    template<class V>
    constexpr bool deserialize_unit(V & v) {
        return done(visitor::visit_unit(v, m_ctx));
    }
    template<class V>
    constexpr bool deserialize_unit_struct(std::string_view, V & v) {
        return done(visitor::visit_unit(v, m_ctx));
    }
    template<class V>
    constexpr bool deserialize_newtype_struct(std::string_view, V & v) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        return done(visitor::visit_newtype_struct(v, *this, m_ctx));
    }

    template<class V>
    constexpr bool deserialize_seq(V & v) {
        std::uint64_t len;
        if(!need(m_in.read_le(len))) return false;
        return run_seq(v, len, Shape::Seq);
    }
    template<class V>
    constexpr bool deserialize_tuple(std::size_t len, V & v) {
        return run_seq(v, len, Shape::Tuple);
    }
    template<class V>
    constexpr bool deserialize_tuple_struct(std::string_view, std::size_t len, V & v) {
        return run_seq(v, len, Shape::TupleStruct);
    }
    template<class V>
    constexpr bool deserialize_map(V & v) {
        std::uint64_t len;
        if(!need(m_in.read_le(len))) return false;
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        MapAccess access(this, len);
        if(!visitor::visit_map(v, access, Shape::Map, m_ctx)) {
            return stamp();
        }
        if(access.remaining() != 0) {
            return fail(DeserializeError::TRAILING_ENTRIES);
        }
        return true;
    }
    /// Fields come in declaration order without keys; the visitor sees a seq.
    template<class V>
    constexpr bool deserialize_struct(std::string_view, std::span<const std::string_view> fields, V & v) {
        return run_seq(v, fields.size(), Shape::Struct);
    }
    template<class V>
    constexpr bool deserialize_enum(std::string_view, std::span<const std::string_view>, V & v) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        EnumAccess access(this);
        return done(visitor::visit_enum(v, access, Shape::NewtypeVariant, m_ctx));
    }
    /// Field and variant identifiers are written as u32 indexes.
    template<class V>
    constexpr bool deserialize_identifier(V & v) {
        return deserialize_u32(v);
    }

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

    template<class U, class V, class F>
    constexpr bool read_int(V &, F && visit) {
        U x;
        if(!need(m_in.read_le(x))) return false;
        return done(visit(x));
    }

    template<class V>
    constexpr bool run_seq(V & v, std::uint64_t len, Shape got) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        SeqAccess access(this, len);
        if(!visitor::visit_seq(v, access, got, m_ctx)) {
            return stamp();
        }
        if(access.remaining() != 0) {
            return fail(DeserializeError::TRAILING_ENTRIES);
        }
        return true;
    }
};

static_assert(deserializer::DeserializerLike<CompactDeserializer<const std::uint8_t*, const std::uint8_t*>>);


namespace Compact {

template<Mapped T, ByteOutputIterator It, class Sent>
constexpr SerializeResult Serialize(const T & obj, It first, Sent last) {
    CompactSerializer<It, Sent> s(first, last);
    return SerializeWith(obj, s);
}

/// Replaces the contents of out.
template<Mapped T>
constexpr SerializeResult Serialize(const T & obj, std::vector<std::uint8_t> & out) {
    out.clear();
    return Serialize(obj, std::back_inserter(out), unbounded_sentinel{});
}

template<Mapped T, ByteInputIterator It, ByteSentinelFor<It> Sent>
constexpr DeserializeResult Deserialize(T & obj, It first, Sent last) {
    CompactDeserializer<It, Sent> d(first, last);
    return DeserializeWith(obj, d);
}

/// Strings and byte arrays are borrowed from in when the target accepts that,
/// so in must outlive obj.
template<Mapped T, std::ranges::input_range R>
constexpr DeserializeResult Deserialize(T & obj, const R & in) {
    return Deserialize(obj, std::ranges::begin(in), std::ranges::end(in));
}

} // namespace Compact

} // namespace ShapeFusion
