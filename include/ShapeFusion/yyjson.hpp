#pragma once
#include <yyjson.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "shape.hpp"
#include "errors.hpp"
#include "results.hpp"
#include "context.hpp"
#include "lifetime.hpp"
#include "utf8.hpp"
#include "visitor.hpp"
#include "serializer_concept.hpp"
#include "deserializer_concept.hpp"
#include "mapping.hpp"

namespace ShapeFusion {

// JSON through the yyjson DOM.
//
//   unit, none, unit_struct      null
//   some, newtype_struct         the bare value
//   char                         one-character string
//   bytes                        array of numbers
//   seq, tuple                   array
//   map, struct                  object; integer map keys are written as strings
//   unit_variant                 "Variant"
//   other variants               {"Variant": payload}
//
// Positions are node ordinals while walking a document and byte offsets for
// text that yyjson rejected.

struct JsonConfig {
    bool pretty = false;
};

class YyjsonSerializer {
public:
    /// One open array or object; frames live on the caller's stack and chain
    /// to their parent.
    struct Scope {
        yyjson_mut_val * node = nullptr;
        bool isMap = false;
        yyjson_mut_val * pendingKey = nullptr;
        Scope * parent = nullptr;
    };

    struct SeqFrame {
        serializer::Session session;
        Scope scope;
    };
    struct MapFrame {
        serializer::Session session;
        Scope scope;
    };
    struct StructFrame {
        serializer::Session session;
        Scope scope;
    };

    explicit YyjsonSerializer(yyjson_mut_doc * doc): m_doc(doc) {
        if(!m_doc) {
            m_err.setError(SerializeError::WRITER_ERROR);
        }
    }

    SerializeError getError() const {
        return m_err.get();
    }
    std::size_t pos() const {
        return m_nodes;
    }

    bool serialize_bool(bool v)          { return attach(ok() ? yyjson_mut_bool(m_doc, v) : nullptr); }
    bool serialize_i8(std::int8_t v)     { return write_sint(v); }
    bool serialize_i16(std::int16_t v)   { return write_sint(v); }
    bool serialize_i32(std::int32_t v)   { return write_sint(v); }
    bool serialize_i64(std::int64_t v)   { return write_sint(v); }
    bool serialize_u8(std::uint8_t v)    { return write_uint(v); }
    bool serialize_u16(std::uint16_t v)  { return write_uint(v); }
    bool serialize_u32(std::uint32_t v)  { return write_uint(v); }
    bool serialize_u64(std::uint64_t v)  { return write_uint(v); }

    bool serialize_i128(i128 v) {
        if(v < std::numeric_limits<std::int64_t>::lowest() || v > std::numeric_limits<std::int64_t>::max()) {
            if(v > 0 && v <= std::numeric_limits<std::uint64_t>::max()) {
                return write_uint(static_cast<std::uint64_t>(v));
            }
            return fail(SerializeError::UNSUPPORTED_SHAPE);
        }
        return write_sint(static_cast<std::int64_t>(v));
    }
    bool serialize_u128(u128 v) {
        if(v > std::numeric_limits<std::uint64_t>::max()) {
            return fail(SerializeError::UNSUPPORTED_SHAPE);
        }
        return write_uint(static_cast<std::uint64_t>(v));
    }
    bool serialize_f32(float v) {
        return serialize_f64(static_cast<double>(v));
    }
    bool serialize_f64(double v) {
        if(!ok()) return false;
        // JSON has no literal for them
        if(!std::isfinite(v)) {
            return fail(SerializeError::UNSUPPORTED_SHAPE);
        }
        return attach(yyjson_mut_real(m_doc, v));
    }
    bool serialize_char(char32_t v) {
        char buf[4] = {};
        const std::size_t n = utf8::encode(v, buf);
        if(n == 0) {
            return fail(SerializeError::UNSUPPORTED_SHAPE);
        }
        return serialize_str(std::string_view(buf, n));
    }
    bool serialize_str(std::string_view v) {
        if(!ok()) return false;
        return attach(yyjson_mut_strncpy(m_doc, v.data(), v.size()));
    }
    bool serialize_bytes(std::span<const std::uint8_t> v) {
        if(!ok()) return false;
        if(m_keyMode) {
            return fail(SerializeError::KEY_MUST_BE_STRING);
        }
        yyjson_mut_val * arr = yyjson_mut_arr(m_doc);
        if(!attach(arr)) return false;
        for(std::uint8_t b: v) {
            yyjson_mut_val * n = yyjson_mut_uint(m_doc, b);
            if(!n || !yyjson_mut_arr_add_val(arr, n)) {
                return fail(SerializeError::WRITER_ERROR);
            }
            m_nodes ++;
        }
        return true;
    }
    bool serialize_none() {
        return attach(ok() ? yyjson_mut_null(m_doc) : nullptr);
    }
    template<class T>
    bool serialize_some(const T & v) {
        return ok() && ShapeFusion::serialize(v, *this);
    }
    bool serialize_unit() {
        return serialize_none();
    }
    bool serialize_unit_struct(std::string_view) {
        return serialize_none();
    }
    bool serialize_unit_variant(std::string_view, std::uint32_t, std::string_view variant) {
        return serialize_str(variant);
    }
    template<class T>
    bool serialize_newtype_struct(std::string_view, const T & v) {
        return ok() && ShapeFusion::serialize(v, *this);
    }
    template<class T>
    bool serialize_newtype_variant(std::string_view, std::uint32_t, std::string_view variant, const T & v) {
        Scope wrapper;
        if(!open_variant(variant, wrapper)) return false;
        m_scope = &wrapper;
        const bool written = ShapeFusion::serialize(v, *this);
        m_scope = wrapper.parent;
        return written;
    }

    // ========== Sequences ==========

    bool begin_seq(std::optional<std::size_t> len, SeqFrame & fr) {
        if(!open(fr.scope, yyjson_mut_arr(m_doc), false)) return false;
        fr.session.start(Shape::Seq, len);
        return true;
    }
    bool begin_tuple(std::size_t len, SeqFrame & fr) {
        if(!open(fr.scope, yyjson_mut_arr(m_doc), false)) return false;
        fr.session.start(Shape::Tuple, len);
        return true;
    }
    bool begin_tuple_struct(std::string_view, std::size_t len, SeqFrame & fr) {
        if(!open(fr.scope, yyjson_mut_arr(m_doc), false)) return false;
        fr.session.start(Shape::TupleStruct, len);
        return true;
    }
    bool begin_tuple_variant(std::string_view, std::uint32_t, std::string_view variant, std::size_t len, SeqFrame & fr) {
        if(!open_variant_body(variant, fr.scope, yyjson_mut_arr(m_doc), false)) return false;
        fr.session.start(Shape::TupleVariant, len);
        return true;
    }
    template<class T>
    bool serialize_element(SeqFrame & fr, const T & v) {
        return entry(fr.session, fr.scope) && ShapeFusion::serialize(v, *this);
    }
    bool end(SeqFrame & fr) {
        return close(fr.session, fr.scope);
    }

    // ========== Maps ==========

    bool begin_map(std::optional<std::size_t> len, MapFrame & fr) {
        if(!open(fr.scope, yyjson_mut_obj(m_doc), true)) return false;
        fr.session.start(Shape::Map, len);
        return true;
    }
    template<class K>
    bool serialize_key(MapFrame & fr, const K & k) {
        if(!ok()) return false;
        if(!fr.session.open || fr.session.keyPending || m_scope != &fr.scope) {
            return fail(SerializeError::SESSION_MISUSE);
        }
        if(!fr.session.roomForOneMore()) {
            return fail(SerializeError::LENGTH_MISMATCH);
        }
        fr.session.keyPending = true;
        m_keyMode = true;
        const bool written = ShapeFusion::serialize(k, *this);
        m_keyMode = false;
        return written;
    }
    template<class V>
    bool serialize_value(MapFrame & fr, const V & v) {
        if(!ok()) return false;
        if(!fr.session.open || !fr.session.keyPending || !fr.scope.pendingKey) {
            return fail(SerializeError::SESSION_MISUSE);
        }
        fr.session.keyPending = false;
        fr.session.count ++;
        return ShapeFusion::serialize(v, *this);
    }
    bool end(MapFrame & fr) {
        return close(fr.session, fr.scope);
    }

    // ========== Structs ==========

    bool begin_struct(std::string_view, std::size_t len, StructFrame & fr) {
        if(!open(fr.scope, yyjson_mut_obj(m_doc), true)) return false;
        fr.session.start(Shape::Struct, len);
        return true;
    }
    bool begin_struct_variant(std::string_view, std::uint32_t, std::string_view variant, std::size_t len, StructFrame & fr) {
        if(!open_variant_body(variant, fr.scope, yyjson_mut_obj(m_doc), true)) return false;
        fr.session.start(Shape::StructVariant, len);
        return true;
    }
    template<class T>
    bool serialize_field(StructFrame & fr, std::string_view key, const T & v) {
        if(!entry(fr.session, fr.scope)) return false;
        fr.scope.pendingKey = yyjson_mut_strncpy(m_doc, key.data(), key.size());
        if(!fr.scope.pendingKey) {
            return fail(SerializeError::WRITER_ERROR);
        }
        return ShapeFusion::serialize(v, *this);
    }
    bool skip_field(StructFrame & fr, std::string_view) {
        if(!ok()) return false;
        return fr.session.open ? true : fail(SerializeError::SESSION_MISUSE);
    }
    bool end(StructFrame & fr) {
        return close(fr.session, fr.scope);
    }

    bool fail(SerializeError e) {
        return m_err.setError(e);
    }
    bool finish() {
        if(!ok()) return false;
        if(m_scope || !m_root) {
            return fail(SerializeError::SESSION_MISUSE);
        }
        return true;
    }

private:
    yyjson_mut_doc * m_doc;
    yyjson_mut_val * m_root = nullptr;
    Scope * m_scope = nullptr;
    bool m_keyMode = false;
    std::size_t m_nodes = 0;
    serializer::ErrorState m_err{};

    bool ok() const {
        return m_err.ok();
    }

    bool write_sint(std::int64_t v) {
        return attach(ok() ? yyjson_mut_sint(m_doc, v) : nullptr);
    }
    bool write_uint(std::uint64_t v) {
        return attach(ok() ? yyjson_mut_uint(m_doc, v) : nullptr);
    }

    // Object keys are strings; integers are spelled out.
    yyjson_mut_val * as_key(yyjson_mut_val * v) {
        if(yyjson_mut_is_str(v)) {
            return v;
        }
        if(!yyjson_mut_is_int(v)) {
            return nullptr;
        }
        char buf[24];
        std::to_chars_result r = yyjson_mut_is_sint(v)
            ? std::to_chars(buf, buf + sizeof(buf), yyjson_mut_get_sint(v))
            : std::to_chars(buf, buf + sizeof(buf), yyjson_mut_get_uint(v));
        if(r.ec != std::errc()) {
            return nullptr;
        }
        return yyjson_mut_strncpy(m_doc, buf, static_cast<std::size_t>(r.ptr - buf));
    }

    bool attach(yyjson_mut_val * v) {
        if(!ok()) return false;
        if(!v) {
            return fail(SerializeError::WRITER_ERROR);
        }
        m_nodes ++;

        if(m_keyMode) {
            yyjson_mut_val * key = as_key(v);
            if(!key) {
                return fail(SerializeError::KEY_MUST_BE_STRING);
            }
            m_scope->pendingKey = key;
            m_keyMode = false;
            return true;
        }
        if(!m_scope) {
            if(m_root) {
                return fail(SerializeError::SESSION_MISUSE);
            }
            m_root = v;
            yyjson_mut_doc_set_root(m_doc, v);
            return true;
        }
        if(m_scope->isMap) {
            if(!m_scope->pendingKey) {
                return fail(SerializeError::SESSION_MISUSE);
            }
            if(!yyjson_mut_obj_add(m_scope->node, m_scope->pendingKey, v)) {
                return fail(SerializeError::WRITER_ERROR);
            }
            m_scope->pendingKey = nullptr;
            return true;
        }
        if(!yyjson_mut_arr_add_val(m_scope->node, v)) {
            return fail(SerializeError::WRITER_ERROR);
        }
        return true;
    }

    bool open(Scope & sc, yyjson_mut_val * node, bool isMap) {
        if(!attach(node)) return false;
        sc.node = node;
        sc.isMap = isMap;
        sc.pendingKey = nullptr;
        sc.parent = m_scope;
        m_scope = &sc;
        return true;
    }

    // {"variant": ...} with the key pending; the caller attaches the payload.
    bool open_variant(std::string_view variant, Scope & wrapper) {
        if(!ok()) return false;
        yyjson_mut_val * obj = yyjson_mut_obj(m_doc);
        if(!attach(obj)) return false;
        wrapper.node = obj;
        wrapper.isMap = true;
        wrapper.parent = m_scope;
        wrapper.pendingKey = yyjson_mut_strncpy(m_doc, variant.data(), variant.size());
        return wrapper.pendingKey ? true : fail(SerializeError::WRITER_ERROR);
    }

    bool open_variant_body(std::string_view variant, Scope & sc, yyjson_mut_val * body, bool isMap) {
        Scope wrapper;
        if(!open_variant(variant, wrapper)) return false;
        m_scope = &wrapper;
        const bool attached = attach(body);
        m_scope = wrapper.parent;
        if(!attached) return false;
        sc.node = body;
        sc.isMap = isMap;
        sc.pendingKey = nullptr;
        sc.parent = m_scope;
        m_scope = &sc;
        return true;
    }

    bool entry(serializer::Session & s, Scope & sc) {
        if(!ok()) return false;
        if(!s.open || m_scope != &sc) {
            return fail(SerializeError::SESSION_MISUSE);
        }
        if(!s.roomForOneMore()) {
            return fail(SerializeError::LENGTH_MISMATCH);
        }
        s.count ++;
        return true;
    }

    bool close(serializer::Session & s, Scope & sc) {
        if(!ok()) return false;
        if(m_scope != &sc) {
            return fail(SerializeError::SESSION_MISUSE);
        }
        SerializeError e = s.closeError();
        if(e != SerializeError::NO_ERROR) {
            return fail(e);
        }
        s.open = false;
        m_scope = sc.parent;
        return true;
    }
};

static_assert(serializer::SerializerLike<YyjsonSerializer>);


class YyjsonDeserializer {
public:
    /// Strings are offered with `flavor`: borrowed when the caller keeps the
    /// document alive for as long as the decoded value is used.
    explicit YyjsonDeserializer(yyjson_val * root, Flavor flavor = Flavor::borrowed,
                                std::size_t maxDepth = default_max_nesting_depth()):
        m_cur(root), m_flavor(flavor), m_ctx(maxDepth)
    {}

    DeserializationContext & context() {
        return m_ctx;
    }
    bool is_self_describing() const {
        return true;
    }
    Flavor string_flavor() const {
        return m_flavor;
    }
    std::size_t pos() const {
        return m_nodes;
    }
    // yyjson rejects anything after the root while parsing
    bool finish() {
        return !m_ctx.failed();
    }

    // ========== Sessions ==========

    class SeqAccess {
        YyjsonDeserializer * m_de;
        yyjson_arr_iter m_it{};
        std::size_t m_remaining;
    public:
        SeqAccess(YyjsonDeserializer * de, yyjson_val * arr): m_de(de), m_remaining(yyjson_arr_size(arr)) {
            yyjson_arr_iter_init(arr, &m_it);
        }

        template<class T>
        stream_read_result next_element(T & out) {
            if(m_de->m_ctx.failed()) return stream_read_result::error;
            yyjson_val * item = yyjson_arr_iter_next(&m_it);
            if(!item) return stream_read_result::end;
            m_remaining --;
            m_de->m_cur = item;
            return ShapeFusion::deserialize(out, *m_de) ? stream_read_result::value : stream_read_result::error;
        }
        std::optional<std::size_t> size_hint() const {
            return m_remaining;
        }
        bool exhausted() {
            return !yyjson_arr_iter_has_next(&m_it);
        }
    };

    class MapAccess {
        YyjsonDeserializer * m_de;
        yyjson_obj_iter m_it{};
        yyjson_val * m_value = nullptr;
        std::size_t m_remaining;
    public:
        MapAccess(YyjsonDeserializer * de, yyjson_val * obj): m_de(de), m_remaining(yyjson_obj_size(obj)) {
            yyjson_obj_iter_init(obj, &m_it);
        }

        template<class K>
        stream_read_result next_key(K & out) {
            if(m_de->m_ctx.failed()) return stream_read_result::error;
            yyjson_val * key = yyjson_obj_iter_next(&m_it);
            if(!key) return stream_read_result::end;
            m_remaining --;
            m_value = yyjson_obj_iter_get_val(key);
            m_de->m_cur = key;
            m_de->m_keyMode = true;
            const bool read = ShapeFusion::deserialize(out, *m_de);
            m_de->m_keyMode = false;
            return read ? stream_read_result::value : stream_read_result::error;
        }
        template<class V>
        bool next_value(V & out) {
            if(m_de->m_ctx.failed()) return false;
            if(!m_value) {
                m_de->m_ctx.withError(DeserializeError::ILLFORMED_INPUT);
                return false;
            }
            m_de->m_cur = m_value;
            m_value = nullptr;
            return ShapeFusion::deserialize(out, *m_de);
        }
        std::optional<std::size_t> size_hint() const {
            return m_remaining;
        }
        bool exhausted() {
            return !yyjson_obj_iter_has_next(&m_it);
        }
    };

    /// A bare "Variant" string or a one-member object {"Variant": payload}.
    class EnumAccess {
        YyjsonDeserializer * m_de;
        yyjson_val * m_tag;
        yyjson_val * m_payload;
    public:
        EnumAccess(YyjsonDeserializer * de, yyjson_val * tag, yyjson_val * payload):
            m_de(de), m_tag(tag), m_payload(payload) {}

        template<class Id>
        bool variant(Id & id) {
            m_de->m_cur = m_tag;
            return ShapeFusion::deserialize(id, *m_de);
        }
        bool unit_variant() {
            if(m_de->m_ctx.failed()) return false;
            if(!m_payload || yyjson_is_null(m_payload)) return true;
            return m_de->payload_mismatch(m_payload, Shape::UnitVariant);
        }
        template<class T>
        bool newtype_variant(T & out) {
            if(!m_payload) return m_de->payload_mismatch(m_tag, Shape::NewtypeVariant);
            m_de->m_cur = m_payload;
            return ShapeFusion::deserialize(out, *m_de);
        }
        template<class V>
        bool tuple_variant(std::size_t, V & visitor) {
            if(!m_payload) return m_de->payload_mismatch(m_tag, Shape::TupleVariant);
            m_de->m_cur = m_payload;
            if(!yyjson_is_arr(m_payload)) return m_de->deserialize_any(visitor);
            return m_de->read_array(visitor, m_de->take(), Shape::TupleVariant);
        }
        template<class V>
        bool struct_variant(std::span<const std::string_view>, V & visitor) {
            if(!m_payload) return m_de->payload_mismatch(m_tag, Shape::StructVariant);
            m_de->m_cur = m_payload;
            if(!yyjson_is_obj(m_payload)) return m_de->deserialize_any(visitor);
            return m_de->read_object(visitor, m_de->take(), Shape::StructVariant);
        }
    };

    // ========== Entry points ==========

    template<class V>
    bool deserialize_any(V & v) {
        yyjson_val * node = take();
        if(!node) return false;

        switch(yyjson_get_type(node)) {
        case YYJSON_TYPE_NULL:
            return visitor::visit_unit(v, m_ctx);
        case YYJSON_TYPE_BOOL:
            return visitor::visit_bool(v, yyjson_get_bool(node), m_ctx);
        case YYJSON_TYPE_NUM:
            if(yyjson_is_uint(node)) {
                return visitor::visit_u64(v, yyjson_get_uint(node), m_ctx);
            }
            if(yyjson_is_sint(node)) {
                return visitor::visit_i64(v, yyjson_get_sint(node), m_ctx);
            }
            return visitor::visit_f64(v, yyjson_get_real(node), m_ctx);
        case YYJSON_TYPE_STR:
            return visitor::visit_str(v, std::string_view(yyjson_get_str(node), yyjson_get_len(node)), m_flavor, m_ctx);
        case YYJSON_TYPE_ARR:
            return read_array(v, node, Shape::Seq);
        case YYJSON_TYPE_OBJ:
            return read_object(v, node, Shape::Map);
        default:
            m_ctx.withError(DeserializeError::ILLFORMED_INPUT);
            return false;
        }
    }

    template<class V> bool deserialize_bool(V & v) { return deserialize_any(v); }
    template<class V> bool deserialize_i8(V & v) { return deserialize_integer(v); }
    template<class V> bool deserialize_i16(V & v) { return deserialize_integer(v); }
    template<class V> bool deserialize_i32(V & v) { return deserialize_integer(v); }
    template<class V> bool deserialize_i64(V & v) { return deserialize_integer(v); }
    template<class V> bool deserialize_i128(V & v) { return deserialize_integer(v); }
    template<class V> bool deserialize_u8(V & v) { return deserialize_integer(v); }
    template<class V> bool deserialize_u16(V & v) { return deserialize_integer(v); }
    template<class V> bool deserialize_u32(V & v) { return deserialize_integer(v); }
    template<class V> bool deserialize_u64(V & v) { return deserialize_integer(v); }
    template<class V> bool deserialize_u128(V & v) { return deserialize_integer(v); }

    /// Any JSON number reads as a float.
    template<class V>
    bool deserialize_f32(V & v) {
        return deserialize_f64(v);
    }
    template<class V>
    bool deserialize_f64(V & v) {
        if(m_cur && yyjson_is_num(m_cur)) {
            yyjson_val * node = take();
            return visitor::visit_f64(v, yyjson_get_num(node), m_ctx);
        }
        return deserialize_any(v);
    }
    template<class V> bool deserialize_char(V & v) { return deserialize_any(v); }
    template<class V> bool deserialize_str(V & v) { return deserialize_any(v); }
    template<class V> bool deserialize_string(V & v) { return deserialize_any(v); }
    template<class V> bool deserialize_bytes(V & v) { return deserialize_any(v); }
    template<class V> bool deserialize_byte_buf(V & v) { return deserialize_any(v); }

    template<class V>
    bool deserialize_option(V & v) {
        if(!m_cur) {
            m_ctx.withError(DeserializeError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(yyjson_is_null(m_cur)) {
            take();
            return visitor::visit_none(v, m_ctx);
        }
        auto guard = m_ctx.enter();
        if(!guard) return false;
        return visitor::visit_some(v, *this, m_ctx);
    }
    template<class V> bool deserialize_unit(V & v) { return deserialize_any(v); }
    template<class V> bool deserialize_unit_struct(std::string_view, V & v) { return deserialize_any(v); }

    template<class V>
    bool deserialize_newtype_struct(std::string_view, V & v) {
        auto guard = m_ctx.enter();
        if(!guard) return false;
        return visitor::visit_newtype_struct(v, *this, m_ctx);
    }
    template<class V> bool deserialize_seq(V & v) { return deserialize_any(v); }
    template<class V> bool deserialize_tuple(std::size_t, V & v) { return deserialize_array_as(v, Shape::Tuple); }
    template<class V> bool deserialize_tuple_struct(std::string_view, std::size_t, V & v) { return deserialize_array_as(v, Shape::TupleStruct); }
    template<class V> bool deserialize_map(V & v) { return deserialize_any(v); }

    // A JSON array requested as a fixed-length shape is labelled with that shape.
    template<class V>
    bool deserialize_array_as(V & v, Shape got) {
        if(m_cur && yyjson_is_arr(m_cur)) {
            return read_array(v, take(), got);
        }
        return deserialize_any(v);
    }

    template<class V>
    bool deserialize_struct(std::string_view, std::span<const std::string_view>, V & v) {
        if(m_cur && yyjson_is_obj(m_cur)) {
            return read_object(v, take(), Shape::Struct);
        }
        return deserialize_any(v);
    }

    template<class V>
    bool deserialize_enum(std::string_view, std::span<const std::string_view>, V & v) {
        if(!m_cur) {
            m_ctx.withError(DeserializeError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        auto guard = m_ctx.enter();
        if(!guard) return false;

        if(yyjson_is_str(m_cur)) {
            EnumAccess access(this, m_cur, nullptr);
            return visitor::visit_enum(v, access, Shape::UnitVariant, m_ctx);
        }
        if(!yyjson_is_obj(m_cur)) {
            return deserialize_any(v);
        }
        yyjson_val * obj = take();
        if(yyjson_obj_size(obj) != 1) {
            return m_ctx.invalidLength(yyjson_obj_size(obj), "object with a single variant entry");
        }
        yyjson_obj_iter it;
        yyjson_obj_iter_init(obj, &it);
        yyjson_val * tag = yyjson_obj_iter_next(&it);
        EnumAccess access(this, tag, yyjson_obj_iter_get_val(tag));
        return visitor::visit_enum(v, access, Shape::NewtypeVariant, m_ctx);
    }

    template<class V> bool deserialize_identifier(V & v) { return deserialize_any(v); }

    /// The tree is already built, so skipping is not descending into it.
    template<class V>
    bool deserialize_ignored_any(V & v) {
        if(!take()) return false;
        return visitor::visit_unit(v, m_ctx);
    }

private:
    yyjson_val * m_cur;
    Flavor m_flavor;
    DeserializationContext m_ctx;
    bool m_keyMode = false;
    std::size_t m_nodes = 0;

    yyjson_val * take() {
        if(m_ctx.failed()) return nullptr;
        if(!m_cur) {
            m_ctx.withError(DeserializeError::UNEXPECTED_END_OF_DATA);
            return nullptr;
        }
        yyjson_val * node = m_cur;
        m_cur = nullptr;
        m_nodes ++;
        return node;
    }

    // Object keys are always strings; an integer target parses the key text.
    template<class V>
    bool deserialize_integer(V & v) {
        if(!m_keyMode || !m_cur || !yyjson_is_str(m_cur)) {
            return deserialize_any(v);
        }
        yyjson_val * node = take();
        const char * first = yyjson_get_str(node);
        const char * last = first + yyjson_get_len(node);
        if(first != last && *first == '-') {
            std::int64_t x = 0;
            auto [ptr, ec] = std::from_chars(first, last, x);
            if(ec == std::errc() && ptr == last) {
                return visitor::visit_i64(v, x, m_ctx);
            }
        } else {
            std::uint64_t x = 0;
            auto [ptr, ec] = std::from_chars(first, last, x);
            if(ec == std::errc() && ptr == last) {
                return visitor::visit_u64(v, x, m_ctx);
            }
        }
        return visitor::reject<V>(Shape::String, m_ctx);
    }

    template<class V>
    bool read_array(V & v, yyjson_val * arr, Shape got) {
        auto guard = m_ctx.enter();
        if(!guard) return false;
        SeqAccess access(this, arr);
        if(!visitor::visit_seq(v, access, got, m_ctx)) {
            return false;
        }
        if(!access.exhausted()) {
            return m_ctx.withError(DeserializeError::TRAILING_ENTRIES);
        }
        return true;
    }

    template<class V>
    bool read_object(V & v, yyjson_val * obj, Shape got) {
        auto guard = m_ctx.enter();
        if(!guard) return false;
        MapAccess access(this, obj);
        if(!visitor::visit_map(v, access, got, m_ctx)) {
            return false;
        }
        if(!access.exhausted()) {
            return m_ctx.withError(DeserializeError::TRAILING_ENTRIES);
        }
        return true;
    }

    bool payload_mismatch(yyjson_val * node, Shape expected) {
        Shape got = Shape::Unit;
        switch(yyjson_get_type(node)) {
        case YYJSON_TYPE_BOOL: got = Shape::Bool; break;
        case YYJSON_TYPE_NUM: got = yyjson_is_real(node) ? Shape::F64 : Shape::I64; break;
        case YYJSON_TYPE_STR: got = Shape::String; break;
        case YYJSON_TYPE_ARR: got = Shape::Seq; break;
        case YYJSON_TYPE_OBJ: got = Shape::Map; break;
        default: break;
        }
        return m_ctx.invalidType(got, ShapeSet{expected}, "enum payload");
    }
};

static_assert(deserializer::DeserializerLike<YyjsonDeserializer>);


/// Owns a parsed yyjson document. Strings decoded from it with the borrowed
/// flavor point into it.
class Document {
public:
    explicit Document(std::string_view text) {
        yyjson_read_err err{};
        // yyjson only writes to the buffer with YYJSON_READ_INSITU
        m_doc = yyjson_read_opts(const_cast<char*>(text.data()), text.size(), YYJSON_READ_NOFLAG, nullptr, &err);
        if(!m_doc) {
            m_error = err.code == YYJSON_READ_ERROR_UNEXPECTED_END || err.code == YYJSON_READ_ERROR_EMPTY_CONTENT
                ? DeserializeError::UNEXPECTED_END_OF_DATA
                : err.code == YYJSON_READ_ERROR_INVALID_STRING
                    ? DeserializeError::INVALID_UTF8
                    : DeserializeError::ILLFORMED_INPUT;
            m_errorPos = err.pos;
        }
    }
    ~Document() {
        if(m_doc) yyjson_doc_free(m_doc);
    }
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;
    Document(Document && other) noexcept:
        m_doc(std::exchange(other.m_doc, nullptr)), m_error(other.m_error), m_errorPos(other.m_errorPos)
    {}

    bool ok() const {
        return m_doc != nullptr;
    }
    yyjson_val * root() const {
        return m_doc ? yyjson_doc_get_root(m_doc) : nullptr;
    }
    /// Why the text was rejected, at which byte.
    DeserializeResult parseResult() const {
        return DeserializeResult(m_error, ErrorDetail{}, m_errorPos);
    }

private:
    yyjson_doc * m_doc = nullptr;
    DeserializeError m_error = DeserializeError::NO_ERROR;
    std::size_t m_errorPos = 0;
};


namespace Json {

namespace detail {
struct MutDocDeleter {
    void operator()(yyjson_mut_doc * doc) const {
        yyjson_mut_doc_free(doc);
    }
};
struct TextDeleter {
    void operator()(char * text) const {
        std::free(text);
    }
};
} // namespace detail

/// Replaces the contents of out.
template<Mapped T>
SerializeResult Serialize(const T & obj, std::string & out, JsonConfig config = {}) {
    std::unique_ptr<yyjson_mut_doc, detail::MutDocDeleter> doc(yyjson_mut_doc_new(nullptr));
    YyjsonSerializer s(doc.get());
    SerializeResult res = SerializeWith(obj, s);
    if(!res) {
        return res;
    }
    const yyjson_write_flag flags = config.pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
    std::size_t len = 0;
    yyjson_write_err err{};
    std::unique_ptr<char, detail::TextDeleter> text(yyjson_mut_write_opts(doc.get(), flags, nullptr, &len, &err));
    if(!text) {
        return SerializeResult(SerializeError::WRITER_ERROR, res.pos());
    }
    out.assign(text.get(), len);
    return res;
}

/// Strings are borrowed from doc when the target accepts that.
template<Mapped T>
DeserializeResult Deserialize(T & obj, const Document & doc) {
    if(!doc.ok()) {
        return doc.parseResult();
    }
    YyjsonDeserializer d(doc.root(), Flavor::borrowed);
    return DeserializeWith(obj, d);
}

/// The document lives only for this call; nothing can be borrowed from it.
template<Mapped T>
DeserializeResult Deserialize(T & obj, std::string_view text) {
    Document doc(text);
    if(!doc.ok()) {
        return doc.parseResult();
    }
    YyjsonDeserializer d(doc.root(), Flavor::transient);
    return DeserializeWith(obj, d);
}

} // namespace Json

} // namespace ShapeFusion
