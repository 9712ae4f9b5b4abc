#pragma once

#include <concepts>
#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "shape.hpp"
#include "errors.hpp"
#include "results.hpp"
#include "context.hpp"
#include "lifetime.hpp"
#include "visitor.hpp"
#include "serializer_concept.hpp"
#include "deserializer_concept.hpp"
#include "mapping.hpp"

namespace ShapeFusion {

/// A flat, self-describing rendition of the data model: one token per
/// serializer call, with explicit end markers for sessions. Used to observe
/// exactly which operations a mapping performs, and as input that can offer
/// every string flavor on demand.
enum class TokenKind : std::uint8_t {
    Bool,
    I8, I16, I32, I64, I128,
    U8, U16, U32, U64, U128,
    F32, F64,
    Char,
    Str,            // offered transient
    BorrowedStr,    // offered borrowed
    String,         // offered owned
    Bytes,
    BorrowedBytes,
    ByteBuf,
    None,
    Some,
    Unit,
    UnitStruct,
    UnitVariant,
    NewtypeStruct,
    NewtypeVariant,
    Seq, SeqEnd,
    Tuple, TupleEnd,
    TupleStruct, TupleStructEnd,
    TupleVariant, TupleVariantEnd,
    Map, MapEnd,
    Struct, StructEnd,
    StructVariant, StructVariantEnd,
    Enum            // Enum{name}, then the variant tag, then the payload
};

constexpr std::string_view token_kind_to_string(TokenKind k) {
    switch(k) {
    case TokenKind::Bool: return "Bool";
    case TokenKind::I8: return "I8";
    case TokenKind::I16: return "I16";
    case TokenKind::I32: return "I32";
    case TokenKind::I64: return "I64";
    case TokenKind::I128: return "I128";
    case TokenKind::U8: return "U8";
    case TokenKind::U16: return "U16";
    case TokenKind::U32: return "U32";
    case TokenKind::U64: return "U64";
    case TokenKind::U128: return "U128";
    case TokenKind::F32: return "F32";
    case TokenKind::F64: return "F64";
    case TokenKind::Char: return "Char";
    case TokenKind::Str: return "Str";
    case TokenKind::BorrowedStr: return "BorrowedStr";
    case TokenKind::String: return "String";
    case TokenKind::Bytes: return "Bytes";
    case TokenKind::BorrowedBytes: return "BorrowedBytes";
    case TokenKind::ByteBuf: return "ByteBuf";
    case TokenKind::None: return "None";
    case TokenKind::Some: return "Some";
    case TokenKind::Unit: return "Unit";
    case TokenKind::UnitStruct: return "UnitStruct";
    case TokenKind::UnitVariant: return "UnitVariant";
    case TokenKind::NewtypeStruct: return "NewtypeStruct";
    case TokenKind::NewtypeVariant: return "NewtypeVariant";
    case TokenKind::Seq: return "Seq";
    case TokenKind::SeqEnd: return "SeqEnd";
    case TokenKind::Tuple: return "Tuple";
    case TokenKind::TupleEnd: return "TupleEnd";
    case TokenKind::TupleStruct: return "TupleStruct";
    case TokenKind::TupleStructEnd: return "TupleStructEnd";
    case TokenKind::TupleVariant: return "TupleVariant";
    case TokenKind::TupleVariantEnd: return "TupleVariantEnd";
    case TokenKind::Map: return "Map";
    case TokenKind::MapEnd: return "MapEnd";
    case TokenKind::Struct: return "Struct";
    case TokenKind::StructEnd: return "StructEnd";
    case TokenKind::StructVariant: return "StructVariant";
    case TokenKind::StructVariantEnd: return "StructVariantEnd";
    case TokenKind::Enum: return "Enum";
    }
    return "N/A";
}

struct Token {
    TokenKind                  kind = TokenKind::Unit;
    bool                       b = false;
    i128                       sint = 0;
    u128                       uint = 0;
    double                     f = 0;
    char32_t                   c = 0;
    std::string                text;     // string payload, or struct/enum name
    std::string                variant;
    std::uint32_t              index = 0;
    std::optional<std::size_t> len;
    std::vector<std::uint8_t>  bytes;

    constexpr bool operator==(const Token&) const = default;

    static constexpr Token Bool(bool v) { Token t{TokenKind::Bool}; t.b = v; return t; }
    static constexpr Token I8(std::int8_t v) { Token t{TokenKind::I8}; t.sint = v; return t; }
    static constexpr Token I16(std::int16_t v) { Token t{TokenKind::I16}; t.sint = v; return t; }
    static constexpr Token I32(std::int32_t v) { Token t{TokenKind::I32}; t.sint = v; return t; }
    static constexpr Token I64(std::int64_t v) { Token t{TokenKind::I64}; t.sint = v; return t; }
    static constexpr Token I128(i128 v) { Token t{TokenKind::I128}; t.sint = v; return t; }
    static constexpr Token U8(std::uint8_t v) { Token t{TokenKind::U8}; t.uint = v; return t; }
    static constexpr Token U16(std::uint16_t v) { Token t{TokenKind::U16}; t.uint = v; return t; }
    static constexpr Token U32(std::uint32_t v) { Token t{TokenKind::U32}; t.uint = v; return t; }
    static constexpr Token U64(std::uint64_t v) { Token t{TokenKind::U64}; t.uint = v; return t; }
    static constexpr Token U128(u128 v) { Token t{TokenKind::U128}; t.uint = v; return t; }
    static constexpr Token F32(float v) { Token t{TokenKind::F32}; t.f = v; return t; }
    static constexpr Token F64(double v) { Token t{TokenKind::F64}; t.f = v; return t; }
    static constexpr Token Char(char32_t v) { Token t{TokenKind::Char}; t.c = v; return t; }

    static constexpr Token Str(std::string_view s) { return text_token(TokenKind::Str, s); }
    static constexpr Token BorrowedStr(std::string_view s) { return text_token(TokenKind::BorrowedStr, s); }
    static constexpr Token String(std::string_view s) { return text_token(TokenKind::String, s); }
    static constexpr Token Bytes(std::span<const std::uint8_t> b) { return bytes_token(TokenKind::Bytes, b); }
    static constexpr Token BorrowedBytes(std::span<const std::uint8_t> b) { return bytes_token(TokenKind::BorrowedBytes, b); }
    static constexpr Token ByteBuf(std::span<const std::uint8_t> b) { return bytes_token(TokenKind::ByteBuf, b); }

    static constexpr Token None() { return Token{TokenKind::None}; }
    static constexpr Token Some() { return Token{TokenKind::Some}; }
    static constexpr Token Unit() { return Token{TokenKind::Unit}; }
    static constexpr Token UnitStruct(std::string_view name) { return text_token(TokenKind::UnitStruct, name); }
    static constexpr Token UnitVariant(std::string_view name, std::string_view variant, std::uint32_t idx = 0) {
        return variant_token(TokenKind::UnitVariant, name, variant, idx);
    }
    static constexpr Token NewtypeStruct(std::string_view name) { return text_token(TokenKind::NewtypeStruct, name); }
    static constexpr Token NewtypeVariant(std::string_view name, std::string_view variant, std::uint32_t idx = 0) {
        return variant_token(TokenKind::NewtypeVariant, name, variant, idx);
    }

    static constexpr Token Seq(std::optional<std::size_t> len) { Token t{TokenKind::Seq}; t.len = len; return t; }
    static constexpr Token SeqEnd() { return Token{TokenKind::SeqEnd}; }
    static constexpr Token Tuple(std::size_t len) { Token t{TokenKind::Tuple}; t.len = len; return t; }
    static constexpr Token TupleEnd() { return Token{TokenKind::TupleEnd}; }
    static constexpr Token TupleStruct(std::string_view name, std::size_t len) {
        Token t = text_token(TokenKind::TupleStruct, name);
        t.len = len;
        return t;
    }
    static constexpr Token TupleStructEnd() { return Token{TokenKind::TupleStructEnd}; }
    static constexpr Token TupleVariant(std::string_view name, std::string_view variant, std::size_t len, std::uint32_t idx = 0) {
        Token t = variant_token(TokenKind::TupleVariant, name, variant, idx);
        t.len = len;
        return t;
    }
    static constexpr Token TupleVariantEnd() { return Token{TokenKind::TupleVariantEnd}; }
    static constexpr Token Map(std::optional<std::size_t> len) { Token t{TokenKind::Map}; t.len = len; return t; }
    static constexpr Token MapEnd() { return Token{TokenKind::MapEnd}; }
    static constexpr Token Struct(std::string_view name, std::size_t len) {
        Token t = text_token(TokenKind::Struct, name);
        t.len = len;
        return t;
    }
    static constexpr Token StructEnd() { return Token{TokenKind::StructEnd}; }
    static constexpr Token StructVariant(std::string_view name, std::string_view variant, std::size_t len, std::uint32_t idx = 0) {
        Token t = variant_token(TokenKind::StructVariant, name, variant, idx);
        t.len = len;
        return t;
    }
    static constexpr Token StructVariantEnd() { return Token{TokenKind::StructVariantEnd}; }
    static constexpr Token Enum(std::string_view name) { return text_token(TokenKind::Enum, name); }

private:
    static constexpr Token text_token(TokenKind k, std::string_view s) {
        Token t{k};
        t.text.assign(s.begin(), s.end());
        return t;
    }
    static constexpr Token bytes_token(TokenKind k, std::span<const std::uint8_t> b) {
        Token t{k};
        t.bytes.assign(b.begin(), b.end());
        return t;
    }
    static constexpr Token variant_token(TokenKind k, std::string_view name, std::string_view variant, std::uint32_t idx) {
        Token t = text_token(k, name);
        t.variant.assign(variant.begin(), variant.end());
        t.index = idx;
        return t;
    }
};

namespace tokens_detail {

constexpr std::optional<Shape> token_shape(TokenKind k) {
    switch(k) {
    case TokenKind::Bool: return Shape::Bool;
    case TokenKind::I8: return Shape::I8;
    case TokenKind::I16: return Shape::I16;
    case TokenKind::I32: return Shape::I32;
    case TokenKind::I64: return Shape::I64;
    case TokenKind::I128: return Shape::I128;
    case TokenKind::U8: return Shape::U8;
    case TokenKind::U16: return Shape::U16;
    case TokenKind::U32: return Shape::U32;
    case TokenKind::U64: return Shape::U64;
    case TokenKind::U128: return Shape::U128;
    case TokenKind::F32: return Shape::F32;
    case TokenKind::F64: return Shape::F64;
    case TokenKind::Char: return Shape::Char;
    case TokenKind::Str:
    case TokenKind::BorrowedStr:
    case TokenKind::String: return Shape::String;
    case TokenKind::Bytes:
    case TokenKind::BorrowedBytes:
    case TokenKind::ByteBuf: return Shape::Bytes;
    case TokenKind::None:
    case TokenKind::Some: return Shape::Option;
    case TokenKind::Unit: return Shape::Unit;
    case TokenKind::UnitStruct: return Shape::UnitStruct;
    case TokenKind::UnitVariant: return Shape::UnitVariant;
    case TokenKind::NewtypeStruct: return Shape::NewtypeStruct;
    case TokenKind::NewtypeVariant: return Shape::NewtypeVariant;
    case TokenKind::Seq: return Shape::Seq;
    case TokenKind::Tuple: return Shape::Tuple;
    case TokenKind::TupleStruct: return Shape::TupleStruct;
    case TokenKind::TupleVariant: return Shape::TupleVariant;
    case TokenKind::Map: return Shape::Map;
    case TokenKind::Struct: return Shape::Struct;
    case TokenKind::StructVariant: return Shape::StructVariant;
    default: return std::nullopt;
    }
}

constexpr TokenKind end_kind(TokenKind k) {
    switch(k) {
    case TokenKind::Seq: return TokenKind::SeqEnd;
    case TokenKind::Tuple: return TokenKind::TupleEnd;
    case TokenKind::TupleStruct: return TokenKind::TupleStructEnd;
    case TokenKind::TupleVariant: return TokenKind::TupleVariantEnd;
    case TokenKind::Map: return TokenKind::MapEnd;
    case TokenKind::Struct: return TokenKind::StructEnd;
    case TokenKind::StructVariant: return TokenKind::StructVariantEnd;
    default: return k;
    }
}

} // namespace tokens_detail


// ================================================================
// TokenSerializer
// ================================================================

class TokenSerializer {
public:
    struct SeqFrame    { serializer::Session session; };
    struct MapFrame    { serializer::Session session; };
    struct StructFrame { serializer::Session session; };

    constexpr explicit TokenSerializer(std::vector<Token> & out): m_out(out) {}

    constexpr SerializeError getError() const {
        return m_err.get();
    }
    constexpr std::size_t pos() const {
        return m_out.size();
    }

    constexpr bool serialize_bool(bool v)             { return push(Token::Bool(v)); }
    constexpr bool serialize_i8(std::int8_t v)        { return push(Token::I8(v)); }
    constexpr bool serialize_i16(std::int16_t v)      { return push(Token::I16(v)); }
    constexpr bool serialize_i32(std::int32_t v)      { return push(Token::I32(v)); }
    constexpr bool serialize_i64(std::int64_t v)      { return push(Token::I64(v)); }
    constexpr bool serialize_i128(i128 v)             { return push(Token::I128(v)); }
    constexpr bool serialize_u8(std::uint8_t v)       { return push(Token::U8(v)); }
    constexpr bool serialize_u16(std::uint16_t v)     { return push(Token::U16(v)); }
    constexpr bool serialize_u32(std::uint32_t v)     { return push(Token::U32(v)); }
    constexpr bool serialize_u64(std::uint64_t v)     { return push(Token::U64(v)); }
    constexpr bool serialize_u128(u128 v)             { return push(Token::U128(v)); }
    constexpr bool serialize_f32(float v)             { return push(Token::F32(v)); }
    constexpr bool serialize_f64(double v)            { return push(Token::F64(v)); }
    constexpr bool serialize_char(char32_t v)         { return push(Token::Char(v)); }
    constexpr bool serialize_str(std::string_view v)  { return push(Token::Str(v)); }
    constexpr bool serialize_bytes(std::span<const std::uint8_t> v) { return push(Token::Bytes(v)); }
    constexpr bool serialize_none()                   { return push(Token::None()); }
    constexpr bool serialize_unit()                   { return push(Token::Unit()); }
    constexpr bool serialize_unit_struct(std::string_view name) { return push(Token::UnitStruct(name)); }
    constexpr bool serialize_unit_variant(std::string_view name, std::uint32_t idx, std::string_view variant) {
        return push(Token::UnitVariant(name, variant, idx));
    }

    template<class T>
    constexpr bool serialize_some(const T & v) {
        return push(Token::Some()) && ShapeFusion::serialize(v, *this);
    }
    template<class T>
    constexpr bool serialize_newtype_struct(std::string_view name, const T & v) {
        return push(Token::NewtypeStruct(name)) && ShapeFusion::serialize(v, *this);
    }
    template<class T>
    constexpr bool serialize_newtype_variant(std::string_view name, std::uint32_t idx, std::string_view variant, const T & v) {
        return push(Token::NewtypeVariant(name, variant, idx)) && ShapeFusion::serialize(v, *this);
    }

    // ========== Sequences ==========

    constexpr bool begin_seq(std::optional<std::size_t> len, SeqFrame & fr) {
        return open(fr.session, Shape::Seq, len, Token::Seq(len));
    }
    constexpr bool begin_tuple(std::size_t len, SeqFrame & fr) {
        return open(fr.session, Shape::Tuple, len, Token::Tuple(len));
    }
    constexpr bool begin_tuple_struct(std::string_view name, std::size_t len, SeqFrame & fr) {
        return open(fr.session, Shape::TupleStruct, len, Token::TupleStruct(name, len));
    }
    constexpr bool begin_tuple_variant(std::string_view name, std::uint32_t idx, std::string_view variant, std::size_t len, SeqFrame & fr) {
        return open(fr.session, Shape::TupleVariant, len, Token::TupleVariant(name, variant, len, idx));
    }
    template<class T>
    constexpr bool serialize_element(SeqFrame & fr, const T & v) {
        if(!entry(fr.session)) return false;
        return ShapeFusion::serialize(v, *this);
    }
    constexpr bool end(SeqFrame & fr) {
        return close(fr.session);
    }

    // ========== Maps ==========

    constexpr bool begin_map(std::optional<std::size_t> len, MapFrame & fr) {
        return open(fr.session, Shape::Map, len, Token::Map(len));
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

    constexpr bool begin_struct(std::string_view name, std::size_t len, StructFrame & fr) {
        return open(fr.session, Shape::Struct, len, Token::Struct(name, len));
    }
    constexpr bool begin_struct_variant(std::string_view name, std::uint32_t idx, std::string_view variant, std::size_t len, StructFrame & fr) {
        return open(fr.session, Shape::StructVariant, len, Token::StructVariant(name, variant, len, idx));
    }
    template<class T>
    constexpr bool serialize_field(StructFrame & fr, std::string_view key, const T & v) {
        if(!entry(fr.session)) return false;
        return push(Token::Str(key)) && ShapeFusion::serialize(v, *this);
    }
    constexpr bool skip_field(StructFrame & fr, std::string_view) {
        if(!ok()) return false;
        if(!fr.session.open) {
            return m_err.setError(SerializeError::SESSION_MISUSE);
        }
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
    std::vector<Token> & m_out;
    serializer::ErrorState m_err{};

    constexpr bool ok() const {
        return m_err.ok();
    }
    constexpr bool push(Token t) {
        if(!ok()) return false;
        m_out.push_back(std::move(t));
        return true;
    }
    constexpr bool open(serializer::Session & s, Shape shape, std::optional<std::size_t> len, Token t) {
        if(!push(std::move(t))) return false;
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
    constexpr TokenKind end_token(Shape shape) const {
        switch(shape) {
        case Shape::Tuple: return TokenKind::TupleEnd;
        case Shape::TupleStruct: return TokenKind::TupleStructEnd;
        case Shape::TupleVariant: return TokenKind::TupleVariantEnd;
        case Shape::Map: return TokenKind::MapEnd;
        case Shape::Struct: return TokenKind::StructEnd;
        case Shape::StructVariant: return TokenKind::StructVariantEnd;
        default: return TokenKind::SeqEnd;
        }
    }
    constexpr bool close(serializer::Session & s) {
        if(!ok()) return false;
        SerializeError e = s.closeError();
        if(e != SerializeError::NO_ERROR) {
            return m_err.setError(e);
        }
        s.open = false;
        return push(Token{end_token(s.shape)});
    }
};

static_assert(serializer::SerializerLike<TokenSerializer>);


// ================================================================
// TokenDeserializer
// ================================================================

class TokenDeserializer {
public:
    constexpr explicit TokenDeserializer(std::span<const Token> input,
                                         std::size_t maxDepth = default_max_nesting_depth()):
        m_in(input), m_ctx(maxDepth)
    {}

    constexpr DeserializationContext & context() {
        return m_ctx;
    }
    constexpr bool is_self_describing() const {
        return true;
    }
    constexpr Flavor string_flavor() const {
        return Flavor::borrowed;
    }
    constexpr std::size_t pos() const {
        return m_pos;
    }
    constexpr bool finish() {
        if(m_ctx.failed()) return false;
        if(m_pos != m_in.size()) {
            return fail(DeserializeError::TRAILING_DATA);
        }
        return true;
    }

    // ========== Sessions ==========

    /// Elements are counted against the length the opening token declares.
    class SeqAccess {
        TokenDeserializer * m_de;
        TokenKind m_end;
        std::optional<std::size_t> m_len;
        std::size_t m_count = 0;
    public:
        constexpr SeqAccess(TokenDeserializer * de, TokenKind endKind, std::optional<std::size_t> len):
            m_de(de), m_end(endKind), m_len(len) {}

        template<class T>
        constexpr stream_read_result next_element(T & out) {
            if(m_de->m_ctx.failed()) return stream_read_result::error;
            if(m_de->peek_is(m_end)) {
                return m_de->check_length(m_len, m_count) ? stream_read_result::end : stream_read_result::error;
            }
            if(m_len && m_count == *m_len) {
                m_de->fail(DeserializeError::LENGTH_MISMATCH);
                return stream_read_result::error;
            }
            m_count ++;
            return ShapeFusion::deserialize(out, *m_de) ? stream_read_result::value : stream_read_result::error;
        }
        constexpr std::optional<std::size_t> size_hint() const {
            return m_len;
        }
        constexpr std::optional<std::size_t> declared() const {
            return m_len;
        }
        constexpr std::size_t consumed() const {
            return m_count;
        }
    };

    class MapAccess {
        TokenDeserializer * m_de;
        TokenKind m_end;
        std::optional<std::size_t> m_len;
        std::size_t m_count = 0;
    public:
        constexpr MapAccess(TokenDeserializer * de, TokenKind endKind, std::optional<std::size_t> len):
            m_de(de), m_end(endKind), m_len(len) {}

        template<class K>
        constexpr stream_read_result next_key(K & out) {
            if(m_de->m_ctx.failed()) return stream_read_result::error;
            if(m_de->peek_is(m_end)) {
                return m_de->check_length(m_len, m_count) ? stream_read_result::end : stream_read_result::error;
            }
            if(m_len && m_count == *m_len) {
                m_de->fail(DeserializeError::LENGTH_MISMATCH);
                return stream_read_result::error;
            }
            m_count ++;
            return ShapeFusion::deserialize(out, *m_de) ? stream_read_result::value : stream_read_result::error;
        }
        template<class V>
        constexpr bool next_value(V & out) {
            if(m_de->m_ctx.failed()) return false;
            return ShapeFusion::deserialize(out, *m_de);
        }
        constexpr std::optional<std::size_t> size_hint() const {
            return m_len;
        }
        constexpr std::optional<std::size_t> declared() const {
            return m_len;
        }
        constexpr std::size_t consumed() const {
            return m_count;
        }
    };

    class EnumAccess {
        TokenDeserializer * m_de;
        Token const * m_tag;    // the variant token, or the Enum token
    public:
        constexpr EnumAccess(TokenDeserializer * de, const Token * tag): m_de(de), m_tag(tag) {}

        template<class Id>
        constexpr bool variant(Id & id) {
            if(m_tag->kind == TokenKind::Enum) {
                return ShapeFusion::deserialize(id, *m_de);
            }
            static_assert(std::same_as<Id, Identifier>, "[[[ ShapeFusion ]]] variant tags decode into Identifier");
            return id.resolve(m_tag->variant, m_de->m_ctx);
        }
        constexpr bool unit_variant() {
            if(m_tag->kind == TokenKind::UnitVariant) return true;
            if(m_tag->kind == TokenKind::Enum && m_de->peek_is(TokenKind::Unit)) {
                m_de->m_pos ++;
                return true;
            }
            return mismatch(Shape::UnitVariant);
        }
        template<class T>
        constexpr bool newtype_variant(T & out) {
            if(m_tag->kind == TokenKind::NewtypeVariant || m_tag->kind == TokenKind::Enum) {
                return ShapeFusion::deserialize(out, *m_de);
            }
            return mismatch(Shape::NewtypeVariant);
        }
        template<class V>
        constexpr bool tuple_variant(std::size_t, V & visitor) {
            if(m_tag->kind == TokenKind::TupleVariant) {
                return m_de->run_seq(visitor, TokenKind::TupleVariantEnd, m_tag->len, Shape::TupleVariant);
            }
            if(m_tag->kind == TokenKind::Enum && (m_de->peek_is(TokenKind::Seq) || m_de->peek_is(TokenKind::Tuple))) {
                const Token & open = m_de->m_in[m_de->m_pos ++];
                return m_de->run_seq(visitor, tokens_detail::end_kind(open.kind), open.len, Shape::TupleVariant);
            }
            return mismatch(Shape::TupleVariant);
        }
        template<class V>
        constexpr bool struct_variant(std::span<const std::string_view>, V & visitor) {
            if(m_tag->kind == TokenKind::StructVariant) {
                return m_de->run_map(visitor, TokenKind::StructVariantEnd, m_tag->len, Shape::StructVariant);
            }
            if(m_tag->kind == TokenKind::Enum && (m_de->peek_is(TokenKind::Map) || m_de->peek_is(TokenKind::Struct))) {
                const Token & open = m_de->m_in[m_de->m_pos ++];
                return m_de->run_map(visitor, tokens_detail::end_kind(open.kind), open.len, Shape::StructVariant);
            }
            return mismatch(Shape::StructVariant);
        }
    private:
        constexpr bool mismatch(Shape expected) {
            std::optional<Shape> got = tokens_detail::token_shape(m_tag->kind);
            m_de->m_ctx.invalidType(got ? *got : Shape::NewtypeVariant, ShapeSet{expected}, "enum payload");
            return m_de->stamp();
        }
    };

    // ========== Entry points ==========

    template<class V>
    constexpr bool deserialize_any(V & v) {
        if(!ensure_token()) return false;
        const Token & t = m_in[m_pos];
        switch(t.kind) {
        case TokenKind::Bool: m_pos ++; return done(visitor::visit_bool(v, t.b, m_ctx));
        case TokenKind::I8: m_pos ++; return done(visitor::visit_i8(v, static_cast<std::int8_t>(t.sint), m_ctx));
        case TokenKind::I16: m_pos ++; return done(visitor::visit_i16(v, static_cast<std::int16_t>(t.sint), m_ctx));
        case TokenKind::I32: m_pos ++; return done(visitor::visit_i32(v, static_cast<std::int32_t>(t.sint), m_ctx));
        case TokenKind::I64: m_pos ++; return done(visitor::visit_i64(v, static_cast<std::int64_t>(t.sint), m_ctx));
        case TokenKind::I128: m_pos ++; return done(visitor::visit_i128(v, t.sint, m_ctx));
        case TokenKind::U8: m_pos ++; return done(visitor::visit_u8(v, static_cast<std::uint8_t>(t.uint), m_ctx));
        case TokenKind::U16: m_pos ++; return done(visitor::visit_u16(v, static_cast<std::uint16_t>(t.uint), m_ctx));
        case TokenKind::U32: m_pos ++; return done(visitor::visit_u32(v, static_cast<std::uint32_t>(t.uint), m_ctx));
        case TokenKind::U64: m_pos ++; return done(visitor::visit_u64(v, static_cast<std::uint64_t>(t.uint), m_ctx));
        case TokenKind::U128: m_pos ++; return done(visitor::visit_u128(v, t.uint, m_ctx));
        case TokenKind::F32: m_pos ++; return done(visitor::visit_f32(v, static_cast<float>(t.f), m_ctx));
        case TokenKind::F64: m_pos ++; return done(visitor::visit_f64(v, t.f, m_ctx));
        case TokenKind::Char: m_pos ++; return done(visitor::visit_char(v, t.c, m_ctx));
        case TokenKind::Str: {
            // a private copy, valid only for this call
            m_scratch = t.text;
            m_pos ++;
            return done(visitor::visit_str(v, std::string_view(m_scratch), Flavor::transient, m_ctx));
        }
        case TokenKind::BorrowedStr:
            m_pos ++;
            return done(visitor::visit_str(v, std::string_view(t.text), Flavor::borrowed, m_ctx));
        case TokenKind::String:
            m_pos ++;
            return done(visitor::visit_string(v, std::string(t.text), m_ctx));
        case TokenKind::Bytes: {
            m_scratchBytes = t.bytes;
            m_pos ++;
            return done(visitor::visit_bytes(v, std::span<const std::uint8_t>(m_scratchBytes), Flavor::transient, m_ctx));
        }
        case TokenKind::BorrowedBytes:
            m_pos ++;
            return done(visitor::visit_bytes(v, std::span<const std::uint8_t>(t.bytes), Flavor::borrowed, m_ctx));
        case TokenKind::ByteBuf:
            m_pos ++;
            return done(visitor::visit_byte_buf(v, std::vector<std::uint8_t>(t.bytes), m_ctx));
        case TokenKind::None: m_pos ++; return done(visitor::visit_none(v, m_ctx));
        case TokenKind::Some: {
            auto guard = m_ctx.enter();
            if(!guard) return stamp();
            m_pos ++;
            return done(visitor::visit_some(v, *this, m_ctx));
        }
        case TokenKind::Unit:
        case TokenKind::UnitStruct:
            m_pos ++;
            return done(visitor::visit_unit(v, m_ctx));
        case TokenKind::NewtypeStruct: {
            auto guard = m_ctx.enter();
            if(!guard) return stamp();
            m_pos ++;
            return done(visitor::visit_newtype_struct(v, *this, m_ctx));
        }
        case TokenKind::UnitVariant:
        case TokenKind::NewtypeVariant:
        case TokenKind::TupleVariant:
        case TokenKind::StructVariant:
        case TokenKind::Enum:
            return run_enum(v);
        case TokenKind::Seq:
        case TokenKind::Tuple:
        case TokenKind::TupleStruct:
            m_pos ++;
            return run_seq(v, tokens_detail::end_kind(t.kind), t.len, *tokens_detail::token_shape(t.kind));
        case TokenKind::Map:
        case TokenKind::Struct:
            m_pos ++;
            return run_map(v, tokens_detail::end_kind(t.kind), t.len, *tokens_detail::token_shape(t.kind));
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

    // Options, units, newtypes and composites are read only from the tokens
    // that name their shape: a Map token never reaches a struct visitor, and a
    // bare value is not an option.
    template<class V>
    constexpr bool deserialize_option(V & v) {
        return expect_kind(v, {TokenKind::None, TokenKind::Some});
    }
    template<class V>
    constexpr bool deserialize_unit(V & v) {
        return expect_kind(v, {TokenKind::Unit});
    }
    template<class V>
    constexpr bool deserialize_unit_struct(std::string_view, V & v) {
        return expect_kind(v, {TokenKind::UnitStruct});
    }
    template<class V>
    constexpr bool deserialize_newtype_struct(std::string_view, V & v) {
        return expect_kind(v, {TokenKind::NewtypeStruct});
    }
    template<class V>
    constexpr bool deserialize_seq(V & v) {
        return expect_kind(v, {TokenKind::Seq});
    }
    template<class V>
    constexpr bool deserialize_tuple(std::size_t, V & v) {
        return expect_kind(v, {TokenKind::Tuple});
    }
    template<class V>
    constexpr bool deserialize_tuple_struct(std::string_view, std::size_t, V & v) {
        return expect_kind(v, {TokenKind::TupleStruct});
    }
    template<class V>
    constexpr bool deserialize_map(V & v) {
        return expect_kind(v, {TokenKind::Map});
    }
    template<class V>
    constexpr bool deserialize_struct(std::string_view, std::span<const std::string_view>, V & v) {
        return expect_kind(v, {TokenKind::Struct});
    }
    template<class V>
    constexpr bool deserialize_enum(std::string_view, std::span<const std::string_view>, V & v) {
        return expect_kind(v, {TokenKind::UnitVariant, TokenKind::NewtypeVariant, TokenKind::TupleVariant,
                               TokenKind::StructVariant, TokenKind::Enum});
    }
    template<class V> constexpr bool deserialize_identifier(V & v) { return deserialize_any(v); }

    /// Skips one complete value structurally, whatever its variant kind.
    template<class V>
    constexpr bool deserialize_ignored_any(V & v) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        if(!skip_value()) return false;
        return done(visitor::visit_unit(v, m_ctx));
    }

private:
    std::span<const Token> m_in;
    std::size_t m_pos = 0;
    DeserializationContext m_ctx;
    std::string m_scratch;
    std::vector<std::uint8_t> m_scratchBytes;

    constexpr bool stamp() {
        m_ctx.stampPosition(m_pos);
        return false;
    }
    constexpr bool fail(DeserializeError e) {
        m_ctx.withError(e);
        return stamp();
    }
    constexpr bool done(bool ok) {
        return ok ? true : stamp();
    }
    constexpr bool ensure_token() {
        if(m_ctx.failed()) return false;
        if(m_pos >= m_in.size()) {
            return fail(DeserializeError::UNEXPECTED_END_OF_DATA);
        }
        return true;
    }
    constexpr bool peek_is(TokenKind k) const {
        return m_pos < m_in.size() && m_in[m_pos].kind == k;
    }

    template<class V>
    constexpr bool expect_kind(V & v, std::initializer_list<TokenKind> kinds) {
        if(!ensure_token()) return false;
        const TokenKind k = m_in[m_pos].kind;
        for(TokenKind accepted: kinds) {
            if(k == accepted) {
                return deserialize_any(v);
            }
        }
        std::optional<Shape> got = tokens_detail::token_shape(k);
        if(!got) {
            return fail(DeserializeError::ILLFORMED_INPUT);
        }
        visitor::reject<V>(*got, m_ctx);
        return stamp();
    }

    constexpr bool check_length(std::optional<std::size_t> declared, std::size_t present) {
        if(declared && *declared != present) {
            return fail(DeserializeError::LENGTH_MISMATCH);
        }
        return true;
    }

    /// Leftover elements after the visitor stopped pulling are rejected. An end
    /// token that comes before or after the declared count is a length mismatch.
    template<class A>
    constexpr bool expect_end(TokenKind endKind, const A & access) {
        if(m_ctx.failed()) return false;
        if(m_pos >= m_in.size()) {
            return fail(DeserializeError::UNEXPECTED_END_OF_DATA);
        }
        if(m_in[m_pos].kind != endKind) {
            const std::optional<std::size_t> declared = access.declared();
            if(declared && access.consumed() >= *declared) {
                return fail(DeserializeError::LENGTH_MISMATCH);
            }
            return fail(DeserializeError::TRAILING_ENTRIES);
        }
        if(!check_length(access.declared(), access.consumed())) {
            return false;
        }
        m_pos ++;
        return true;
    }

    constexpr bool skip_value() {
        if(!ensure_token()) return false;
        const Token & t = m_in[m_pos ++];
        switch(t.kind) {
        case TokenKind::Some:
        case TokenKind::NewtypeStruct:
        case TokenKind::NewtypeVariant:
            return skip_value();
        case TokenKind::Enum:
            return skip_value() && skip_value();
        case TokenKind::Seq:
        case TokenKind::Tuple:
        case TokenKind::TupleStruct:
        case TokenKind::TupleVariant:
        case TokenKind::Map:
        case TokenKind::Struct:
        case TokenKind::StructVariant: {
            const TokenKind endKind = tokens_detail::end_kind(t.kind);
            const bool keyed = t.kind == TokenKind::Map || t.kind == TokenKind::Struct || t.kind == TokenKind::StructVariant;
            std::size_t values = 0;
            while(!peek_is(endKind)) {
                if(!skip_value()) return false;
                values ++;
            }
            if(keyed && values % 2 != 0) {
                return fail(DeserializeError::ILLFORMED_INPUT);
            }
            if(!check_length(t.len, keyed ? values / 2 : values)) {
                return false;
            }
            m_pos ++;
            return true;
        }
        case TokenKind::SeqEnd:
        case TokenKind::TupleEnd:
        case TokenKind::TupleStructEnd:
        case TokenKind::TupleVariantEnd:
        case TokenKind::MapEnd:
        case TokenKind::StructEnd:
        case TokenKind::StructVariantEnd:
            m_pos --;
            return fail(DeserializeError::ILLFORMED_INPUT);
        default:
            return true;
        }
    }

    template<class V>
    constexpr bool run_seq(V & v, TokenKind endKind, std::optional<std::size_t> len, Shape got) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        SeqAccess access(this, endKind, len);
        if(!visitor::visit_seq(v, access, got, m_ctx)) {
            return stamp();
        }
        return expect_end(endKind, access);
    }

    template<class V>
    constexpr bool run_map(V & v, TokenKind endKind, std::optional<std::size_t> len, Shape got) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        MapAccess access(this, endKind, len);
        if(!visitor::visit_map(v, access, got, m_ctx)) {
            return stamp();
        }
        return expect_end(endKind, access);
    }

    template<class V>
    constexpr bool run_enum(V & v) {
        auto guard = m_ctx.enter();
        if(!guard) return stamp();
        const Token & tag = m_in[m_pos ++];
        Shape got = tag.kind == TokenKind::Enum ? Shape::NewtypeVariant : *tokens_detail::token_shape(tag.kind);
        EnumAccess access(this, &tag);
        return done(visitor::visit_enum(v, access, got, m_ctx));
    }
};

static_assert(deserializer::DeserializerLike<TokenDeserializer>);


namespace Tokens {

/// Serializes obj into a token stream.
template<Mapped T>
constexpr SerializeResult Serialize(const T & obj, std::vector<Token> & out) {
    out.clear();
    TokenSerializer s(out);
    return SerializeWith(obj, s);
}

template<Mapped T>
constexpr DeserializeResult Deserialize(T & obj, std::span<const Token> in) {
    TokenDeserializer d(in);
    return DeserializeWith(obj, d);
}

} // namespace Tokens

} // namespace ShapeFusion
