#include "../test_helpers.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

using namespace ShapeFusion;
using namespace TestHelpers;

namespace visitor_tests {

// ========== Test visitors ==========

struct BoolOnly {
    static constexpr std::string_view expecting = "a boolean";
    std::optional<bool> value;
    int calls = 0;

    constexpr bool visit_bool(bool b, DeserializationContext &) {
        calls ++;
        value = b;
        return true;
    }
};

struct IntOrNothing {
    static constexpr std::string_view expecting = "an optional integer";
    bool sawNone = false;
    std::optional<int> inner;

    constexpr bool visit_none(DeserializationContext &) {
        sawNone = true;
        return true;
    }
    template<class D>
    constexpr bool visit_some(D & d, DeserializationContext &) {
        int x = 0;
        if(!ShapeFusion::deserialize(x, d)) {
            return false;
        }
        inner = x;
        return true;
    }
};

struct WideSigned {
    std::int64_t value = 0;
    constexpr bool visit_i64(std::int64_t x, DeserializationContext &) {
        value = x;
        return true;
    }
};

struct TextOnly {
    std::string value;
    constexpr bool visit_str(std::string_view s, DeserializationContext &) {
        value.assign(s.begin(), s.end());
        return true;
    }
};

struct BorrowOnly {
    std::string_view value;
    constexpr bool visit_borrowed_str(std::string_view s, DeserializationContext &) {
        value = s;
        return true;
    }
};

/// Pulls a (u8, string, seq of int) triple and records how many fetches it made.
struct TriplePuller {
    static constexpr std::string_view expecting = "a 3-tuple";
    std::uint8_t id = 0;
    std::string label;
    std::vector<int> values;
    int fetches = 0;

    template<class A>
    constexpr bool visit_seq(A & seq, DeserializationContext & ctx) {
        fetches ++;
        if(seq.next_element(id) != stream_read_result::value) return ctx.invalidLength(0, expecting);
        fetches ++;
        if(seq.next_element(label) != stream_read_result::value) return ctx.invalidLength(1, expecting);
        fetches ++;
        if(seq.next_element(values) != stream_read_result::value) return ctx.invalidLength(2, expecting);
        return true;
    }
};

/// Collects string -> int pairs from a map until the session reports its end.
struct PairCollector {
    static constexpr std::string_view expecting = "a map of counters";
    std::vector<std::pair<std::string, int>> pairs;
    int keyFetches = 0;
    bool sawEnd = false;

    template<class A>
    constexpr bool visit_map(A & map, DeserializationContext &) {
        while(true) {
            std::string key;
            keyFetches ++;
            switch(map.next_key(key)) {
            case stream_read_result::value: break;
            case stream_read_result::end:
                sawEnd = true;
                return true;
            case stream_read_result::error: return false;
            }
            int value = 0;
            if(!map.next_value(value)) {
                return false;
            }
            pairs.emplace_back(std::move(key), value);
        }
    }
};

/// Accepts any shape and counts the calls it receives. Inner values are
/// consumed through IgnoredAny, so only the top-level call is counted.
struct Counting {
    static constexpr std::string_view expecting = "anything";
    int calls = 0;
    std::optional<Shape> last;

    constexpr bool hit(Shape s) {
        calls ++;
        last = s;
        return true;
    }
    constexpr bool visit_bool(bool, DeserializationContext&) { return hit(Shape::Bool); }
    constexpr bool visit_i64(std::int64_t, DeserializationContext&) { return hit(Shape::I64); }
    constexpr bool visit_i128(i128, DeserializationContext&) { return hit(Shape::I128); }
    constexpr bool visit_u64(std::uint64_t, DeserializationContext&) { return hit(Shape::U64); }
    constexpr bool visit_u128(u128, DeserializationContext&) { return hit(Shape::U128); }
    constexpr bool visit_f64(double, DeserializationContext&) { return hit(Shape::F64); }
    constexpr bool visit_char(char32_t, DeserializationContext&) { return hit(Shape::Char); }
    constexpr bool visit_str(std::string_view, DeserializationContext&) { return hit(Shape::String); }
    constexpr bool visit_bytes(std::span<const std::uint8_t>, DeserializationContext&) { return hit(Shape::Bytes); }
    constexpr bool visit_none(DeserializationContext&) { return hit(Shape::Option); }
    constexpr bool visit_unit(DeserializationContext&) { return hit(Shape::Unit); }

    template<class D>
    constexpr bool visit_some(D & d, DeserializationContext&) {
        hit(Shape::Option);
        IgnoredAny inner;
        return ShapeFusion::deserialize(inner, d);
    }
    template<class D>
    constexpr bool visit_newtype_struct(D & d, DeserializationContext&) {
        hit(Shape::NewtypeStruct);
        IgnoredAny inner;
        return ShapeFusion::deserialize(inner, d);
    }
    template<class A>
    constexpr bool visit_seq(A & seq, DeserializationContext&) {
        hit(Shape::Seq);
        IgnoredAny elem;
        while(true) {
            switch(seq.next_element(elem)) {
            case stream_read_result::value: break;
            case stream_read_result::end: return true;
            case stream_read_result::error: return false;
            }
        }
    }
    template<class A>
    constexpr bool visit_map(A & map, DeserializationContext&) {
        hit(Shape::Map);
        IgnoredAny item;
        while(true) {
            switch(map.next_key(item)) {
            case stream_read_result::value: break;
            case stream_read_result::end: return true;
            case stream_read_result::error: return false;
            }
            if(!map.next_value(item)) return false;
        }
    }
    template<class A>
    constexpr bool visit_enum(A & data, DeserializationContext&) {
        hit(Shape::NewtypeVariant);
        Identifier tag{{}, IdentifierKind::variant, true};
        if(!data.variant(tag)) return false;
        IgnoredAny payload;
        return data.newtype_variant(payload);
    }
};

/// Declines a value without recording a reason.
struct Refusing {
    constexpr bool visit_bool(bool, DeserializationContext &) {
        return false;
    }
};

struct Point {
    int x;
    int y;
};

} // namespace visitor_tests

using namespace visitor_tests;


// ========== Declared capabilities ==========

static_assert(capabilities<BoolOnly>() == ShapeSet{Shape::Bool});
static_assert(capabilities<WideSigned>() == ShapeSet{Shape::I8, Shape::I16, Shape::I32, Shape::I64});
static_assert(capabilities<TextOnly>() == ShapeSet{Shape::Char, Shape::String});
static_assert(capabilities<IntOrNothing>() == ShapeSet{Shape::Option});
static_assert(capabilities<TriplePuller>().contains(Shape::Tuple));
static_assert(capabilities<PairCollector>().contains(Shape::Struct));
static_assert(capabilities<Counting>().size() == ShapesCount);

static_assert(string_flavors<TextOnly>() == FlavorSet{Flavor::transient, Flavor::owned, Flavor::borrowed});
static_assert(string_flavors<BorrowOnly>() == FlavorSet{Flavor::borrowed});
static_assert(string_flavors<BoolOnly>().empty());

static_assert(expecting<BoolOnly>() == "a boolean");
static_assert(expecting<WideSigned>().empty());


// ========== Scenario: a bool written, read back through a bool-only visitor ==========

static_assert([] {
    std::vector<Token> out;
    if(!Tokens::Serialize(true, out)) return false;
    if(out.size() != 1 || !(out[0] == Token::Bool(true))) return false;

    TokenDeserializer de{std::span<const Token>(out)};
    BoolOnly v;
    return de.deserialize_bool(v) && de.finish()
        && v.calls == 1 && v.value == std::optional<bool>(true);
}());

static_assert([] {
    std::vector<std::uint8_t> bytes;
    if(!Compact::Serialize(true, bytes)) return false;
    CompactDeserializer de(bytes.cbegin(), bytes.cend());
    BoolOnly v;
    return de.deserialize_bool(v) && de.finish() && v.calls == 1 && *v.value;
}());

static_assert([] {
    std::vector<std::uint8_t> bytes;
    if(!Cbor::Serialize(true, bytes)) return false;
    CborDeserializer de(bytes.cbegin(), bytes.cend());
    BoolOnly v;
    return bytes == std::vector<std::uint8_t>{0xF5}
        && de.deserialize_bool(v) && de.finish() && v.calls == 1 && *v.value;
}());

// the same visitor offered an integer fails with the shapes it declared
static_assert([] {
    auto r = DecodeWith({Token::I32(1)}, [](auto & de) {
        BoolOnly v;
        return de.deserialize_bool(v);
    });
    return !r && r.error() == DeserializeError::INVALID_TYPE
        && r.got() == std::optional<Shape>(Shape::I32)
        && r.expected() == ShapeSet{Shape::Bool}
        && r.expecting() == "a boolean";
}());


// ========== Scenario: none written, an option visitor sees none ==========

static_assert([] {
    std::vector<Token> out;
    if(!Tokens::Serialize(std::optional<int>{}, out)) return false;
    TokenDeserializer de{std::span<const Token>(out)};
    IntOrNothing v;
    return de.deserialize_option(v) && de.finish() && v.sawNone && !v.inner;
}());

static_assert([] {
    std::vector<std::uint8_t> bytes;
    if(!Cbor::Serialize(std::optional<int>{}, bytes)) return false;
    CborDeserializer de(bytes.cbegin(), bytes.cend());
    IntOrNothing v;
    return de.deserialize_option(v) && de.finish() && v.sawNone;
}());

static_assert([] {
    std::vector<std::uint8_t> bytes;
    if(!Compact::Serialize(std::optional<int>{9}, bytes)) return false;
    CompactDeserializer de(bytes.cbegin(), bytes.cend());
    IntOrNothing v;
    return de.deserialize_option(v) && de.finish() && !v.sawNone && v.inner == std::optional<int>(9);
}());


// ========== Scenario: a 3-tuple pulled element by element ==========

constexpr std::tuple<std::uint8_t, std::string, std::vector<int>> make_triple() {
    return {7, "seven", {1, 2, 3}};
}

constexpr bool check_triple(const TriplePuller & v) {
    return v.fetches == 3 && v.id == 7 && v.label == "seven" && v.values == std::vector<int>{1, 2, 3};
}

static_assert([] {
    std::vector<Token> out;
    if(!Tokens::Serialize(make_triple(), out)) return false;
    TokenDeserializer de{std::span<const Token>(out)};
    TriplePuller v;
    return de.deserialize_tuple(3, v) && de.finish() && check_triple(v);
}());

static_assert([] {
    std::vector<std::uint8_t> bytes;
    if(!Compact::Serialize(make_triple(), bytes)) return false;
    CompactDeserializer de(bytes.cbegin(), bytes.cend());
    TriplePuller v;
    return de.deserialize_tuple(3, v) && de.finish() && check_triple(v);
}());

static_assert([] {
    std::vector<std::uint8_t> bytes;
    if(!Cbor::Serialize(make_triple(), bytes)) return false;
    CborDeserializer de(bytes.cbegin(), bytes.cend());
    TriplePuller v;
    return de.deserialize_tuple(3, v) && de.finish() && check_triple(v);
}());

// a fourth element the visitor never asks for is rejected
static_assert([] {
    auto r = DecodeWith({Token::Tuple(4), Token::U8(1), Token::Str("a"), Token::Seq(0), Token::SeqEnd(), Token::Bool(true), Token::TupleEnd()},
        [](auto & de) {
            TriplePuller v;
            return de.deserialize_tuple(3, v);
        });
    return !r && r.error() == DeserializeError::TRAILING_ENTRIES && r.errorClass() == ErrorClass::syntax;
}());


// ========== Scenario: decode-any over a two-entry map ==========

static_assert([] {
    std::vector<Token> in{Token::Map(2), Token::Str("a"), Token::I32(1), Token::Str("b"), Token::I32(2), Token::MapEnd()};
    TokenDeserializer de{std::span<const Token>(in)};
    PairCollector v;
    return de.deserialize_any(v) && de.finish()
        && v.pairs.size() == 2
        && v.pairs[0].first == "a" && v.pairs[0].second == 1
        && v.pairs[1].first == "b" && v.pairs[1].second == 2
        && v.keyFetches == 3 && v.sawEnd;
}());

static_assert([] {
    // {"a": 1, "b": 2}
    std::vector<std::uint8_t> in{0xA2, 0x61, 'a', 0x01, 0x61, 'b', 0x02};
    CborDeserializer de(in.cbegin(), in.cend());
    PairCollector v;
    return de.deserialize_any(v) && de.finish()
        && v.pairs.size() == 2 && v.keyFetches == 3 && v.sawEnd;
}());

// the same map written with indefinite length
static_assert([] {
    std::vector<std::uint8_t> in{0xBF, 0x61, 'a', 0x01, 0x61, 'b', 0x02, 0xFF};
    CborDeserializer de(in.cbegin(), in.cend());
    PairCollector v;
    return de.deserialize_any(v) && de.finish()
        && v.pairs.size() == 2 && v.keyFetches == 3 && v.sawEnd;
}());

// a format that cannot say what comes next refuses decode-any
static_assert([] {
    std::vector<std::uint8_t> in{0x02, 0, 0, 0, 0, 0, 0, 0};
    CompactDeserializer de(in.cbegin(), in.cend());
    PairCollector v;
    return !de.deserialize_any(v) && de.context().currentError() == DeserializeError::NOT_SELF_DESCRIBING;
}());


// ========== Exactly one visitor call per decode ==========

template<class T>
constexpr bool OneCallThroughTokens(const T & value) {
    std::vector<Token> out;
    if(!Tokens::Serialize(value, out)) return false;
    TokenDeserializer de{std::span<const Token>(out)};
    Counting v;
    return de.deserialize_any(v) && de.finish() && v.calls == 1;
}

template<class T>
constexpr bool OneCallThroughCbor(const T & value) {
    std::vector<std::uint8_t> out;
    if(!Cbor::Serialize(value, out)) return false;
    CborDeserializer de(out.cbegin(), out.cend());
    Counting v;
    return de.deserialize_any(v) && de.finish() && v.calls == 1;
}

static_assert(OneCallThroughTokens(true));
static_assert(OneCallThroughTokens(-5));
static_assert(OneCallThroughTokens(std::string("s")));
static_assert(OneCallThroughTokens(std::optional<int>{}));
static_assert(OneCallThroughTokens(std::optional<int>{3}));
static_assert(OneCallThroughTokens(std::vector<std::vector<int>>{{1}, {2, 3}}));
static_assert(OneCallThroughTokens(std::tuple<int, std::string>{1, "x"}));
static_assert(OneCallThroughTokens(Point{1, 2}));

static_assert(OneCallThroughCbor(false));
static_assert(OneCallThroughCbor(1.25));
static_assert(OneCallThroughCbor(std::vector<std::optional<int>>{1, std::nullopt}));
static_assert(OneCallThroughCbor(Point{3, 4}));

// a failed decode reports its error without a visitor call
static_assert([] {
    std::vector<Token> in{};
    TokenDeserializer de{std::span<const Token>(in)};
    Counting v;
    return !de.deserialize_any(v) && v.calls == 0
        && de.context().currentError() == DeserializeError::UNEXPECTED_END_OF_DATA;
}());


// ========== Widening defaults ==========

static_assert([] {
    std::vector<Token> in{Token::I8(-4)};
    TokenDeserializer de{std::span<const Token>(in)};
    WideSigned v;
    return de.deserialize_i8(v) && v.value == -4;
}());

static_assert([] {
    std::vector<Token> in{Token::Char(U'é')};
    TokenDeserializer de{std::span<const Token>(in)};
    TextOnly v;
    return de.deserialize_char(v) && v.value == "\xC3\xA9";
}());

// out of range for the widened target
static_assert([] {
    auto r = DecodeWith({Token::U64(1)}, [](auto & de) {
        WideSigned v;
        return de.deserialize_u64(v);
    });
    return !r && r.error() == DeserializeError::INVALID_TYPE && r.got() == std::optional<Shape>(Shape::U64);
}());


// ========== A visitor that declines without a reason ==========

static_assert([] {
    auto r = DecodeWith({Token::Bool(true)}, [](auto & de) {
        Refusing v;
        return de.deserialize_bool(v);
    });
    return !r && r.error() == DeserializeError::CUSTOM && r.pos() == 1;
}());
