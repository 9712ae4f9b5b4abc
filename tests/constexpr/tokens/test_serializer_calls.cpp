#include "../test_helpers.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

using namespace ShapeFusion;
using namespace TestHelpers;

namespace token_call_tests {

struct Point {
    int x;
    int y;
    constexpr bool operator==(const Point&) const = default;
};

struct Empty {
    constexpr bool operator==(const Empty&) const = default;
};

struct Meters {
    double value;
    constexpr bool operator==(const Meters&) const = default;
};

struct Rgb {
    std::uint8_t r;
    std::uint8_t g;
    std::uint8_t b;
    constexpr bool operator==(const Rgb&) const = default;
};

struct Labeled {
    int id;
    Annotated<std::optional<std::string>, options::omit_if_none> label;
    Annotated<int, options::key<"n">> count;
    constexpr bool operator==(const Labeled&) const = default;
};

enum class Color { Red, Green, Blue, Unlisted };

struct Move {
    int dx;
    int dy;
    constexpr bool operator==(const Move&) const = default;
};

using Message = std::variant<std::monostate, std::string, std::tuple<int, int>, Move>;

} // namespace token_call_tests

template<> struct ShapeFusion::StructMeta<token_call_tests::Point> {
    using Options = OptionsPack<options::name<"Point">>;
};
template<> struct ShapeFusion::StructMeta<token_call_tests::Empty> {
    using Options = OptionsPack<options::name<"Empty">>;
};
template<> struct ShapeFusion::StructMeta<token_call_tests::Meters> {
    using Options = OptionsPack<options::name<"Meters">, options::newtype>;
};
template<> struct ShapeFusion::StructMeta<token_call_tests::Rgb> {
    using Options = OptionsPack<options::name<"Rgb">, options::as_array>;
};
template<> struct ShapeFusion::StructMeta<token_call_tests::Labeled> {
    using Options = OptionsPack<options::name<"Labeled">>;
};
template<> struct ShapeFusion::EnumMeta<token_call_tests::Color> {
    using Variants = EnumVariants<Variant<token_call_tests::Color::Red, "Red">,
                                  Variant<token_call_tests::Color::Green, "Green">,
                                  Variant<token_call_tests::Color::Blue, "Blue">>;
    using Options = OptionsPack<options::name<"Color">>;
};
template<> struct ShapeFusion::VariantMeta<token_call_tests::Message> {
    using Alternatives = VariantNames<"Quit", "Write", "ChangeColor", "Move">;
    using Options = OptionsPack<options::name<"Message">>;
};

using namespace token_call_tests;


// ========== Primitives: one call each ==========

static_assert(SerializesTo(true, {Token::Bool(true)}));
static_assert(SerializesTo(std::int8_t{-5}, {Token::I8(-5)}));
static_assert(SerializesTo(std::int16_t{-300}, {Token::I16(-300)}));
static_assert(SerializesTo(42, {Token::I32(42)}));
static_assert(SerializesTo(std::int64_t{-1}, {Token::I64(-1)}));
static_assert(SerializesTo(i128{1} << 100, {Token::I128(i128{1} << 100)}));
static_assert(SerializesTo(std::uint8_t{255}, {Token::U8(255)}));
static_assert(SerializesTo(std::uint16_t{65535}, {Token::U16(65535)}));
static_assert(SerializesTo(std::uint32_t{7}, {Token::U32(7)}));
static_assert(SerializesTo(std::uint64_t{1} << 63, {Token::U64(std::uint64_t{1} << 63)}));
static_assert(SerializesTo(u128{3}, {Token::U128(3)}));
static_assert(SerializesTo(1.5f, {Token::F32(1.5f)}));
static_assert(SerializesTo(2.25, {Token::F64(2.25)}));
static_assert(SerializesTo(U'é', {Token::Char(U'é')}));


// ========== Text and bytes ==========

static_assert(SerializesTo(std::string("hello"), {Token::Str("hello")}));
static_assert(SerializesTo(std::string_view("view"), {Token::Str("view")}));
static_assert([] {
    const std::uint8_t raw[] = {1, 2, 3};
    return SerializesTo(ByteBuf{1, 2, 3}, {Token::Bytes(raw)});
}());
static_assert(SerializesTo(std::vector<std::uint8_t>{1, 2},
    {Token::Seq(2), Token::U8(1), Token::U8(2), Token::SeqEnd()}));


// ========== Option and unit ==========

static_assert(SerializesTo(std::optional<int>{}, {Token::None()}));
static_assert(SerializesTo(std::optional<int>{5}, {Token::Some(), Token::I32(5)}));
static_assert(SerializesTo(std::monostate{}, {Token::Unit()}));
static_assert(SerializesTo(Empty{}, {Token::UnitStruct("Empty")}));
static_assert(SerializesTo(Meters{1.5}, {Token::NewtypeStruct("Meters"), Token::F64(1.5)}));


// ========== Sequences and fixed sequences ==========

static_assert(SerializesTo(std::vector<int>{1, 2, 3},
    {Token::Seq(3), Token::I32(1), Token::I32(2), Token::I32(3), Token::SeqEnd()}));
static_assert(SerializesTo(std::vector<int>{}, {Token::Seq(0), Token::SeqEnd()}));
static_assert(SerializesTo(std::array<int, 2>{4, 5},
    {Token::Tuple(2), Token::I32(4), Token::I32(5), Token::TupleEnd()}));
static_assert(SerializesTo(std::tuple<bool, int>{true, 9},
    {Token::Tuple(2), Token::Bool(true), Token::I32(9), Token::TupleEnd()}));
static_assert(SerializesTo(Rgb{1, 2, 3},
    {Token::TupleStruct("Rgb", 3), Token::U8(1), Token::U8(2), Token::U8(3), Token::TupleStructEnd()}));


// ========== Structs ==========

static_assert(SerializesTo(Point{1, 2},
    {Token::Struct("Point", 2), Token::Str("x"), Token::I32(1), Token::Str("y"), Token::I32(2), Token::StructEnd()}));

// omitted fields are skipped and not counted, renamed keys are used as written
static_assert(SerializesTo(Labeled{7, std::nullopt, 3},
    {Token::Struct("Labeled", 2), Token::Str("id"), Token::I32(7), Token::Str("n"), Token::I32(3), Token::StructEnd()}));
static_assert(SerializesTo(Labeled{7, std::optional<std::string>("x"), 3},
    {Token::Struct("Labeled", 3), Token::Str("id"), Token::I32(7),
     Token::Str("label"), Token::Some(), Token::Str("x"),
     Token::Str("n"), Token::I32(3), Token::StructEnd()}));


// ========== Enumerations ==========

static_assert(SerializesTo(Color::Blue, {Token::UnitVariant("Color", "Blue", 2)}));
static_assert(SerializeFailsWith(Color::Unlisted, SerializeError::UNKNOWN_VARIANT));

static_assert(SerializesTo(Message{std::monostate{}}, {Token::UnitVariant("Message", "Quit", 0)}));
static_assert(SerializesTo(Message{std::string("hi")},
    {Token::NewtypeVariant("Message", "Write", 1), Token::Str("hi")}));
static_assert(SerializesTo(Message{std::tuple<int, int>{1, 2}},
    {Token::TupleVariant("Message", "ChangeColor", 2, 2), Token::I32(1), Token::I32(2), Token::TupleVariantEnd()}));
static_assert(SerializesTo(Message{Move{3, 4}},
    {Token::StructVariant("Message", "Move", 2, 3), Token::Str("dx"), Token::I32(3),
     Token::Str("dy"), Token::I32(4), Token::StructVariantEnd()}));


// ========== Nesting ==========

static_assert(SerializesTo(std::vector<std::optional<Point>>{Point{1, 2}, std::nullopt},
    {Token::Seq(2),
        Token::Some(), Token::Struct("Point", 2), Token::Str("x"), Token::I32(1), Token::Str("y"), Token::I32(2), Token::StructEnd(),
        Token::None(),
     Token::SeqEnd()}));


// ========== Round trips through tokens ==========

static_assert(TestTokensRoundTrip(true));
static_assert(TestTokensRoundTrip(-17));
static_assert(TestTokensRoundTrip(i128{-1} << 90));
static_assert(TestTokensRoundTrip(u128{1} << 127));
static_assert(TestTokensRoundTrip(std::string("round trip")));
static_assert(TestTokensRoundTrip(ByteBuf{0, 255, 7}));
static_assert(TestTokensRoundTrip(std::optional<int>{}));
static_assert(TestTokensRoundTrip(std::optional<int>{8}));
static_assert(TestTokensRoundTrip(Point{-1, 1}));
static_assert(TestTokensRoundTrip(Empty{}));
static_assert(TestTokensRoundTrip(Meters{3.0}));
static_assert(TestTokensRoundTrip(Rgb{9, 8, 7}));
static_assert(TestTokensRoundTrip(Labeled{1, std::nullopt, 2}));
static_assert(TestTokensRoundTrip(Labeled{1, std::optional<std::string>("z"), 2}));
static_assert(TestTokensRoundTrip(Color::Green));
static_assert(TestTokensRoundTrip(Message{std::monostate{}}));
static_assert(TestTokensRoundTrip(Message{std::string("text")}));
static_assert(TestTokensRoundTrip(Message{std::tuple<int, int>{5, 6}}));
static_assert(TestTokensRoundTrip(Message{Move{7, 8}}));
static_assert(TestTokensRoundTrip(std::tuple<std::uint8_t, std::string, std::vector<int>>{1, "a", {2, 3}}));
static_assert(TestRoundTripDeep(std::vector<std::vector<Point>>{{Point{1, 2}}, {}, {Point{3, 4}, Point{5, 6}}}));
