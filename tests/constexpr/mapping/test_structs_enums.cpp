#include "../test_helpers.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

using namespace ShapeFusion;
using namespace TestHelpers;

namespace mapping_tests {

struct Account {
    int id;
    std::string owner;
    int scratch = -1;   // not listed in StructMeta, never mapped
    constexpr bool operator==(const Account&) const = default;
};

struct Settings {
    int level = 3;
    bool verbose = false;
    constexpr bool operator==(const Settings&) const = default;
};

struct Tolerant {
    std::string name;
    constexpr bool operator==(const Tolerant&) const = default;
};

struct Ids {
    std::vector<int> values;
    constexpr bool operator==(const Ids&) const = default;
};

struct Pixel {
    std::uint8_t r;
    std::uint8_t g;
    std::uint8_t b;
    std::uint8_t a;
    constexpr bool operator==(const Pixel&) const = default;
};

struct Line {
    Pixel color;
    std::pair<int, int> from;
    std::pair<int, int> to;
    std::optional<std::string> label;
    constexpr bool operator==(const Line&) const = default;
};

struct Cached {
    int value;
    Annotated<int, options::exclude> memo = 99;
    constexpr bool operator==(const Cached&) const = default;
};

enum class Level : std::uint8_t { Low = 1, High = 10 };

struct Stop {
    constexpr bool operator==(const Stop&) const = default;
};

struct Jump {
    int x;
    int y;
    constexpr bool operator==(const Jump&) const = default;
};

using Command = std::variant<Stop, std::string, Pixel, std::tuple<int, int, int>, Jump>;

} // namespace mapping_tests

template<> struct ShapeFusion::StructMeta<mapping_tests::Account> {
    using Fields = StructFields<
        Field<&mapping_tests::Account::id, "account_id">,
        Field<&mapping_tests::Account::owner, "owner">
    >;
    using Options = OptionsPack<options::name<"Account">>;
};
template<> struct ShapeFusion::StructMeta<mapping_tests::Settings> {
    using Fields = StructFields<
        Field<&mapping_tests::Settings::level, "level", options::not_required>,
        Field<&mapping_tests::Settings::verbose, "verbose", options::not_required>
    >;
};
template<> struct ShapeFusion::StructMeta<mapping_tests::Tolerant> {
    using Options = OptionsPack<options::allow_excess_fields>;
};
template<> struct ShapeFusion::StructMeta<mapping_tests::Ids> {
    using Options = OptionsPack<options::name<"Ids">, options::newtype>;
};
template<> struct ShapeFusion::StructMeta<mapping_tests::Pixel> {
    using Options = OptionsPack<options::name<"Pixel">, options::as_array>;
};
template<> struct ShapeFusion::StructMeta<mapping_tests::Stop> {
    using Options = OptionsPack<options::name<"Stop">>;
};
template<> struct ShapeFusion::EnumMeta<mapping_tests::Level> {
    using Variants = EnumVariants<Variant<mapping_tests::Level::Low, "low">,
                                  Variant<mapping_tests::Level::High, "high">>;
};
template<> struct ShapeFusion::VariantMeta<mapping_tests::Command> {
    using Alternatives = VariantNames<"Stop", "Say", "Paint", "Move", "Jump">;
    using Options = OptionsPack<options::name<"Command">>;
};

using namespace mapping_tests;


// ========== Explicit field lists ==========

static_assert(shape_of_v<Account> == Shape::Struct);
static_assert(SerializesTo(Account{5, "ann", 0},
    {Token::Struct("Account", 2), Token::Str("account_id"), Token::I32(5), Token::Str("owner"), Token::Str("ann"), Token::StructEnd()}));

// an unlisted member is left alone on decode
static_assert([] {
    std::vector<Token> in{Token::Struct("Account", 2), Token::Str("account_id"), Token::I32(5),
                          Token::Str("owner"), Token::Str("ann"), Token::StructEnd()};
    Account a{};
    a.scratch = 42;
    return Tokens::Deserialize(a, std::span<const Token>(in)) && a.id == 5 && a.owner == "ann" && a.scratch == 42;
}());

// not_required fields keep their defaults when absent
static_assert(DecodesTo({Token::Struct("", 0), Token::StructEnd()}, Settings{3, false}));
static_assert(DecodesTo({Token::Struct("", 1), Token::Str("verbose"), Token::Bool(true), Token::StructEnd()}, Settings{3, true}));

// excess fields
static_assert(DecodesTo({Token::Struct("", 2), Token::Str("name"), Token::Str("n"), Token::Str("age"), Token::I32(4), Token::StructEnd()},
                        Tolerant{"n"}));
static_assert(DecodeFailsWith<Account>({Token::Struct("Account", 3), Token::Str("account_id"), Token::I32(1), Token::Str("owner"), Token::Str("o"),
                                        Token::Str("age"), Token::I32(4), Token::StructEnd()},
                                       DeserializeError::UNKNOWN_FIELD));

// excluded members keep their value and are not on the wire
static_assert(SerializesTo(Cached{1, 2}, {Token::Struct("", 1), Token::Str("value"), Token::I32(1), Token::StructEnd()}));
static_assert([] {
    std::vector<Token> in{Token::Struct("", 1), Token::Str("value"), Token::I32(8), Token::StructEnd()};
    Cached c{};
    return Tokens::Deserialize(c, std::span<const Token>(in)) && c.value == 8 && c.memo.get() == 99;
}());


// ========== Newtype and tuple structs ==========

static_assert(shape_of_v<Ids> == Shape::NewtypeStruct);
static_assert(SerializesTo(Ids{{1, 2}},
    {Token::NewtypeStruct("Ids"), Token::Seq(2), Token::I32(1), Token::I32(2), Token::SeqEnd()}));
static_assert(DecodesTo({Token::NewtypeStruct("Ids"), Token::Seq(1), Token::I32(5), Token::SeqEnd()}, Ids{{5}}));
// the payload alone is not a newtype struct
static_assert(DecodeFailsWith<Ids>({Token::Seq(1), Token::I32(5), Token::SeqEnd()}, DeserializeError::INVALID_TYPE));

static_assert(shape_of_v<Pixel> == Shape::TupleStruct);
static_assert(DecodeFailsWith<Pixel>({Token::TupleStruct("Pixel", 3), Token::U8(1), Token::U8(2), Token::U8(3), Token::TupleStructEnd()},
                                     DeserializeError::INVALID_LENGTH));


// ========== Enumerations ==========

static_assert(SerializesTo(Level::High, {Token::UnitVariant("", "high", 1)}));
static_assert(DecodesTo({Token::UnitVariant("", "low", 0)}, Level::Low));
// a bare string is not an enum in the token stream
static_assert(DecodeFailsWith<Level>({Token::Str("high")}, DeserializeError::INVALID_TYPE));
static_assert(DecodeFailsWith<Level>({Token::UnitVariant("", "medium", 1)}, DeserializeError::UNKNOWN_VARIANT));

// a unit struct alternative is a unit variant, an as_array one is a tuple variant
static_assert(SerializesTo(Command{Stop{}}, {Token::UnitVariant("Command", "Stop", 0)}));
static_assert(SerializesTo(Command{Pixel{1, 2, 3, 4}},
    {Token::TupleVariant("Command", "Paint", 4, 2), Token::U8(1), Token::U8(2), Token::U8(3), Token::U8(4), Token::TupleVariantEnd()}));
static_assert(SerializesTo(Command{std::tuple<int, int, int>{1, 2, 3}},
    {Token::TupleVariant("Command", "Move", 3, 3), Token::I32(1), Token::I32(2), Token::I32(3), Token::TupleVariantEnd()}));

// a payload of the wrong kind for the chosen variant
static_assert(DecodeFailsWith<Command>({Token::NewtypeVariant("Command", "Stop", 0), Token::I32(1)}, DeserializeError::INVALID_TYPE));
static_assert(DecodeFailsWith<Command>({Token::UnitVariant("Command", "Say", 1)}, DeserializeError::INVALID_TYPE));


// ========== The same values through every format ==========

static_assert(TestRoundTripEverywhere(Account{1, "x", -1}));
static_assert(TestRoundTripEverywhere(Settings{7, true}));
static_assert(TestRoundTripEverywhere(Ids{{3, 2, 1}}));
static_assert(TestRoundTripEverywhere(Pixel{10, 20, 30, 40}));
static_assert(TestRoundTripEverywhere(Line{Pixel{1, 1, 1, 1}, {0, 0}, {5, -5}, std::nullopt}));
static_assert(TestRoundTripEverywhere(Line{Pixel{0, 0, 0, 255}, {-1, 2}, {3, 4}, std::string("edge")}));
static_assert(TestRoundTripEverywhere(Level::Low));
static_assert(TestRoundTripEverywhere(Level::High));
static_assert(TestRoundTripEverywhere(Command{Stop{}}));
static_assert(TestRoundTripEverywhere(Command{std::string("hello")}));
static_assert(TestRoundTripEverywhere(Command{Pixel{1, 2, 3, 4}}));
static_assert(TestRoundTripEverywhere(Command{std::tuple<int, int, int>{7, 8, 9}}));
static_assert(TestRoundTripEverywhere(Command{Jump{-3, 3}}));
static_assert(TestRoundTripEverywhere(std::vector<Command>{Stop{}, std::string("a"), Jump{1, 2}}));
static_assert(TestRoundTripEverywhere(std::pair<std::string, std::optional<int>>{"k", std::nullopt}));

// some(none) survives formats that tag options, CBOR writes both as null
static_assert(TestTokensRoundTrip(std::optional<std::optional<int>>{std::optional<int>{}}));
static_assert(TestCompactRoundTrip(std::optional<std::optional<int>>{std::optional<int>{}}));
static_assert(!TestCborRoundTrip(std::optional<std::optional<int>>{std::optional<int>{}}));
