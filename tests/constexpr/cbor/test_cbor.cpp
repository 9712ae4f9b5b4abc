#include "../test_helpers.hpp"
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

using namespace ShapeFusion;
using namespace TestHelpers;

namespace cbor_tests {

struct Point {
    int x;
    int y;
    constexpr bool operator==(const Point&) const = default;
};

struct Profile {
    std::string name;
    Annotated<std::optional<int>, options::omit_if_none> age;
    bool admin;
    constexpr bool operator==(const Profile&) const = default;
};

enum class Color { Red, Green };

using Event = std::variant<std::monostate, int, std::tuple<int, int>, Point>;

} // namespace cbor_tests

template<> struct ShapeFusion::EnumMeta<cbor_tests::Color> {
    using Variants = EnumVariants<Variant<cbor_tests::Color::Red, "red">,
                                  Variant<cbor_tests::Color::Green, "green">>;
};
template<> struct ShapeFusion::VariantMeta<cbor_tests::Event> {
    using Alternatives = VariantNames<"Quit", "Key", "Move", "Click">;
};

using namespace cbor_tests;

constexpr CborConfig packed{.packed = true};


// ========== RFC 8949 Appendix A encodings ==========

static_assert(CborBytesEqual(0, {0x00}));
static_assert(CborBytesEqual(23, {0x17}));
static_assert(CborBytesEqual(24, {0x18, 0x18}));
static_assert(CborBytesEqual(100, {0x18, 0x64}));
static_assert(CborBytesEqual(500, {0x19, 0x01, 0xF4}));
static_assert(CborBytesEqual(1000000, {0x1A, 0x00, 0x0F, 0x42, 0x40}));
static_assert(CborBytesEqual(std::uint64_t{18446744073709551615u}, {0x1B, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}));
static_assert(CborBytesEqual(-1, {0x20}));
static_assert(CborBytesEqual(-10, {0x29}));
static_assert(CborBytesEqual(-100, {0x38, 0x63}));
static_assert(CborBytesEqual(-1000, {0x39, 0x03, 0xE7}));
static_assert(CborBytesEqual(1.1, {0xFB, 0x3F, 0xF1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9A}));
static_assert(CborBytesEqual(100000.0f, {0xFA, 0x47, 0xC3, 0x50, 0x00}));
static_assert(CborBytesEqual(false, {0xF4}));
static_assert(CborBytesEqual(true, {0xF5}));
static_assert(CborBytesEqual(std::string(""), {0x60}));
static_assert(CborBytesEqual(std::string("a"), {0x61, 0x61}));
static_assert(CborBytesEqual(std::string("IETF"), {0x64, 0x49, 0x45, 0x54, 0x46}));
static_assert(CborBytesEqual(std::string("\xC3\xBC"), {0x62, 0xC3, 0xBC}));
static_assert(CborBytesEqual(ByteBuf{1, 2, 3, 4}, {0x44, 0x01, 0x02, 0x03, 0x04}));
static_assert(CborBytesEqual(std::vector<int>{}, {0x80}));
static_assert(CborBytesEqual(std::vector<int>{1, 2, 3}, {0x83, 0x01, 0x02, 0x03}));

// a char travels as one-character text
static_assert(CborBytesEqual(U'a', {0x61, 0x61}));
static_assert(CborBytesEqual(U'ü', {0x62, 0xC3, 0xBC}));

// none, unit and unit structs are null; some is the bare value
static_assert(CborBytesEqual(std::optional<int>{}, {0xF6}));
static_assert(CborBytesEqual(std::optional<int>{1}, {0x01}));
static_assert(CborBytesEqual(std::monostate{}, {0xF6}));

// tuples are arrays
static_assert(CborBytesEqual(std::tuple<int, bool>{1, false}, {0x82, 0x01, 0xF4}));


// ========== Structs ==========

static_assert(CborBytesEqual(Point{1, 2}, {0xA2, 0x61, 'x', 0x01, 0x61, 'y', 0x02}));
static_assert(CborBytesEqual(Point{1, 2}, {0xA2, 0x00, 0x01, 0x01, 0x02}, packed));

// an omitted field shrinks the map; packed keys still name the declared position
static_assert(CborBytesEqual(Profile{"a", std::nullopt, true},
    {0xA2, 0x64, 'n', 'a', 'm', 'e', 0x61, 'a', 0x65, 'a', 'd', 'm', 'i', 'n', 0xF5}));
static_assert(CborBytesEqual(Profile{"a", std::nullopt, true}, {0xA2, 0x00, 0x61, 'a', 0x02, 0xF5}, packed));
static_assert(TestCborRoundTrip(Profile{"b", std::optional<int>{30}, false}));
static_assert(TestCborRoundTrip(Profile{"b", std::nullopt, false}, packed));

// keys may come in any order, by name or by index
static_assert(CborDecodesTo({0xA2, 0x61, 'y', 0x02, 0x61, 'x', 0x01}, Point{1, 2}));
static_assert(CborDecodesTo({0xA2, 0x01, 0x02, 0x00, 0x01}, Point{1, 2}));
// an array is not a struct
static_assert(CborDecodeFailsWith<Point>({0x82, 0x01, 0x02}, DeserializeError::INVALID_TYPE));

static_assert(CborDecodeFailsWith<Point>({0xA1, 0x61, 'x', 0x01}, DeserializeError::MISSING_FIELD));
static_assert(CborDecodeFailsWith<Point>({0xA3, 0x61, 'x', 0x01, 0x61, 'y', 0x02, 0x61, 'z', 0x03}, DeserializeError::UNKNOWN_FIELD));
static_assert(CborDecodeFailsWith<Point>({0xA2, 0x61, 'x', 0x01, 0x61, 'x', 0x02}, DeserializeError::DUPLICATE_FIELD));


// ========== Enumerations ==========

static_assert(CborBytesEqual(Color::Green, {0x65, 'g', 'r', 'e', 'e', 'n'}));
static_assert(CborBytesEqual(Color::Green, {0x01}, packed));
static_assert(CborDecodesTo({0x63, 'r', 'e', 'd'}, Color::Red));
static_assert(CborDecodesTo({0x00}, Color::Red));
static_assert(CborDecodeFailsWith<Color>({0x64, 'b', 'l', 'u', 'e'}, DeserializeError::UNKNOWN_VARIANT));

static_assert(CborBytesEqual(Event{std::monostate{}}, {0x64, 'Q', 'u', 'i', 't'}));
static_assert(CborBytesEqual(Event{5}, {0xA1, 0x63, 'K', 'e', 'y', 0x05}));
static_assert(CborBytesEqual(Event{5}, {0xA1, 0x01, 0x05}, packed));
static_assert(CborBytesEqual(Event{std::tuple<int, int>{1, 2}}, {0xA1, 0x64, 'M', 'o', 'v', 'e', 0x82, 0x01, 0x02}));
static_assert(CborBytesEqual(Event{Point{1, 2}},
    {0xA1, 0x65, 'C', 'l', 'i', 'c', 'k', 0xA2, 0x61, 'x', 0x01, 0x61, 'y', 0x02}));

// {tag: null} is a unit variant as well
static_assert(CborDecodesTo({0xA1, 0x64, 'Q', 'u', 'i', 't', 0xF6}, Event{std::monostate{}}));
// an indefinite one-entry map
static_assert(CborDecodesTo({0xBF, 0x63, 'K', 'e', 'y', 0x07, 0xFF}, Event{7}));

static_assert(CborDecodeFailsWith<Event>({0xA2, 0x63, 'K', 'e', 'y', 0x05, 0x64, 'M', 'o', 'v', 'e', 0x82, 0x01, 0x02},
                                         DeserializeError::INVALID_LENGTH));
static_assert(CborDecodeFailsWith<Event>({0xA0}, DeserializeError::INVALID_LENGTH));
// a bare tag where a payload is required
static_assert(CborDecodeFailsWith<Event>({0x63, 'K', 'e', 'y'}, DeserializeError::INVALID_TYPE));
static_assert(CborDecodeFailsWith<Event>({0xA1, 0x64, 'Q', 'u', 'i', 't', 0x01}, DeserializeError::INVALID_TYPE));
static_assert(CborDecodeFailsWith<Event>({0xBF, 0x63, 'K', 'e', 'y', 0x07, 0x01, 0xFF}, DeserializeError::TRAILING_ENTRIES));

static_assert(TestCborRoundTrip(std::vector<Event>{std::monostate{}, 1, std::tuple<int, int>{2, 3}, Point{4, 5}}));
static_assert(TestCborRoundTrip(std::vector<Event>{std::monostate{}, 1, std::tuple<int, int>{2, 3}, Point{4, 5}}, packed));


// ========== What decoding tolerates ==========

// half precision floats
static_assert(CborDecodesTo({0xF9, 0x3C, 0x00}, 1.0));
static_assert(CborDecodesTo({0xF9, 0x3E, 0x00}, 1.5f));
static_assert(CborDecodesTo({0xF9, 0xC4, 0x00}, -4.0));
static_assert(CborDecodesTo({0xF9, 0x00, 0x01}, 1.0 / 16777216.0));
static_assert(CborDecodesTo({0xF9, 0x7C, 0x00}, std::numeric_limits<double>::infinity()));

// integers widen into floats, floats never narrow into integers
static_assert(CborDecodesTo({0x18, 0x64}, 100.0));
static_assert(CborDecodeFailsWith<int>({0xF9, 0x3C, 0x00}, DeserializeError::INVALID_TYPE));

// semantic tags are skipped
static_assert(CborDecodesTo({0xC1, 0x1A, 0x51, 0x4B, 0x67, 0xB0}, std::int64_t{1363896240}));
static_assert(CborDecodesTo({0xD8, 0x20, 0x61, 'u'}, std::string("u")));
static_assert(CborDecodesTo({0xC1, 0xA2, 0x61, 'x', 0x01, 0x61, 'y', 0x02}, Point{1, 2}));
static_assert(CborDecodesTo({0xC6, 0xF6}, std::optional<int>{}));

// discarded values, including an enum payload and a tagged item
static_assert(CborDecodesTo({0xA1, 0x64, 'M', 'o', 'v', 'e', 0x82, 0x01, 0x02}, IgnoredAny{}));
static_assert(CborDecodesTo({0xC1, 0xF6}, IgnoredAny{}));

// a run of tags is consumed without nesting
static_assert([] {
    std::vector<std::uint8_t> in(300, 0xC6);
    in.push_back(0x01);
    int out = 0;
    return static_cast<bool>(Cbor::Deserialize(out, in)) && out == 1;
}());
static_assert([] {
    std::vector<std::uint8_t> in(300, 0xC6);
    int out = 0;
    auto r = Cbor::Deserialize(out, in);
    return !r && r.error() == DeserializeError::UNEXPECTED_END_OF_DATA;
}());

// indefinite arrays and maps
static_assert(CborDecodesTo({0x9F, 0xFF}, std::vector<int>{}));
static_assert(CborDecodesTo({0x9F, 0x01, 0x02, 0x03, 0xFF}, std::vector<int>{1, 2, 3}));
static_assert(CborDecodesTo({0x9F, 0x01, 0x9F, 0x02, 0x03, 0xFF, 0xFF},
                            std::tuple<int, std::vector<int>>{1, {2, 3}}));
static_assert(CborDecodesTo({0xBF, 0x61, 'x', 0x01, 0x61, 'y', 0x02, 0xFF}, Point{1, 2}));

// indefinite strings are joined
static_assert(CborDecodesTo({0x7F, 0x65, 's', 't', 'r', 'e', 'a', 0x64, 'm', 'i', 'n', 'g', 0xFF}, std::string("streaming")));
static_assert(CborDecodesTo({0x5F, 0x42, 0x01, 0x02, 0x43, 0x03, 0x04, 0x05, 0xFF}, ByteBuf{1, 2, 3, 4, 5}));
static_assert(CborDecodeFailsWith<std::string>({0x7F, 0x41, 0x01, 0xFF}, DeserializeError::ILLFORMED_INPUT));

// undefined reads as none
static_assert(CborDecodesTo({0xF7}, std::optional<int>{}));

// negative integers beyond the 64-bit range reach 128-bit targets
static_assert(CborDecodesTo({0x3B, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}, -(i128{1} << 64)));
static_assert(CborDecodeFailsWith<std::int64_t>({0x3B, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF},
                                                DeserializeError::INVALID_TYPE));


// ========== What decoding rejects ==========

static_assert(CborDecodeFailsWith<int>({0x19, 0x01}, DeserializeError::UNEXPECTED_END_OF_DATA));
static_assert(CborDecodeFailsWith<int>({0x01, 0x02}, DeserializeError::TRAILING_DATA));
static_assert(CborDecodeFailsWith<int>({0x1C}, DeserializeError::ILLFORMED_INPUT));
static_assert(CborDecodeFailsWith<int>({0xFF}, DeserializeError::ILLFORMED_INPUT));
static_assert(CborDecodeFailsWith<std::string>({0x61, 0xFF}, DeserializeError::INVALID_UTF8));
static_assert(CborDecodeFailsWith<std::uint8_t>({0x19, 0x01, 0x00}, DeserializeError::INVALID_VALUE));
static_assert(CborDecodeFailsWith<std::tuple<int, int, int>>({0x82, 0x01, 0x02}, DeserializeError::INVALID_LENGTH));
static_assert(CborDecodeFailsWith<std::tuple<int, int>>({0x83, 0x01, 0x02, 0x03}, DeserializeError::TRAILING_ENTRIES));
static_assert(CborDecodeFailsWith<std::tuple<int, int>>({0x9F, 0x01, 0x02, 0x03, 0xFF}, DeserializeError::TRAILING_ENTRIES));
static_assert(CborDecodeFailsWith<std::vector<int>>({0x9F, 0x01, 0x02}, DeserializeError::UNEXPECTED_END_OF_DATA));

static_assert([] {
    std::vector<std::uint8_t> in{0x82, 0x01, 0x61, 'x'};
    std::vector<int> out;
    auto r = Cbor::Deserialize(out, in);
    return !r && r.error() == DeserializeError::INVALID_TYPE
        && r.got() == std::optional<Shape>(Shape::String)
        && r.errorClass() == ErrorClass::semantic;
}());


// ========== What encoding refuses ==========

static_assert([] {
    std::vector<std::uint8_t> out;
    auto r = Cbor::Serialize(u128{1} << 64, out);
    return !r && r.error() == SerializeError::UNSUPPORTED_SHAPE;
}());
static_assert([] {
    std::vector<std::uint8_t> out;
    auto r = Cbor::Serialize(-(i128{1} << 64) - 1, out);
    return !r && r.error() == SerializeError::UNSUPPORTED_SHAPE;
}());
static_assert(TestCborRoundTrip(-(i128{1} << 64)));
static_assert(TestCborRoundTrip(u128{0xFFFFFFFFFFFFFFFFu}));
