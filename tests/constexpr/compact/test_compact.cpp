#include "../test_helpers.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

using namespace ShapeFusion;
using namespace TestHelpers;

namespace compact_tests {

struct Sample {
    std::uint8_t kind;
    std::string tag;
    bool flag;
    constexpr bool operator==(const Sample&) const = default;
};

struct Sparse {
    int id;
    Annotated<std::optional<int>, options::omit_if_none> extra;
};

enum class Mode { Off, On, Auto };

/// A run of integers whose length is only known once it has been walked.
struct Countdown {
    int from = 0;
    constexpr bool operator==(const Countdown&) const = default;
};

/// Declares more elements than it writes.
struct ShortSeq {};

/// Writes a map value before any key.
struct KeylessMap {};

using Shape3 = std::variant<std::monostate, std::int16_t, std::tuple<bool, bool>>;

} // namespace compact_tests

template<> struct ShapeFusion::EnumMeta<compact_tests::Mode> {
    using Variants = EnumVariants<Variant<compact_tests::Mode::Off, "off">,
                                  Variant<compact_tests::Mode::On, "on">,
                                  Variant<compact_tests::Mode::Auto, "auto">>;
};
template<> struct ShapeFusion::VariantMeta<compact_tests::Shape3> {
    using Alternatives = VariantNames<"Empty", "Small", "Pair">;
};

template<>
struct ShapeFusion::Mapping<compact_tests::Countdown> {
    static constexpr Shape shape = Shape::Seq;

    template<class S>
    static constexpr bool serialize(const compact_tests::Countdown & c, S & s) {
        typename S::SeqFrame fr;
        if(!s.begin_seq(std::nullopt, fr)) {
            return false;
        }
        for(int i = c.from; i > 0; i --) {
            if(!s.serialize_element(fr, i)) {
                return false;
            }
        }
        return s.end(fr);
    }
    template<class D>
    static constexpr bool deserialize(compact_tests::Countdown & c, D & d) {
        std::vector<int> items;
        if(!ShapeFusion::deserialize(items, d)) {
            return false;
        }
        c.from = static_cast<int>(items.size());
        return true;
    }
};

template<>
struct ShapeFusion::Mapping<compact_tests::ShortSeq> {
    static constexpr Shape shape = Shape::Tuple;

    template<class S>
    static constexpr bool serialize(const compact_tests::ShortSeq &, S & s) {
        typename S::SeqFrame fr;
        return s.begin_tuple(3, fr) && s.serialize_element(fr, true) && s.end(fr);
    }
    template<class D>
    static constexpr bool deserialize(compact_tests::ShortSeq &, D &) {
        return false;
    }
};

template<>
struct ShapeFusion::Mapping<compact_tests::KeylessMap> {
    static constexpr Shape shape = Shape::Map;

    template<class S>
    static constexpr bool serialize(const compact_tests::KeylessMap &, S & s) {
        typename S::MapFrame fr;
        return s.begin_map(1, fr) && s.serialize_value(fr, 1) && s.end(fr);
    }
    template<class D>
    static constexpr bool deserialize(compact_tests::KeylessMap &, D &) {
        return false;
    }
};

using namespace compact_tests;


// ========== Layout ==========

static_assert(CompactBytesEqual(true, {0x01}));
static_assert(CompactBytesEqual(false, {0x00}));
static_assert(CompactBytesEqual(std::int32_t{-2}, {0xFE, 0xFF, 0xFF, 0xFF}));
static_assert(CompactBytesEqual(std::uint16_t{0x0102}, {0x02, 0x01}));
static_assert(CompactBytesEqual(std::int64_t{1}, {0x01, 0, 0, 0, 0, 0, 0, 0}));
static_assert(CompactBytesEqual(i128{1}, {0x01, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}));
static_assert(CompactBytesEqual(1.0, {0, 0, 0, 0, 0, 0, 0xF0, 0x3F}));
static_assert(CompactBytesEqual(1.0f, {0, 0, 0x80, 0x3F}));
static_assert(CompactBytesEqual(U'A', {0x41, 0, 0, 0}));
static_assert(CompactBytesEqual(std::string("ab"), {2, 0, 0, 0, 0, 0, 0, 0, 'a', 'b'}));
static_assert(CompactBytesEqual(ByteBuf{0xAA}, {1, 0, 0, 0, 0, 0, 0, 0, 0xAA}));
static_assert(CompactBytesEqual(std::optional<std::uint8_t>{}, {0x00}));
static_assert(CompactBytesEqual(std::optional<std::uint8_t>{5}, {0x01, 0x05}));
static_assert(CompactBytesEqual(std::monostate{}, {}));

// tuples and structs carry no length and no names
static_assert(CompactBytesEqual(std::tuple<std::uint8_t, bool>{1, true}, {0x01, 0x01}));
static_assert(CompactBytesEqual(std::array<std::uint8_t, 3>{7, 8, 9}, {7, 8, 9}));
static_assert(CompactBytesEqual(Sample{3, "x", false}, {0x03, 1, 0, 0, 0, 0, 0, 0, 0, 'x', 0x00}));

// seqs carry a u64 count
static_assert(CompactBytesEqual(std::vector<std::uint8_t>{4, 5}, {2, 0, 0, 0, 0, 0, 0, 0, 4, 5}));

// variants are a u32 index, then the payload
static_assert(CompactBytesEqual(Mode::Auto, {2, 0, 0, 0}));
static_assert(CompactBytesEqual(Shape3{std::monostate{}}, {0, 0, 0, 0}));
static_assert(CompactBytesEqual(Shape3{std::int16_t{-1}}, {1, 0, 0, 0, 0xFF, 0xFF}));
static_assert(CompactBytesEqual(Shape3{std::tuple<bool, bool>{true, false}}, {2, 0, 0, 0, 0x01, 0x00}));


// ========== Round trips ==========

static_assert(TestCompactRoundTrip(Sample{200, "name", true}));
static_assert(TestCompactRoundTrip(std::vector<Sample>{{1, "a", false}, {2, "", true}}));
static_assert(TestCompactRoundTrip(Mode::On));
static_assert(TestCompactRoundTrip(Shape3{std::int16_t{-300}}));
static_assert(TestCompactRoundTrip(std::optional<std::string>{"z"}));
static_assert(TestCompactRoundTrip(u128{1} << 100));
static_assert(TestCompactRoundTrip(-0.5));
static_assert(TestCompactRoundTrip(U'\U0001F600'));


// ========== Malformed input ==========

static_assert(CompactDecodeFailsWith<bool>({0x02}, DeserializeError::ILLFORMED_INPUT));
static_assert(CompactDecodeFailsWith<std::optional<int>>({0x02, 0, 0, 0, 0}, DeserializeError::ILLFORMED_INPUT));
static_assert(CompactDecodeFailsWith<char32_t>({0x00, 0xD8, 0, 0}, DeserializeError::ILLFORMED_INPUT));
static_assert(CompactDecodeFailsWith<char32_t>({0x00, 0x00, 0x11, 0}, DeserializeError::ILLFORMED_INPUT));
static_assert(CompactDecodeFailsWith<std::int32_t>({0x01, 0x02}, DeserializeError::UNEXPECTED_END_OF_DATA));
static_assert(CompactDecodeFailsWith<std::string>({5, 0, 0, 0, 0, 0, 0, 0, 'a'}, DeserializeError::UNEXPECTED_END_OF_DATA));
static_assert(CompactDecodeFailsWith<std::uint8_t>({0x01, 0x02}, DeserializeError::TRAILING_DATA));
static_assert(CompactDecodeFailsWith<std::string>({1, 0, 0, 0, 0, 0, 0, 0, 0xFF}, DeserializeError::INVALID_UTF8));
static_assert(CompactDecodeFailsWith<Mode>({7, 0, 0, 0}, DeserializeError::INVALID_VALUE));

// the reader stops where the error was found
static_assert([] {
    std::vector<std::uint8_t> in{0x01, 0x02};
    std::uint8_t v{};
    auto r = Compact::Deserialize(v, in);
    return !r && r.pos() == 1 && r.errorClass() == ErrorClass::syntax;
}());

// nothing tells the reader what shape comes next
static_assert(CompactDecodeFailsWith<IgnoredAny>({0x01}, DeserializeError::NOT_SELF_DESCRIBING));
static_assert([] {
    std::vector<std::uint8_t> in{0x01};
    CompactDeserializer de(in.cbegin(), in.cend());
    return !de.is_self_describing();
}());


// ========== What the writer refuses ==========

// a seq must announce its length up front
static_assert([] {
    std::vector<std::uint8_t> out;
    auto r = Compact::Serialize(Countdown{3}, out);
    return !r && r.error() == SerializeError::LENGTH_REQUIRED;
}());
// formats that can delimit an open seq accept it
static_assert(SerializesTo(Countdown{2}, {Token::Seq(std::nullopt), Token::I32(2), Token::I32(1), Token::SeqEnd()}));
static_assert(TestCborRoundTrip(Countdown{4}));

// positional structs cannot leave a hole
static_assert([] {
    std::vector<std::uint8_t> out;
    auto r = Compact::Serialize(Sparse{1, std::nullopt}, out);
    return !r && r.error() == SerializeError::UNSUPPORTED_SHAPE;
}());
static_assert([] {
    std::vector<std::uint8_t> out;
    return static_cast<bool>(Compact::Serialize(Sparse{1, std::optional<int>{2}}, out))
        && out == std::vector<std::uint8_t>{1, 0, 0, 0, 1, 2, 0, 0, 0};
}());

// sessions must be used as declared
static_assert([] {
    std::vector<std::uint8_t> out;
    auto r = Compact::Serialize(ShortSeq{}, out);
    return !r && r.error() == SerializeError::LENGTH_MISMATCH;
}());
static_assert([] {
    std::vector<std::uint8_t> out;
    auto r = Compact::Serialize(KeylessMap{}, out);
    return !r && r.error() == SerializeError::SESSION_MISUSE;
}());
static_assert(SerializeFailsWith(ShortSeq{}, SerializeError::LENGTH_MISMATCH));
static_assert(SerializeFailsWith(KeylessMap{}, SerializeError::SESSION_MISUSE));

// a bounded output range reports when it runs out
static_assert([] {
    std::array<std::uint8_t, 4> buf{};
    auto r = Compact::Serialize(std::int64_t{1}, buf.begin(), buf.end());
    return !r && r.error() == SerializeError::WRITER_ERROR;
}());
