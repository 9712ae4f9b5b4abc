#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <list>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <ShapeFusion/shapefusion.hpp>

using namespace ShapeFusion;

namespace {

struct Reading {
    std::string sensor;
    std::map<std::string, double> values;
    std::unique_ptr<int> calibration;
};

struct Tagged {
    std::string_view label;
    std::uint16_t code;
};

void report(const DeserializeResult & r) {
    if(!r) {
        std::cerr << "  " << error_to_string(r.error()) << " at " << r.pos();
        if(!r.name().empty()) {
            std::cerr << " (" << r.name() << ")";
        }
        std::cerr << "\n";
    }
}

void map_tests() {
    const std::map<std::string, int> m{{"a", 1}, {"b", 2}};
    {
        std::vector<Token> tokens;
        assert(Tokens::Serialize(m, tokens));
        assert(tokens.size() == 6);
        assert(tokens[0] == Token::Map(2));
        assert(tokens[1] == Token::Str("a"));
        std::map<std::string, int> back;
        assert(Tokens::Deserialize(back, std::span<const Token>(tokens)) && back == m);
    }
    {
        std::vector<std::uint8_t> bytes;
        assert(Compact::Serialize(m, bytes));
        std::map<std::string, int> back;
        assert(Compact::Deserialize(back, bytes) && back == m);
    }
    {
        std::vector<std::uint8_t> bytes;
        assert(Cbor::Serialize(m, bytes));
        assert(bytes == (std::vector<std::uint8_t>{0xA2, 0x61, 'a', 0x01, 0x61, 'b', 0x02}));
        std::unordered_map<std::string, int> back;
        assert(Cbor::Deserialize(back, bytes) && back.size() == 2 && back.at("b") == 2);
    }
    // integer keys
    {
        const std::map<int, std::string> byId{{-1, "neg"}, {7, "seven"}};
        std::vector<std::uint8_t> bytes;
        assert(Cbor::Serialize(byId, bytes));
        std::map<int, std::string> back;
        assert(Cbor::Deserialize(back, bytes) && back == byId);
    }
    // a repeated key is a semantic error, not a silent overwrite
    {
        std::vector<Token> in{Token::Map(2), Token::Str("a"), Token::I32(1), Token::Str("a"), Token::I32(2), Token::MapEnd()};
        std::map<std::string, int> out;
        auto r = Tokens::Deserialize(out, std::span<const Token>(in));
        assert(!r && r.error() == DeserializeError::DUPLICATE_KEY);
        assert(r.errorClass() == ErrorClass::semantic);
    }
    {
        const std::vector<std::uint8_t> in{0xA2, 0x61, 'k', 0x01, 0x61, 'k', 0x02};
        std::map<std::string, int> out;
        auto r = Cbor::Deserialize(out, in);
        assert(!r && r.error() == DeserializeError::DUPLICATE_KEY);
    }
    // the declared entry count must match what sits between Map and MapEnd
    for(std::size_t declared: {std::size_t{1}, std::size_t{5}}) {
        std::vector<Token> in{Token::Map(declared), Token::Str("a"), Token::I32(1), Token::Str("b"), Token::I32(2), Token::MapEnd()};
        std::map<std::string, int> out;
        auto r = Tokens::Deserialize(out, std::span<const Token>(in));
        assert(!r && r.error() == DeserializeError::LENGTH_MISMATCH);
        assert(r.errorClass() == ErrorClass::syntax);
    }
    // a struct is not a map
    {
        std::vector<Token> in{Token::Struct("Point", 1), Token::Str("x"), Token::I32(1), Token::StructEnd()};
        std::map<std::string, int> out;
        auto r = Tokens::Deserialize(out, std::span<const Token>(in));
        assert(!r && r.error() == DeserializeError::INVALID_TYPE);
        assert(r.got() == std::optional<Shape>(Shape::Struct));
    }
    {
        auto d = describe(m);
        assert(d && d->shape == Shape::Map && d->length == std::optional<std::size_t>(2));
    }
    // sets collapse duplicates
    {
        const std::vector<std::uint8_t> in{0x83, 0x03, 0x01, 0x03};
        std::set<int> out;
        assert(Cbor::Deserialize(out, in) && out == (std::set<int>{1, 3}));
    }
}

void owning_pointer_tests() {
    Reading r{"t1", {{"min", -1.5}, {"max", 2.25}}, std::make_unique<int>(42)};
    for(bool packed: {false, true}) {
        std::vector<std::uint8_t> bytes;
        assert(Cbor::Serialize(r, bytes, CborConfig{.packed = packed}));
        Reading back;
        auto res = Cbor::Deserialize(back, bytes);
        report(res);
        assert(res);
        assert(back.sensor == "t1" && back.values == r.values);
        assert(back.calibration && *back.calibration == 42);
    }
    {
        Reading empty{"t2", {}, nullptr};
        std::vector<std::uint8_t> bytes;
        assert(Compact::Serialize(empty, bytes));
        Reading back{"", {}, std::make_unique<int>(1)};
        assert(Compact::Deserialize(back, bytes));
        assert(back.sensor == "t2" && !back.calibration);
    }
    {
        auto d = describe(std::unique_ptr<int>{});
        assert(d && d->shape == Shape::Option);
    }
}

void path_tests() {
    const std::filesystem::path p = "dir/file.txt";
    std::vector<std::uint8_t> bytes;
    assert(Cbor::Serialize(p, bytes));
    std::string asText;
    assert(Cbor::Deserialize(asText, bytes) && asText == "dir/file.txt");
    std::filesystem::path back;
    assert(Cbor::Deserialize(back, bytes) && back == p);
}

// Inputs that are not one contiguous, caller-owned buffer never lend data.
void borrow_safety_tests() {
    std::vector<std::uint8_t> bytes;
    assert(Compact::Serialize(std::string("kept"), bytes));

    {
        const std::list<std::uint8_t> scattered(bytes.begin(), bytes.end());
        CompactDeserializer de(scattered.begin(), scattered.end());
        assert(de.string_flavor() == Flavor::transient);

        std::string_view view;
        auto r = Compact::Deserialize(view, scattered);
        assert(!r && r.error() == DeserializeError::BORROW_UNAVAILABLE);
        assert(r.expecting() == "a borrowed string");

        std::string owned;
        assert(Compact::Deserialize(owned, scattered) && owned == "kept");
    }
    {
        std::istringstream stream(std::string(bytes.begin(), bytes.end()));
        std::istreambuf_iterator<char> first(stream), last;
        std::string owned;
        assert(Compact::Deserialize(owned, first, last) && owned == "kept");
    }
    {
        std::vector<std::uint8_t> cbor;
        assert(Cbor::Serialize(Tagged{"label", 9}, cbor));
        std::istringstream stream(std::string(cbor.begin(), cbor.end()));
        std::istreambuf_iterator<char> first(stream), last;
        Tagged out{};
        auto r = Cbor::Deserialize(out, first, last);
        assert(!r && r.error() == DeserializeError::BORROW_UNAVAILABLE);
    }
    // the runtime path borrows from byte buffers too
    {
        std::vector<std::uint8_t> cbor;
        assert(Cbor::Serialize(Tagged{"label", 9}, cbor));
        Tagged out{};
        assert(Cbor::Deserialize(out, cbor));
        assert(out.label == "label" && out.code == 9);
        const auto * base = reinterpret_cast<const char *>(cbor.data());
        assert(out.label.data() >= base && out.label.data() + out.label.size() <= base + cbor.size());
    }
}

void limits_tests() {
    // deeper than the default limit
    std::vector<std::uint8_t> deep(default_max_nesting_depth() + 10, 0x81);
    deep.push_back(0x01);
    IgnoredAny sink;
    auto r = Cbor::Deserialize(sink, deep);
    assert(!r && r.error() == DeserializeError::NESTING_TOO_DEEP);
    assert(r.errorClass() == ErrorClass::syntax);

    std::vector<std::uint8_t> shallow(10, 0x81);
    shallow.push_back(0x01);
    assert(Cbor::Deserialize(sink, shallow));

    // a caller-chosen limit
    CborDeserializer de(shallow.cbegin(), shallow.cend(), 4);
    auto r2 = DeserializeWith(sink, de);
    assert(!r2 && r2.error() == DeserializeError::NESTING_TOO_DEEP);

    // a long run of semantic tags does not nest
    std::vector<std::uint8_t> tagged(100000, 0xC6);
    tagged.push_back(0x01);
    int value = 0;
    assert(Cbor::Deserialize(value, tagged) && value == 1);
    assert(Cbor::Deserialize(sink, tagged));

    std::vector<std::uint8_t> unfinished(100000, 0xC6);
    auto r3 = Cbor::Deserialize(value, unfinished);
    assert(!r3 && r3.error() == DeserializeError::UNEXPECTED_END_OF_DATA);
}

void bounded_output_tests() {
    char buf[16] = {};
    auto r = Compact::Serialize(std::string("0123456789"), buf, buf + sizeof(buf));
    assert(!r && r.error() == SerializeError::WRITER_ERROR);
    assert(r.pos() == sizeof(buf));

    auto r2 = Compact::Serialize(std::string("01234567"), buf, buf + sizeof(buf));
    assert(r2 && r2.pos() == 16);
    assert(std::string_view(buf + 8, 8) == "01234567");
}

void error_text_tests() {
    assert(error_to_string(DeserializeError::BORROW_UNAVAILABLE) == "BORROW_UNAVAILABLE");
    assert(error_to_string(SerializeError::LENGTH_REQUIRED) == "LENGTH_REQUIRED");
    assert(shape_to_string(Shape::StructVariant) == "struct_variant");

    std::vector<std::uint8_t> in{0x61, 'x'};
    bool out = false;
    auto r = Cbor::Deserialize(out, in);
    report(r);
    assert(!r && r.error() == DeserializeError::INVALID_TYPE);
    assert(r.got() == std::optional<Shape>(Shape::String));
    assert(r.expected() == ShapeSet{Shape::Bool});
    assert(r.expecting() == "a boolean");
}

} // namespace

int main() {
    map_tests();
    owning_pointer_tests();
    path_tests();
    borrow_safety_tests();
    limits_tests();
    bounded_output_tests();
    error_text_tests();
    std::cout << "runtime tests: PASSED\n";
    return 0;
}
