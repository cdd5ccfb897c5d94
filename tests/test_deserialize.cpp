/// @file test_deserialize.cpp
/// @brief Unit tests for the JSON text deserializer: scalars, containers,
/// out-of-order objects, the lookback arena and error reporting.

#include <serdex/serdex.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory_resource>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

using namespace serdex;

namespace {

/// Deserializes @p text as T and returns the error it fails with.
template <typename T>
DeserializeError error_of(std::string_view text, const json::TextDeserializerConfig& config = {}) {
    try {
        (void)json::from_str<T>(text, config);
    } catch (const DeserializeError& e) {
        return e;
    }
    ADD_FAILURE() << "no error for: " << text;
    return DeserializeError(errc::ok, {});
}

template <typename T>
errc code_of(std::string_view text, const json::TextDeserializerConfig& config = {}) {
    return static_cast<errc>(error_of<T>(text, config).code().value());
}

// ─── Mapped types ────────────────────────────────────────────────────

enum class Greek { alpha, beta, gamma };
SERDEX_DEFINE_ENUM(Greek, alpha, beta, gamma)

struct Person {
    std::string name;
    uint32_t age;
    bool data;
    std::optional<std::vector<std::string>> other_info;
};
SERDEX_DEFINE_STRUCT(Person, name, age, data, other_info)

struct Point {
    int32_t x;
    int32_t y;
};
SERDEX_DEFINE_STRUCT(Point, x, y)

struct Flags {
    bool on;
};
SERDEX_DEFINE_STRUCT(Flags, on)

struct Leaf {
    int32_t a;
    std::string b;
    std::vector<uint32_t> c;
};
SERDEX_DEFINE_STRUCT(Leaf, a, b, c)

struct Branch {
    Leaf left;
    Leaf right;
    std::optional<bool> flag;
};
SERDEX_DEFINE_STRUCT(Branch, left, right, flag)

struct Tree {
    std::string name;
    std::vector<Branch> branches;
    Branch root;
};
SERDEX_DEFINE_STRUCT(Tree, name, branches, root)

struct Numbers {
    int32_t z;
    uint64_t u;
    int64_t i;
    double f;
    double e;
};
SERDEX_DEFINE_STRUCT(Numbers, z, u, i, f, e)

struct Tagged {
    Greek kind;
    Point at;
};
SERDEX_DEFINE_STRUCT(Tagged, kind, at)

struct Layered {
    int32_t id;
    std::optional<std::optional<bool>> maybe;
};
SERDEX_DEFINE_STRUCT(Layered, id, maybe)

struct Extended {
    std::string label;
    Point base;
};

template <typename D>
void deserialize(Value<D> v, Extended& out) {
    auto s = std::move(v).into_struct("Extended");
    out.label = s.field("label").get_str();
    out.base = s.template inline_get<Point>();
    std::move(s).close();
}

struct Percent {
    uint32_t value;
};

template <typename D>
void deserialize(Value<D> v, Percent& out) {
    out.value = std::move(v).validate_with([](Value<D> inner) {
        uint32_t x = std::move(inner).get_u32();
        if (x > 100) throw ValidationError("percentage out of range");
        return x;
    });
}

using Deser = json::TextDeserializer<StringReader>;

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Scalars
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Deserialize, Bool) {
    EXPECT_TRUE(json::from_str<bool>("true"));
    EXPECT_FALSE(json::from_str<bool>(" false "));
    EXPECT_EQ(code_of<bool>("null"), errc::expected_bool);
    EXPECT_EQ(code_of<bool>("tru"), errc::invalid_literal);
}

TEST(Deserialize, String) {
    EXPECT_EQ(json::from_str<std::string>("\"Hello world!\""), "Hello world!");
    EXPECT_EQ(json::from_str<std::string>("\"\\t\\n\""), "\t\n");
    EXPECT_EQ(json::from_str<std::string>("\"\""), "");
    EXPECT_EQ(code_of<std::string>("12"), errc::expected_string);
}

TEST(Deserialize, Char) {
    EXPECT_EQ(json::from_str<char32_t>("\"x\""), U'x');
    EXPECT_EQ(code_of<char32_t>("\"xy\""), errc::expected_char);
    EXPECT_EQ(code_of<char32_t>("\"\""), errc::expected_char);
}

TEST(Deserialize, Integers) {
    EXPECT_EQ(json::from_str<uint32_t>("1234"), 1234u);
    EXPECT_EQ(json::from_str<uint32_t>("-0"), 0u);
    EXPECT_EQ(code_of<uint32_t>("-20"), errc::number_overflow);
    EXPECT_EQ(json::from_str<uint8_t>("255"), 255);
    EXPECT_EQ(code_of<uint8_t>("256"), errc::number_overflow);
    EXPECT_EQ(json::from_str<int8_t>("127"), 127);
    EXPECT_EQ(json::from_str<int8_t>("-128"), -128);
    EXPECT_EQ(code_of<int8_t>("128"), errc::number_overflow);
    EXPECT_EQ(code_of<int8_t>("-129"), errc::number_overflow);
    EXPECT_EQ(json::from_str<int32_t>("1400"), 1400);
    EXPECT_EQ(json::from_str<uint64_t>("18446744073709551615"),
              std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(json::from_str<int64_t>("-9223372036854775808"),
              std::numeric_limits<int64_t>::min());
}

TEST(Deserialize, IntegerExponents) {
    EXPECT_EQ(json::from_str<uint32_t>("12E3"), 12000u);
    EXPECT_EQ(json::from_str<uint32_t>("1000E-3"), 1u);
    EXPECT_EQ(json::from_str<int32_t>("2.50e1"), 25);
    EXPECT_EQ(json::from_str<uint32_t>("0e999"), 0u);
    EXPECT_EQ(code_of<int32_t>("15.7"), errc::number_overflow);
    EXPECT_EQ(json::from_str<uint32_t>("0.5e1"), 5u);
    EXPECT_EQ(json::from_str<int32_t>("-0.25E+2"), -25);
    EXPECT_EQ(code_of<double>("1e99999999999"), errc::number_overflow);
    EXPECT_EQ(code_of<uint32_t>("1e10"), errc::number_overflow);
}

TEST(Deserialize, LeadingZerosRejected) {
    EXPECT_EQ(code_of<uint32_t>("01234"), errc::unexpected_character);
    EXPECT_EQ(code_of<uint32_t>("-01234"), errc::unexpected_character);
    EXPECT_EQ(json::from_str<uint32_t>("0"), 0u);
}

TEST(Deserialize, MalformedNumbers) {
    EXPECT_EQ(code_of<int32_t>("-"), errc::unexpected_end_of_input);
    EXPECT_EQ(code_of<double>("1."), errc::unexpected_end_of_input);
    EXPECT_EQ(code_of<double>("1.e5"), errc::expected_number);
    EXPECT_EQ(code_of<double>("1e+"), errc::unexpected_end_of_input);
    EXPECT_EQ(code_of<int32_t>("+1"), errc::expected_number);
}

TEST(Deserialize, Floats) {
    EXPECT_EQ(json::from_str<float>("3.125"), 3.125f);
    EXPECT_EQ(json::from_str<float>("1.0e7"), 1.0e7f);
    EXPECT_EQ(json::from_str<float>("1.625e+3"), 1.625e3f);
    EXPECT_EQ(json::from_str<float>("-1.0e-4"), -1.0e-4f);
    EXPECT_EQ(json::from_str<float>("-0.125"), -0.125f);
    EXPECT_TRUE(std::signbit(json::from_str<float>("-0e5")));
    EXPECT_EQ(json::from_str<double>("0.1"), 0.1);
    EXPECT_EQ(json::from_str<double>("12"), 12.0);
}

TEST(Deserialize, FloatsOutOfRange) {
    EXPECT_TRUE(std::isinf(json::from_str<float>("1e40")));
    EXPECT_EQ(json::from_str<double>("1e-400"), 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Options, enums, lists, tuples
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Deserialize, OptionNiche) {
    EXPECT_EQ(json::from_str<std::optional<uint32_t>>("null"), std::nullopt);
    EXPECT_EQ(json::from_str<std::optional<uint32_t>>("5"), std::optional<uint32_t>(5));
}

TEST(Deserialize, OptionFallbackStruct) {
    using Nested = std::optional<std::optional<bool>>;
    EXPECT_EQ(json::from_str<Nested>(R"({ "has_value": true, "value": true })"),
              Nested(std::optional<bool>(true)));
    EXPECT_EQ(json::from_str<Nested>(R"({ "has_value": true, "value": null })"),
              Nested(std::optional<bool>()));
    EXPECT_EQ(json::from_str<Nested>(R"({ "has_value": false })"), Nested());
}

TEST(Deserialize, EnumByNameOrIndex) {
    EXPECT_EQ(json::from_str<Greek>("\"alpha\""), Greek::alpha);
    EXPECT_EQ(json::from_str<Greek>("\"gamma\""), Greek::gamma);
    EXPECT_EQ(json::from_str<Greek>("1"), Greek::beta);
    EXPECT_EQ(code_of<Greek>("\"delta\""), errc::invalid_name);
    EXPECT_EQ(code_of<Greek>("3"), errc::invalid_index);
    EXPECT_EQ(code_of<Greek>("\"alph\""), errc::invalid_name);
}

TEST(Deserialize, InvalidNameListsOptions) {
    auto e = error_of<Greek>("\"delta\"");
    EXPECT_EQ(e.detail(), R"(name is not one of the allowed options ("alpha", "beta", "gamma"))");
}

TEST(Deserialize, List) {
    EXPECT_EQ(json::from_str<std::vector<uint32_t>>("[1, 1, 2, 3, 5, 7]"),
              (std::vector<uint32_t>{1, 1, 2, 3, 5, 7}));
    EXPECT_TRUE(json::from_str<std::vector<uint32_t>>("[ ]").empty());
    EXPECT_EQ(code_of<std::vector<uint32_t>>("[1, 2,]"), errc::expected_number);
    EXPECT_EQ(code_of<std::vector<uint32_t>>("{}"), errc::expected_array);
}

TEST(Deserialize, Tuple) {
    EXPECT_EQ((json::from_str<std::array<uint32_t, 3>>("[3, 6, 9]")),
              (std::array<uint32_t, 3>{3, 6, 9}));
    EXPECT_EQ((json::from_str<std::pair<uint32_t, bool>>("[3, false]")),
              (std::pair<uint32_t, bool>(3, false)));
    EXPECT_EQ((json::from_str<std::tuple<std::string, int32_t, bool>>(R"(["a", -1, true])")),
              (std::tuple<std::string, int32_t, bool>("a", -1, true)));
    EXPECT_EQ((code_of<std::array<uint32_t, 4>>("[3, 6, 9]")), errc::missing_items);
    EXPECT_EQ((code_of<std::array<uint32_t, 2>>("[3, 6, 9]")), errc::excess_items);
}

TEST(Deserialize, ExcessItemsReportedAtArray) {
    auto e = error_of<std::array<uint32_t, 2>>("  [3, 6, 9]");
    EXPECT_EQ(e.location().column, 3u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Objects through the raw protocol
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Deserialize, ObjectWithComments) {
    const char* source = R"({
        "name": "Finland",
        /* The population of the country */
        "pop": 5.5e6,
        // The official languages of the country
        "langs": ["fi", "sv"]
    })";
    Deser d{StringReader(source), json::TextDeserializerConfig::permissive()};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        auto root = json::into_object(std::move(value));
        EXPECT_EQ(root.entry("name").get_str(), "Finland");
        EXPECT_EQ(root.entry("pop").get_u32(), 5500000u);
        auto langs = root.entry("langs").into_list();
        auto fi = langs.next();
        EXPECT_EQ(std::move(*fi).get_str(), "fi");
        auto sv = langs.next();
        EXPECT_EQ(std::move(*sv).get_str(), "sv");
        EXPECT_FALSE(langs.next().has_value());
        std::move(root).close();
    });
    d.close();
    EXPECT_EQ(d.buffered_items(), 0u);
}

TEST(Deserialize, CommentsRejectedByDefault) {
    EXPECT_EQ(code_of<std::vector<uint32_t>>("[1, /* two */ 2]"), errc::expected_number);
    EXPECT_EQ(json::from_str<std::vector<uint32_t>>("[1, /* two */ 2] // end\n",
                                                    json::TextDeserializerConfig::permissive()),
              (std::vector<uint32_t>{1, 2}));
}

TEST(Deserialize, Lookback) {
    const char* source = R"({
        "bool_true": true,
        "bool_false": false,
        "list": [1, 2, 3],
        "empty_list": [],
        "string": "test",
        "empty_object": {},
        "null": null,
        "last": "entry"
    })";
    Deser d{StringReader(source)};
    d.open_object();
    ASSERT_TRUE(d.try_push_entry("last"));
    EXPECT_EQ(d.read_str(), "entry");
    EXPECT_EQ(d.buffered_items(), 10u);
    ASSERT_TRUE(d.try_push_entry("bool_false"));
    EXPECT_FALSE(d.get_bool());
    ASSERT_TRUE(d.try_push_entry("bool_true"));
    EXPECT_TRUE(d.get_bool());
    ASSERT_TRUE(d.try_push_entry("list"));
    EXPECT_EQ(d.peek_value_type(), json::ValueType::Array);
    EXPECT_EQ(d.open_list(), std::nullopt);
    ASSERT_TRUE(d.next_item());
    EXPECT_EQ(d.get_u32(), 1u);
    ASSERT_TRUE(d.next_item());
    EXPECT_EQ(d.get_u32(), 2u);
    ASSERT_TRUE(d.next_item());
    EXPECT_EQ(d.get_u32(), 3u);
    EXPECT_FALSE(d.next_item());
    ASSERT_TRUE(d.try_push_entry("empty_list"));
    d.open_list();
    EXPECT_FALSE(d.next_item());
    ASSERT_TRUE(d.try_push_entry("empty_object"));
    d.open_object();
    EXPECT_FALSE(d.next_entry());
    ASSERT_TRUE(d.try_push_entry("null"));
    d.pop_null();
    ASSERT_TRUE(d.try_push_entry("string"));
    EXPECT_EQ(d.read_str(), "test");
    EXPECT_FALSE(d.try_push_entry("missing"));
    d.close_object();
    d.close();
    EXPECT_EQ(d.buffered_items(), 0u);
}

TEST(Deserialize, ObjectOutOfOrder) {
    const char* source = R"({
        "del\ta": 4,
        "beta": 2,
        "alphaplus": 10,
        "alp": 20,
        "alpha": 1,
        "gamma": 3
    })";
    Deser d{StringReader(source)};
    d.open_object();
    ASSERT_TRUE(d.try_push_entry("alpha"));
    EXPECT_EQ(d.get_u32(), 1u);
    ASSERT_TRUE(d.try_push_entry("beta"));
    EXPECT_EQ(d.get_u32(), 2u);
    ASSERT_TRUE(d.try_push_entry("gamma"));
    EXPECT_EQ(d.get_u32(), 3u);
    ASSERT_TRUE(d.try_push_entry("del\ta"));
    EXPECT_EQ(d.get_u32(), 4u);
    ASSERT_TRUE(d.try_push_entry("alphaplus"));
    EXPECT_EQ(d.get_u32(), 10u);
    ASSERT_TRUE(d.try_push_entry("alp"));
    EXPECT_EQ(d.get_u32(), 20u);
    d.close_object();
    d.close();
}

TEST(Deserialize, ObjectComplex) {
    const char* source = R"({
        "animal": {
            "tetrapod": {
                "mammal": "goat",
                "reptile": "lizard",
                "bird": "sparrow"
            },
            "crustacean": {
                "crab": {}
            }
        },
        "plant": {
            "bryophyte": "moss",
            "spermatophyte": {
                "conifer": {
                    "pinus": "pine"
                }
            }
        },
        "fungus": {}
    })";
    Deser d{StringReader(source)};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        auto root = json::into_object(std::move(value));
        auto plant = json::into_object(root.entry("plant"));
        auto spermatophyte = json::into_object(plant.entry("spermatophyte"));
        auto conifer = json::into_object(spermatophyte.entry("conifer"));
        EXPECT_EQ(conifer.entry("pinus").get_str(), "pine");
        std::move(conifer).close();
        std::move(spermatophyte).close();
        EXPECT_EQ(plant.entry("bryophyte").get_str(), "moss");
        std::move(plant).close();
        auto animal = json::into_object(root.entry("animal"));
        auto crustacean = json::into_object(animal.entry("crustacean"));
        auto crab = json::into_object(crustacean.entry("crab"));
        std::move(crab).close();
        std::move(crustacean).close();
        auto tetrapod = json::into_object(animal.entry("tetrapod"));
        EXPECT_EQ(tetrapod.entry("mammal").get_str(), "goat");
        EXPECT_EQ(tetrapod.entry("reptile").get_str(), "lizard");
        EXPECT_EQ(tetrapod.entry("bird").get_str(), "sparrow");
        std::move(tetrapod).close();
        std::move(animal).close();
        auto fungus = json::into_object(root.entry("fungus"));
        std::move(fungus).close();
        std::move(root).close();
    });
    d.close();
    EXPECT_EQ(d.buffered_items(), 0u);
}

TEST(Deserialize, NextEntryServesLookbackFirst) {
    const char* source = R"({
        "asdf": "fdsa",
        "hello": "olleh",
        "world": "dlrow",
        "hjkl": "lkjh"
    })";
    Deser d{StringReader(source)};
    d.open_object();
    ASSERT_TRUE(d.try_push_entry("world"));
    EXPECT_EQ(d.read_str(), "dlrow");
    std::vector<std::string> keys;
    while (d.next_entry()) {
        std::string key = d.flush_str();
        std::string value = d.read_str();
        EXPECT_EQ(std::string(key.rbegin(), key.rend()), value);
        keys.push_back(key);
    }
    d.close();
    EXPECT_EQ(keys, (std::vector<std::string>{"asdf", "hello", "hjkl"}));
}

TEST(Deserialize, PeekValueTypes) {
    Deser d{StringReader(R"({"s": "x", "n": -1, "o": {}, "a": [], "b": true, "z": null})")};
    d.open_object();
    ASSERT_TRUE(d.try_push_entry("z"));
    EXPECT_EQ(d.peek_value_type(), json::ValueType::Null);
    d.pop_null();
    const std::pair<const char*, json::ValueType> expected[] = {
        {"s", json::ValueType::String}, {"n", json::ValueType::Number},
        {"o", json::ValueType::Object}, {"a", json::ValueType::Array},
        {"b", json::ValueType::Bool},
    };
    for (const auto& [key, type] : expected) {
        ASSERT_TRUE(d.try_push_entry(key));
        EXPECT_EQ(d.peek_value_type(), type) << key;
        d.skip_value();
    }
    d.close_object();
    d.close();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Mapped structs
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Deserialize, DefinedStruct) {
    auto p = json::from_str<Person>(R"({
        "name": "Mike",
        "age": 28,
        "data": false
    })");
    EXPECT_EQ(p.name, "Mike");
    EXPECT_EQ(p.age, 28u);
    EXPECT_FALSE(p.data);
    EXPECT_FALSE(p.other_info.has_value());
}

TEST(Deserialize, DefinedStructOutOfOrder) {
    auto p = json::from_str<Person>(
        R"({"other_info": ["a", "b"], "data": true, "age": 3, "name": "Ann"})");
    EXPECT_EQ(p.name, "Ann");
    EXPECT_EQ(p.age, 3u);
    EXPECT_TRUE(p.data);
    ASSERT_TRUE(p.other_info.has_value());
    EXPECT_EQ(*p.other_info, (std::vector<std::string>{"a", "b"}));
}

TEST(Deserialize, StructFromPositionalArray) {
    auto pt = json::from_str<Point>("[4, -7]");
    EXPECT_EQ(pt.x, 4);
    EXPECT_EQ(pt.y, -7);
    EXPECT_EQ(code_of<Point>("[4]"), errc::missing_items);
    EXPECT_EQ(code_of<Point>("[4, 5, 6]"), errc::excess_items);
    EXPECT_EQ(code_of<Point>("4"), errc::expected_object);
}

TEST(Deserialize, MissingFieldIsError) {
    auto e = error_of<Person>(R"(  {"name": "Mike", "data": true})");
    EXPECT_TRUE(e.is(errc::missing_key));
    EXPECT_EQ(e.detail(), "age");
    EXPECT_EQ(e.location().column, 3u);
    EXPECT_EQ(std::string(e.what()),
              R"(deserialize error at line 1, column 3: missing object key "age")");
}

TEST(Deserialize, MissingStructFieldIsError) {
    auto e = error_of<Tagged>(R"({"kind": "beta"})");
    EXPECT_TRUE(e.is(errc::missing_key));
    EXPECT_EQ(e.detail(), "at");
    EXPECT_EQ(e.location().column, 1u);
    EXPECT_EQ(std::string(e.what()),
              R"(deserialize error at line 1, column 1: missing object key "at")");
}

TEST(Deserialize, NonObjectStructFieldIsError) {
    auto e = error_of<Tagged>(R"({"kind": "beta", "at": 4})");
    EXPECT_TRUE(e.is(errc::expected_object));
    EXPECT_EQ(e.location().column, 24u);
}

TEST(Deserialize, MissingNestedOptionIsError) {
    auto e = error_of<Layered>(R"({"id": 3})");
    EXPECT_TRUE(e.is(errc::missing_key));
    EXPECT_EQ(e.detail(), "maybe");

    auto l = json::from_str<Layered>(R"({"maybe": {"has_value": true, "value": null}, "id": 3})");
    EXPECT_EQ(l.id, 3);
    ASSERT_TRUE(l.maybe.has_value());
    EXPECT_FALSE(l.maybe->has_value());
}

TEST(Deserialize, ExtraFieldsIgnored) {
    auto pt = json::from_str<Point>(
        R"({"label": {"deep": [1, {"x": 99}]}, "y": 2, "extra": null, "x": 1, "tail": "t"})");
    EXPECT_EQ(pt.x, 1);
    EXPECT_EQ(pt.y, 2);
}

TEST(Deserialize, VirtualNullForMissingOptional) {
    Deser d{StringReader(R"({"x": 1})")};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        auto s = std::move(value).into_struct("Sample");
        EXPECT_EQ(s.field("x").get_i32(), 1);
        auto missing = s.field("label");
        EXPECT_EQ(json::value_type(missing), json::ValueType::Null);
        EXPECT_TRUE(missing.check_null());
        std::move(s).close();
    });
    d.close();
}

TEST(Deserialize, VirtualNullReadAsValue) {
    Deser d{StringReader(R"({"x": 1})")};
    d.open_object();
    EXPECT_FALSE(d.try_push_entry("y"));
    d.push_null(std::string_view("y"));
    try {
        (void)d.get_i32();
        ADD_FAILURE() << "virtual null read as a number";
    } catch (const DeserializeError& e) {
        EXPECT_TRUE(e.is(errc::missing_key));
        EXPECT_EQ(e.detail(), "y");
        EXPECT_EQ(e.location().offset, 0u);
    }
}

TEST(Deserialize, EnumField) {
    auto t = json::from_str<Tagged>(R"({"at": {"y": 2, "x": 1}, "kind": "beta"})");
    EXPECT_EQ(t.kind, Greek::beta);
    EXPECT_EQ(t.at.x, 1);
    EXPECT_EQ(t.at.y, 2);
}

TEST(Deserialize, FlattenedStruct) {
    auto e = json::from_str<Extended>(R"({"y": 5, "label": "p", "x": 4})");
    EXPECT_EQ(e.label, "p");
    EXPECT_EQ(e.base.x, 4);
    EXPECT_EQ(e.base.y, 5);
}

TEST(Deserialize, LookbackNumbers) {
    auto n = json::from_str<Numbers>(R"({
        "e": 1.5e-3,
        "f": -0.0,
        "i": -9223372036854775808,
        "u": 18446744073709551615,
        "z": 0
    })");
    EXPECT_EQ(n.z, 0);
    EXPECT_EQ(n.u, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(n.i, std::numeric_limits<int64_t>::min());
    EXPECT_EQ(n.f, 0.0);
    EXPECT_TRUE(std::signbit(n.f));
    EXPECT_DOUBLE_EQ(n.e, 1.5e-3);
}

TEST(Deserialize, LookbackTypeMismatch) {
    auto e = error_of<Point>("{\"y\": \"two\",\n \"x\": 1}");
    EXPECT_TRUE(e.is(errc::expected_number));
    EXPECT_EQ(e.location().line, 1u);
    EXPECT_EQ(e.location().column, 7u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// JSON handles
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Deserialize, ObjectCloseRejectsExtraKey) {
    Deser d{StringReader(R"({"a": 1, "b": [2]})")};
    try {
        Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
            auto obj = json::into_object(std::move(value));
            EXPECT_EQ(obj.entry("a").get_i32(), 1);
            std::move(obj).close();
        });
        ADD_FAILURE() << "extra key accepted";
    } catch (const DeserializeError& e) {
        EXPECT_TRUE(e.is(errc::extra_key));
        EXPECT_EQ(e.detail(), "b");
        EXPECT_EQ(e.location().offset, 0u);
    }
}

TEST(Deserialize, ObjectEntryRequired) {
    Deser d{StringReader(R"({"a": 1})")};
    try {
        Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
            auto obj = json::into_object(std::move(value));
            (void)obj.entry("b").get_i32();
            ADD_FAILURE() << "missing entry accepted";
        });
    } catch (const DeserializeError& e) {
        EXPECT_TRUE(e.is(errc::missing_key));
        EXPECT_EQ(e.detail(), "b");
    }
}

TEST(Deserialize, TryEntry) {
    Deser d{StringReader(R"({"b": 2, "a": 1})")};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        auto obj = json::into_object(std::move(value));
        auto a = obj.try_entry("a");
        EXPECT_TRUE(a.has_value());
        EXPECT_EQ(std::move(*a).get_i32(), 1);
        EXPECT_FALSE(obj.try_entry("c").has_value());
        auto b = obj.try_entry("b");
        EXPECT_TRUE(b.has_value());
        EXPECT_EQ(std::move(*b).get_i32(), 2);
        std::move(obj).close();
    });
    d.close();
}

TEST(Deserialize, EntryIteration) {
    Deser d{StringReader(R"({"one": 1, "two": 2, "three": 3})")};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        auto obj = json::into_object(std::move(value));
        EXPECT_EQ(obj.entry("two").get_i32(), 2);
        std::vector<std::string> keys;
        int32_t sum = 0;
        while (auto entry = obj.next_entry()) {
            if (keys.empty()) {
                keys.push_back(entry->key());
            } else {
                keys.push_back("?");
            }
            sum += std::move(*entry).value().get_i32();
        }
        EXPECT_EQ(keys, (std::vector<std::string>{"one", "?"}));
        EXPECT_EQ(sum, 4);
    });
    d.close();
}

TEST(Deserialize, CollectionOverObjectAndArray) {
    auto sum = [](std::string_view text) {
        Deser d{StringReader(text)};
        int64_t total = Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
            auto coll = json::into_collection(std::move(value));
            int64_t t = 0;
            while (auto item = coll.next()) {
                t += std::move(*item).get_i64();
            }
            return t;
        });
        d.close();
        return total;
    };
    EXPECT_EQ(sum(R"({"a": 1, "b": 2, "c": 3})"), 6);
    EXPECT_EQ(sum("[10, 20, 30]"), 60);
    EXPECT_EQ(sum("[]"), 0);
}

TEST(Deserialize, SkipValue) {
    Deser d{StringReader(R"([{"a": [1, {"b": null}], "c": "d"}, 7])")};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        auto list = std::move(value).into_list();
        auto first = list.next();
        EXPECT_EQ(json::value_type(*first), json::ValueType::Object);
        json::skip(std::move(*first));
        auto second = list.next();
        EXPECT_EQ(std::move(*second).get_u8(), 7);
        EXPECT_FALSE(list.next().has_value());
    });
    d.close();
}

TEST(Deserialize, IntoNull) {
    Deser d{StringReader("null")};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        json::into_null(std::move(value));
    });
    d.close();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Nesting stress
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

std::string leaf_json(int i) {
    std::string s = R"({"zzz": {"skip": [)" + std::to_string(i) + R"(, {"q": "r"}]}, "c": [)";
    for (int k = 0; k <= i % 4; ++k) {
        if (k) s += ", ";
        s += std::to_string(i * 10 + k);
    }
    s += R"(], "b": "leaf)" + std::to_string(i) + R"(", "a": )" + std::to_string(-i) + "}";
    return s;
}

std::string branch_json(int i) {
    std::string s = "{";
    if (i % 2 == 0) s += R"("flag": )" + std::string(i % 4 == 0 ? "true" : "null") + ", ";
    s += R"("right": )" + leaf_json(2 * i + 1) + R"(, "left": )" + leaf_json(2 * i) + "}";
    return s;
}

void expect_leaf(const Leaf& leaf, int i) {
    EXPECT_EQ(leaf.a, -i);
    EXPECT_EQ(leaf.b, "leaf" + std::to_string(i));
    ASSERT_EQ(leaf.c.size(), static_cast<size_t>(i % 4 + 1));
    for (size_t k = 0; k < leaf.c.size(); ++k) {
        EXPECT_EQ(leaf.c[k], static_cast<uint32_t>(i * 10) + k);
    }
}

void expect_branch(const Branch& b, int i) {
    expect_leaf(b.left, 2 * i);
    expect_leaf(b.right, 2 * i + 1);
    if (i % 4 == 0) {
        EXPECT_EQ(b.flag, std::optional<bool>(true));
    } else {
        EXPECT_EQ(b.flag, std::nullopt);
    }
}

} // namespace

TEST(Deserialize, NestingStressLeavesArenaEmpty) {
    constexpr int kBranches = 12;
    std::string text = R"({"root": )" + branch_json(100) + R"(, "branches": [)";
    for (int i = 0; i < kBranches; ++i) {
        if (i) text += ", ";
        text += branch_json(i);
    }
    text += R"(], "name": "stress"})";

    Deser d{StringReader(text)};
    Tree tree = Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        return std::move(value).get<Tree>();
    });
    d.close();
    EXPECT_EQ(d.buffered_items(), 0u);

    EXPECT_EQ(tree.name, "stress");
    expect_branch(tree.root, 100);
    ASSERT_EQ(tree.branches.size(), static_cast<size_t>(kBranches));
    for (int i = 0; i < kBranches; ++i) {
        expect_branch(tree.branches[i], i);
    }
}

TEST(Deserialize, SiblingContainersReuseKeys) {
    const char* source = R"({
        "first": {"k": 1, "j": 2},
        "second": {"k": 3, "j": 4},
        "third": 0
    })";
    Deser d{StringReader(source)};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        auto root = json::into_object(std::move(value));
        EXPECT_EQ(root.entry("third").get_i32(), 0);
        auto second = json::into_object(root.entry("second"));
        EXPECT_EQ(second.entry("j").get_i32(), 4);
        EXPECT_EQ(second.entry("k").get_i32(), 3);
        std::move(second).close();
        auto first = json::into_object(root.entry("first"));
        EXPECT_EQ(first.entry("j").get_i32(), 2);
        EXPECT_EQ(first.entry("k").get_i32(), 1);
        std::move(first).close();
        std::move(root).close();
    });
    d.close();
    EXPECT_EQ(d.buffered_items(), 0u);
}

TEST(Deserialize, SiblingStructsInArray) {
    auto points = json::from_str<std::vector<Point>>(
        R"([{"y": 1, "x": 2}, {"y": 3, "x": 4}, {"x": 5, "y": 6}])");
    ASSERT_EQ(points.size(), 3u);
    EXPECT_EQ(points[0].x, 2);
    EXPECT_EQ(points[0].y, 1);
    EXPECT_EQ(points[1].x, 4);
    EXPECT_EQ(points[1].y, 3);
    EXPECT_EQ(points[2].x, 5);
    EXPECT_EQ(points[2].y, 6);
}

TEST(Deserialize, NestedSameKeysAtDifferentDepths) {
    auto t = json::from_str<Branch>(R"({
        "right": {"c": [], "b": "r", "a": 2},
        "left": {"c": [7], "b": "l", "a": 1}
    })");
    EXPECT_EQ(t.left.a, 1);
    EXPECT_EQ(t.left.b, "l");
    EXPECT_EQ(t.left.c, (std::vector<uint32_t>{7}));
    EXPECT_EQ(t.right.a, 2);
    EXPECT_EQ(t.right.b, "r");
    EXPECT_TRUE(t.right.c.empty());
    EXPECT_EQ(t.flag, std::nullopt);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Entry points and errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Deserialize, FromStream) {
    std::istringstream is(R"({"y": 20, "x": 10})");
    auto pt = json::from_stream<Point>(is);
    EXPECT_EQ(pt.x, 10);
    EXPECT_EQ(pt.y, 20);
}

TEST(Deserialize, FromStreamLarge) {
    std::string text = "[";
    for (int i = 0; i < 5000; ++i) {
        if (i) text += ", ";
        text += std::to_string(i);
    }
    text += "]";
    std::istringstream is(text);
    auto values = json::from_stream<std::vector<int32_t>>(is);
    ASSERT_EQ(values.size(), 5000u);
    EXPECT_EQ(values.back(), 4999);
}

TEST(Deserialize, TrailingContentRejected) {
    EXPECT_EQ(code_of<bool>("true false"), errc::unexpected_character);
    EXPECT_TRUE(json::from_str<bool>("true \n\t "));
}

TEST(Deserialize, ErrorPosition) {
    auto e = error_of<Flags>("{\n  \"on\": tru\n}");
    EXPECT_TRUE(e.is(errc::invalid_literal));
    EXPECT_EQ(e.location().line, 2u);
    EXPECT_EQ(e.location().column, 9u);
    EXPECT_EQ(e.location().offset, 10u);
    EXPECT_EQ(std::string(e.what()), "deserialize error at line 2, column 9: invalid literal");
}

TEST(Deserialize, UnexpectedEnd) {
    auto e = error_of<std::vector<int32_t>>("[1, 2");
    EXPECT_TRUE(e.is(errc::unexpected_end_of_input));
    EXPECT_EQ(e.location().offset, 5u);
    EXPECT_EQ(code_of<Point>(R"({"x": 1, "y")"), errc::unexpected_end_of_input);
    EXPECT_EQ(code_of<Point>(R"({"y": [1, 2)"), errc::unexpected_end_of_input);
    EXPECT_EQ(code_of<std::string>(""), errc::unexpected_end_of_input);
}

TEST(Deserialize, TryFromStr) {
    auto ok = json::try_from_str<uint32_t>("1234");
    EXPECT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value, 1234u);

    auto bad = json::try_from_str<uint32_t>("-20");
    EXPECT_FALSE(bad.has_value());
    EXPECT_EQ(bad.ec, errc::number_overflow);
    EXPECT_EQ(bad.value, 0u);
    EXPECT_EQ(bad.message, "deserialize error at line 1, column 1: numeric overflow");
}

TEST(Deserialize, ValidateWith) {
    EXPECT_EQ(json::from_str<Percent>("42").value, 42u);
    auto e = error_of<Percent>("  150");
    EXPECT_TRUE(e.is(errc::custom));
    EXPECT_EQ(e.detail(), "percentage out of range");
    EXPECT_EQ(e.location().column, 3u);
    EXPECT_EQ(std::string(e.what()),
              "deserialize error at line 1, column 3: percentage out of range");
}

TEST(Deserialize, MaxDepth) {
    using Deep = std::vector<std::vector<std::vector<std::vector<std::vector<int32_t>>>>>;
    json::TextDeserializerConfig config;
    config.max_depth = 4;
    EXPECT_EQ(code_of<Deep>("[[[[[1]]]]]", config), errc::max_depth_exceeded);
    EXPECT_EQ(json::from_str<Deep>("[[[[[1]]]]]").size(), 1u);
    EXPECT_EQ(code_of<Point>(R"({"y": [[[[1]]]], "x": 1})", config), errc::max_depth_exceeded);
    EXPECT_EQ(json::from_str<Point>(R"({"y": 2, "z": [[[1]]], "x": 1})", config).x, 1);
}

TEST(Deserialize, ErrorCategory) {
    std::error_code ec = errc::missing_key;
    EXPECT_STREQ(ec.category().name(), "serdex");
    EXPECT_EQ(ec.message(), "missing object key");
    EXPECT_EQ(make_error_code(errc::number_overflow).message(), "numeric overflow");
}

TEST(Deserialize, CustomMemoryResource) {
    std::pmr::monotonic_buffer_resource pool;
    Deser d{StringReader(R"({"y": 2, "x": 1})"), {}, &pool};
    auto pt = Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> value) {
        return std::move(value).get<Point>();
    });
    d.close();
    EXPECT_EQ(pt.x, 1);
    EXPECT_EQ(pt.y, 2);
}
