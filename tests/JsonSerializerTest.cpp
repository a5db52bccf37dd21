#include <catch2/catch.hpp>
#include "TestTypes.hpp"
#include "formats/JsonSerializer.hpp"

using namespace marshal;
using namespace marshal::formats;
using namespace fixtures;

// =============================================================================
// Serialization
// =============================================================================

TEST_CASE("JsonSerializer writes beans in property order", "[JsonSerializer]") {
    TestContext ctx;
    auto json = JsonSerializer().serialize(ctx.get(), Pojo::object(makePerson()));
    REQUIRE(json == R"({"name":"John","age":42,"address":{"street":"1 Main St","city":"Springfield"},"tags":["a","b"]})");
}

TEST_CASE("JsonSerializer keeps null map values", "[JsonSerializer]") {
    TestContext ctx;
    PojoMap map;
    map.put(Pojo("foo"), Pojo());
    REQUIRE(JsonSerializer().serialize(ctx.get(), Pojo::map(map)) == R"({"foo":null})");
}

TEST_CASE("JsonSerializer writes scalars at the root", "[JsonSerializer]") {
    TestContext ctx;
    JsonSerializer serializer;
    REQUIRE(serializer.serialize(ctx.get(), Pojo()) == "null");
    REQUIRE(serializer.serialize(ctx.get(), Pojo(true)) == "true");
    REQUIRE(serializer.serialize(ctx.get(), Pojo(12)) == "12");
    REQUIRE(serializer.serialize(ctx.get(), Pojo("a\"b")) == R"("a\"b")");
}

TEST_CASE("JsonSerializer applies the JSON swap", "[JsonSerializer]") {
    TestContext ctx;
    auto widget = std::make_shared<Widget>();
    widget->f = std::make_shared<Gadget>(Gadget{"g"});
    REQUIRE(JsonSerializer().serialize(ctx.get(), Pojo::object(widget)) == R"({"f":"x-json"})");
}

TEST_CASE("JsonSerializer writes stringifiable values as strings", "[JsonSerializer]") {
    TestContext ctx;
    PojoMap map;
    map.put(Pojo("color"), Pojo::object(std::make_shared<Color>(Color{"#123456", ""})));
    map.put(Pojo("version"), Pojo::object(std::make_shared<Version>(Version{3, 1})));
    REQUIRE(JsonSerializer().serialize(ctx.get(), Pojo::map(map)) ==
            R"({"color":"#123456","version":"3.1"})");
}

TEST_CASE("JsonSerializer null key is written as null", "[JsonSerializer]") {
    TestContext ctx;
    PojoMap map;
    map.put(Pojo(), Pojo(1));
    REQUIRE(JsonSerializer().serialize(ctx.get(), Pojo::map(map)) == R"({"null":1})");
}

TEST_CASE("JsonSerializer fails on recursion unless ignored", "[JsonSerializer]") {
    TestContext ctx;
    auto node = std::make_shared<Node>();
    node->name = "loop";
    node->next = node;

    SessionOptions detect;
    detect.detectRecursions = true;
    REQUIRE_THROWS_AS(JsonSerializer().serialize(ctx.get(), Pojo::object(node), nullptr, detect),
                      SerializeError);

    SessionOptions ignore = detect;
    ignore.ignoreRecursions = true;
    REQUIRE(JsonSerializer().serialize(ctx.get(), Pojo::object(node), nullptr, ignore) ==
            R"({"name":"loop","next":null})");
    node->next = nullptr;
}

TEST_CASE("JsonSerializer indents with whitespace option", "[JsonSerializer]") {
    TestContext ctx;
    SessionOptions options;
    options.useWhitespace = true;
    PojoMap map;
    map.put(Pojo("a"), Pojo(1));
    REQUIRE(JsonSerializer().serialize(ctx.get(), Pojo::map(map), nullptr, options) == "{\n  \"a\": 1\n}");
}

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("JsonParser reads generic values", "[JsonParser]") {
    TestContext ctx;
    auto value = JsonParser().parse(ctx.get(), R"({"foo":null,"n":[1,2.5,true,"s"]})");

    REQUIRE(value.isMap());
    REQUIRE(value.asMap().contains(Pojo("foo")));
    REQUIRE(value.asMap().get(Pojo("foo")).isNull());
    const auto& list = value.asMap().get(Pojo("n")).asList();
    REQUIRE(list.size() == 4);
    REQUIRE(list[0].isInt());
    REQUIRE(list[1].isDouble());
    REQUIRE(list[2] == Pojo(true));
    REQUIRE(list[3] == Pojo("s"));
}

TEST_CASE("JsonParser keeps document key order", "[JsonParser]") {
    TestContext ctx;
    auto value = JsonParser().parse(ctx.get(), R"({"z":1,"a":2})");
    REQUIRE(value.asMap().begin()->first == Pojo("z"));
}

TEST_CASE("JsonParser reads into beans", "[JsonParser]") {
    TestContext ctx;
    auto person = JsonParser().parse(ctx.get(),
        R"({"name":"Jane","age":33,"address":{"street":"Elm","city":"Oslo"},"tags":["t"]})",
        ctx.meta<Person>()).as<Person>();

    REQUIRE(person);
    REQUIRE(person->name == "Jane");
    REQUIRE(person->age == 33);
    REQUIRE(person->address->street == "Elm");
    REQUIRE(person->tags == std::vector<std::string>{"t"});
}

TEST_CASE("JsonParser prefers the parse factory for stringifiable types", "[JsonParser]") {
    TestContext ctx;
    auto color = JsonParser().parse(ctx.get(), R"("#abcdef")", ctx.meta<Color>()).as<Color>();
    REQUIRE(color->hex == "#abcdef");
    REQUIRE(color->createdBy == "parse");
}

TEST_CASE("JsonParser reports malformed input", "[JsonParser]") {
    TestContext ctx;
    REQUIRE_THROWS_AS(JsonParser().parse(ctx.get(), R"({"a":)"), ParseError);
    REQUIRE_THROWS_AS(JsonParser().parse(ctx.get(), R"({"name":[1]})", ctx.meta<Person>()), ParseError);
}

TEST_CASE("JsonParser refuses one-way types", "[JsonParser]") {
    TestContext ctx;
    REQUIRE_THROWS_AS(JsonParser().parse(ctx.get(), R"("x-json")", ctx.meta<Gadget>()), UnswapError);
    REQUIRE_THROWS_AS(JsonParser().parse(ctx.get(), R"("1.0")", ctx.meta<Version>()), NotConvertibleError);
}

TEST_CASE("JsonParser large unsigned numbers become doubles", "[JsonParser]") {
    TestContext ctx;
    auto value = JsonParser().parse(ctx.get(), "18446744073709551615");
    REQUIRE(value.isDouble());
}

TEST_CASE("JsonParser rejects integers out of int64 range", "[JsonParser]") {
    TestContext ctx;
    REQUIRE_THROWS_AS(JsonParser().parse(ctx.get(), R"({"name":"John","age":18446744073709551615})",
                                         ctx.meta<Person>()),
                      ParseError);
    REQUIRE_THROWS_AS(JsonParser().parse(ctx.get(), R"({"name":"John","age":1e20})", ctx.meta<Person>()),
                      ParseError);
}
