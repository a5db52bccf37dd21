#include <catch2/catch.hpp>
#include "TestTypes.hpp"
#include "core/VirtualBean.hpp"
#include "formats/FormatRegistry.hpp"

using namespace marshal;
using namespace marshal::formats;
using namespace fixtures;

namespace {

const std::vector<std::string> FORMATS = {"json", "xml", "html", "uon", "urlencoding", "msgpack", "rdf"};

Pojo roundTrip(const std::string& format, const MarshalContext& context, const Pojo& value,
               const ClassMetaPtr& type, const SessionOptions& options = {}) {
    auto mediaType = FormatRegistry::resolveFormatName(format);
    auto serializer = FormatRegistry::instance().getSerializer(mediaType);
    auto parser = FormatRegistry::instance().getParser(mediaType);
    std::string text = serializer->serialize(context, value, type, options);
    return parser->parse(context, text, type, options);
}

} // namespace

TEST_CASE("Round trip of beans through every format", "[RoundTrip]") {
    TestContext ctx;
    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto person = roundTrip(format, ctx.get(), Pojo::object(makePerson()), ctx.meta<Person>()).as<Person>();
        REQUIRE(person);
        REQUIRE(person->name == "John");
        REQUIRE(person->age == 42);
        REQUIRE(person->address);
        REQUIRE(person->address->street == "1 Main St");
        REQUIRE(person->address->city == "Springfield");
        REQUIRE(person->tags == std::vector<std::string>{"a", "b"});
    }
}

TEST_CASE("Round trip keeps null map values in every format", "[RoundTrip]") {
    TestContext ctx;
    PojoMap map;
    map.put(Pojo("foo"), Pojo());
    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto value = roundTrip(format, ctx.get(), Pojo::map(map), nullptr);
        REQUIRE(value.isMap());
        REQUIRE(value.asMap().size() == 1);
        REQUIRE(value.asMap().contains(Pojo("foo")));
        REQUIRE(value.asMap().get(Pojo("foo")).isNull());
    }
}

TEST_CASE("Round trip of generic trees in every format", "[RoundTrip]") {
    TestContext ctx;
    PojoMap inner;
    inner.put(Pojo("flag"), Pojo(true));
    inner.put(Pojo("ratio"), Pojo(0.5));
    PojoMap map;
    map.put(Pojo("text"), Pojo("hello world"));
    map.put(Pojo("count"), Pojo(-7));
    map.put(Pojo("inner"), Pojo::map(inner));
    map.put(Pojo("items"), Pojo::list({Pojo("a"), Pojo(1), Pojo()}));
    auto original = Pojo::map(map);

    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        REQUIRE(roundTrip(format, ctx.get(), original, nullptr) == original);
    }
}

TEST_CASE("Round trip of two-way swapped properties", "[RoundTrip]") {
    TestContext ctx;
    auto holder = std::make_shared<Holder>();
    holder->values = {{"k", "v"}};
    holder->origin.x = 10;
    holder->origin.y = 20;

    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto copy = roundTrip(format, ctx.get(), Pojo::object(holder), ctx.meta<Holder>()).as<Holder>();
        REQUIRE(copy);
        REQUIRE(copy->values == holder->values);
        REQUIRE(copy->origin.x == 10);
        REQUIRE(copy->origin.y == 20);
    }
}

TEST_CASE("Round trip of stringifiable values", "[RoundTrip]") {
    TestContext ctx;
    auto color = Pojo::object(std::make_shared<Color>(Color{"#c0ffee", ""}));
    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto copy = roundTrip(format, ctx.get(), color, ctx.meta<Color>()).as<Color>();
        REQUIRE(copy->hex == "#c0ffee");
        REQUIRE(copy->createdBy == "parse");
    }
}

TEST_CASE("Round trip of interface values", "[RoundTrip]") {
    TestContext ctx;
    auto shape = VirtualBean::create(ctx.meta<Shape>());
    shape.as<VirtualBean>()->set("kind", Pojo("circle"));
    shape.as<VirtualBean>()->set("area", Pojo(3.25));

    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto copy = roundTrip(format, ctx.get(), shape, ctx.meta<Shape>()).as<VirtualBean>();
        REQUIRE(copy);
        REQUIRE(copy->get("kind") == Pojo("circle"));
        REQUIRE(copy->get("area") == Pojo(3.25));
    }
}

TEST_CASE("Round trip into Any with type hints", "[RoundTrip]") {
    TestContext ctx;
    SessionOptions options;
    options.addTypeProperties = true;
    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        auto value = roundTrip(format, ctx.get(), Pojo::object(makePerson()), nullptr, options);
        auto person = value.as<Person>();
        REQUIRE(person);
        REQUIRE(person->address->city == "Springfield");
    }
}

TEST_CASE("Round trip refuses one-way swapped types", "[RoundTrip]") {
    TestContext ctx;
    auto secret = Pojo::object(std::make_shared<Secret>(Secret{"pw"}));
    for (const auto& format : FORMATS) {
        INFO("format: " << format);
        REQUIRE_THROWS_AS(roundTrip(format, ctx.get(), secret, ctx.meta<Secret>()), UnswapError);
    }
}
