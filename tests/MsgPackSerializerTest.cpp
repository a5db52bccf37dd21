#include <catch2/catch.hpp>
#include "TestTypes.hpp"
#include "formats/MsgPackSerializer.hpp"

using namespace marshal;
using namespace marshal::formats;
using namespace fixtures;

TEST_CASE("MsgPackSerializer is binary", "[MsgPackSerializer]") {
    MsgPackSerializer serializer;
    REQUIRE(serializer.isBinary());
    REQUIRE(serializer.getMediaType().toString() == "octal/msgpack");
}

TEST_CASE("MsgPackSerializer encodes compact scalars", "[MsgPackSerializer]") {
    TestContext ctx;
    MsgPackSerializer serializer;
    REQUIRE(serializer.serialize(ctx.get(), Pojo()) == std::string(1, '\xc0'));
    REQUIRE(serializer.serialize(ctx.get(), Pojo(true)) == std::string(1, '\xc3'));
    REQUIRE(serializer.serialize(ctx.get(), Pojo(5)) == std::string(1, '\x05'));
    REQUIRE(serializer.serialize(ctx.get(), Pojo("ab")) == std::string("\xa2" "ab"));
}

TEST_CASE("MsgPackSerializer round trips beans", "[MsgPackSerializer]") {
    TestContext ctx;
    auto bytes = MsgPackSerializer().serialize(ctx.get(), Pojo::object(makePerson()));
    auto person = MsgPackParser().parse(ctx.get(), bytes, ctx.meta<Person>()).as<Person>();

    REQUIRE(person->name == "John");
    REQUIRE(person->age == 42);
    REQUIRE(person->address->city == "Springfield");
    REQUIRE(person->tags == std::vector<std::string>{"a", "b"});
}

TEST_CASE("MsgPackParser keeps null map values", "[MsgPackSerializer]") {
    TestContext ctx;
    PojoMap map;
    map.put(Pojo("foo"), Pojo());
    auto bytes = MsgPackSerializer().serialize(ctx.get(), Pojo::map(map));
    auto value = MsgPackParser().parse(ctx.get(), bytes);
    REQUIRE(value.asMap().contains(Pojo("foo")));
    REQUIRE(value.asMap().get(Pojo("foo")).isNull());
}

TEST_CASE("MsgPackParser rejects truncated input", "[MsgPackSerializer]") {
    TestContext ctx;
    REQUIRE_THROWS_AS(MsgPackParser().parse(ctx.get(), std::string("\x92\x01", 2)), ParseError);
}
