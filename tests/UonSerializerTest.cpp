#include <catch2/catch.hpp>
#include "TestTypes.hpp"
#include "formats/UonSerializer.hpp"

using namespace marshal;
using namespace marshal::formats;
using namespace fixtures;

// =============================================================================
// Tokens
// =============================================================================

TEST_CASE("UonWriter quotes only ambiguous strings", "[UonSerializer]") {
    REQUIRE(UonWriter::stringToken("plain") == "plain");
    REQUIRE(UonWriter::stringToken("with space") == "with space");
    REQUIRE(UonWriter::stringToken("") == "''");
    REQUIRE(UonWriter::stringToken("null") == "'null'");
    REQUIRE(UonWriter::stringToken("true") == "'true'");
    REQUIRE(UonWriter::stringToken("123") == "'123'");
    REQUIRE(UonWriter::stringToken("-1.5e3") == "'-1.5e3'");
    REQUIRE(UonWriter::stringToken("@home") == "'@home'");
    REQUIRE(UonWriter::stringToken(" lead") == "' lead'");
    REQUIRE(UonWriter::stringToken("a,b") == "'a,b'");
    REQUIRE(UonWriter::stringToken("it's ~") == "'it~'s ~~'");
}

TEST_CASE("UonWriter scalar tokens", "[UonSerializer]") {
    REQUIRE(UonWriter::scalarToken(Pojo()) == "null");
    REQUIRE(UonWriter::scalarToken(Pojo(false)) == "false");
    REQUIRE(UonWriter::scalarToken(Pojo(-3)) == "-3");
    REQUIRE(UonWriter::scalarToken(Pojo(0.25)) == "0.25");
}

// =============================================================================
// Serialization
// =============================================================================

TEST_CASE("UonSerializer writes beans", "[UonSerializer]") {
    TestContext ctx;
    REQUIRE(UonSerializer().serialize(ctx.get(), Pojo::object(makePerson())) ==
            "(name=John,age=42,address=(street=1 Main St,city=Springfield),tags=@(a,b))");
}

TEST_CASE("UonSerializer writes nulls and empty containers", "[UonSerializer]") {
    TestContext ctx;
    PojoMap map;
    map.put(Pojo("foo"), Pojo());
    map.put(Pojo("list"), Pojo::list());
    map.put(Pojo("map"), Pojo::map());
    REQUIRE(UonSerializer().serialize(ctx.get(), Pojo::map(map)) == "(foo=null,list=@(),map=())");
}

TEST_CASE("UonSerializer indents with whitespace option", "[UonSerializer]") {
    TestContext ctx;
    SessionOptions options;
    options.useWhitespace = true;
    PojoMap map;
    map.put(Pojo("a"), Pojo::list({Pojo(1)}));
    REQUIRE(UonSerializer().serialize(ctx.get(), Pojo::map(map), nullptr, options) ==
            "(\n  a=@(\n    1\n  )\n)");
}

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("UonParser reads typed tokens", "[UonParser]") {
    TestContext ctx;
    auto value = UonParser().parse(ctx.get(), "(a=1,b=2.5,c=true,d=null,e='null',f=text here,g=@(x,'1'))");
    const auto& map = value.asMap();
    REQUIRE(map.get(Pojo("a")) == Pojo(1));
    REQUIRE(map.get(Pojo("b")) == Pojo(2.5));
    REQUIRE(map.get(Pojo("c")) == Pojo(true));
    REQUIRE(map.contains(Pojo("d")));
    REQUIRE(map.get(Pojo("d")).isNull());
    REQUIRE(map.get(Pojo("e")) == Pojo("null"));
    REQUIRE(map.get(Pojo("f")) == Pojo("text here"));
    REQUIRE(map.get(Pojo("g")).asList()[1] == Pojo("1"));
}

TEST_CASE("UonParser handles escapes and null keys", "[UonParser]") {
    TestContext ctx;
    auto value = UonParser().parse(ctx.get(), "(null=1,'it~'s'=a~,b)");
    REQUIRE(value.asMap().get(Pojo()) == Pojo(1));
    REQUIRE(value.asMap().get(Pojo("it's")) == Pojo("a,b"));
}

TEST_CASE("UonParser keeps out-of-range numbers as text", "[UonParser]") {
    TestContext ctx;
    REQUIRE(UonParser().parse(ctx.get(), "99999999999999999999") == Pojo("99999999999999999999"));
}

TEST_CASE("UonParser reports syntax errors", "[UonParser]") {
    TestContext ctx;
    REQUIRE_THROWS_AS(UonParser().parse(ctx.get(), "(a=1"), ParseError);
    REQUIRE_THROWS_AS(UonParser().parse(ctx.get(), "(a)"), ParseError);
    REQUIRE_THROWS_AS(UonParser().parse(ctx.get(), "'open"), ParseError);
    REQUIRE_THROWS_AS(UonParser().parse(ctx.get(), "@(1))"), ParseError);
}

TEST_CASE("UonParser reads into beans", "[UonParser]") {
    TestContext ctx;
    auto person = UonParser().parse(ctx.get(), "(name=Kim,age=7,tags=@(q))", ctx.meta<Person>()).as<Person>();
    REQUIRE(person->name == "Kim");
    REQUIRE(person->age == 7);
    REQUIRE(person->address == nullptr);
    REQUIRE(person->tags == std::vector<std::string>{"q"});
}
