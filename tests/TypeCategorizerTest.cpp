#include <catch2/catch.hpp>
#include "TestTypes.hpp"
#include "core/BuiltinTypes.hpp"
#include "core/TypeCategorizer.hpp"

using namespace marshal;
using namespace fixtures;

namespace {

const MediaType JSON = MediaType::parse("application/json");
const MediaType HTML = MediaType::parse("text/html");
const MediaType RDF = MediaType::parse("text/xml+rdf");

} // namespace

// =============================================================================
// Values
// =============================================================================

TEST_CASE("TypeCategorizer null has no category", "[TypeCategorizer]") {
    TestContext ctx;
    REQUIRE_FALSE(ctx.get().categorizer().categorize(Pojo(), nullptr, JSON).has_value());
}

TEST_CASE("TypeCategorizer scalars are primitive", "[TypeCategorizer]") {
    TestContext ctx;
    const auto& categorizer = ctx.get().categorizer();
    REQUIRE(categorizer.categorize(Pojo(1), nullptr, JSON) == Category::PRIMITIVE);
    REQUIRE(categorizer.categorize(Pojo("s"), ClassMeta::string(), JSON) == Category::PRIMITIVE);
    REQUIRE(categorizer.categorizeType(ClassMeta::any(), JSON) == Category::PRIMITIVE);
}

TEST_CASE("TypeCategorizer unregistered instances are opaque", "[TypeCategorizer]") {
    TestContext ctx;
    auto handle = Pojo::object(std::make_shared<Handle>());
    REQUIRE(ctx.get().categorizer().categorize(handle, nullptr, JSON) == Category::OPAQUE);
    REQUIRE(ctx.get().categorizer().categorizeType(
        ClassMeta::reference(std::type_index(typeid(Handle))), JSON) == Category::OPAQUE);
}

// =============================================================================
// Beans
// =============================================================================

TEST_CASE("TypeCategorizer standard beans", "[TypeCategorizer]") {
    TestContext ctx;
    const auto& categorizer = ctx.get().categorizer();
    REQUIRE(categorizer.categorizeType(ctx.meta<Person>(), JSON) == Category::BEAN_STANDARD);
    REQUIRE(categorizer.categorizeType(ctx.meta<Address>(), JSON) == Category::BEAN_STANDARD);
    REQUIRE(categorizer.categorize(Pojo::object(makePerson()), nullptr, JSON) == Category::BEAN_STANDARD);
}

TEST_CASE("TypeCategorizer handles self-referencing beans", "[TypeCategorizer]") {
    TestContext ctx;
    REQUIRE(ctx.get().categorizer().categorizeType(ctx.meta<Node>(), JSON) == Category::BEAN_STANDARD);
}

TEST_CASE("TypeCategorizer read-only beans", "[TypeCategorizer]") {
    TestContext ctx;
    const auto& categorizer = ctx.get().categorizer();
    REQUIRE(categorizer.categorizeType(ctx.meta<Summary>(), JSON) == Category::BEAN_READONLY);
    REQUIRE(categorizer.categorizeType(ctx.meta<Token>(), JSON) == Category::BEAN_READONLY);
}

TEST_CASE("TypeCategorizer interfaces are virtual beans", "[TypeCategorizer]") {
    TestContext ctx;
    REQUIRE(ctx.get().categorizer().categorizeType(ctx.meta<Shape>(), JSON) == Category::BEAN_VIRTUAL);
}

TEST_CASE("TypeCategorizer bean with one-way member is nonstandard", "[TypeCategorizer]") {
    TestContext ctx;
    const auto& categorizer = ctx.get().categorizer();
    REQUIRE(categorizer.categorizeType(ctx.meta<Widget>(), JSON) == Category::BEAN_NONSTANDARD);
    REQUIRE(categorizer.categorizeType(ctx.meta<Widget>(), HTML) == Category::BEAN_STANDARD);
}

// =============================================================================
// Swaps
// =============================================================================

TEST_CASE("TypeCategorizer swaps depend on the media type", "[TypeCategorizer]") {
    TestContext ctx;
    const auto& categorizer = ctx.get().categorizer();
    REQUIRE(categorizer.categorizeType(ctx.meta<Gadget>(), JSON) == Category::SWAPPED_ONEWAY);
    REQUIRE(categorizer.categorizeType(ctx.meta<Gadget>(), RDF) == Category::SWAPPED_ONEWAY);
    REQUIRE(categorizer.categorizeType(ctx.meta<Gadget>(), HTML) == Category::BEAN_STANDARD);
}

TEST_CASE("TypeCategorizer two-way and one-way swaps", "[TypeCategorizer]") {
    TestContext ctx;
    const auto& categorizer = ctx.get().categorizer();
    REQUIRE(categorizer.categorizeType(ctx.meta<Point>(), JSON) == Category::SWAPPED_TWOWAY);
    REQUIRE(categorizer.categorizeType(ctx.meta<Secret>(), JSON) == Category::SWAPPED_ONEWAY);
    REQUIRE(categorizer.categorizeType(ctx.meta<Holder>(), JSON) == Category::BEAN_STANDARD);
}

TEST_CASE("TypeCategorizer structure ignores swaps", "[TypeCategorizer]") {
    TestContext ctx;
    const auto& categorizer = ctx.get().categorizer();
    REQUIRE(categorizer.categorizeStructure(ctx.meta<Gadget>(), JSON) == Category::BEAN_STANDARD);
    REQUIRE(categorizer.categorizeStructure(ctx.meta<Point>(), JSON) == Category::OPAQUE);
}

// =============================================================================
// Other categories
// =============================================================================

TEST_CASE("TypeCategorizer stringifiable types", "[TypeCategorizer]") {
    TestContext ctx;
    const auto& categorizer = ctx.get().categorizer();
    REQUIRE(categorizer.categorizeType(ctx.meta<Color>(), JSON) == Category::STRINGIFIABLE_TWOWAY);
    REQUIRE(categorizer.categorizeType(ctx.meta<Version>(), JSON) == Category::STRINGIFIABLE_ONEWAY);
    REQUIRE(categorizer.categorizeType(ctx.meta(std::type_index(typeid(Locale))), JSON) ==
            Category::STRINGIFIABLE_TWOWAY);
    REQUIRE(categorizer.categorizeType(ctx.meta(std::type_index(typeid(TimeZone))), JSON) ==
            Category::STRINGIFIABLE_TWOWAY);
}

TEST_CASE("TypeCategorizer streams", "[TypeCategorizer]") {
    TestContext ctx;
    auto stream = Pojo::object(CharStream::fromString("data"));
    REQUIRE(ctx.get().categorizer().categorize(stream, nullptr, JSON) == Category::STREAM_LIKE);
}

TEST_CASE("TypeCategorizer collections follow their members", "[TypeCategorizer]") {
    TestContext ctx;
    const auto& categorizer = ctx.get().categorizer();
    REQUIRE(categorizer.categorizeType(ClassMeta::listOf(nullptr), JSON) == Category::COLLECTION_STANDARD);
    REQUIRE(categorizer.categorizeType(
        ClassMeta::mapOf(ClassMeta::string(), ctx.meta<Person>()), JSON) == Category::COLLECTION_STANDARD);
    REQUIRE(categorizer.categorizeType(
        ClassMeta::listOf(ClassMeta::reference(std::type_index(typeid(Handle)))), JSON) ==
        Category::COLLECTION_NONSTANDARD);
    REQUIRE(categorizer.categorizeType(ClassMeta::listOf(ctx.meta<Summary>()), JSON) ==
            Category::COLLECTION_NONSTANDARD);
}

TEST_CASE("TypeCategorizer declared collection type wins over runtime type", "[TypeCategorizer]") {
    TestContext ctx;
    auto declared = ClassMeta::listOf(ctx.meta<Version>());
    auto effective = ctx.get().categorizer().effectiveType(Pojo::list(), declared);
    REQUIRE(effective == declared);
    REQUIRE(ctx.get().categorizer().categorize(Pojo::list(), declared, JSON) ==
            Category::COLLECTION_NONSTANDARD);
}

TEST_CASE("TypeCategorizer caches results per media type", "[TypeCategorizer]") {
    TestContext ctx;
    auto& categorizer = ctx.get().categorizer();
    categorizer.clearCache();
    REQUIRE(categorizer.cacheSize() == 0);

    categorizer.categorizeType(ctx.meta<Gadget>(), JSON);
    categorizer.categorizeType(ctx.meta<Gadget>(), JSON);
    REQUIRE(categorizer.cacheSize() == 1);

    categorizer.categorizeType(ctx.meta<Gadget>(), HTML);
    categorizer.categorizeStructure(ctx.meta<Gadget>(), JSON);
    REQUIRE(categorizer.cacheSize() == 3);
}
