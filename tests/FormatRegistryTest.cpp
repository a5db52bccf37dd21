#include <catch2/catch.hpp>
#include "formats/FormatRegistry.hpp"
#include "formats/JsonSerializer.hpp"

using namespace marshal;
using namespace marshal::formats;

TEST_CASE("FormatRegistry registers every default format", "[FormatRegistry]") {
    auto& registry = FormatRegistry::instance();
    for (const char* type : {"application/json", "text/xml", "text/html", "text/uon",
                             "application/x-www-form-urlencoded", "octal/msgpack", "text/xml+rdf"}) {
        auto mediaType = MediaType::parse(type);
        REQUIRE(registry.getSerializer(mediaType) != nullptr);
        REQUIRE(registry.getParser(mediaType) != nullptr);
    }
    REQUIRE(registry.getMediaTypes().size() == 7);
}

TEST_CASE("FormatRegistry lookup ignores parameters", "[FormatRegistry]") {
    auto serializer = FormatRegistry::instance().getSerializer(MediaType::parse("application/json; charset=utf-8"));
    REQUIRE(serializer);
    REQUIRE(serializer->getMediaType().getSubType() == "json");
}

TEST_CASE("FormatRegistry unknown media type returns null", "[FormatRegistry]") {
    REQUIRE(FormatRegistry::instance().getSerializer(MediaType::parse("text/csv")) == nullptr);
    REQUIRE(FormatRegistry::instance().getParser(MediaType::parse("text/csv")) == nullptr);
}

TEST_CASE("FormatRegistry resolves short format names", "[FormatRegistry]") {
    REQUIRE(FormatRegistry::resolveFormatName("json").toString() == "application/json");
    REQUIRE(FormatRegistry::resolveFormatName("rdf").toString() == "text/xml+rdf");
    REQUIRE(FormatRegistry::resolveFormatName("urlencoding").toString() == "application/x-www-form-urlencoded");
    REQUIRE(FormatRegistry::resolveFormatName("text/html").toString() == "text/html");
    REQUIRE_THROWS_AS(FormatRegistry::resolveFormatName("yaml"), std::invalid_argument);
}

TEST_CASE("FormatRegistry custom instance", "[FormatRegistry]") {
    FormatRegistry registry;
    REQUIRE(registry.getMediaTypes().empty());
    registry.registerSerializer(std::make_shared<JsonSerializer>());
    REQUIRE(registry.getSerializer(MediaType::parse("application/json")) != nullptr);
    REQUIRE(registry.getParser(MediaType::parse("application/json")) == nullptr);
    REQUIRE_THROWS_AS(registry.registerParser(nullptr), std::invalid_argument);
}
