#include <catch2/catch.hpp>
#include "core/Category.hpp"

using namespace marshal;

TEST_CASE("Category string conversion", "[Category]") {
    REQUIRE(categoryToString(Category::BEAN_STANDARD) == "BEAN_STANDARD");
    REQUIRE(stringToCategory("SWAPPED_ONEWAY") == Category::SWAPPED_ONEWAY);
    REQUIRE(stringToCategory(categoryToString(Category::OPAQUE)) == Category::OPAQUE);
    REQUIRE_THROWS_AS(stringToCategory("bogus"), std::invalid_argument);
}

TEST_CASE("Category parsability", "[Category]") {
    REQUIRE(isParsable(Category::PRIMITIVE));
    REQUIRE(isParsable(Category::COLLECTION_STANDARD));
    REQUIRE(isParsable(Category::BEAN_STANDARD));
    REQUIRE(isParsable(Category::BEAN_VIRTUAL));
    REQUIRE(isParsable(Category::SWAPPED_TWOWAY));
    REQUIRE(isParsable(Category::STRINGIFIABLE_TWOWAY));

    REQUIRE_FALSE(isParsable(Category::OPAQUE));
    REQUIRE_FALSE(isParsable(Category::STREAM_LIKE));
    REQUIRE_FALSE(isParsable(Category::SWAPPED_ONEWAY));
    REQUIRE_FALSE(isParsable(Category::STRINGIFIABLE_ONEWAY));
    REQUIRE_FALSE(isParsable(Category::BEAN_READONLY));
    REQUIRE_FALSE(isParsable(Category::BEAN_NONSTANDARD));
    REQUIRE_FALSE(isParsable(Category::COLLECTION_NONSTANDARD));
}

TEST_CASE("Every category is serializable", "[Category]") {
    REQUIRE(isSerializable(Category::OPAQUE));
    REQUIRE(isSerializable(Category::STREAM_LIKE));
}

TEST_CASE("Category groups", "[Category]") {
    REQUIRE(isBeanCategory(Category::BEAN_READONLY));
    REQUIRE_FALSE(isBeanCategory(Category::COLLECTION_STANDARD));
    REQUIRE(isSwappedCategory(Category::SWAPPED_TWOWAY));
    REQUIRE_FALSE(isSwappedCategory(Category::STRINGIFIABLE_TWOWAY));
}
