#pragma once

#include <string>

namespace marshal {

/**
 * Structural category of a POJO type.
 *
 * The category decides how the tree walker handles a value and whether a
 * value of that shape can be reconstructed by a parser.
 */
enum class Category {
    PRIMITIVE,
    COLLECTION_STANDARD,
    COLLECTION_NONSTANDARD,
    BEAN_STANDARD,
    BEAN_NONSTANDARD,
    BEAN_VIRTUAL,
    BEAN_READONLY,
    SWAPPED_TWOWAY,
    SWAPPED_ONEWAY,
    STREAM_LIKE,
    STRINGIFIABLE_TWOWAY,
    STRINGIFIABLE_ONEWAY,
    OPAQUE
};

/**
 * Convert Category to its upper-case name
 */
std::string categoryToString(Category category);

/**
 * Convert an upper-case name to Category
 */
Category stringToCategory(const std::string& str);

/**
 * Every category is serializable
 */
bool isSerializable(Category category);

/**
 * False for OPAQUE, STREAM_LIKE, SWAPPED_ONEWAY, STRINGIFIABLE_ONEWAY,
 * BEAN_NONSTANDARD, BEAN_READONLY and COLLECTION_NONSTANDARD
 */
bool isParsable(Category category);

bool isBeanCategory(Category category);
bool isSwappedCategory(Category category);

} // namespace marshal
