#include "core/Category.hpp"
#include <stdexcept>

namespace marshal {

std::string categoryToString(Category category) {
    switch (category) {
        case Category::PRIMITIVE:              return "PRIMITIVE";
        case Category::COLLECTION_STANDARD:    return "COLLECTION_STANDARD";
        case Category::COLLECTION_NONSTANDARD: return "COLLECTION_NONSTANDARD";
        case Category::BEAN_STANDARD:          return "BEAN_STANDARD";
        case Category::BEAN_NONSTANDARD:       return "BEAN_NONSTANDARD";
        case Category::BEAN_VIRTUAL:           return "BEAN_VIRTUAL";
        case Category::BEAN_READONLY:          return "BEAN_READONLY";
        case Category::SWAPPED_TWOWAY:         return "SWAPPED_TWOWAY";
        case Category::SWAPPED_ONEWAY:         return "SWAPPED_ONEWAY";
        case Category::STREAM_LIKE:            return "STREAM_LIKE";
        case Category::STRINGIFIABLE_TWOWAY:   return "STRINGIFIABLE_TWOWAY";
        case Category::STRINGIFIABLE_ONEWAY:   return "STRINGIFIABLE_ONEWAY";
        case Category::OPAQUE:                 return "OPAQUE";
    }
    return "UNKNOWN";
}

Category stringToCategory(const std::string& str) {
    if (str == "PRIMITIVE")              return Category::PRIMITIVE;
    if (str == "COLLECTION_STANDARD")    return Category::COLLECTION_STANDARD;
    if (str == "COLLECTION_NONSTANDARD") return Category::COLLECTION_NONSTANDARD;
    if (str == "BEAN_STANDARD")          return Category::BEAN_STANDARD;
    if (str == "BEAN_NONSTANDARD")       return Category::BEAN_NONSTANDARD;
    if (str == "BEAN_VIRTUAL")           return Category::BEAN_VIRTUAL;
    if (str == "BEAN_READONLY")          return Category::BEAN_READONLY;
    if (str == "SWAPPED_TWOWAY")         return Category::SWAPPED_TWOWAY;
    if (str == "SWAPPED_ONEWAY")         return Category::SWAPPED_ONEWAY;
    if (str == "STREAM_LIKE")            return Category::STREAM_LIKE;
    if (str == "STRINGIFIABLE_TWOWAY")   return Category::STRINGIFIABLE_TWOWAY;
    if (str == "STRINGIFIABLE_ONEWAY")   return Category::STRINGIFIABLE_ONEWAY;
    if (str == "OPAQUE")                 return Category::OPAQUE;
    throw std::invalid_argument("Unknown category: " + str);
}

bool isSerializable(Category) {
    return true;
}

bool isParsable(Category category) {
    switch (category) {
        case Category::OPAQUE:
        case Category::STREAM_LIKE:
        case Category::SWAPPED_ONEWAY:
        case Category::STRINGIFIABLE_ONEWAY:
        case Category::BEAN_NONSTANDARD:
        case Category::BEAN_READONLY:
        case Category::COLLECTION_NONSTANDARD:
            return false;
        default:
            return true;
    }
}

bool isBeanCategory(Category category) {
    return category == Category::BEAN_STANDARD ||
           category == Category::BEAN_NONSTANDARD ||
           category == Category::BEAN_VIRTUAL ||
           category == Category::BEAN_READONLY;
}

bool isSwappedCategory(Category category) {
    return category == Category::SWAPPED_TWOWAY ||
           category == Category::SWAPPED_ONEWAY;
}

} // namespace marshal
