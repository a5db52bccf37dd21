#include "core/StringConvertibility.hpp"
#include "core/BuiltinTypes.hpp"
#include "core/Errors.hpp"
#include "core/TypeRegistry.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <sstream>
#include <exception>
#include <stdexcept>

namespace marshal {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

const std::string CONSTRUCTOR_NAME = "<init>";

} // namespace

StringConvertibility::StringConvertibility(const TypeRegistry& types)
    : m_types(types)
{}

const std::vector<std::string>& StringConvertibility::factoryMethodNames() {
    static const std::vector<std::string> names = {
        "create", "fromString", "fromValue", "valueOf",
        "parse", "parseString", "forName", "forString"
    };
    return names;
}

std::string StringConvertibility::formatDouble(double value) {
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    return std::string(buffer, result.ptr);
}

std::string StringConvertibility::toString(const Pojo& value) const {
    if (value.isNull()) return "null";
    if (value.isBool()) return value.getBool() ? "true" : "false";
    if (value.isInt()) return std::to_string(value.getInt());
    if (value.isDouble()) return formatDouble(value.getDouble());
    if (value.isString()) return value.getString();

    if (auto tz = value.as<TimeZone>()) {
        return tz->getId();
    }
    auto meta = m_types.forObject(value);
    if (meta && meta->getToStringFunction()) {
        return meta->getToStringFunction()(value);
    }
    return defaultString(value);
}

std::string StringConvertibility::defaultString(const Pojo& value) const {
    auto meta = m_types.forObject(value);
    std::string name = meta ? meta->getName() : std::string(value.type().name());
    std::ostringstream oss;
    oss << name << "@" << std::hex << reinterpret_cast<uintptr_t>(value.identity());
    return oss.str();
}

bool StringConvertibility::hasToString(const ClassMetaPtr& meta) const {
    if (!meta) return false;
    if (meta->isScalar()) return true;
    if (meta->getType() && *meta->getType() == std::type_index(typeid(TimeZone))) return true;
    return static_cast<bool>(meta->getToStringFunction());
}

bool StringConvertibility::hasFromString(const ClassMetaPtr& meta) const {
    if (!meta) return false;
    if (meta->isScalar()) return true;
    return !resolveFromStringName(meta).empty();
}

std::string StringConvertibility::resolveFromStringName(const ClassMetaPtr& meta) const {
    for (const auto& name : factoryMethodNames()) {
        if (meta->findStaticMethod(name)) {
            return name;
        }
    }
    if (meta->getStringConstructor()) {
        return CONSTRUCTOR_NAME;
    }
    return "";
}

Pojo StringConvertibility::fromString(const ClassMetaPtr& targetType, const std::string& text) const {
    auto meta = m_types.resolve(targetType);
    if (!meta) {
        throw TypeResolutionError("Unregistered type '" + targetType->getName() + "'");
    }

    auto fail = [&](const std::string& how, const std::exception& cause) {
        return ConversionError("Could not convert '" + text + "' to '" + meta->getName() +
                               "' via " + how + ": " + cause.what(), std::current_exception());
    };

    switch (meta->getKind()) {
        case TypeKind::Any:
        case TypeKind::String:
            return Pojo(text);

        case TypeKind::Boolean: {
            if (isBlank(text) || text == "null") return Pojo();
            std::string lower = toLower(text);
            if (lower == "true") return Pojo(true);
            if (lower == "false") return Pojo(false);
            std::invalid_argument cause("not a boolean");
            throw ConversionError("Could not convert '" + text + "' to 'Boolean': " + cause.what(),
                                  std::make_exception_ptr(cause));
        }

        case TypeKind::Integer: {
            try {
                size_t pos = 0;
                long long value = std::stoll(text, &pos);
                if (pos != text.size()) {
                    throw std::invalid_argument("trailing characters in " + text);
                }
                return Pojo(static_cast<int64_t>(value));
            } catch (const std::exception& e) {
                throw fail("Integer", e);
            }
        }

        case TypeKind::Double: {
            try {
                size_t pos = 0;
                double value = std::stod(text, &pos);
                if (pos != text.size()) {
                    throw std::invalid_argument("trailing characters in " + text);
                }
                return Pojo(value);
            } catch (const std::exception& e) {
                throw fail("Double", e);
            }
        }

        default:
            break;
    }

    std::string input = text;
    if (meta->getType() && *meta->getType() == std::type_index(typeid(Locale))) {
        std::replace(input.begin(), input.end(), '-', '_');
    }

    std::string name = resolveFromStringName(meta);
    if (name.empty()) {
        throw NotConvertibleError("No from-string conversion for type '" + meta->getName() + "'");
    }
    const FromStringFunction& fn = name == CONSTRUCTOR_NAME
        ? meta->getStringConstructor()
        : *meta->findStaticMethod(name);
    try {
        return fn(input);
    } catch (const std::exception& e) {
        throw fail(name, e);
    }
}

} // namespace marshal
