#pragma once

#include "core/ClassMeta.hpp"
#include "core/Pojo.hpp"
#include <string>
#include <vector>

namespace marshal {

class TypeRegistry;

/**
 * String conversions of values and types
 *
 * fromString resolution per target type:
 * 1. Boolean: blank or "null" => null, otherwise case-insensitive true/false
 * 2. Locale: '-' normalized to '_' first
 * 3. Integer / Double / String coercions
 * 4. The first existing static factory, in factoryMethodNames() order
 * 5. The single-string constructor
 *
 * The first conversion that exists is chosen. If it throws, the failure is
 * reported as ConversionError; later candidates are not tried.
 */
class StringConvertibility {
public:
    explicit StringConvertibility(const TypeRegistry& types);

    /**
     * create, fromString, fromValue, valueOf, parse, parseString, forName, forString
     */
    static const std::vector<std::string>& factoryMethodNames();

    /**
     * Native string form of a value
     */
    std::string toString(const Pojo& value) const;

    /**
     * Build a value of targetType from text
     * Throws NotConvertibleError if no conversion exists, ConversionError if
     * the chosen one fails, TypeResolutionError for an unregistered type
     */
    Pojo fromString(const ClassMetaPtr& targetType, const std::string& text) const;

    bool hasToString(const ClassMetaPtr& meta) const;
    bool hasFromString(const ClassMetaPtr& meta) const;

    /**
     * Name of the conversion fromString uses: a factory name,
     * "<init>" for the string constructor, "" when none exists
     */
    std::string resolveFromStringName(const ClassMetaPtr& meta) const;

    /**
     * "TypeName@hexaddress" form used for opaque values
     */
    std::string defaultString(const Pojo& value) const;

    /**
     * Shortest form that parses back to the same double
     */
    static std::string formatDouble(double value);

private:
    const TypeRegistry& m_types;
};

} // namespace marshal
