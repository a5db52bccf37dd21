#pragma once

#include "formats/Parser.hpp"
#include "formats/Serializer.hpp"
#include <string>

namespace marshal::formats {

/**
 * application/x-www-form-urlencoded
 *
 * A root map is written as key=value pairs joined by '&', each side in
 * UON notation and percent-encoded. Any other root is written as a single
 * _value=... pair.
 */
class UrlEncodingSerializer : public Serializer {
public:
    UrlEncodingSerializer() : Serializer("application/x-www-form-urlencoded") {}

    static std::string percentEncode(const std::string& text);
    static std::string percentDecode(const std::string& text);

    /**
     * Name of the pair holding a root that is not a map
     */
    static const std::string VALUE_PARAMETER;

protected:
    std::unique_ptr<EventWriter> createWriter(const Session& session, std::string& out) const override;
};

class UrlEncodingParser : public Parser {
public:
    UrlEncodingParser() : Parser("application/x-www-form-urlencoded") {}

    Pojo read(const std::string& input) const override;
};

} // namespace marshal::formats
