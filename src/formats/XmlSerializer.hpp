#pragma once

#include "formats/Parser.hpp"
#include "formats/Serializer.hpp"

namespace marshal::formats {

/**
 * text/xml
 *
 * Document shape:
 *   <object><name>John</name><age _type='number'>42</age></object>
 *   <array><string>a</string><number>1</number><null/></array>
 *
 * Root and list-item elements are named after the value kind (object,
 * array, string, number, boolean, null). Map entries are elements named
 * by their encoded key; a _type attribute marks entries that are not
 * strings or non-empty objects.
 */
class XmlSerializer : public Serializer {
public:
    XmlSerializer() : Serializer("text/xml") {}

protected:
    std::unique_ptr<EventWriter> createWriter(const Session& session, std::string& out) const override;
};

class XmlParser : public Parser {
public:
    XmlParser() : Parser("text/xml") {}

    Pojo read(const std::string& input) const override;
};

} // namespace marshal::formats
