#pragma once

#include "formats/Parser.hpp"
#include "formats/Serializer.hpp"

namespace marshal::formats {

/**
 * text/xml+rdf
 *
 * Maps and beans are rdf:Description resources whose properties are
 * jp:<key> elements. Nested maps use rdf:parseType='Resource', lists are
 * rdf:Seq containers, null is a reference to rdf:nil and non-string
 * literals carry an XML Schema rdf:datatype. A root that is not a map is
 * wrapped in a j:value property.
 */
class RdfXmlSerializer : public Serializer {
public:
    RdfXmlSerializer() : Serializer("text/xml+rdf") {}

protected:
    std::unique_ptr<EventWriter> createWriter(const Session& session, std::string& out) const override;
};

class RdfXmlParser : public Parser {
public:
    RdfXmlParser() : Parser("text/xml+rdf") {}

    Pojo read(const std::string& input) const override;
};

} // namespace marshal::formats
