#pragma once

#include "formats/Parser.hpp"
#include "formats/Serializer.hpp"

namespace marshal::formats {

/**
 * text/html
 *
 * Maps and beans are two-column tables, lists are <ul> lists:
 *   <table><tr><th>key</th><th>value</th></tr><tr><td>name</td><td>John</td></tr></table>
 *   <ul><li>a</li><li><number>1</number></li></ul>
 *
 * Strings are cell text; numbers, booleans and null are tagged so the
 * parser restores their type.
 */
class HtmlSerializer : public Serializer {
public:
    HtmlSerializer() : Serializer("text/html") {}

protected:
    std::unique_ptr<EventWriter> createWriter(const Session& session, std::string& out) const override;
};

class HtmlParser : public Parser {
public:
    HtmlParser() : Parser("text/html") {}

    Pojo read(const std::string& input) const override;
};

} // namespace marshal::formats
