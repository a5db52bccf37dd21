#include "formats/RdfXmlSerializer.hpp"
#include "core/Errors.hpp"
#include "formats/DocumentBuilder.hpp"
#include "formats/XmlUtil.hpp"

namespace marshal::formats {

namespace {

const std::string RDF_NS = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
const std::string XSD_NS = "http://www.w3.org/2001/XMLSchema#";
const std::string BEAN_PROPERTY_NS = "urn:marshal:property:";
const std::string VALUE_NS = "urn:marshal:value:";
const std::string PROPERTY_PREFIX = "jp:";
const std::string ROOT_VALUE = "j:value";

class RdfXmlWriter : public DocumentBuilder {
public:
    RdfXmlWriter(const Session& session, std::string& out)
        : DocumentBuilder(session, out)
        , m_indent(session.getOptions().useWhitespace)
    {}

protected:
    void render(const Pojo& document, std::string& out) override {
        out += "<rdf:RDF xmlns:rdf='" + RDF_NS + "' xmlns:j='" + VALUE_NS +
               "' xmlns:jp='" + BEAN_PROPERTY_NS + "'>";
        newline(out, 1);
        out += "<rdf:Description>";
        if (document.isMap()) {
            writeProperties(out, document.asMap(), 2);
        } else {
            newline(out, 2);
            writeProperty(out, ROOT_VALUE, document, 2);
        }
        newline(out, 1);
        out += "</rdf:Description>";
        newline(out, 0);
        out += "</rdf:RDF>";
    }

private:
    void writeProperties(std::string& out, const PojoMap& map, int level) {
        for (const auto& [key, item] : map) {
            newline(out, level);
            writeProperty(out, PROPERTY_PREFIX + xml::encodeName(key), item, level);
        }
    }

    /**
     * Property or rdf:li element holding one value
     */
    void writeProperty(std::string& out, const std::string& name, const Pojo& value, int level) {
        out += "<" + name;
        if (value.isNull()) {
            out += " rdf:resource='" + RDF_NS + "nil'/>";
            return;
        }
        if (value.isMap()) {
            out += " rdf:parseType='Resource'";
            if (value.asMap().empty()) {
                out += "/>";
                return;
            }
            out += ">";
            writeProperties(out, value.asMap(), level + 1);
            newline(out, level);
        } else if (value.isList()) {
            out += ">";
            newline(out, level + 1);
            out += "<rdf:Seq>";
            for (const auto& item : value.asList()) {
                newline(out, level + 2);
                writeProperty(out, "rdf:li", item, level + 2);
            }
            newline(out, level + 1);
            out += "</rdf:Seq>";
            newline(out, level);
        } else {
            if (value.isBool()) {
                out += " rdf:datatype='" + XSD_NS + "boolean'";
            } else if (value.isInt()) {
                out += " rdf:datatype='" + XSD_NS + "integer'";
            } else if (value.isDouble()) {
                out += " rdf:datatype='" + XSD_NS + "double'";
            }
            out += ">" + xml::escapeText(xml::scalarText(value));
        }
        out += "</" + name + ">";
    }

    void newline(std::string& out, int level) const {
        if (m_indent) {
            out += "\n" + std::string(static_cast<size_t>(level) * 2, ' ');
        }
    }

    bool m_indent;
};

Pojo readProperty(const xml::ptree& element);

Pojo readResource(const xml::ptree& element) {
    PojoMap entries;
    for (const auto& [name, child] : element) {
        if (!xml::isElement(name)) continue;
        if (name.compare(0, PROPERTY_PREFIX.size(), PROPERTY_PREFIX) != 0) {
            throw ParseError("Unexpected RDF property <" + name + ">");
        }
        entries.put(xml::decodeName(name.substr(PROPERTY_PREFIX.size())), readProperty(child));
    }
    return Pojo::map(std::move(entries));
}

Pojo readProperty(const xml::ptree& element) {
    if (auto resource = xml::attribute(element, "rdf:resource")) {
        if (*resource == RDF_NS + "nil") {
            return Pojo();
        }
        return Pojo(*resource);
    }
    if (auto parseType = xml::attribute(element, "rdf:parseType")) {
        if (*parseType != "Resource") {
            throw ParseError("Unsupported rdf:parseType '" + *parseType + "'");
        }
        return readResource(element);
    }

    for (const auto& [name, child] : element) {
        if (name == "rdf:Seq" || name == "rdf:Bag") {
            PojoList items;
            for (const auto& [itemName, item] : child) {
                if (itemName == "rdf:li") {
                    items.push_back(readProperty(item));
                }
            }
            return Pojo::list(std::move(items));
        }
        if (name == "rdf:Description") {
            return readResource(child);
        }
    }

    std::string text = xml::decodeText(element.data());
    if (auto datatype = xml::attribute(element, "rdf:datatype")) {
        if (*datatype == XSD_NS + "boolean") {
            if (text == "true") return Pojo(true);
            if (text == "false") return Pojo(false);
            throw ParseError("Invalid boolean '" + text + "'");
        }
        if (*datatype == XSD_NS + "integer" || *datatype == XSD_NS + "double") {
            return xml::parseNumber(text);
        }
    }
    return Pojo(text);
}

} // namespace

std::unique_ptr<EventWriter> RdfXmlSerializer::createWriter(const Session& session, std::string& out) const {
    return std::make_unique<RdfXmlWriter>(session, out);
}

Pojo RdfXmlParser::read(const std::string& input) const {
    auto document = xml::readDocument(input);
    const auto& root = xml::rootElement(document);
    if (root.first != "rdf:RDF") {
        throw ParseError("Expected <rdf:RDF> root but found <" + root.first + ">");
    }

    auto description = root.second.find("rdf:Description");
    if (description == root.second.not_found()) {
        throw ParseError("RDF document has no rdf:Description");
    }
    const auto& resource = description->second;
    auto value = resource.find(ROOT_VALUE);
    if (value != resource.not_found()) {
        return readProperty(value->second);
    }
    return readResource(resource);
}

} // namespace marshal::formats
