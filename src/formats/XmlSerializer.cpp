#include "formats/XmlSerializer.hpp"
#include "core/Errors.hpp"
#include "formats/DocumentBuilder.hpp"
#include "formats/XmlUtil.hpp"

namespace marshal::formats {

namespace {

std::string kindOf(const Pojo& value) {
    if (value.isNull()) return "null";
    if (value.isMap()) return "object";
    if (value.isList()) return "array";
    if (value.isBool()) return "boolean";
    if (value.isNumber()) return "number";
    return "string";
}

class XmlWriter : public DocumentBuilder {
public:
    XmlWriter(const Session& session, std::string& out)
        : DocumentBuilder(session, out)
        , m_indent(session.getOptions().useWhitespace)
    {}

protected:
    void render(const Pojo& document, std::string& out) override {
        writeElement(out, kindOf(document), document, false, 0);
    }

private:
    /**
     * Write one element. typed adds the _type attribute when the element
     * name doesn't already tell the value kind.
     */
    void writeElement(std::string& out, const std::string& name, const Pojo& value,
                      bool typed, int level) {
        std::string kind = kindOf(value);
        out += "<" + name;
        bool needsType = typed && (kind == "null" || kind == "array" || kind == "number" ||
                                   kind == "boolean" || (kind == "object" && value.asMap().empty()));
        if (needsType) {
            out += " _type='" + kind + "'";
        }

        if (value.isNull() || (value.isMap() && value.asMap().empty()) ||
            (value.isList() && value.asList().empty())) {
            out += "/>";
            return;
        }
        out += ">";

        if (value.isMap()) {
            for (const auto& [key, item] : value.asMap()) {
                newline(out, level + 1);
                writeElement(out, xml::encodeName(key), item, true, level + 1);
            }
            newline(out, level);
        } else if (value.isList()) {
            for (const auto& item : value.asList()) {
                newline(out, level + 1);
                writeElement(out, kindOf(item), item, false, level + 1);
            }
            newline(out, level);
        } else {
            out += xml::escapeText(xml::scalarText(value));
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

Pojo readElement(const std::string& name, const xml::ptree& element, bool named);

Pojo readValue(const std::string& kind, const xml::ptree& element) {
    if (kind == "null") {
        return Pojo();
    }
    if (kind == "object") {
        PojoMap entries;
        for (const auto& [childName, child] : element) {
            if (!xml::isElement(childName)) continue;
            entries.put(xml::decodeName(childName), readElement(childName, child, false));
        }
        return Pojo::map(std::move(entries));
    }
    if (kind == "array") {
        PojoList items;
        for (const auto& [childName, child] : element) {
            if (!xml::isElement(childName)) continue;
            items.push_back(readElement(childName, child, true));
        }
        return Pojo::list(std::move(items));
    }
    std::string text = xml::decodeText(element.data());
    if (kind == "number") {
        return xml::parseNumber(text);
    }
    if (kind == "boolean") {
        if (text == "true") return Pojo(true);
        if (text == "false") return Pojo(false);
        throw ParseError("Invalid boolean '" + text + "'");
    }
    if (kind == "string") {
        return Pojo(text);
    }
    throw ParseError("Unknown _type '" + kind + "'");
}

/**
 * named: the element name is the value kind (root and list items)
 */
Pojo readElement(const std::string& name, const xml::ptree& element, bool named) {
    if (auto type = xml::attribute(element, "_type")) {
        return readValue(*type, element);
    }
    if (named && (name == "object" || name == "array" || name == "string" ||
                  name == "number" || name == "boolean" || name == "null")) {
        return readValue(name, element);
    }
    return readValue(xml::hasChildElements(element) ? "object" : "string", element);
}

} // namespace

std::unique_ptr<EventWriter> XmlSerializer::createWriter(const Session& session, std::string& out) const {
    return std::make_unique<XmlWriter>(session, out);
}

Pojo XmlParser::read(const std::string& input) const {
    auto document = xml::readDocument(input);
    const auto& root = xml::rootElement(document);
    return readElement(root.first, root.second, true);
}

} // namespace marshal::formats
