#include "formats/HtmlSerializer.hpp"
#include "core/Errors.hpp"
#include "formats/DocumentBuilder.hpp"
#include "formats/XmlUtil.hpp"

namespace marshal::formats {

namespace {

class HtmlWriter : public DocumentBuilder {
public:
    HtmlWriter(const Session& session, std::string& out)
        : DocumentBuilder(session, out)
        , m_indent(session.getOptions().useWhitespace)
    {}

protected:
    void render(const Pojo& document, std::string& out) override {
        if (document.isString()) {
            out += "<string>" + xml::escapeText(document.getString()) + "</string>";
        } else {
            writeValue(out, document, 0);
        }
    }

private:
    void writeValue(std::string& out, const Pojo& value, int level) {
        if (value.isNull()) {
            out += "<null/>";
        } else if (value.isMap()) {
            writeTable(out, value.asMap(), level);
        } else if (value.isList()) {
            writeList(out, value.asList(), level);
        } else if (value.isBool()) {
            out += "<boolean>" + xml::scalarText(value) + "</boolean>";
        } else if (value.isNumber()) {
            out += "<number>" + xml::scalarText(value) + "</number>";
        } else {
            out += xml::escapeText(value.getString());
        }
    }

    void writeTable(std::string& out, const PojoMap& map, int level) {
        out += "<table>";
        newline(out, level + 1);
        out += "<tr><th>key</th><th>value</th></tr>";
        for (const auto& [key, item] : map) {
            newline(out, level + 1);
            out += "<tr><td>";
            writeValue(out, key, level + 2);
            out += "</td><td>";
            writeValue(out, item, level + 2);
            out += "</td></tr>";
        }
        newline(out, level);
        out += "</table>";
    }

    void writeList(std::string& out, const PojoList& list, int level) {
        out += "<ul>";
        for (const auto& item : list) {
            newline(out, level + 1);
            out += "<li>";
            writeValue(out, item, level + 2);
            out += "</li>";
        }
        newline(out, level);
        out += "</ul>";
    }

    void newline(std::string& out, int level) const {
        if (m_indent) {
            out += "\n" + std::string(static_cast<size_t>(level) * 2, ' ');
        }
    }

    bool m_indent;
};

Pojo readNode(const std::string& name, const xml::ptree& element);

/**
 * Value held by a <td> or <li>
 */
Pojo readCell(const xml::ptree& cell) {
    for (const auto& [childName, child] : cell) {
        if (xml::isElement(childName)) {
            return readNode(childName, child);
        }
    }
    return Pojo(xml::decodeText(cell.data()));
}

Pojo readNode(const std::string& name, const xml::ptree& element) {
    if (name == "null") {
        return Pojo();
    }
    if (name == "string") {
        return Pojo(xml::decodeText(element.data()));
    }
    if (name == "number") {
        return xml::parseNumber(xml::decodeText(element.data()));
    }
    if (name == "boolean") {
        std::string text = element.data();
        if (text == "true") return Pojo(true);
        if (text == "false") return Pojo(false);
        throw ParseError("Invalid boolean '" + text + "'");
    }
    if (name == "ul") {
        PojoList items;
        for (const auto& [childName, child] : element) {
            if (childName == "li") {
                items.push_back(readCell(child));
            }
        }
        return Pojo::list(std::move(items));
    }
    if (name == "table") {
        PojoMap entries;
        for (const auto& [rowName, row] : element) {
            if (rowName != "tr") continue;
            std::vector<const xml::ptree*> cells;
            for (const auto& [cellName, cell] : row) {
                if (cellName == "td") cells.push_back(&cell);
            }
            if (cells.empty()) continue;  // header row
            if (cells.size() != 2) {
                throw ParseError("Table row must have a key and a value cell");
            }
            Pojo key = readCell(*cells[0]);
            if (!key.isNull() && !key.isString()) {
                key = Pojo(xml::scalarText(key));
            }
            entries.put(key, readCell(*cells[1]));
        }
        return Pojo::map(std::move(entries));
    }
    throw ParseError("Unexpected HTML element <" + name + ">");
}

} // namespace

std::unique_ptr<EventWriter> HtmlSerializer::createWriter(const Session& session, std::string& out) const {
    return std::make_unique<HtmlWriter>(session, out);
}

Pojo HtmlParser::read(const std::string& input) const {
    auto document = xml::readDocument(input);
    const auto& root = xml::rootElement(document);
    return readNode(root.first, root.second);
}

} // namespace marshal::formats
