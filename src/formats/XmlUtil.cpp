#include "formats/XmlUtil.hpp"
#include "core/Errors.hpp"
#include "core/StringConvertibility.hpp"
#include <boost/property_tree/xml_parser.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace marshal::formats::xml {

namespace {

std::string hexEscape(unsigned char c) {
    std::ostringstream oss;
    oss << "_x" << std::uppercase << std::hex << std::setw(4) << std::setfill('0')
        << static_cast<unsigned>(c) << "_";
    return oss.str();
}

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

/**
 * Whether an _xHHHH_ escape starts at position i
 */
bool isEscapeAt(const std::string& s, size_t i) {
    if (i + 7 > s.size() || s[i] != '_' || s[i + 1] != 'x' || s[i + 6] != '_') {
        return false;
    }
    return isHex(s[i + 2]) && isHex(s[i + 3]) && isHex(s[i + 4]) && isHex(s[i + 5]);
}

/**
 * Append a BMP code point as UTF-8
 */
void appendUtf8(std::string& out, unsigned codePoint) {
    if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

/**
 * Escapes up to _x00FF_ are single bytes, as hexEscape writes them.
 * Higher escapes are code points and decode to UTF-8.
 */
std::string decodeEscapes(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (isEscapeAt(s, i)) {
            unsigned value = static_cast<unsigned>(std::stoul(s.substr(i + 2, 4), nullptr, 16));
            if (value <= 0xFF) {
                result += static_cast<char>(value);
            } else if (value >= 0xD800 && value <= 0xDFFF) {
                throw ParseError("Invalid escape '" + s.substr(i, 7) + "': surrogate code point");
            } else {
                appendUtf8(result, value);
            }
            i += 6;
        } else {
            result += s[i];
        }
    }
    return result;
}

} // namespace

std::string escapeText(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            default:
                if ((c < 0x20 && c != '\t' && c != '\n') || isEscapeAt(text, i)) {
                    result += hexEscape(c);
                } else {
                    result += static_cast<char>(c);
                }
        }
    }
    return result;
}

std::string escapeAttribute(const std::string& text) {
    std::string result = escapeText(text);
    std::string quoted;
    quoted.reserve(result.size());
    for (char c : result) {
        if (c == '\'') quoted += "&apos;";
        else if (c == '"') quoted += "&quot;";
        else quoted += c;
    }
    return quoted;
}

std::string decodeText(const std::string& text) {
    return decodeEscapes(text);
}

std::string encodeName(const Pojo& key) {
    if (key.isNull()) {
        return "_x0000_";
    }
    const std::string& name = key.getString();
    if (name.empty()) {
        return "_x_";
    }

    std::string result;
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        bool valid = std::isalpha(c) || c == '_' ||
                     (i > 0 && (std::isdigit(c) || c == '-' || c == '.'));
        if (c >= 0x80 || !valid || (c == '_' && i + 1 < name.size() && name[i + 1] == 'x')) {
            result += hexEscape(c);
        } else {
            result += static_cast<char>(c);
        }
    }
    return result;
}

Pojo decodeName(const std::string& name) {
    if (name == "_x0000_") {
        return Pojo();
    }
    if (name == "_x_") {
        return Pojo(std::string());
    }
    return Pojo(decodeEscapes(name));
}

ptree readDocument(const std::string& input) {
    ptree document;
    std::istringstream in(input);
    try {
        boost::property_tree::read_xml(in, document,
                                       boost::property_tree::xml_parser::no_comments);
    } catch (const boost::property_tree::xml_parser_error& e) {
        throw ParseError(std::string("Invalid XML: ") + e.what());
    }
    return document;
}

std::optional<std::string> attribute(const ptree& element, const std::string& name) {
    auto attrs = element.find("<xmlattr>");
    if (attrs == element.not_found()) {
        return std::nullopt;
    }
    auto it = attrs->second.find(name);
    if (it == attrs->second.not_found()) {
        return std::nullopt;
    }
    return decodeText(it->second.data());
}

bool isElement(const std::string& childName) {
    return childName != "<xmlattr>" && childName != "<xmlcomment>" && childName != "<xmltext>";
}

bool hasChildElements(const ptree& element) {
    for (const auto& child : element) {
        if (isElement(child.first)) {
            return true;
        }
    }
    return false;
}

const ptree::value_type& rootElement(const ptree& document) {
    const ptree::value_type* root = nullptr;
    for (const auto& child : document) {
        if (!isElement(child.first)) continue;
        if (root) {
            throw ParseError("XML document has more than one root element");
        }
        root = &child;
    }
    if (!root) {
        throw ParseError("XML document has no root element");
    }
    return *root;
}

Pojo parseNumber(const std::string& text) {
    try {
        size_t pos = 0;
        if (text.find_first_of(".eEn") == std::string::npos) {
            long long value = std::stoll(text, &pos);
            if (pos == text.size()) return Pojo(static_cast<int64_t>(value));
        } else {
            double value = std::stod(text, &pos);
            if (pos == text.size()) return Pojo(value);
        }
    } catch (const std::exception& e) {
        throw ParseError("Invalid number '" + text + "': " + e.what());
    }
    throw ParseError("Invalid number '" + text + "'");
}

std::string scalarText(const Pojo& value) {
    if (value.isBool()) return value.getBool() ? "true" : "false";
    if (value.isInt()) return std::to_string(value.getInt());
    if (value.isDouble()) return StringConvertibility::formatDouble(value.getDouble());
    if (value.isString()) return value.getString();
    return "";
}

} // namespace marshal::formats::xml
