#include "formats/UonSerializer.hpp"
#include "core/Errors.hpp"
#include "core/StringConvertibility.hpp"
#include <cctype>

namespace marshal::formats {

namespace {

bool isSpecial(char c) {
    return c == '(' || c == ')' || c == ',' || c == '=' || c == '~' || c == '\'';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/**
 * Integer or decimal number, optional sign and exponent
 */
bool looksNumeric(const std::string& s) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
    size_t digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++digits; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++digits; }
    }
    if (digits == 0) return false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
        size_t expDigits = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) { ++i; ++expDigits; }
        if (expDigits == 0) return false;
    }
    return i == s.size();
}

} // namespace

// =============================================================================
// UonWriter
// =============================================================================

UonWriter::UonWriter(const Session& session, std::string& out)
    : EventWriter(session)
    , m_out(out)
    , m_indent(session.getOptions().useWhitespace)
{}

void UonWriter::onEvent(const NodeEvent& event) {
    switch (event.type) {
        case NodeEventType::EnterMap:
            m_out += "(";
            m_frames.push_back(Frame{});
            break;
        case NodeEventType::EnterSequence:
            m_out += "@(";
            m_frames.push_back(Frame{});
            break;
        case NodeEventType::ExitMap:
        case NodeEventType::ExitSequence: {
            bool empty = m_frames.back().first;
            m_frames.pop_back();
            if (!empty) newline(m_frames.size());
            m_out += ")";
            break;
        }
        case NodeEventType::MapEntry:
            separator();
            m_out += event.value.isNull() ? "null" : stringToken(event.value.getString());
            m_out += "=";
            break;
        case NodeEventType::SequenceElement:
            separator();
            break;
        case NodeEventType::Scalar:
            m_out += scalarToken(event.value);
            break;
        case NodeEventType::Null:
            m_out += "null";
            break;
        case NodeEventType::RecursionDetected:
            checkRecursion(event);
            m_out += "null";
            break;
    }
}

void UonWriter::separator() {
    Frame& frame = m_frames.back();
    if (!frame.first) {
        m_out += ",";
    }
    frame.first = false;
    newline(m_frames.size());
}

void UonWriter::newline(size_t level) {
    if (m_indent) {
        m_out += "\n" + std::string(level * 2, ' ');
    }
}

std::string UonWriter::scalarToken(const Pojo& value) {
    if (value.isNull()) return "null";
    if (value.isBool()) return value.getBool() ? "true" : "false";
    if (value.isInt()) return std::to_string(value.getInt());
    if (value.isDouble()) return StringConvertibility::formatDouble(value.getDouble());
    return stringToken(value.getString());
}

std::string UonWriter::stringToken(const std::string& value) {
    bool quote = value.empty() || value == "null" || value == "true" || value == "false" ||
                 looksNumeric(value) || value[0] == '@' || isSpace(value.front()) ||
                 isSpace(value.back());
    for (char c : value) {
        if (isSpecial(c)) {
            quote = true;
            break;
        }
    }
    if (!quote) {
        return value;
    }

    std::string result = "'";
    for (char c : value) {
        if (c == '\'' || c == '~') {
            result += '~';
        }
        result += c;
    }
    result += "'";
    return result;
}

// =============================================================================
// UonReader
// =============================================================================

UonReader::UonReader(const std::string& input)
    : m_input(input)
{}

Pojo UonReader::readAll() {
    Pojo value = readValue();
    skipWhitespace();
    if (m_pos != m_input.size()) {
        fail("Unexpected trailing content");
    }
    return value;
}

Pojo UonReader::readValue() {
    skipWhitespace();
    if (m_pos >= m_input.size()) {
        fail("Unexpected end of input");
    }
    char c = m_input[m_pos];
    if (c == '(') {
        return readMap();
    }
    if (c == '@' && m_pos + 1 < m_input.size() && m_input[m_pos + 1] == '(') {
        return readList();
    }
    if (c == '\'') {
        return Pojo(readQuoted());
    }
    return readBare();
}

Pojo UonReader::readMap() {
    expect('(');
    PojoMap entries;
    skipWhitespace();
    if (m_pos < m_input.size() && m_input[m_pos] == ')') {
        ++m_pos;
        return Pojo::map(std::move(entries));
    }
    while (true) {
        Pojo key = readValue();
        if (!key.isNull() && !key.isString()) {
            key = Pojo(UonWriter::scalarToken(key));
        }
        skipWhitespace();
        expect('=');
        Pojo value = readValue();
        entries.put(key, value);
        skipWhitespace();
        if (m_pos < m_input.size() && m_input[m_pos] == ',') {
            ++m_pos;
            continue;
        }
        expect(')');
        return Pojo::map(std::move(entries));
    }
}

Pojo UonReader::readList() {
    expect('@');
    expect('(');
    PojoList items;
    skipWhitespace();
    if (m_pos < m_input.size() && m_input[m_pos] == ')') {
        ++m_pos;
        return Pojo::list(std::move(items));
    }
    while (true) {
        items.push_back(readValue());
        skipWhitespace();
        if (m_pos < m_input.size() && m_input[m_pos] == ',') {
            ++m_pos;
            continue;
        }
        expect(')');
        return Pojo::list(std::move(items));
    }
}

std::string UonReader::readQuoted() {
    expect('\'');
    std::string result;
    while (m_pos < m_input.size()) {
        char c = m_input[m_pos++];
        if (c == '~') {
            if (m_pos >= m_input.size()) {
                fail("Dangling escape character");
            }
            result += m_input[m_pos++];
        } else if (c == '\'') {
            return result;
        } else {
            result += c;
        }
    }
    fail("Unterminated quoted string");
}

Pojo UonReader::readBare() {
    std::string token;
    while (m_pos < m_input.size()) {
        char c = m_input[m_pos];
        if (c == ',' || c == ')' || c == '=' || c == '(') {
            break;
        }
        if (c == '~') {
            ++m_pos;
            if (m_pos >= m_input.size()) {
                fail("Dangling escape character");
            }
            c = m_input[m_pos];
        }
        token += c;
        ++m_pos;
    }
    while (!token.empty() && isSpace(token.back())) {
        token.pop_back();
    }

    if (token.empty()) fail("Expected a value");
    if (token == "null") return Pojo();
    if (token == "true") return Pojo(true);
    if (token == "false") return Pojo(false);
    if (looksNumeric(token)) {
        try {
            if (token.find_first_of(".eE") == std::string::npos) {
                return Pojo(static_cast<int64_t>(std::stoll(token)));
            }
            return Pojo(std::stod(token));
        } catch (const std::out_of_range&) {
            // Beyond int64 / double range: keep the text
            return Pojo(token);
        }
    }
    return Pojo(token);
}

void UonReader::skipWhitespace() {
    while (m_pos < m_input.size() && isSpace(m_input[m_pos])) {
        ++m_pos;
    }
}

void UonReader::expect(char c) {
    if (m_pos >= m_input.size() || m_input[m_pos] != c) {
        fail(std::string("Expected '") + c + "'");
    }
    ++m_pos;
}

void UonReader::fail(const std::string& message) const {
    throw ParseError("Invalid UON at position " + std::to_string(m_pos) + ": " + message);
}

// =============================================================================
// UonSerializer / UonParser
// =============================================================================

std::unique_ptr<EventWriter> UonSerializer::createWriter(const Session& session, std::string& out) const {
    return std::make_unique<UonWriter>(session, out);
}

Pojo UonParser::read(const std::string& input) const {
    return UonReader(input).readAll();
}

} // namespace marshal::formats
