#include "core/BuiltinTypes.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace marshal {

Locale::Locale(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == '_') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);

    if (parts.size() > 3 || parts[0].empty()) {
        throw std::invalid_argument("Invalid locale: '" + text + "'");
    }
    language = parts[0];
    if (parts.size() > 1) country = parts[1];
    if (parts.size() > 2) variant = parts[2];
}

std::string Locale::toString() const {
    std::string result = language;
    if (!country.empty() || !variant.empty()) {
        result += "_" + country;
    }
    if (!variant.empty()) {
        result += "_" + variant;
    }
    return result;
}

TimeZone TimeZone::forName(const std::string& id) {
    bool blank = std::all_of(id.begin(), id.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        throw std::invalid_argument("Empty time zone id");
    }
    return TimeZone(id);
}

CharStream::CharStream(std::shared_ptr<std::istream> input)
    : m_input(std::move(input))
{
    if (!m_input) {
        throw std::invalid_argument("CharStream requires an input stream");
    }
}

std::shared_ptr<CharStream> CharStream::fromString(const std::string& content) {
    return std::make_shared<CharStream>(std::make_shared<std::istringstream>(content));
}

std::string CharStream::readAll() const {
    return std::string(std::istreambuf_iterator<char>(*m_input),
                       std::istreambuf_iterator<char>());
}

std::shared_ptr<ByteStream> ByteStream::fromString(const std::string& content) {
    return std::make_shared<ByteStream>(std::vector<uint8_t>(content.begin(), content.end()));
}

std::string ByteStream::readAll() const {
    return std::string(m_bytes.begin(), m_bytes.end());
}

} // namespace marshal
