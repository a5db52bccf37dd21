#include "formats/FormatRegistry.hpp"
#include "formats/HtmlSerializer.hpp"
#include "formats/JsonSerializer.hpp"
#include "formats/MsgPackSerializer.hpp"
#include "formats/RdfXmlSerializer.hpp"
#include "formats/UonSerializer.hpp"
#include "formats/UrlEncodingSerializer.hpp"
#include "formats/XmlSerializer.hpp"
#include "util/Logger.hpp"
#include <mutex>
#include <set>
#include <stdexcept>

namespace marshal::formats {

FormatRegistry& FormatRegistry::instance() {
    static FormatRegistry registry;
    static std::once_flag initialized;
    std::call_once(initialized, [] { registry.registerDefaults(); });
    return registry;
}

void FormatRegistry::registerDefaults() {
    registerSerializer(std::make_shared<JsonSerializer>());
    registerParser(std::make_shared<JsonParser>());
    registerSerializer(std::make_shared<XmlSerializer>());
    registerParser(std::make_shared<XmlParser>());
    registerSerializer(std::make_shared<HtmlSerializer>());
    registerParser(std::make_shared<HtmlParser>());
    registerSerializer(std::make_shared<UonSerializer>());
    registerParser(std::make_shared<UonParser>());
    registerSerializer(std::make_shared<UrlEncodingSerializer>());
    registerParser(std::make_shared<UrlEncodingParser>());
    registerSerializer(std::make_shared<MsgPackSerializer>());
    registerParser(std::make_shared<MsgPackParser>());
    registerSerializer(std::make_shared<RdfXmlSerializer>());
    registerParser(std::make_shared<RdfXmlParser>());
}

void FormatRegistry::registerSerializer(SerializerPtr serializer) {
    if (!serializer) {
        throw std::invalid_argument("Cannot register a null serializer");
    }
    std::string key = keyOf(serializer->getMediaType());
    LOG_DEBUG("Registered serializer: " + key);
    m_serializers[key] = std::move(serializer);
}

void FormatRegistry::registerParser(ParserPtr parser) {
    if (!parser) {
        throw std::invalid_argument("Cannot register a null parser");
    }
    std::string key = keyOf(parser->getMediaType());
    LOG_DEBUG("Registered parser: " + key);
    m_parsers[key] = std::move(parser);
}

SerializerPtr FormatRegistry::getSerializer(const MediaType& mediaType) const {
    auto it = m_serializers.find(keyOf(mediaType));
    return it != m_serializers.end() ? it->second : nullptr;
}

ParserPtr FormatRegistry::getParser(const MediaType& mediaType) const {
    auto it = m_parsers.find(keyOf(mediaType));
    return it != m_parsers.end() ? it->second : nullptr;
}

std::vector<std::string> FormatRegistry::getMediaTypes() const {
    std::set<std::string> types;
    for (const auto& [key, serializer] : m_serializers) types.insert(key);
    for (const auto& [key, parser] : m_parsers) types.insert(key);
    return std::vector<std::string>(types.begin(), types.end());
}

MediaType FormatRegistry::resolveFormatName(const std::string& name) {
    static const std::unordered_map<std::string, std::string> shortNames = {
        {"json", "application/json"},
        {"xml", "text/xml"},
        {"html", "text/html"},
        {"uon", "text/uon"},
        {"urlencoding", "application/x-www-form-urlencoded"},
        {"msgpack", "octal/msgpack"},
        {"rdf", "text/xml+rdf"},
    };
    auto it = shortNames.find(name);
    if (it != shortNames.end()) {
        return MediaType::parse(it->second);
    }
    if (name.find('/') == std::string::npos) {
        throw std::invalid_argument("Unknown format: " + name);
    }
    return MediaType::parse(name);
}

std::string FormatRegistry::keyOf(const MediaType& mediaType) {
    return mediaType.getType() + "/" + mediaType.getSubType();
}

} // namespace marshal::formats
