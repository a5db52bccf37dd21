#pragma once

#include "core/MediaType.hpp"
#include "formats/Parser.hpp"
#include "formats/Serializer.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace marshal::formats {

/**
 * Serializers and parsers by media type ("type/subtype", parameters ignored)
 *
 * Usage:
 *   FormatRegistry formats;
 *   formats.registerDefaults();
 *   auto json = formats.getSerializer(MediaType::parse("application/json"));
 */
class FormatRegistry {
public:
    FormatRegistry() = default;

    // Non-copyable
    FormatRegistry(const FormatRegistry&) = delete;
    FormatRegistry& operator=(const FormatRegistry&) = delete;

    /**
     * Global instance with the default formats registered
     */
    static FormatRegistry& instance();

    /**
     * Register JSON, XML, HTML, UON, URL-encoding, MessagePack and RDF/XML
     */
    void registerDefaults();

    // === Registration (overwrites an existing entry) ===

    void registerSerializer(SerializerPtr serializer);
    void registerParser(ParserPtr parser);

    // === Lookup ===

    /**
     * Returns nullptr if no serializer handles the media type
     */
    SerializerPtr getSerializer(const MediaType& mediaType) const;

    /**
     * Returns nullptr if no parser handles the media type
     */
    ParserPtr getParser(const MediaType& mediaType) const;

    /**
     * Registered media types, sorted
     */
    std::vector<std::string> getMediaTypes() const;

    /**
     * Resolve a short format name (json, xml, html, uon, urlencoding,
     * msgpack, rdf) or a media type string to a media type
     * Throws std::invalid_argument for unknown names
     */
    static MediaType resolveFormatName(const std::string& name);

private:
    static std::string keyOf(const MediaType& mediaType);

    std::unordered_map<std::string, SerializerPtr> m_serializers;
    std::unordered_map<std::string, ParserPtr> m_parsers;
};

} // namespace marshal::formats
