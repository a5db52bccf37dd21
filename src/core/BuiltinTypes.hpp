#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace marshal {

/**
 * Language/country/variant triple, string form "en_US" or "en_US_POSIX"
 */
struct Locale {
    std::string language;
    std::string country;
    std::string variant;

    Locale() = default;

    /**
     * Parse "ll", "ll_CC" or "ll_CC_variant"
     */
    explicit Locale(const std::string& text);

    std::string toString() const;

    bool operator==(const Locale& other) const {
        return language == other.language && country == other.country && variant == other.variant;
    }
};

/**
 * Time zone identified by its canonical id ("UTC", "Europe/Paris")
 */
class TimeZone {
public:
    TimeZone() : m_id("UTC") {}

    /**
     * Throws std::invalid_argument on an empty or blank id
     */
    static TimeZone forName(const std::string& id);

    const std::string& getId() const { return m_id; }

    bool operator==(const TimeZone& other) const { return m_id == other.m_id; }

private:
    explicit TimeZone(std::string id) : m_id(std::move(id)) {}

    std::string m_id;
};

/**
 * Character stream value; serialized as one scalar holding its content
 */
class CharStream {
public:
    explicit CharStream(std::shared_ptr<std::istream> input);

    static std::shared_ptr<CharStream> fromString(const std::string& content);

    /**
     * Drain the remaining characters. The stream is consumed.
     */
    std::string readAll() const;

private:
    std::shared_ptr<std::istream> m_input;
};

/**
 * Byte stream value; serialized as one scalar holding the raw bytes
 */
class ByteStream {
public:
    explicit ByteStream(std::vector<uint8_t> bytes) : m_bytes(std::move(bytes)) {}

    static std::shared_ptr<ByteStream> fromString(const std::string& content);

    const std::vector<uint8_t>& getBytes() const { return m_bytes; }

    std::string readAll() const;

private:
    std::vector<uint8_t> m_bytes;
};

} // namespace marshal
