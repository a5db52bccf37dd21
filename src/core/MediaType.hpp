#pragma once

#include <map>
#include <string>
#include <vector>

namespace marshal {

/**
 * Media type (e.g. "application/json", "text/xml+rdf; charset=utf-8").
 *
 * Type and subtype are stored lower-case. The subtype is also split on '+'
 * into sub-types so "text/xml+rdf" has sub-types {"xml", "rdf"}.
 *
 * A MediaType containing '*' wildcards is used as a range: match() scores
 * how specifically the range matches a concrete media type.
 */
class MediaType {
public:
    MediaType() = default;
    MediaType(const std::string& type, const std::string& subType,
              std::map<std::string, std::string> parameters = {});

    /**
     * Parse "type/subtype[; key=value]*"
     * Throws std::invalid_argument on malformed input
     */
    static MediaType parse(const std::string& str);

    // Getters
    const std::string& getType() const { return m_type; }
    const std::string& getSubType() const { return m_subType; }
    const std::vector<std::string>& getSubTypes() const { return m_subTypes; }
    const std::map<std::string, std::string>& getParameters() const { return m_parameters; }
    std::string getParameter(const std::string& name) const;

    bool empty() const { return m_type.empty(); }
    bool hasSubType(const std::string& subType) const;
    bool isWildcard() const { return m_type == "*" || m_subType == "*"; }

    /**
     * Score this media range against a concrete media type.
     *
     * Returns 0 when there is no match. Otherwise a positive score where an
     * exact subtype beats a partial sub-type match, an exact type beats '*',
     * and each matching parameter adds one. A full wildcard range scores 1.
     */
    int match(const MediaType& target) const;

    /**
     * "type/subtype" followed by ";key=value" for each parameter
     */
    std::string toString() const;

    bool operator==(const MediaType& other) const;
    bool operator!=(const MediaType& other) const { return !(*this == other); }

private:
    std::string m_type;
    std::string m_subType;
    std::vector<std::string> m_subTypes;
    std::map<std::string, std::string> m_parameters;
};

using MediaRange = MediaType;

} // namespace marshal
