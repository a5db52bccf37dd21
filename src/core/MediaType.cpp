#include "core/MediaType.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace marshal {

static std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) ++start;
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(start, end - start);
}

static std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

static std::vector<std::string> splitSubTypes(const std::string& subType) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= subType.size()) {
        size_t plus = subType.find('+', start);
        if (plus == std::string::npos) plus = subType.size();
        std::string part = subType.substr(start, plus - start);
        if (!part.empty()) {
            parts.push_back(part);
        }
        start = plus + 1;
    }
    return parts;
}

MediaType::MediaType(const std::string& type, const std::string& subType,
                     std::map<std::string, std::string> parameters)
    : m_type(toLower(trim(type)))
    , m_subType(toLower(trim(subType)))
    , m_subTypes(splitSubTypes(m_subType))
    , m_parameters(std::move(parameters))
{
    if (m_type.empty() || m_subType.empty()) {
        throw std::invalid_argument("Invalid media type: '" + type + "/" + subType + "'");
    }
}

MediaType MediaType::parse(const std::string& str) {
    std::string value = trim(str);
    std::string head = value;
    std::map<std::string, std::string> params;

    size_t semi = value.find(';');
    if (semi != std::string::npos) {
        head = trim(value.substr(0, semi));
        std::string rest = value.substr(semi + 1);
        size_t start = 0;
        while (start <= rest.size()) {
            size_t next = rest.find(';', start);
            if (next == std::string::npos) next = rest.size();
            std::string param = trim(rest.substr(start, next - start));
            if (!param.empty()) {
                size_t eq = param.find('=');
                if (eq == std::string::npos) {
                    throw std::invalid_argument("Invalid media type parameter: '" + param + "'");
                }
                std::string key = toLower(trim(param.substr(0, eq)));
                std::string val = trim(param.substr(eq + 1));
                if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
                    val = val.substr(1, val.size() - 2);
                }
                params[key] = val;
            }
            start = next + 1;
        }
    }

    size_t slash = head.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= head.size()) {
        throw std::invalid_argument("Invalid media type: '" + str + "'");
    }

    return MediaType(head.substr(0, slash), head.substr(slash + 1), std::move(params));
}

std::string MediaType::getParameter(const std::string& name) const {
    auto it = m_parameters.find(toLower(name));
    return it != m_parameters.end() ? it->second : "";
}

bool MediaType::hasSubType(const std::string& subType) const {
    std::string st = toLower(subType);
    return std::find(m_subTypes.begin(), m_subTypes.end(), st) != m_subTypes.end();
}

int MediaType::match(const MediaType& target) const {
    if (empty() || target.empty()) return 0;

    int score = 1;

    if (m_type != "*") {
        if (m_type != target.m_type) return 0;
        score += 10;
    }

    if (m_subType != "*") {
        if (m_subType == target.m_subType) {
            score += 100;
        } else {
            // "*/json" style partial match: every sub-type of the range must
            // appear among the target's sub-types
            for (const auto& st : m_subTypes) {
                if (!target.hasSubType(st)) return 0;
            }
            score += 50;
        }
    }

    for (const auto& [key, value] : m_parameters) {
        auto it = target.m_parameters.find(key);
        if (it == target.m_parameters.end() || it->second != value) return 0;
        score += 1;
    }

    return score;
}

std::string MediaType::toString() const {
    if (empty()) return "";
    std::string result = m_type + "/" + m_subType;
    for (const auto& [key, value] : m_parameters) {
        result += ";" + key + "=" + value;
    }
    return result;
}

bool MediaType::operator==(const MediaType& other) const {
    return m_type == other.m_type &&
           m_subType == other.m_subType &&
           m_parameters == other.m_parameters;
}

} // namespace marshal
