#include "core/SessionOptions.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace marshal {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    throw std::invalid_argument("Invalid boolean for '" + key + "': " + value);
}

int parseInt(const std::string& key, const std::string& value) {
    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for '" + key + "': " + value);
    }
    if (pos != value.size() || result < 0) {
        throw std::invalid_argument("Invalid integer for '" + key + "': " + value);
    }
    return result;
}

} // namespace

void SessionOptions::apply(const std::string& key, const std::string& value) {
    if (key == "detectRecursions") detectRecursions = parseBool(key, value);
    else if (key == "ignoreRecursions") ignoreRecursions = parseBool(key, value);
    else if (key == "maxDepth") maxDepth = parseInt(key, value);
    else if (key == "maxSwapDepth") maxSwapDepth = parseInt(key, value);
    else if (key == "trimNullProperties") trimNullProperties = parseBool(key, value);
    else if (key == "addTypeProperties") addTypeProperties = parseBool(key, value);
    else if (key == "ignoreUnknownProperties") ignoreUnknownProperties = parseBool(key, value);
    else if (key == "lenient") lenient = parseBool(key, value);
    else if (key == "useWhitespace") useWhitespace = parseBool(key, value);
    else if (key == "mediaType") mediaType = value;
    else LOG_WARN("Unknown option ignored: " + key);
}

SessionOptions SessionOptions::loadFromFile(const std::string& path) {
    SessionOptions options;
    options.applyFile(path);
    return options;
}

void SessionOptions::applyFile(const std::string& file) {
    std::string path = file;
    if (!path.empty() && path[0] == '@') path = path.substr(1);

    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    int count = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        apply(trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
        ++count;
    }
    LOG_DEBUG("Loaded " + std::to_string(count) + " options from " + path);
}

} // namespace marshal
