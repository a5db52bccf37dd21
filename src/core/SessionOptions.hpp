#pragma once

#include <string>

namespace marshal {

/**
 * Per-call settings of a serialize or parse operation
 */
struct SessionOptions {
    bool detectRecursions = false;
    bool ignoreRecursions = false;      // write null instead of failing at a recursion
    int maxDepth = 0;                   // 0 = unbounded
    int maxSwapDepth = 10;
    bool trimNullProperties = true;     // null map values are always kept
    bool addTypeProperties = false;
    bool ignoreUnknownProperties = false;
    bool lenient = false;
    bool useWhitespace = false;

    std::string mediaType;              // default output type for the CLI, may be empty

    /**
     * Apply one key=value setting
     * Unknown keys are logged and ignored
     * Throws std::invalid_argument on a malformed value
     */
    void apply(const std::string& key, const std::string& value);

    /**
     * Load settings from a key=value file ('#' comments, '@' path prefix)
     * Throws std::runtime_error if the file can't be opened
     */
    static SessionOptions loadFromFile(const std::string& path);

    /**
     * Apply a key=value file on top of the current settings
     */
    void applyFile(const std::string& path);
};

} // namespace marshal
