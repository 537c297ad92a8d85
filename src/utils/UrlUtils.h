#pragma once
#include <string>

// Percent-encoding helpers for building backend request targets.
namespace UrlUtils {
    /**
     * @brief Escape a value for use inside a query string
     *
     * Unreserved characters (A-Z a-z 0-9 - _ . ~) pass through, space becomes
     * '+', every other byte becomes %XX.
     */
    std::string queryEscape(const std::string& value);

    /**
     * @brief Escape a single path segment
     *
     * Like queryEscape, but space becomes %20 and $ & + = : @ are kept.
     * '/', ',' and ';' are escaped.
     */
    std::string pathEscape(const std::string& segment);

    /**
     * @brief Escape a slash-separated path segment by segment, keeping '/'
     */
    std::string escapePath(const std::string& path);

    // Drops at most one leading c.
    std::string trimPrefix(const std::string& s, char c);
    std::string trim(const std::string& s, char c);
}
