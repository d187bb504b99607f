#ifndef RETICLE_STRING_UTILS_H
#define RETICLE_STRING_UTILS_H

#include <string>
#include <vector>

namespace reticle {
namespace utils {

/**
 * @brief String helpers shared by label and title matching
 *
 * All functions operate on UTF-8 byte strings. Case folding is ASCII only;
 * non-ASCII bytes pass through unchanged.
 */
class StringUtils {
public:
    /**
     * @brief Replace all occurrences of a substring with another string
     * @param str Source string
     * @param from Substring to find (must not be empty)
     * @param to Replacement string (can be empty)
     * @return Modified string with all replacements made
     */
    static std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

    /**
     * @brief Remove leading and trailing ASCII whitespace
     */
    static std::string trim(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @return Parts in order; empty vector for an empty input
     */
    static std::vector<std::string> split(const std::string& str, const std::string& delimiter);

    static bool contains(const std::string& haystack, const std::string& needle);

    static std::string toLowerCase(const std::string& str);

    static std::string join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace runs of whitespace (including NBSP and narrow NBSP)
     *        with a single space and trim the result
     */
    static std::string collapseWhitespace(const std::string& str);

    /**
     * @brief Canonical form used for every label/title comparison
     *
     * Collapses whitespace, trims and lower-cases. Two strings that render
     * identically on screen but differ in spacing characters compare equal.
     */
    static std::string normalizeText(const std::string& str);

    /**
     * @brief Lower-cased alphanumeric words longer than minLength
     */
    static std::vector<std::string> significantTokens(const std::string& str, size_t minLength = 2);

private:
    static bool isWhitespace(char c);
};

} // namespace utils
} // namespace reticle

#endif // RETICLE_STRING_UTILS_H
