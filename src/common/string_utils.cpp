#include "string_utils.h"
#include "structured_logger.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace reticle {
namespace utils {

namespace {
    // UTF-8 spacing characters that UI toolkits put into labels and titles
    const std::string kNoBreakSpace = "\xC2\xA0";         // U+00A0
    const std::string kNarrowNoBreakSpace = "\xE2\x80\xAF"; // U+202F
    const std::string kThinSpace = "\xE2\x80\x89";          // U+2009
}

std::string StringUtils::replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        RETICLE_LOG_ERROR().message("Empty 'from' parameter in replaceAll");
        return str;
    }

    std::string result = str;
    size_t startPos = 0;
    while ((startPos = result.find(from, startPos)) != std::string::npos) {
        result.replace(startPos, from.length(), to);
        startPos += to.length();
    }
    return result;
}

std::string StringUtils::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> StringUtils::split(const std::string& str, const std::string& delimiter) {
    std::vector<std::string> result;

    if (delimiter.empty()) {
        RETICLE_LOG_ERROR().message("Empty delimiter in split");
        if (!str.empty()) {
            result.push_back(str);
        }
        return result;
    }

    if (str.empty()) {
        return result;
    }

    size_t start = 0;
    size_t end = 0;
    while ((end = str.find(delimiter, start)) != std::string::npos) {
        result.push_back(str.substr(start, end - start));
        start = end + delimiter.length();
    }
    result.push_back(str.substr(start));
    return result;
}

bool StringUtils::contains(const std::string& haystack, const std::string& needle) {
    return !needle.empty() && haystack.find(needle) != std::string::npos;
}

std::string StringUtils::toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& strings, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << strings[i];
    }
    return oss.str();
}

std::string StringUtils::collapseWhitespace(const std::string& str) {
    std::string spaced = replaceAll(str, kNoBreakSpace, " ");
    spaced = replaceAll(spaced, kNarrowNoBreakSpace, " ");
    spaced = replaceAll(spaced, kThinSpace, " ");

    std::string result;
    result.reserve(spaced.size());
    bool pendingSpace = false;
    for (char c : spaced) {
        if (isWhitespace(c)) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(c);
    }
    return result;
}

std::string StringUtils::normalizeText(const std::string& str) {
    return toLowerCase(collapseWhitespace(str));
}

std::vector<std::string> StringUtils::significantTokens(const std::string& str, size_t minLength) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (current.size() > minLength &&
            std::find(tokens.begin(), tokens.end(), current) == tokens.end()) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (unsigned char c : normalizeText(str)) {
        // Bytes >= 0x80 belong to multi-byte UTF-8 letters and are kept
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(c));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

bool StringUtils::isWhitespace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace utils
} // namespace reticle
