#ifndef RETICLE_IDENTITY_MATCHER_H
#define RETICLE_IDENTITY_MATCHER_H

#include <map>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "../introspection/ui_introspector.h"
#include "../signature/element_signature.h"

namespace reticle {

struct IdentitySettings {
    double minConfidence = 0.6;
    std::map<std::string, std::vector<std::string>> appAliases;  // Normalized names
    std::vector<std::string> systemProcessBlacklist;
    std::vector<std::string> genericTitles;

    static IdentitySettings defaults();
};

/**
 * @brief Title confidence levels, highest first
 */
namespace title_confidence {
    constexpr double kExact = 1.0;
    constexpr double kNormalized = 0.95;
    constexpr double kSegmentSuffix = 0.85;
    constexpr double kSubstring = 0.8;
    constexpr double kGeneric = 0.7;
    constexpr double kMismatch = 0.5;
}

struct IdentityMatch {
    bool matched = false;
    std::optional<WindowInfo> window;
    double confidence = 0.0;
    std::string titleRule;            // exact, normalized, segment_suffix, ...
    int windowsConsidered = 0;
    int windowsWithMatchingApp = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief L1: picks the live window the recording was made in
 */
class IdentityMatcher {
public:
    explicit IdentityMatcher(IdentitySettings settings = IdentitySettings::defaults());

    /**
     * @brief Enumerate live windows and select the best match
     *
     * Only windows of the recorded application are candidates. Blacklisted
     * system processes are never selected. The highest title confidence
     * wins; on a tie the front-most window wins. Introspection errors
     * propagate to the caller.
     */
    IdentityMatch match(const ElementSignature& signature, IUiIntrospector& introspector) const;

    bool appMatches(const std::string& recordedApp, const std::string& liveApp) const;
    bool isBlacklisted(const std::string& appName) const;

    /**
     * @brief Confidence that a live title names the recorded window
     * @param rule Receives the name of the rule that matched
     */
    double titleConfidence(const std::string& recorded, const std::string& live, std::string* rule = nullptr) const;

    /**
     * @brief Strip volatile title parts: unread counters "(3)", e-mail
     *        addresses, clock times "10:42 PM"; collapse whitespace; case-fold
     */
    static std::string normalizeTitle(const std::string& title);

    /**
     * @brief Compare the rightmost two " - " separated segments of normalized titles
     */
    static bool segmentSuffixEqual(const std::string& normalizedA, const std::string& normalizedB);

private:
    IdentitySettings m_settings;
};

} // namespace reticle

#endif // RETICLE_IDENTITY_MATCHER_H
