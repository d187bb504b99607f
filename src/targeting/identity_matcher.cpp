#include "identity_matcher.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <regex>

namespace reticle {

using utils::StringUtils;

namespace {
    const std::regex kUnreadCounter(R"(\(\d[\d,]*\))");
    const std::regex kEmailAddress(R"([^\s@()]+@[^\s@()]+)");
    const std::regex kClockTime(R"(\b\d{1,2}:\d{2}\s?[ap]m\b)", std::regex::icase);
    const std::regex kSegmentSeparator(R"((\s+-)+\s+)");

    std::vector<std::string> titleSegments(const std::string& title) {
        std::vector<std::string> segments;
        for (const auto& part : StringUtils::split(title, " - ")) {
            std::string trimmed = StringUtils::trim(part);
            if (!trimmed.empty()) {
                segments.push_back(trimmed);
            }
        }
        return segments;
    }

    std::string rightmostSegments(const std::vector<std::string>& segments) {
        if (segments.size() < 2) {
            return segments.empty() ? "" : segments.back();
        }
        return segments[segments.size() - 2] + " - " + segments.back();
    }
}

IdentitySettings IdentitySettings::defaults() {
    IdentitySettings settings;
    settings.appAliases = {
        {"google chrome", {"chrome", "gmail"}},
        {"visual studio code", {"code"}}
    };
    settings.systemProcessBlacklist = {
        "loginwindow", "windowserver", "systemuiserver", "controlcenter",
        "notificationcenter", "spotlight", "launchd", "universalaccessd"
    };
    settings.genericTitles = {"new tab", "tab", "untitled", "document", "home", "start page"};
    return settings;
}

nlohmann::json IdentityMatch::toJson() const {
    nlohmann::json j = {
        {"matched", matched},
        {"confidence", confidence},
        {"title_rule", titleRule},
        {"windows_considered", windowsConsidered},
        {"windows_with_matching_app", windowsWithMatchingApp}
    };
    if (window) {
        j["window"] = {
            {"id", window->ref.id},
            {"app_name", window->appName},
            {"title", window->title},
            {"frame", window->frame},
            {"scale", window->scale}
        };
    }
    return j;
}

IdentityMatcher::IdentityMatcher(IdentitySettings settings) : m_settings(std::move(settings)) {}

std::string IdentityMatcher::normalizeTitle(const std::string& title) {
    std::string t = StringUtils::collapseWhitespace(title);
    t = std::regex_replace(t, kUnreadCounter, "");
    t = std::regex_replace(t, kEmailAddress, "");
    t = std::regex_replace(t, kClockTime, "");
    t = std::regex_replace(t, kSegmentSeparator, " - ");
    // Removed parts can leave empty segments behind
    return StringUtils::normalizeText(StringUtils::join(titleSegments(t), " - "));
}

bool IdentityMatcher::segmentSuffixEqual(const std::string& normalizedA, const std::string& normalizedB) {
    std::vector<std::string> a = titleSegments(normalizedA);
    std::vector<std::string> b = titleSegments(normalizedB);
    if (a.empty() || b.empty()) {
        return false;
    }
    return rightmostSegments(a) == rightmostSegments(b);
}

bool IdentityMatcher::appMatches(const std::string& recordedApp, const std::string& liveApp) const {
    std::string recorded = StringUtils::normalizeText(recordedApp);
    std::string live = StringUtils::normalizeText(liveApp);
    if (recorded.empty() || live.empty()) {
        return false;
    }
    if (recorded == live) {
        return true;
    }

    for (const auto& entry : m_settings.appAliases) {
        auto inGroup = [&entry](const std::string& name) {
            return name == entry.first ||
                   std::find(entry.second.begin(), entry.second.end(), name) != entry.second.end();
        };
        if (inGroup(recorded) && inGroup(live)) {
            return true;
        }
    }
    return false;
}

bool IdentityMatcher::isBlacklisted(const std::string& appName) const {
    std::string name = StringUtils::normalizeText(appName);
    for (const auto& blocked : m_settings.systemProcessBlacklist) {
        if (StringUtils::normalizeText(blocked) == name) {
            return true;
        }
    }
    return false;
}

double IdentityMatcher::titleConfidence(const std::string& recorded, const std::string& live, std::string* rule) const {
    auto result = [rule](const char* name, double confidence) {
        if (rule) {
            *rule = name;
        }
        return confidence;
    };

    if (recorded == live) {
        return result("exact", title_confidence::kExact);
    }

    std::string recordedNorm = normalizeTitle(recorded);
    std::string liveNorm = normalizeTitle(live);

    if (!recordedNorm.empty() && recordedNorm == liveNorm) {
        return result("normalized", title_confidence::kNormalized);
    }
    if (segmentSuffixEqual(recordedNorm, liveNorm)) {
        return result("segment_suffix", title_confidence::kSegmentSuffix);
    }
    if (!recordedNorm.empty() && !liveNorm.empty() &&
        (StringUtils::contains(liveNorm, recordedNorm) || StringUtils::contains(recordedNorm, liveNorm))) {
        return result("substring", title_confidence::kSubstring);
    }

    std::string recordedPlain = StringUtils::normalizeText(recorded);
    bool generic = recordedPlain.empty() ||
        std::find(m_settings.genericTitles.begin(), m_settings.genericTitles.end(), recordedPlain) !=
            m_settings.genericTitles.end();
    if (generic) {
        return result("generic", title_confidence::kGeneric);
    }
    return result("mismatch", title_confidence::kMismatch);
}

IdentityMatch IdentityMatcher::match(const ElementSignature& signature, IUiIntrospector& introspector) const {
    IdentityMatch best;
    std::vector<WindowInfo> windows = introspector.listWindows(std::nullopt);
    best.windowsConsidered = static_cast<int>(windows.size());

    const std::string& bundleId = signature.data().bundleId;
    for (const auto& window : windows) {
        if (isBlacklisted(window.appName)) {
            continue;
        }
        bool sameBundle = !bundleId.empty() && bundleId == window.bundleId;
        if (!sameBundle && !appMatches(signature.appName(), window.appName)) {
            continue;
        }
        best.windowsWithMatchingApp++;

        std::string rule;
        double confidence = titleConfidence(signature.windowTitle(), window.title, &rule);
        if (!best.window || confidence > best.confidence) {
            best.window = window;
            best.confidence = confidence;
            best.titleRule = rule;
        }
    }

    best.matched = best.window.has_value() && best.confidence >= m_settings.minConfidence;

    RETICLE_LOG_DEBUG().component("identity").message("Window identity evaluated")
        .context("app", signature.appName())
        .context("title", signature.windowTitle())
        .context("result", best.toJson());
    return best;
}

} // namespace reticle
