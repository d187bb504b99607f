#include "element_signature.h"
#include "../common/error_handler.h"
#include "../common/json_utils.h"
#include "../common/string_utils.h"
#include <algorithm>
#include <set>

namespace reticle {

using utils::JsonUtils;
using utils::StringUtils;

namespace {
    // Recorded geometry is rounded by the capture backend
    constexpr double kGeometryTolerancePx = 1.0;

    constexpr size_t kMaxAncestorsCompared = 8;

    const std::set<std::string> kRecordingKeys = {
        "role", "subrole", "labels", "best_label", "title", "description", "value",
        "placeholder", "help", "app_name", "bundle_id", "pid", "window_title",
        "window_frame", "frame", "activation_point", "click_point", "parent_chain",
        "display_scale", "screen_scale", "click_frac", "recorded_at", "schema_version"
    };

    double sizeRatio(double a, double b) {
        if (a <= 0.0 && b <= 0.0) return 1.0;
        if (a <= 0.0 || b <= 0.0) return 0.0;
        return std::min(a, b) / std::max(a, b);
    }

    double tokenOverlap(const std::string& recorded, const std::string& live) {
        if (StringUtils::contains(live, recorded) || StringUtils::contains(recorded, live)) {
            return 1.0;
        }
        std::vector<std::string> recordedTokens = StringUtils::significantTokens(recorded);
        if (recordedTokens.empty()) {
            return 0.0;
        }
        std::vector<std::string> liveTokens = StringUtils::significantTokens(live);
        size_t common = 0;
        for (const auto& token : recordedTokens) {
            if (std::find(liveTokens.begin(), liveTokens.end(), token) != liveTokens.end()) {
                ++common;
            }
        }
        return static_cast<double>(common) / recordedTokens.size();
    }

    Rect readRect(const nlohmann::json& json, const char* key) {
        try {
            return json.at(key).get<Rect>();
        } catch (const nlohmann::json::exception& e) {
            RETICLE_THROW(ErrorType::SIGNATURE_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                          std::string("Recording entry has no valid \"") + key + "\"", e.what(),
                          "ElementSignature::fromJson");
        }
    }

    std::optional<Point> readPoint(const nlohmann::json& json, const char* key) {
        if (!json.contains(key) || !json[key].is_object()) {
            return std::nullopt;
        }
        try {
            return json[key].get<Point>();
        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }
}

// SimilarityWeights
SimilarityWeights SimilarityWeights::fromJson(const nlohmann::json& json) {
    SimilarityWeights weights;
    weights.label = JsonUtils::getDoubleField(json, "label", weights.label);
    weights.role = JsonUtils::getDoubleField(json, "role", weights.role);
    weights.ancestry = JsonUtils::getDoubleField(json, "ancestry", weights.ancestry);
    weights.size = JsonUtils::getDoubleField(json, "size", weights.size);
    weights.partialLabelFraction = JsonUtils::getDoubleField(json, "partial_label_fraction",
                                                             weights.partialLabelFraction);
    return weights;
}

nlohmann::json SimilarityWeights::toJson() const {
    return nlohmann::json{
        {"label", label}, {"role", role}, {"ancestry", ancestry}, {"size", size},
        {"partial_label_fraction", partialLabelFraction}
    };
}

nlohmann::json SimilarityBreakdown::toJson() const {
    return nlohmann::json{
        {"role_matched", roleMatched}, {"label", label}, {"ancestry", ancestry},
        {"size", size}, {"score", score}
    };
}

// ElementSignature
ElementSignature::ElementSignature(SignatureData data) : m_data(std::move(data)) {
    validate();
    m_bestLabel = resolveBestLabel();
}

void ElementSignature::validate() const {
    if (StringUtils::trim(m_data.role).empty()) {
        RETICLE_THROW(ErrorType::SIGNATURE_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Signature has no role", "", "ElementSignature");
    }
    if (m_data.windowFrame.isEmpty()) {
        RETICLE_THROW(ErrorType::SIGNATURE_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Signature window frame is empty", "", "ElementSignature");
    }

    const double t = kGeometryTolerancePx;
    Rect window(-t, -t, m_data.windowFrame.width + 2 * t, m_data.windowFrame.height + 2 * t);
    Rect element(m_data.elementFrame.x - t, m_data.elementFrame.y - t,
                 m_data.elementFrame.width + 2 * t, m_data.elementFrame.height + 2 * t);

    if (!element.contains(m_data.activationPoint)) {
        RETICLE_THROW(ErrorType::SIGNATURE_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Activation point lies outside the element frame",
                      (nlohmann::json{{"activation_point", m_data.activationPoint},
                                      {"element_frame", m_data.elementFrame}}.dump()),
                      "ElementSignature");
    }
    if (!window.contains(m_data.elementFrame)) {
        RETICLE_THROW(ErrorType::SIGNATURE_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Element frame lies outside the window",
                      (nlohmann::json{{"element_frame", m_data.elementFrame},
                                      {"window_size", {m_data.windowFrame.width, m_data.windowFrame.height}}}.dump()),
                      "ElementSignature");
    }
}

std::string ElementSignature::resolveBestLabel() const {
    for (const auto& label : m_data.labels) {
        if (!isTrivialLabel(label)) {
            return StringUtils::collapseWhitespace(label);
        }
    }
    for (const auto& entry : m_data.ancestorChain) {
        if (!isTrivialLabel(entry.label)) {
            return StringUtils::collapseWhitespace(entry.label);
        }
    }
    return "";
}

Point ElementSignature::activationOffset() const {
    return Point(m_data.activationPoint.x - m_data.elementFrame.x,
                 m_data.activationPoint.y - m_data.elementFrame.y);
}

double ElementSignature::similarity(const CandidateFeatures& candidate, const SimilarityWeights& weights) const {
    return explain(candidate, weights).score;
}

SimilarityBreakdown ElementSignature::explain(const CandidateFeatures& candidate,
                                              const SimilarityWeights& weights) const {
    SimilarityBreakdown result;
    result.roleMatched = canonicalRole(m_data.role) == canonicalRole(candidate.attributes.role());
    if (!result.roleMatched) {
        return result;
    }

    result.label = labelScore(candidate.attributes, weights.partialLabelFraction);
    if (result.label < 1.0 && m_data.labels.end() == std::find_if(m_data.labels.begin(), m_data.labels.end(),
            [](const std::string& l) { return !isTrivialLabel(l); })) {
        // Label came from an ancestor; look for it among the live ancestors
        for (const auto& ancestor : candidate.ancestors) {
            if (StringUtils::normalizeText(ancestor.label) == StringUtils::normalizeText(m_bestLabel)) {
                result.label = 1.0;
                break;
            }
        }
    }
    result.ancestry = ancestryScore(candidate.ancestors);
    result.size = sizeScore(candidate.attributes.frame(), candidate.windowScaleX, candidate.windowScaleY);

    double total = weights.total();
    if (total <= 0.0) {
        result.score = 1.0;
        return result;
    }

    double score = (weights.label * result.label + weights.role +
                    weights.ancestry * result.ancestry + weights.size * result.size) / total;
    result.score = std::clamp(score, 0.0, 1.0);
    return result;
}

double ElementSignature::labelScore(const NodeAttributes& live, double partialFraction) const {
    std::string recorded = StringUtils::normalizeText(m_bestLabel);
    if (recorded.empty()) {
        return 1.0;
    }

    double bestPartial = 0.0;
    for (const auto& label : live.labels()) {
        if (isTrivialLabel(label)) {
            continue;
        }
        std::string normalized = StringUtils::normalizeText(label);
        if (normalized == recorded) {
            return 1.0;
        }
        bestPartial = std::max(bestPartial, tokenOverlap(recorded, normalized));
    }
    return std::clamp(partialFraction, 0.0, 1.0) * bestPartial;
}

double ElementSignature::ancestryScore(const std::vector<AncestorEntry>& liveAncestors) const {
    if (m_data.ancestorChain.size() <= 1) {
        return 1.0;
    }

    size_t compared = std::min(m_data.ancestorChain.size() - 1, kMaxAncestorsCompared);
    double credit = 0.0;
    for (size_t i = 0; i < compared; ++i) {
        const AncestorEntry& recorded = m_data.ancestorChain[i + 1];
        if (i >= liveAncestors.size()) {
            break;
        }
        const AncestorEntry& live = liveAncestors[i];
        if (canonicalRole(recorded.role) != canonicalRole(live.role)) {
            continue;
        }
        if (isTrivialLabel(recorded.label) ||
            StringUtils::normalizeText(recorded.label) == StringUtils::normalizeText(live.label)) {
            credit += 1.0;
        } else {
            credit += 0.5;
        }
    }
    return credit / static_cast<double>(compared);
}

double ElementSignature::sizeScore(const Rect& liveFrame, double scaleX, double scaleY) const {
    if (m_data.elementFrame.isEmpty()) {
        return 1.0;
    }
    double expectedWidth = m_data.elementFrame.width * scaleX;
    double expectedHeight = m_data.elementFrame.height * scaleY;
    return (sizeRatio(expectedWidth, liveFrame.width) + sizeRatio(expectedHeight, liveFrame.height)) / 2.0;
}

ElementSignature ElementSignature::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        RETICLE_THROW(ErrorType::SIGNATURE_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Recording entry is not an object", "", "ElementSignature::fromJson");
    }

    std::vector<std::string> missing;
    if (!JsonUtils::hasRequiredFields(json, {"role", "app_name", "window_frame", "frame"}, missing)) {
        RETICLE_THROW(ErrorType::SIGNATURE_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Recording entry is missing required fields", StringUtils::join(missing, ", "),
                      "ElementSignature::fromJson");
    }

    SignatureData data;
    data.role = JsonUtils::getStringField(json, "role");
    data.subrole = JsonUtils::getStringField(json, "subrole");

    auto addLabel = [&data](const std::string& label) {
        if (!isTrivialLabel(label) &&
            std::find(data.labels.begin(), data.labels.end(), label) == data.labels.end()) {
            data.labels.push_back(label);
        }
    };
    for (const auto& label : JsonUtils::getStringArrayField(json, "labels")) {
        addLabel(label);
    }
    for (const char* key : {"best_label", "title", "description", "value", "placeholder", "help"}) {
        addLabel(JsonUtils::getStringField(json, key));
    }

    data.appName = JsonUtils::getStringField(json, "app_name");
    data.bundleId = JsonUtils::getStringField(json, "bundle_id");
    if (json.contains("pid") && json["pid"].is_number_integer()) {
        data.processId = json["pid"].get<int>();
    }
    data.windowTitle = JsonUtils::getStringField(json, "window_title");

    data.windowFrame = readRect(json, "window_frame");
    Rect absoluteFrame = readRect(json, "frame");
    data.elementFrame = absoluteFrame.translated(-data.windowFrame.x, -data.windowFrame.y);

    // The recorder's activation point is unreliable for some controls;
    // prefer it only when it falls inside the element
    Point absolutePoint = absoluteFrame.center();
    std::optional<Point> activation = readPoint(json, "activation_point");
    std::optional<Point> click = readPoint(json, "click_point");
    if (activation && absoluteFrame.contains(*activation)) {
        absolutePoint = *activation;
    } else if (click) {
        absolutePoint = *click;
    }
    data.activationPoint = Point(absolutePoint.x - data.windowFrame.x, absolutePoint.y - data.windowFrame.y);

    nlohmann::json chain;
    if (JsonUtils::getArrayField(json, "parent_chain", chain)) {
        for (const auto& item : chain) {
            if (!item.is_object()) {
                continue;
            }
            AncestorEntry entry;
            entry.role = JsonUtils::getStringField(item, "role");
            entry.label = JsonUtils::getStringField(item, "title", JsonUtils::getStringField(item, "label"));
            data.ancestorChain.push_back(entry);
        }
    }
    if (data.ancestorChain.empty() || canonicalRole(data.ancestorChain.front().role) != canonicalRole(data.role)) {
        AncestorEntry self;
        self.role = data.role;
        self.label = data.labels.empty() ? "" : data.labels.front();
        data.ancestorChain.insert(data.ancestorChain.begin(), self);
    }

    data.screenScale = JsonUtils::getDoubleField(json, "display_scale",
                                                 JsonUtils::getDoubleField(json, "screen_scale", 1.0));
    if (data.screenScale <= 0.0) {
        data.screenScale = 1.0;
    }

    nlohmann::json fraction;
    if (JsonUtils::getObjectField(json, "click_frac", fraction) &&
        fraction.contains("fx") && fraction.contains("fy")) {
        data.clickFraction = Point(JsonUtils::getDoubleField(fraction, "fx"),
                                   JsonUtils::getDoubleField(fraction, "fy"));
    }

    data.recordedAt = JsonUtils::getStringField(json, "recorded_at");
    data.schemaVersion = JsonUtils::getIntField(json, "schema_version", 1);

    for (auto it = json.begin(); it != json.end(); ++it) {
        if (kRecordingKeys.count(it.key()) == 0) {
            data.extra[it.key()] = it.value();
        }
    }

    return ElementSignature(std::move(data));
}

nlohmann::json ElementSignature::toJson() const {
    nlohmann::json j = m_data.extra.is_object() ? m_data.extra : nlohmann::json::object();

    j["role"] = m_data.role;
    if (!m_data.subrole.empty()) {
        j["subrole"] = m_data.subrole;
    }
    j["labels"] = m_data.labels;
    j["best_label"] = m_bestLabel;
    j["app_name"] = m_data.appName;
    if (!m_data.bundleId.empty()) {
        j["bundle_id"] = m_data.bundleId;
    }
    if (m_data.processId) {
        j["pid"] = *m_data.processId;
    }
    j["window_title"] = m_data.windowTitle;
    j["window_frame"] = m_data.windowFrame;
    j["frame"] = m_data.elementFrame.translated(m_data.windowFrame.x, m_data.windowFrame.y);
    j["activation_point"] = Point(m_data.activationPoint.x + m_data.windowFrame.x,
                                  m_data.activationPoint.y + m_data.windowFrame.y);

    nlohmann::json chain = nlohmann::json::array();
    for (const auto& entry : m_data.ancestorChain) {
        chain.push_back({{"role", entry.role}, {"title", entry.label}});
    }
    j["parent_chain"] = chain;
    j["display_scale"] = m_data.screenScale;
    if (m_data.clickFraction) {
        j["click_frac"] = {{"fx", m_data.clickFraction->x}, {"fy", m_data.clickFraction->y}};
    }
    if (!m_data.recordedAt.empty()) {
        j["recorded_at"] = m_data.recordedAt;
    }
    j["schema_version"] = m_data.schemaVersion;
    return j;
}

} // namespace reticle
