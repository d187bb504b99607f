#ifndef RETICLE_ELEMENT_SIGNATURE_H
#define RETICLE_ELEMENT_SIGNATURE_H

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "../common/geometry.h"
#include "../introspection/node_attributes.h"

namespace reticle {

/**
 * @brief One step of the recorded ancestor chain
 */
struct AncestorEntry {
    std::string role;
    std::string label;
};

/**
 * @brief Relative weights of the similarity components
 *
 * Weights need not sum to one; the score is normalised by their sum so the
 * best possible score is always 1.0.
 */
struct SimilarityWeights {
    double label = 0.50;
    double role = 0.10;
    double ancestry = 0.25;
    double size = 0.15;
    double partialLabelFraction = 0.60;  // Share of the label weight granted for a partial match

    double total() const { return label + role + ancestry + size; }

    static SimilarityWeights fromJson(const nlohmann::json& json);
    nlohmann::json toJson() const;
};

/**
 * @brief Per-component result of a similarity computation
 */
struct SimilarityBreakdown {
    bool roleMatched = false;
    double label = 0.0;
    double ancestry = 0.0;
    double size = 0.0;
    double score = 0.0;

    nlohmann::json toJson() const;
};

/**
 * @brief Live-side input to a similarity computation
 */
struct CandidateFeatures {
    NodeAttributes attributes;
    std::vector<AncestorEntry> ancestors;  // Nearest ancestor first, element excluded
    double windowScaleX = 1.0;             // Live/recorded window size ratio
    double windowScaleY = 1.0;
};

/**
 * @brief Plain fields of a recorded element. Geometry is window-relative.
 */
struct SignatureData {
    std::string role;
    std::string subrole;
    std::vector<std::string> labels;         // Most specific first
    std::string appName;
    std::string bundleId;
    std::optional<int> processId;
    std::string windowTitle;
    Rect windowFrame;                        // Screen coordinates at capture
    Point activationPoint;                   // Relative to windowFrame origin
    Rect elementFrame;                       // Relative to windowFrame origin
    std::vector<AncestorEntry> ancestorChain; // Element first, then parents up to the window
    double screenScale = 1.0;
    std::optional<Point> clickFraction;      // Activation point as a fraction of window size
    std::string recordedAt;
    int schemaVersion = 1;
    nlohmann::json extra = nlohmann::json::object();
};

/**
 * @brief Immutable record of a UI element at capture time
 */
class ElementSignature {
public:
    /**
     * @throws ReticleException (SIGNATURE_FORMAT_ERROR) if the role is
     *         empty, the window is empty, the activation point lies outside
     *         the element frame or the element frame lies outside the window
     */
    explicit ElementSignature(SignatureData data);

    const SignatureData& data() const { return m_data; }
    const std::string& role() const { return m_data.role; }
    const std::vector<std::string>& labels() const { return m_data.labels; }
    const std::string& appName() const { return m_data.appName; }
    const std::string& windowTitle() const { return m_data.windowTitle; }
    const Rect& windowFrame() const { return m_data.windowFrame; }
    const Point& activationPoint() const { return m_data.activationPoint; }
    const Rect& elementFrame() const { return m_data.elementFrame; }
    const std::vector<AncestorEntry>& ancestorChain() const { return m_data.ancestorChain; }
    double screenScale() const { return m_data.screenScale; }

    /**
     * @brief First non-trivial label of the element, else of its nearest
     *        labelled ancestor, else empty
     */
    const std::string& bestLabel() const { return m_bestLabel; }

    /**
     * @brief Activation point relative to the element frame origin
     */
    Point activationOffset() const;

    /**
     * @brief Score in [0, 1]; 0 whenever the roles differ
     */
    double similarity(const CandidateFeatures& candidate, const SimilarityWeights& weights) const;
    SimilarityBreakdown explain(const CandidateFeatures& candidate, const SimilarityWeights& weights) const;

    /**
     * @brief Parse one recording entry
     *
     * Recordings store screen coordinates ("frame", "activation_point",
     * "click_point", "window_frame"); they are converted to window-relative
     * geometry here. Unknown keys are kept in SignatureData::extra.
     * @throws ReticleException (SIGNATURE_FORMAT_ERROR)
     */
    static ElementSignature fromJson(const nlohmann::json& json);

    /**
     * @brief Serialise in the recording layout accepted by fromJson
     */
    nlohmann::json toJson() const;

private:
    SignatureData m_data;
    std::string m_bestLabel;

    void validate() const;
    std::string resolveBestLabel() const;
    double labelScore(const NodeAttributes& live, double partialFraction) const;
    double ancestryScore(const std::vector<AncestorEntry>& liveAncestors) const;
    double sizeScore(const Rect& liveFrame, double scaleX, double scaleY) const;
};

} // namespace reticle

#endif // RETICLE_ELEMENT_SIGNATURE_H
