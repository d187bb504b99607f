#ifndef RETICLE_CANDIDATE_H
#define RETICLE_CANDIDATE_H

#include <map>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "../introspection/ui_introspector.h"
#include "../signature/element_signature.h"

namespace reticle {

/**
 * @brief Live node under consideration as the click target
 */
struct Candidate {
    NodeRef node;
    NodeAttributes attributes;
    std::vector<AncestorEntry> ancestors;  // Nearest first
    SimilarityBreakdown breakdown;
    double score = 0.0;
    double distance = 0.0;                  // Projected point to frame center
    std::string strategy;
    size_t discoveryIndex = 0;

    /**
     * @brief Strict ordering for candidate selection: higher score, then
     *        closer to the projected point, then discovered earlier
     */
    bool betterThan(const Candidate& other) const;

    nlohmann::json toJson() const;
};

/**
 * @brief Scores live nodes against one signature for the duration of a run
 *
 * Node attributes and ancestor chains are fetched once and cached, so
 * strategies that visit the same node do not repeat collaborator calls.
 */
class CandidateScorer {
public:
    static constexpr size_t kMaxAncestorDepth = 16;

    CandidateScorer(const ElementSignature& signature, IUiIntrospector& introspector,
                    SimilarityWeights weights, double windowScaleX, double windowScaleY,
                    Point projectedPoint);

    /**
     * @brief Build and score a candidate; nullopt if the node is gone
     */
    std::optional<Candidate> score(const NodeRef& node, const std::string& strategy);

    /**
     * @brief Attributes only, without ancestors or scoring
     */
    std::optional<NodeAttributes> attributesOf(const NodeRef& node);

    bool roleMatches(const NodeAttributes& attributes) const;

    const Point& projectedPoint() const { return m_projectedPoint; }
    size_t scoredCount() const { return m_discovered; }

private:
    std::vector<AncestorEntry> ancestorsOf(const NodeRef& node);

    const ElementSignature& m_signature;
    IUiIntrospector& m_introspector;
    SimilarityWeights m_weights;
    double m_scaleX;
    double m_scaleY;
    Point m_projectedPoint;
    std::string m_canonicalRole;
    size_t m_discovered = 0;

    std::map<std::string, std::optional<NodeAttributes>> m_attributeCache;
};

} // namespace reticle

#endif // RETICLE_CANDIDATE_H
