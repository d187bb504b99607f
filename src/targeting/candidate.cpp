#include "candidate.h"

namespace reticle {

bool Candidate::betterThan(const Candidate& other) const {
    if (score != other.score) {
        return score > other.score;
    }
    if (distance != other.distance) {
        return distance < other.distance;
    }
    return discoveryIndex < other.discoveryIndex;
}

nlohmann::json Candidate::toJson() const {
    return nlohmann::json{
        {"node", node.id},
        {"role", attributes.role()},
        {"label", attributes.bestLabel()},
        {"frame", attributes.frame()},
        {"score", score},
        {"breakdown", breakdown.toJson()},
        {"distance", distance},
        {"strategy", strategy}
    };
}

CandidateScorer::CandidateScorer(const ElementSignature& signature, IUiIntrospector& introspector,
                                 SimilarityWeights weights, double windowScaleX, double windowScaleY,
                                 Point projectedPoint)
    : m_signature(signature),
      m_introspector(introspector),
      m_weights(weights),
      m_scaleX(windowScaleX),
      m_scaleY(windowScaleY),
      m_projectedPoint(projectedPoint),
      m_canonicalRole(canonicalRole(signature.role())) {}

std::optional<NodeAttributes> CandidateScorer::attributesOf(const NodeRef& node) {
    if (node.isNull()) {
        return std::nullopt;
    }
    auto cached = m_attributeCache.find(node.id);
    if (cached != m_attributeCache.end()) {
        return cached->second;
    }
    std::optional<NodeAttributes> attributes = m_introspector.attributes(node);
    m_attributeCache.emplace(node.id, attributes);
    return attributes;
}

bool CandidateScorer::roleMatches(const NodeAttributes& attributes) const {
    return canonicalRole(attributes.role()) == m_canonicalRole;
}

std::vector<AncestorEntry> CandidateScorer::ancestorsOf(const NodeRef& node) {
    std::vector<AncestorEntry> ancestors;
    NodeRef current = m_introspector.parentOf(node);
    while (!current.isNull() && ancestors.size() < kMaxAncestorDepth) {
        std::optional<NodeAttributes> attributes = attributesOf(current);
        if (!attributes) {
            break;
        }
        ancestors.push_back(AncestorEntry{attributes->role(), attributes->bestLabel()});
        current = m_introspector.parentOf(current);
    }
    return ancestors;
}

std::optional<Candidate> CandidateScorer::score(const NodeRef& node, const std::string& strategy) {
    std::optional<NodeAttributes> attributes = attributesOf(node);
    if (!attributes) {
        return std::nullopt;
    }

    Candidate candidate;
    candidate.node = node;
    candidate.attributes = *attributes;
    candidate.strategy = strategy;
    candidate.discoveryIndex = m_discovered++;
    candidate.distance = m_projectedPoint.distanceTo(attributes->frame().center());

    // Role mismatch scores zero; skip the ancestor walk
    if (roleMatches(*attributes)) {
        candidate.ancestors = ancestorsOf(node);
    }

    CandidateFeatures features{candidate.attributes, candidate.ancestors, m_scaleX, m_scaleY};
    candidate.breakdown = m_signature.explain(features, m_weights);
    candidate.score = candidate.breakdown.score;
    return candidate;
}

} // namespace reticle
