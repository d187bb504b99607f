#ifndef RETICLE_SEARCH_STRATEGY_H
#define RETICLE_SEARCH_STRATEGY_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "candidate.h"
#include "geometry_projector.h"

namespace reticle {

struct SearchLimits {
    int maxDepth = 5;
    int maxNodes = 800;
    double minNodeSizePx = 12.0;
    double lineThicknessPx = 6.0;
    double lineMinLengthPx = 60.0;
};

/**
 * @brief Inputs shared by all refinement strategies of one L4 pass
 */
struct SearchContext {
    const ElementSignature& signature;
    IUiIntrospector& introspector;
    const WindowInfo& window;
    const Projection& projection;
    NodeRef hitNode;          // Element found at the projected point by L3, may be null
    double radiusPx;          // Neighbor scan radius
    SearchLimits limits;
    std::vector<NodeRef> excluded = {};   // Nodes never chosen, e.g. ones covered at every confirmation point
};

struct StrategyResult {
    bool available = true;
    std::vector<Candidate> pool;
    nlohmann::json detail = nlohmann::json::object();
};

/**
 * @brief One L4 refinement strategy
 *
 * Strategies only read the live tree. Selection among the returned pool is
 * done by CandidateSearch, so a strategy may return every node it scored.
 */
class ISearchStrategy {
public:
    virtual ~ISearchStrategy() = default;

    virtual std::string name() const = 0;
    virtual StrategyResult search(const SearchContext& context, CandidateScorer& scorer) = 0;
};

class ChildrenScanStrategy : public ISearchStrategy {
public:
    std::string name() const override { return "children_scan"; }
    StrategyResult search(const SearchContext& context, CandidateScorer& scorer) override;
};

class NeighborScanStrategy : public ISearchStrategy {
public:
    std::string name() const override { return "neighbor_scan"; }
    StrategyResult search(const SearchContext& context, CandidateScorer& scorer) override;
};

/**
 * @brief Breadth-first walk of the window tree bounded by depth and node count
 *
 * Microscopic and line-like nodes are traversed but never scored. Nodes
 * whose role differs from the recorded role are not scored either.
 */
class TreeSearchStrategy : public ISearchStrategy {
public:
    std::string name() const override { return "tree_search"; }
    StrategyResult search(const SearchContext& context, CandidateScorer& scorer) override;

    static bool isMicroscopic(const Rect& frame, const SearchLimits& limits);
    static bool isLineLike(const Rect& frame, const SearchLimits& limits);
};

/**
 * @brief Request to an image-based locator
 */
struct VisualQuery {
    Rect region;                // Screen region to capture
    std::string expectedLabel;
};

/**
 * @brief Reserved image-based strategy
 *
 * Contract: a screenshot of VisualQuery::region plus the expected label
 * yields a point or a failure. No locator is available in this build, so
 * search() always reports the strategy as unavailable.
 */
class VisualSearchStrategy : public ISearchStrategy {
public:
    std::string name() const override { return "visual_search"; }
    StrategyResult search(const SearchContext& context, CandidateScorer& scorer) override;

    static VisualQuery buildQuery(const SearchContext& context);
};

} // namespace reticle

#endif // RETICLE_SEARCH_STRATEGY_H
