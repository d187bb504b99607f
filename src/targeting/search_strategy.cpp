#include "search_strategy.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <deque>
#include <set>

namespace reticle {

// ChildrenScanStrategy
StrategyResult ChildrenScanStrategy::search(const SearchContext& context, CandidateScorer& scorer) {
    StrategyResult result;
    NodeRef parent = context.hitNode.isNull() ? context.window.root : context.hitNode;
    std::vector<NodeRef> children = context.introspector.children(parent);

    for (const auto& child : children) {
        std::optional<Candidate> candidate = scorer.score(child, name());
        if (candidate) {
            result.pool.push_back(*candidate);
        }
    }

    result.detail = {
        {"parent", parent.id},
        {"parent_is_root", context.hitNode.isNull()},
        {"children", children.size()}
    };
    return result;
}

// NeighborScanStrategy
StrategyResult NeighborScanStrategy::search(const SearchContext& context, CandidateScorer& scorer) {
    StrategyResult result;
    result.detail["radius_px"] = context.radiusPx;
    if (context.hitNode.isNull()) {
        result.detail["skipped"] = "no element at projected point";
        return result;
    }

    std::vector<NodeRef> siblings = context.introspector.siblings(context.hitNode);
    size_t inRadius = 0;
    for (const auto& sibling : siblings) {
        std::optional<NodeAttributes> attributes = scorer.attributesOf(sibling);
        if (!attributes) {
            continue;
        }
        if (scorer.projectedPoint().distanceTo(attributes->frame().center()) > context.radiusPx) {
            continue;
        }
        ++inRadius;
        std::optional<Candidate> candidate = scorer.score(sibling, name());
        if (candidate) {
            result.pool.push_back(*candidate);
        }
    }

    result.detail["siblings"] = siblings.size();
    result.detail["in_radius"] = inRadius;
    return result;
}

// TreeSearchStrategy
bool TreeSearchStrategy::isMicroscopic(const Rect& frame, const SearchLimits& limits) {
    return frame.width < limits.minNodeSizePx || frame.height < limits.minNodeSizePx;
}

bool TreeSearchStrategy::isLineLike(const Rect& frame, const SearchLimits& limits) {
    double thickness = std::min(frame.width, frame.height);
    double length = std::max(frame.width, frame.height);
    return thickness <= limits.lineThicknessPx && length >= limits.lineMinLengthPx;
}

StrategyResult TreeSearchStrategy::search(const SearchContext& context, CandidateScorer& scorer) {
    StrategyResult result;
    if (context.window.root.isNull()) {
        result.detail["skipped"] = "window has no root";
        return result;
    }

    std::deque<std::pair<NodeRef, int>> queue;
    std::set<NodeRef> seen;
    queue.emplace_back(context.window.root, 0);
    seen.insert(context.window.root);

    int visited = 0;
    int filtered = 0;
    bool truncated = false;

    while (!queue.empty()) {
        if (visited >= context.limits.maxNodes) {
            truncated = true;
            break;
        }
        NodeRef node = queue.front().first;
        int depth = queue.front().second;
        queue.pop_front();
        ++visited;

        std::optional<NodeAttributes> attributes = scorer.attributesOf(node);
        if (!attributes) {
            continue;
        }

        const Rect& frame = attributes->frame();
        if (isMicroscopic(frame, context.limits) || isLineLike(frame, context.limits)) {
            ++filtered;
        } else if (scorer.roleMatches(*attributes)) {
            std::optional<Candidate> candidate = scorer.score(node, name());
            if (candidate) {
                result.pool.push_back(*candidate);
            }
        }

        if (depth < context.limits.maxDepth) {
            for (const auto& child : context.introspector.children(node)) {
                if (seen.insert(child).second) {
                    queue.emplace_back(child, depth + 1);
                }
            }
        }
    }

    result.detail = {
        {"visited", visited},
        {"filtered", filtered},
        {"scored", result.pool.size()},
        {"truncated", truncated},
        {"max_depth", context.limits.maxDepth},
        {"max_nodes", context.limits.maxNodes}
    };
    return result;
}

// VisualSearchStrategy
VisualQuery VisualSearchStrategy::buildQuery(const SearchContext& context) {
    VisualQuery query;
    Rect expected = context.projection.frame;
    double margin = context.radiusPx;
    query.region = Rect(expected.x - margin, expected.y - margin,
                        expected.width + 2 * margin, expected.height + 2 * margin);
    query.expectedLabel = context.signature.bestLabel();
    return query;
}

StrategyResult VisualSearchStrategy::search(const SearchContext& context, CandidateScorer& scorer) {
    (void)scorer;
    VisualQuery query = buildQuery(context);

    StrategyResult result;
    result.available = false;
    result.detail = {
        {"reason", "no visual locator available"},
        {"region", query.region},
        {"expected_label", query.expectedLabel}
    };
    return result;
}

} // namespace reticle
