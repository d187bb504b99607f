#include "hit_test_confirmer.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace reticle {

namespace {
    std::string waitStatusToString(WaitStatus status) {
        switch (status) {
            case WaitStatus::COMPLETED: return "completed";
            case WaitStatus::TIMED_OUT: return "timed_out";
            case WaitStatus::FAILED: return "failed";
            default: return "unknown";
        }
    }
}

nlohmann::json ConfirmationResult::toJson() const {
    nlohmann::json j = {
        {"confirmed", confirmed},
        {"point", point},
        {"returned_node", returned.id},
        {"wait", waitStatusToString(waitStatus)},
        {"detail", detail}
    };
    if (confirmed) {
        j["depth"] = depth;
    }
    if (tried.size() > 1) {
        j["tried"] = tried;
    }
    return j;
}

HitTestConfirmer::HitTestConfirmer(ThreadPool& pool, std::chrono::milliseconds timeout)
    : m_pool(pool), m_timeout(timeout) {}

Point HitTestConfirmer::confirmationPoint(const Candidate& candidate, const ElementSignature& signature,
                                          const ProjectionTransform& transform) {
    const Rect& frame = candidate.attributes.frame();
    Point offset = transform.scale(signature.activationOffset());
    Point point(frame.x + offset.x, frame.y + offset.y);
    return frame.contains(point) ? point : frame.center();
}

std::vector<Point> HitTestConfirmer::nudgePoints(const Candidate& candidate, const Point& first) {
    const Rect& frame = candidate.attributes.frame();
    std::vector<Point> grid;
    for (int row = 1; row <= 3; ++row) {
        for (int column = 1; column <= 3; ++column) {
            Point p(frame.x + frame.width * column / 4.0, frame.y + frame.height * row / 4.0);
            if (!p.near(frame.center())) {
                grid.push_back(p);
            }
        }
    }
    std::stable_sort(grid.begin(), grid.end(), [&first](const Point& a, const Point& b) {
        return a.distanceTo(first) < b.distanceTo(first);
    });

    std::vector<Point> points;
    points.push_back(frame.center());
    points.insert(points.end(), grid.begin(), grid.end());
    points.erase(std::remove_if(points.begin(), points.end(),
                                [&first](const Point& p) { return p.near(first, 1.0); }),
                 points.end());
    return points;
}

ConfirmationResult HitTestConfirmer::confirm(const Candidate& candidate, const ElementSignature& signature,
                                             const ProjectionTransform& transform, IUiIntrospector& introspector,
                                             const WindowRef& window) {
    return confirmAny(candidate, {confirmationPoint(candidate, signature, transform)}, introspector, window);
}

ConfirmationResult HitTestConfirmer::confirmAny(const Candidate& candidate, const std::vector<Point>& points,
                                                IUiIntrospector& introspector, const WindowRef& window) {
    struct HitChain {
        NodeRef returned;
        int depth = -1;
    };

    ConfirmationResult result;
    result.detail = "no point to test";

    const NodeRef wanted = candidate.node;
    const WindowRef target = window;
    IUiIntrospector* source = &introspector;

    for (const Point& point : points) {
        result.point = point;
        result.tried.push_back(point);

        // The parent walk shares the hit test's deadline
        BoundedResult<HitChain> hit = m_pool.runWithDeadline([source, point, target, wanted]() {
            HitChain chain;
            chain.returned = source->elementAt(point, target);
            NodeRef current = chain.returned;
            for (int depth = 0; !current.isNull() && depth <= kMaxDescendantDepth; ++depth) {
                if (current == wanted) {
                    chain.depth = depth;
                    break;
                }
                current = source->parentOf(current);
            }
            return chain;
        }, m_timeout);

        result.waitStatus = hit.status;
        if (!hit.ok()) {
            result.returned = NodeRef();
            result.detail = hit.error;
            RETICLE_LOG_WARNING().component("confirm").message("Hit test did not complete")
                .context("error", hit.error)
                .context("point", point);
            return result;
        }

        result.returned = hit.value->returned;
        result.depth = hit.value->depth;
        result.confirmed = result.depth >= 0;
        if (result.confirmed) {
            result.detail = result.depth == 0 ? "same node" : "descendant of target";
            return result;
        }
        result.detail = result.returned.isNull() ? "nothing at point" : "different node at point";
    }
    return result;
}

} // namespace reticle
