#ifndef RETICLE_HIT_TEST_CONFIRMER_H
#define RETICLE_HIT_TEST_CONFIRMER_H

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "candidate.h"
#include "geometry_projector.h"
#include "../common/thread_pool.h"

namespace reticle {

struct ConfirmationResult {
    bool confirmed = false;
    Point point;                   // Confirmed point, or the last point tested
    NodeRef returned;
    int depth = -1;                // Levels from `returned` up to the candidate; -1 when not reached
    WaitStatus waitStatus = WaitStatus::COMPLETED;
    std::string detail;
    std::vector<Point> tried;

    nlohmann::json toJson() const;
};

/**
 * @brief L5: re-queries the live tree at the chosen point and requires the
 *        candidate back
 *
 * Hit tests return the deepest node at a point, so a node whose ancestor
 * chain reaches the candidate (a label inside a button) also confirms it.
 * Nothing is matched by similarity here.
 */
class HitTestConfirmer {
public:
    static constexpr int kMaxDescendantDepth = 16;

    HitTestConfirmer(ThreadPool& pool, std::chrono::milliseconds timeout);

    /**
     * @brief Where the candidate would be clicked
     *
     * The recorded activation offset, scaled into the candidate's frame,
     * when it lands inside the frame; the frame center otherwise.
     */
    static Point confirmationPoint(const Candidate& candidate, const ElementSignature& signature,
                                   const ProjectionTransform& transform);

    /**
     * @brief Alternative points inside the candidate's frame, for when the
     *        first point is covered
     *
     * The frame center, then a 3x3 grid at quarter steps of the frame,
     * nearest to `first` first. Points within a pixel of `first` are left out.
     */
    static std::vector<Point> nudgePoints(const Candidate& candidate, const Point& first);

    /**
     * @brief Hit test with a bounded wait. A timeout or a collaborator
     *        exception is a failed confirmation.
     */
    ConfirmationResult confirm(const Candidate& candidate, const ElementSignature& signature,
                               const ProjectionTransform& transform, IUiIntrospector& introspector,
                               const WindowRef& window);

    /**
     * @brief Hit test each point in order until one confirms the candidate
     *
     * Stops at the first timeout or collaborator exception.
     */
    ConfirmationResult confirmAny(const Candidate& candidate, const std::vector<Point>& points,
                                  IUiIntrospector& introspector, const WindowRef& window);

private:
    ThreadPool& m_pool;
    std::chrono::milliseconds m_timeout;
};

} // namespace reticle

#endif // RETICLE_HIT_TEST_CONFIRMER_H
