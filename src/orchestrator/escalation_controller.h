#ifndef RETICLE_ESCALATION_CONTROLLER_H
#define RETICLE_ESCALATION_CONTROLLER_H

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "diagnostic_trace.h"
#include "pipeline_types.h"

namespace reticle {

struct EscalationPolicy {
    int budget = 3;                  // Total attempts, the first included
    double thresholdStep = 0.05;
    double thresholdFloor = 0.50;
    double radiusStepPx = 16.0;
    double maxRadiusPx = 64.0;
};

/**
 * @brief What the orchestrator knows about a failure beyond its kind
 */
struct FailureContext {
    std::optional<ExecutionMechanism> untriedMechanism;  // ExecutionFailed: usable mechanism not yet tried this run
    bool timedOut = false;                               // ExecutionFailed: the action may still land
    bool windowChanged = false;                          // ConfirmationFailed: window moved, resized or closed
    bool nudged = false;                                 // ConfirmationFailed: nudge points already tested
};

/**
 * @brief Parameters for the next attempt
 */
struct EscalationDecision {
    bool retry = false;
    bool budgetExhausted = false;
    Stage reentry = Stage::L1_IDENTITY;
    double threshold = 0.0;
    double radiusPx = 0.0;
    std::optional<ExecutionMechanism> mechanism;  // Forced mechanism for an L6 re-entry
    bool nudge = false;                           // L5 re-entry tests points around the first one
    bool excludeChosen = false;                   // L4 re-entry skips the node that failed confirmation
    std::string reason;

    nlohmann::json toJson() const;
};

/**
 * @brief L7: decides whether and where a failed attempt is retried
 *
 * Re-entry points:
 *  - NoCandidateFound re-enters L4 with a wider radius and a lower threshold
 *  - ConfirmationFailed re-enters L1 when the window changed, else L5 with
 *    nudged points, then L4 relaxed and without the covered node
 *  - ExecutionFailed re-enters L6 once with a mechanism not yet tried
 * Any other failure kind is not retried.
 */
class EscalationController {
public:
    EscalationController(EscalationPolicy policy, double initialThreshold, double initialRadiusPx);

    EscalationDecision onFailure(FailureKind kind, const FailureContext& failure = FailureContext());

    int attempt() const { return m_attempt; }
    bool exhausted() const { return m_attempt >= m_policy.budget; }
    double threshold() const { return m_threshold; }
    double radiusPx() const { return m_radiusPx; }

private:
    void relax();

    EscalationPolicy m_policy;
    int m_attempt = 1;
    double m_threshold;
    double m_radiusPx;
    bool m_executionRetried = false;
};

} // namespace reticle

#endif // RETICLE_ESCALATION_CONTROLLER_H
