#include "escalation_controller.h"
#include <algorithm>

namespace reticle {

nlohmann::json EscalationDecision::toJson() const {
    nlohmann::json j = {
        {"retry", retry},
        {"budget_exhausted", budgetExhausted},
        {"reason", reason},
        {"threshold", threshold},
        {"radius_px", radiusPx}
    };
    if (retry) {
        j["reentry"] = stageId(reentry);
    }
    if (mechanism) {
        j["mechanism"] = executionMechanismToString(*mechanism);
    }
    if (nudge) {
        j["nudge"] = true;
    }
    if (excludeChosen) {
        j["exclude_chosen"] = true;
    }
    return j;
}

EscalationController::EscalationController(EscalationPolicy policy, double initialThreshold, double initialRadiusPx)
    : m_policy(policy), m_threshold(initialThreshold), m_radiusPx(initialRadiusPx) {
    m_policy.budget = std::max(1, m_policy.budget);
}

void EscalationController::relax() {
    m_radiusPx = std::min(m_radiusPx + m_policy.radiusStepPx, m_policy.maxRadiusPx);
    m_threshold = std::max(m_threshold - m_policy.thresholdStep, m_policy.thresholdFloor);
}

EscalationDecision EscalationController::onFailure(FailureKind kind, const FailureContext& failure) {
    EscalationDecision decision;
    decision.threshold = m_threshold;
    decision.radiusPx = m_radiusPx;

    if (exhausted()) {
        decision.budgetExhausted = true;
        decision.reason = "attempt budget of " + std::to_string(m_policy.budget) + " used";
        return decision;
    }

    switch (kind) {
        case FailureKind::NO_CANDIDATE_FOUND:
            relax();
            decision.retry = true;
            decision.reentry = Stage::L4_REFINEMENT;
            decision.reason = "widen search";
            break;

        case FailureKind::CONFIRMATION_FAILED:
            decision.retry = true;
            if (failure.windowChanged) {
                decision.reentry = Stage::L1_IDENTITY;
                decision.reason = "window changed; re-match window";
            } else if (!failure.nudged) {
                decision.reentry = Stage::L5_CONFIRMATION;
                decision.nudge = true;
                decision.reason = "nudge confirmation point";
            } else {
                relax();
                decision.reentry = Stage::L4_REFINEMENT;
                decision.excludeChosen = true;
                decision.reason = "target covered at every nudge point; search without it";
            }
            break;

        case FailureKind::EXECUTION_FAILED:
            if (failure.timedOut) {
                decision.reason = "action timed out and may still land";
            } else if (m_executionRetried) {
                decision.reason = "execution already retried";
            } else if (!failure.untriedMechanism) {
                decision.reason = "no untried mechanism left";
            } else {
                m_executionRetried = true;
                decision.retry = true;
                decision.reentry = Stage::L6_EXECUTION;
                decision.mechanism = failure.untriedMechanism;
                decision.reason = "retry with alternate mechanism";
            }
            break;

        default:
            decision.reason = failureKindToString(kind) + " is not retried";
            break;
    }

    if (decision.retry) {
        ++m_attempt;
        decision.threshold = m_threshold;
        decision.radiusPx = m_radiusPx;
    }
    return decision;
}

} // namespace reticle
