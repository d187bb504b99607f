#include "pipeline_types.h"

namespace reticle {

std::string failureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::NOT_AUTHORIZED: return "NotAuthorized";
        case FailureKind::IDENTITY_MISMATCH: return "IdentityMismatch";
        case FailureKind::NO_CANDIDATE_FOUND: return "NoCandidateFound";
        case FailureKind::CONFIRMATION_FAILED: return "ConfirmationFailed";
        case FailureKind::EXECUTION_FAILED: return "ExecutionFailed";
        case FailureKind::ESCALATION_EXHAUSTED: return "EscalationExhausted";
        case FailureKind::CANCELLED: return "Cancelled";
        case FailureKind::COLLABORATOR_ERROR: return "CollaboratorError";
        default: return "Unknown";
    }
}

std::string outcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::SUCCEEDED: return "succeeded";
        case Outcome::DRY_RUN: return "dry_run";
        case Outcome::FAILED: return "failed";
        default: return "unknown";
    }
}

std::string executionMechanismToString(ExecutionMechanism mechanism) {
    switch (mechanism) {
        case ExecutionMechanism::NATIVE_ACTION: return "native_action";
        case ExecutionMechanism::SYNTHETIC_CLICK: return "synthetic_click";
        default: return "unknown";
    }
}

nlohmann::json PipelineResult::toJson() const {
    nlohmann::json j = {
        {"outcome", outcomeToString(outcome)},
        {"attempts", attempts},
        {"trace", trace.toJson()}
    };
    if (failureKind) {
        j["failure_kind"] = failureKindToString(*failureKind);
    }
    if (executedAt) {
        j["executed_at"] = *executedAt;
    }
    if (plannedPoint) {
        j["planned_point"] = *plannedPoint;
    }
    if (mechanism) {
        j["mechanism"] = executionMechanismToString(*mechanism);
    }
    return j;
}

} // namespace reticle
