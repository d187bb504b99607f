#ifndef RETICLE_PIPELINE_TYPES_H
#define RETICLE_PIPELINE_TYPES_H

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "diagnostic_trace.h"
#include "../common/cancellation_token.h"
#include "../common/geometry.h"

namespace reticle {

enum class FailureKind {
    NOT_AUTHORIZED,
    IDENTITY_MISMATCH,
    NO_CANDIDATE_FOUND,
    CONFIRMATION_FAILED,
    EXECUTION_FAILED,
    ESCALATION_EXHAUSTED,
    CANCELLED,
    COLLABORATOR_ERROR   // An introspection call threw outside the bounded stages
};

std::string failureKindToString(FailureKind kind);

enum class Outcome {
    SUCCEEDED,
    DRY_RUN,     // Every check passed; nothing was executed
    FAILED
};

std::string outcomeToString(Outcome outcome);

enum class ExecutionMechanism {
    NATIVE_ACTION,
    SYNTHETIC_CLICK
};

std::string executionMechanismToString(ExecutionMechanism mechanism);

struct RunOptions {
    bool dryRun = false;
    bool escalate = true;
    std::optional<double> minConfidence;     // Overrides the acceptance threshold
    std::optional<int> maxAttempts;          // Overrides the escalation budget
    std::shared_ptr<CancellationToken> cancellation;
};

struct PipelineResult {
    Outcome outcome = Outcome::FAILED;
    std::optional<FailureKind> failureKind;
    DiagnosticTrace trace;
    std::optional<Point> executedAt;
    std::optional<ExecutionMechanism> mechanism;
    std::optional<Point> plannedPoint;       // Confirmed point, also set for dry runs
    int attempts = 0;

    bool succeeded() const { return outcome == Outcome::SUCCEEDED; }
    nlohmann::json toJson() const;
};

} // namespace reticle

#endif // RETICLE_PIPELINE_TYPES_H
