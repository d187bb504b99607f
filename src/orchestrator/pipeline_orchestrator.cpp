#include "pipeline_orchestrator.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <thread>

namespace reticle {

struct PipelineOrchestrator::RunState {
    const ElementSignature& signature;
    const RunOptions& options;
    LiveContext context;
    EscalationController escalation;
    double highThreshold;

    std::unique_ptr<CandidateScorer> scorer;
    PredictionResult prediction;
    std::optional<Candidate> chosen;
    std::optional<Point> confirmedPoint;
    std::optional<ExecutionMechanism> forcedMechanism;
    std::vector<ExecutionMechanism> triedMechanisms;
    std::vector<NodeRef> excluded;   // Covered at every confirmation point in the bound window
    bool nudgeNext = false;
    bool nudged = false;             // The chosen candidate's nudge points were tested
    int reprojectedAttempt = 0;
    bool executionStarted = false;

    void choose(const std::optional<Candidate>& candidate) {
        chosen = candidate;
        nudgeNext = false;
        nudged = false;
    }

    RunState(const ElementSignature& sig, const RunOptions& opts, EscalationPolicy policy,
             double threshold, double highConfidence, double radiusPx)
        : signature(sig),
          options(opts),
          escalation(policy, threshold, radiusPx),
          highThreshold(std::max(highConfidence, threshold)) {}
};

PipelineOrchestrator::PipelineOrchestrator(std::shared_ptr<IUiIntrospector> introspector,
                                           std::shared_ptr<IActionProvider> actions,
                                           PipelineSettings settings)
    : m_introspector(std::move(introspector)),
      m_actions(std::move(actions)),
      m_settings(std::move(settings)),
      m_identity(m_settings.identity),
      m_search(CandidateSearch::defaultStrategies()),
      m_pool(std::make_unique<ThreadPool>(static_cast<size_t>(std::max(1, m_settings.collaboratorThreads)))) {
    if (!m_introspector || !m_actions) {
        RETICLE_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                      "Pipeline needs an introspector and an action provider", "",
                      "PipelineOrchestrator");
    }
}

PipelineOrchestrator::~PipelineOrchestrator() {
    m_pool->shutdown(false);
}

void PipelineOrchestrator::setRefinementStrategies(CandidateSearch::StrategyList strategies) {
    m_search = CandidateSearch(std::move(strategies));
}

ExecutionSettings PipelineOrchestrator::executionSettings(const RunOptions& options) const {
    ExecutionSettings settings{m_settings.clickableRoles, m_settings.pressActionNames, m_settings.actionTimeout};
    // Without escalation there is no later stage to try the click
    settings.fallbackOnRejection = !options.escalate;
    return settings;
}

bool PipelineOrchestrator::cancelled(const RunOptions& options) const {
    return options.cancellation && options.cancellation->isCancellationRequested();
}

void PipelineOrchestrator::record(RunState& state, PipelineResult& result, Stage stage, bool passed,
                                  const std::string& detail, nlohmann::json data,
                                  const std::string& strategy) const {
    TraceEntry entry;
    entry.stage = stage;
    entry.attempt = state.escalation.attempt();
    entry.passed = passed;
    entry.detail = detail;
    entry.data = std::move(data);
    entry.strategy = strategy;

    if (passed) {
        RETICLE_LOG_DEBUG().component("pipeline").message(stageId(stage) + " " + stageName(stage) + " passed")
            .context("attempt", entry.attempt)
            .context("detail", detail);
    } else {
        RETICLE_LOG_WARNING().component("pipeline").message(stageId(stage) + " " + stageName(stage) + " failed")
            .context("attempt", entry.attempt)
            .context("detail", detail);
    }
    result.trace.record(std::move(entry));
}

void PipelineOrchestrator::finish(RunState& state, PipelineResult& result, Outcome outcome,
                                  std::optional<FailureKind> kind) const {
    result.outcome = outcome;
    result.failureKind = kind;
    result.attempts = state.escalation.attempt();

    RETICLE_LOG_INFO().component("pipeline").message("Replay finished")
        .context("outcome", outcomeToString(outcome))
        .context("failure_kind", kind ? failureKindToString(*kind) : "")
        .context("attempts", result.attempts)
        .context("stages", result.trace.size())
        .context("executed_at", result.executedAt ? nlohmann::json(*result.executedAt) : nlohmann::json());
}

PipelineResult PipelineOrchestrator::run(const ElementSignature& signature, const RunOptions& options) {
    RETICLE_SCOPED_TIMER("pipeline.run");

    EscalationPolicy policy;
    policy.budget = options.maxAttempts.value_or(m_settings.escalationBudget);
    policy.thresholdStep = m_settings.thresholdStep;
    policy.thresholdFloor = m_settings.thresholdFloor;
    policy.radiusStepPx = m_settings.neighborRadiusStepPx;
    policy.maxRadiusPx = m_settings.maxNeighborRadiusPx;

    double threshold = options.minConfidence.value_or(m_settings.acceptanceThreshold);
    RunState state(signature, options, policy, threshold, m_settings.highConfidenceThreshold,
                   m_settings.neighborRadiusPx);
    PipelineResult result;

    std::optional<Stage> next = Stage::L0_AUTHORIZATION;
    while (next) {
        Stage stage = *next;

        // Once L6 has started the run is no longer cancellable
        if (!state.executionStarted && cancelled(options)) {
            record(state, result, stage, false, "cancelled: " + options.cancellation->reason());
            finish(state, result, Outcome::FAILED, FailureKind::CANCELLED);
            break;
        }

        ScopedTimer timer("pipeline." + stageName(stage));
        try {
            switch (stage) {
                case Stage::L0_AUTHORIZATION: next = authorize(state, result); break;
                case Stage::L1_IDENTITY: next = matchIdentity(state, result); break;
                case Stage::L2_PROJECTION: next = project(state, result); break;
                case Stage::L3_PREDICTION: next = predict(state, result); break;
                case Stage::L4_REFINEMENT: next = refine(state, result); break;
                case Stage::L5_CONFIRMATION: next = confirm(state, result); break;
                case Stage::L6_EXECUTION: next = execute(state, result); break;
                default:
                    record(state, result, stage, false, "stage cannot be entered directly");
                    finish(state, result, Outcome::FAILED, FailureKind::COLLABORATOR_ERROR);
                    next.reset();
                    break;
            }
        } catch (const std::exception& e) {
            timer.markFailed();
            ErrorInfo info = ErrorHandler::getInstance().handleException(e, "pipeline " + stageId(stage));
            record(state, result, stage, false, "collaborator error: " + info.message,
                   {{"error_type", errorTypeToString(info.type)}, {"details", info.details}});
            finish(state, result, Outcome::FAILED, FailureKind::COLLABORATOR_ERROR);
            next.reset();
        }
    }

    return result;
}

std::optional<Stage> PipelineOrchestrator::authorize(RunState& state, PipelineResult& result) {
    state.context.reset();
    bool trusted = m_introspector->isTrusted();
    record(state, result, Stage::L0_AUTHORIZATION, trusted,
           trusted ? "process is trusted" : "process is not trusted for UI access");
    if (!trusted) {
        finish(state, result, Outcome::FAILED, FailureKind::NOT_AUTHORIZED);
        return std::nullopt;
    }
    return Stage::L1_IDENTITY;
}

std::optional<Stage> PipelineOrchestrator::matchIdentity(RunState& state, PipelineResult& result) {
    IdentityMatch match = m_identity.match(state.signature, *m_introspector);
    std::string detail = match.matched
        ? "matched \"" + match.window->title + "\" by " + match.titleRule
        : match.windowsWithMatchingApp == 0 ? "no window of \"" + state.signature.appName() + "\""
                                            : "no window title cleared the confidence threshold";
    record(state, result, Stage::L1_IDENTITY, match.matched, detail, match.toJson());
    if (!match.matched) {
        finish(state, result, Outcome::FAILED, FailureKind::IDENTITY_MISMATCH);
        return std::nullopt;
    }

    state.context.bind(*match.window, match.confidence);
    state.choose(std::nullopt);
    state.confirmedPoint.reset();
    state.forcedMechanism.reset();
    state.excluded.clear();
    return Stage::L2_PROJECTION;
}

std::optional<Stage> PipelineOrchestrator::project(RunState& state, PipelineResult& result) {
    const WindowInfo& window = *state.context.window;
    Projection projection = m_projector.project(state.signature, window);
    state.context.projection = projection;
    state.scorer = std::make_unique<CandidateScorer>(state.signature, *m_introspector, m_settings.weights,
                                                     projection.transform.scaleX, projection.transform.scaleY,
                                                     projection.point);
    record(state, result, Stage::L2_PROJECTION, true, driftKindToString(projection.drift), projection.toJson());
    return Stage::L3_PREDICTION;
}

std::optional<Stage> PipelineOrchestrator::predict(RunState& state, PipelineResult& result) {
    SearchContext context{state.signature, *m_introspector, *state.context.window, *state.context.projection,
                          NodeRef(), state.escalation.radiusPx(), m_settings.search};
    state.prediction = m_search.predict(context, *state.scorer, state.highThreshold);

    std::string detail = state.prediction.hitNode.isNull() ? "nothing at projected point"
                       : state.prediction.accepted ? "direct hit accepted"
                       : "direct hit below threshold";
    record(state, result, Stage::L3_PREDICTION, state.prediction.accepted, detail,
           state.prediction.toJson(), "direct_hit");

    if (state.prediction.accepted) {
        state.choose(state.prediction.candidate);
        return Stage::L5_CONFIRMATION;
    }
    return Stage::L4_REFINEMENT;
}

std::optional<Stage> PipelineOrchestrator::refine(RunState& state, PipelineResult& result) {
    int attempt = state.escalation.attempt();
    if (attempt > 1 && state.reprojectedAttempt != attempt) {
        state.reprojectedAttempt = attempt;
        std::optional<WindowInfo> fresh = m_introspector->windowInfo(state.context.window->ref);
        if (!fresh) {
            record(state, result, Stage::L4_REFINEMENT, false, "window closed; re-matching identity");
            return Stage::L1_IDENTITY;
        }
        if (fresh->frame != state.context.window->frame) {
            record(state, result, Stage::L4_REFINEMENT, false, "window frame changed; re-projecting",
                   {{"previous", state.context.window->frame}, {"current", fresh->frame}});
            state.context.bind(*fresh, state.context.identityConfidence);
            state.excluded.clear();
            return Stage::L2_PROJECTION;
        }
    }

    SearchContext context{state.signature, *m_introspector, *state.context.window, *state.context.projection,
                          state.prediction.hitNode, state.escalation.radiusPx(), m_settings.search, state.excluded};
    RefinementResult refinement = m_search.refine(context, *state.scorer, state.escalation.threshold());

    nlohmann::json data = refinement.toJson();
    data["radius_px"] = state.escalation.radiusPx();
    std::string detail = refinement.found() ? "candidate found by " + refinement.strategy
                       : refinement.best ? "best candidate below threshold"
                       : "no candidates";
    record(state, result, Stage::L4_REFINEMENT, refinement.found(), detail, data, refinement.strategy);

    if (refinement.found()) {
        state.choose(refinement.chosen);
        return Stage::L5_CONFIRMATION;
    }
    return escalate(state, result, FailureKind::NO_CANDIDATE_FOUND);
}

std::optional<Stage> PipelineOrchestrator::confirm(RunState& state, PipelineResult& result) {
    HitTestConfirmer confirmer(*m_pool, m_settings.hitTestTimeout);
    ConfirmationResult confirmation;
    if (state.nudgeNext) {
        state.nudgeNext = false;
        state.nudged = true;
        Point first = HitTestConfirmer::confirmationPoint(*state.chosen, state.signature,
                                                          state.context.projection->transform);
        confirmation = confirmer.confirmAny(*state.chosen, HitTestConfirmer::nudgePoints(*state.chosen, first),
                                            *m_introspector, state.context.window->ref);
    } else {
        confirmation = confirmer.confirm(*state.chosen, state.signature, state.context.projection->transform,
                                         *m_introspector, state.context.window->ref);
    }

    nlohmann::json data = confirmation.toJson();
    data["node"] = state.chosen->node.id;
    data["nudged"] = state.nudged;
    record(state, result, Stage::L5_CONFIRMATION, confirmation.confirmed, confirmation.detail, data);

    if (!confirmation.confirmed) {
        return escalate(state, result, FailureKind::CONFIRMATION_FAILED);
    }

    state.confirmedPoint = confirmation.point;
    result.plannedPoint = confirmation.point;

    if (state.options.dryRun) {
        ExecutionDispatcher dispatcher(*m_pool, executionSettings(state.options));
        result.mechanism = dispatcher.preferredMechanism(state.chosen->attributes);
        finish(state, result, Outcome::DRY_RUN);
        return std::nullopt;
    }
    return Stage::L6_EXECUTION;
}

std::optional<Stage> PipelineOrchestrator::execute(RunState& state, PipelineResult& result) {
    if (!state.confirmedPoint || !state.chosen) {
        record(state, result, Stage::L6_EXECUTION, false, "no confirmed target in this run");
        finish(state, result, Outcome::FAILED, FailureKind::CONFIRMATION_FAILED);
        return std::nullopt;
    }

    state.executionStarted = true;
    ExecutionDispatcher dispatcher(*m_pool, executionSettings(state.options));
    const WindowInfo& window = *state.context.window;
    ExecutionResult execution = state.forcedMechanism
        ? dispatcher.executeWith(*state.forcedMechanism, *state.chosen, *state.confirmedPoint, window,
                                 *m_introspector, *m_actions)
        : dispatcher.execute(*state.chosen, *state.confirmedPoint, window, *m_introspector, *m_actions);
    state.triedMechanisms.insert(state.triedMechanisms.end(), execution.tried.begin(), execution.tried.end());

    std::string mechanism = execution.lastTried ? executionMechanismToString(*execution.lastTried) : "";
    record(state, result, Stage::L6_EXECUTION, execution.success, execution.detail, execution.toJson(), mechanism);

    if (execution.success) {
        result.executedAt = state.confirmedPoint;
        result.mechanism = execution.mechanism;
        finish(state, result, Outcome::SUCCEEDED);
        return std::nullopt;
    }
    FailureContext failure;
    failure.timedOut = execution.timedOut;
    failure.untriedMechanism = dispatcher.untriedMechanism(state.chosen->attributes, state.triedMechanisms);
    return escalate(state, result, FailureKind::EXECUTION_FAILED, failure);
}

std::optional<Stage> PipelineOrchestrator::escalate(RunState& state, PipelineResult& result, FailureKind kind,
                                                    FailureContext failure) {
    if (!state.options.escalate) {
        finish(state, result, Outcome::FAILED, kind);
        return std::nullopt;
    }

    if (kind == FailureKind::CONFIRMATION_FAILED && !state.escalation.exhausted()) {
        std::optional<WindowInfo> fresh = m_introspector->windowInfo(state.context.window->ref);
        failure.windowChanged = !fresh || fresh->frame != state.context.window->frame;
        failure.nudged = state.nudged;
    }

    EscalationDecision decision = state.escalation.onFailure(kind, failure);
    nlohmann::json data = decision.toJson();
    data["failure"] = failureKindToString(kind);
    record(state, result, Stage::L7_ESCALATION, decision.retry, decision.reason, data);

    if (!decision.retry) {
        bool exhausted = decision.budgetExhausted && !(kind == FailureKind::EXECUTION_FAILED && failure.timedOut);
        finish(state, result, Outcome::FAILED, exhausted ? FailureKind::ESCALATION_EXHAUSTED : kind);
        return std::nullopt;
    }

    if (m_settings.retryDelay.count() > 0) {
        std::this_thread::sleep_for(m_settings.retryDelay);
    }

    if (decision.reentry == Stage::L6_EXECUTION) {
        state.forcedMechanism = decision.mechanism;
    } else if (decision.reentry == Stage::L5_CONFIRMATION) {
        state.nudgeNext = decision.nudge;
        state.confirmedPoint.reset();
    } else {
        if (decision.excludeChosen && state.chosen) {
            state.excluded.push_back(state.chosen->node);
        }
        state.choose(std::nullopt);
        state.confirmedPoint.reset();
    }
    return decision.reentry;
}

} // namespace reticle
