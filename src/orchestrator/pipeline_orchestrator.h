#ifndef RETICLE_PIPELINE_ORCHESTRATOR_H
#define RETICLE_PIPELINE_ORCHESTRATOR_H

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "diagnostic_trace.h"
#include "escalation_controller.h"
#include "execution_dispatcher.h"
#include "live_context.h"
#include "pipeline_settings.h"
#include "pipeline_types.h"
#include "../common/thread_pool.h"
#include "../introspection/ui_introspector.h"
#include "../ocal/action_provider.h"
#include "../targeting/candidate_search.h"
#include "../targeting/geometry_projector.h"
#include "../targeting/hit_test_confirmer.h"
#include "../targeting/identity_matcher.h"

namespace reticle {

/**
 * @brief Runs the L0..L7 replay pipeline for one recorded click
 *
 * Stages run in order L0 -> L1 -> L2 -> L3 -> (L4 on miss) -> L5 -> L6.
 * Failures at L4, L5 and L6 go to L7, which may send the run back to L1,
 * L4, L5 or L6 within the attempt budget. Nothing is executed unless L5
 * confirmed the target in the same run.
 *
 * Failures are reported in PipelineResult, never thrown. Runs against the
 * same live application must be serialized by the caller; the orchestrator
 * keeps no run state between calls.
 */
class PipelineOrchestrator {
public:
    PipelineOrchestrator(std::shared_ptr<IUiIntrospector> introspector,
                         std::shared_ptr<IActionProvider> actions,
                         PipelineSettings settings = PipelineSettings());
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    PipelineResult run(const ElementSignature& signature, const RunOptions& options = RunOptions());

    /**
     * @brief Replace the L4 strategies, e.g. to append a VisualSearchStrategy
     */
    void setRefinementStrategies(CandidateSearch::StrategyList strategies);

    const PipelineSettings& settings() const { return m_settings; }

private:
    struct RunState;

    bool cancelled(const RunOptions& options) const;
    void finish(RunState& state, PipelineResult& result, Outcome outcome,
                std::optional<FailureKind> kind = std::nullopt) const;

    // Each stage returns the next stage to run, or nullopt when the run is over
    std::optional<Stage> authorize(RunState& state, PipelineResult& result);
    std::optional<Stage> matchIdentity(RunState& state, PipelineResult& result);
    std::optional<Stage> project(RunState& state, PipelineResult& result);
    std::optional<Stage> predict(RunState& state, PipelineResult& result);
    std::optional<Stage> refine(RunState& state, PipelineResult& result);
    std::optional<Stage> confirm(RunState& state, PipelineResult& result);
    std::optional<Stage> execute(RunState& state, PipelineResult& result);
    std::optional<Stage> escalate(RunState& state, PipelineResult& result, FailureKind kind,
                                  FailureContext failure = FailureContext());

    ExecutionSettings executionSettings(const RunOptions& options) const;

    void record(RunState& state, PipelineResult& result, Stage stage, bool passed,
                const std::string& detail, nlohmann::json data = nlohmann::json::object(),
                const std::string& strategy = "") const;

    std::shared_ptr<IUiIntrospector> m_introspector;
    std::shared_ptr<IActionProvider> m_actions;
    PipelineSettings m_settings;

    IdentityMatcher m_identity;
    GeometryProjector m_projector;
    CandidateSearch m_search;

    // Declared last: destroyed first, joining abandoned collaborator calls
    // while the collaborators are still alive
    std::unique_ptr<ThreadPool> m_pool;
};

} // namespace reticle

#endif // RETICLE_PIPELINE_ORCHESTRATOR_H
