#ifndef RETICLE_EXECUTION_DISPATCHER_H
#define RETICLE_EXECUTION_DISPATCHER_H

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pipeline_types.h"
#include "../common/thread_pool.h"
#include "../ocal/action_provider.h"
#include "../targeting/candidate.h"

namespace reticle {

struct ExecutionSettings {
    std::vector<std::string> clickableRoles;
    std::vector<std::string> pressActionNames;
    std::chrono::milliseconds actionTimeout{5000};
    bool fallbackOnRejection = false;   // Try the click in the same stage when native is rejected
};

struct ExecutionResult {
    bool success = false;
    bool timedOut = false;
    std::optional<ExecutionMechanism> mechanism;   // Mechanism that succeeded
    std::optional<ExecutionMechanism> lastTried;
    std::vector<ExecutionMechanism> tried;         // Every mechanism attempted, refused ones included
    std::string detail;
    nlohmann::json attempts = nlohmann::json::array();

    nlohmann::json toJson() const;
};

/**
 * @brief L6: the only stage that touches the live UI
 *
 * A synthetic click goes wherever the pointer is, so the target window is
 * made frontmost first. The click is refused when it cannot be.
 */
class ExecutionDispatcher {
public:
    ExecutionDispatcher(ThreadPool& pool, ExecutionSettings settings);

    /**
     * @brief Clickable role, or an advertised press action
     */
    bool supportsNativeAction(const NodeAttributes& attributes) const;

    ExecutionMechanism preferredMechanism(const NodeAttributes& attributes) const;

    static ExecutionMechanism alternateOf(ExecutionMechanism mechanism);

    /**
     * @brief First usable mechanism for the node that is not in `tried`
     *
     * Native only counts as usable when supportsNativeAction() holds.
     */
    std::optional<ExecutionMechanism> untriedMechanism(const NodeAttributes& attributes,
                                                       const std::vector<ExecutionMechanism>& tried) const;

    /**
     * @brief Native action when supported, synthetic click when native is
     *        unavailable
     *
     * A rejected native action ends the stage unless fallbackOnRejection is
     * set; the click is then left to escalation. A timed-out call ends the
     * stage without trying the other mechanism, since the first action may
     * still land.
     */
    ExecutionResult execute(const Candidate& candidate, const Point& point, const WindowInfo& window,
                            IUiIntrospector& introspector, IActionProvider& provider);

    /**
     * @brief Try exactly one mechanism
     */
    ExecutionResult executeWith(ExecutionMechanism mechanism, const Candidate& candidate, const Point& point,
                                const WindowInfo& window, IUiIntrospector& introspector,
                                IActionProvider& provider);

private:
    ActionStatus attempt(ExecutionMechanism mechanism, const Candidate& candidate, const Point& point,
                         const WindowInfo& window, IUiIntrospector& introspector, IActionProvider& provider,
                         ExecutionResult& result);

    /**
     * @brief Make `window` frontmost, activating it when another window is
     * @return false when another window is still frontmost afterwards
     */
    bool bringToFront(const WindowInfo& window, IUiIntrospector& introspector, IActionProvider& provider,
                      nlohmann::json& record);

    ThreadPool& m_pool;
    ExecutionSettings m_settings;
};

} // namespace reticle

#endif // RETICLE_EXECUTION_DISPATCHER_H
