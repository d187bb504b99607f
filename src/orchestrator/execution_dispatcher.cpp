#include "execution_dispatcher.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace reticle {

using utils::StringUtils;

nlohmann::json ExecutionResult::toJson() const {
    nlohmann::json j = {
        {"success", success},
        {"timed_out", timedOut},
        {"detail", detail},
        {"attempts", attempts}
    };
    if (mechanism) {
        j["mechanism"] = executionMechanismToString(*mechanism);
    }
    return j;
}

ExecutionDispatcher::ExecutionDispatcher(ThreadPool& pool, ExecutionSettings settings)
    : m_pool(pool), m_settings(std::move(settings)) {}

bool ExecutionDispatcher::supportsNativeAction(const NodeAttributes& attributes) const {
    std::string role = canonicalRole(attributes.role());
    for (const auto& clickable : m_settings.clickableRoles) {
        if (canonicalRole(clickable) == role) {
            return true;
        }
    }

    std::optional<std::vector<std::string>> actions = attributes.getStringList(NodeAttributes::kActions);
    if (!actions) {
        return false;
    }
    for (const auto& action : *actions) {
        std::string name = StringUtils::toLowerCase(StringUtils::trim(action));
        if (std::find(m_settings.pressActionNames.begin(), m_settings.pressActionNames.end(), name) !=
            m_settings.pressActionNames.end()) {
            return true;
        }
    }
    return false;
}

ExecutionMechanism ExecutionDispatcher::preferredMechanism(const NodeAttributes& attributes) const {
    return supportsNativeAction(attributes) ? ExecutionMechanism::NATIVE_ACTION : ExecutionMechanism::SYNTHETIC_CLICK;
}

ExecutionMechanism ExecutionDispatcher::alternateOf(ExecutionMechanism mechanism) {
    return mechanism == ExecutionMechanism::NATIVE_ACTION ? ExecutionMechanism::SYNTHETIC_CLICK
                                                          : ExecutionMechanism::NATIVE_ACTION;
}

std::optional<ExecutionMechanism> ExecutionDispatcher::untriedMechanism(
    const NodeAttributes& attributes, const std::vector<ExecutionMechanism>& tried) const {
    ExecutionMechanism preferred = preferredMechanism(attributes);
    for (ExecutionMechanism mechanism : {preferred, alternateOf(preferred)}) {
        if (mechanism == ExecutionMechanism::NATIVE_ACTION && !supportsNativeAction(attributes)) {
            continue;
        }
        if (std::find(tried.begin(), tried.end(), mechanism) == tried.end()) {
            return mechanism;
        }
    }
    return std::nullopt;
}

bool ExecutionDispatcher::bringToFront(const WindowInfo& window, IUiIntrospector& introspector,
                                       IActionProvider& provider, nlohmann::json& record) {
    IUiIntrospector* source = &introspector;
    auto frontmost = [this, source]() {
        return m_pool.runWithDeadline([source]() { return source->frontmostWindow(); }, m_settings.actionTimeout);
    };

    BoundedResult<WindowRef> before = frontmost();
    nlohmann::json activation = {{"frontmost_before", before.ok() ? before.value->id : ""}};
    if (before.ok() && *before.value == window.ref) {
        activation["status"] = "already_frontmost";
        record["activation"] = activation;
        return true;
    }

    IActionProvider* target = &provider;
    WindowInfo info = window;
    BoundedResult<ActionStatus> raised = m_pool.runWithDeadline(
        [target, info]() { return target->activateWindow(info); }, m_settings.actionTimeout);
    activation["status"] = raised.ok() ? actionStatusToString(*raised.value)
                         : raised.status == WaitStatus::TIMED_OUT ? "timed_out" : "error";
    if (!raised.ok()) {
        activation["detail"] = raised.error;
    }

    BoundedResult<WindowRef> after = frontmost();
    activation["frontmost_after"] = after.ok() ? after.value->id : "";
    record["activation"] = activation;

    // A null ref means the backend cannot tell; the activation request stands
    bool front = after.ok() && (after.value->isNull() || *after.value == window.ref);
    RETICLE_LOG_DEBUG().component("execution").message("Activated target window")
        .context("window", window.ref.id)
        .context("activation", activation)
        .context("frontmost", front);
    return front;
}

ActionStatus ExecutionDispatcher::attempt(ExecutionMechanism mechanism, const Candidate& candidate, const Point& point,
                                          const WindowInfo& window, IUiIntrospector& introspector,
                                          IActionProvider& provider, ExecutionResult& result) {
    result.lastTried = mechanism;
    result.tried.push_back(mechanism);
    nlohmann::json record = {{"mechanism", executionMechanismToString(mechanism)}};

    if (mechanism == ExecutionMechanism::SYNTHETIC_CLICK) {
        if (!window.frame.contains(point)) {
            record["status"] = "refused";
            record["detail"] = "point outside the live window";
            result.attempts.push_back(record);
            result.detail = "synthetic click refused outside the window";
            return ActionStatus::FAILED;
        }
        if (!bringToFront(window, introspector, provider, record)) {
            record["status"] = "refused";
            record["detail"] = "window is not frontmost";
            result.attempts.push_back(record);
            result.detail = "synthetic click refused: window is not frontmost";
            RETICLE_LOG_WARNING().component("execution").message("Target window could not be brought to front")
                .context("window", window.ref.id)
                .context("activation", record["activation"]);
            return ActionStatus::FAILED;
        }
    }

    IActionProvider* target = &provider;
    NodeRef node = candidate.node;
    BoundedResult<ActionStatus> call = mechanism == ExecutionMechanism::NATIVE_ACTION
        ? m_pool.runWithDeadline([target, node]() { return target->invokeAction(node); }, m_settings.actionTimeout)
        : m_pool.runWithDeadline([target, point]() { return target->syntheticClick(point); }, m_settings.actionTimeout);

    ActionStatus status = ActionStatus::FAILED;
    if (call.status == WaitStatus::TIMED_OUT) {
        result.timedOut = true;
        record["status"] = "timed_out";
        result.detail = call.error;
    } else if (call.status == WaitStatus::FAILED) {
        record["status"] = "error";
        record["detail"] = call.error;
        result.detail = call.error;
    } else {
        status = *call.value;
        record["status"] = actionStatusToString(status);
        if (status != ActionStatus::OK) {
            result.detail = executionMechanismToString(mechanism) + " " + actionStatusToString(status);
        }
    }
    result.attempts.push_back(record);

    if (status == ActionStatus::OK) {
        result.success = true;
        result.mechanism = mechanism;
        result.detail = executionMechanismToString(mechanism) + " succeeded";
    }
    return status;
}

ExecutionResult ExecutionDispatcher::execute(const Candidate& candidate, const Point& point, const WindowInfo& window,
                                             IUiIntrospector& introspector, IActionProvider& provider) {
    ExecutionResult result;

    if (supportsNativeAction(candidate.attributes)) {
        ActionStatus status = attempt(ExecutionMechanism::NATIVE_ACTION, candidate, point, window,
                                      introspector, provider, result);
        if (result.success || result.timedOut) {
            return result;
        }
        if (status != ActionStatus::UNSUPPORTED && !m_settings.fallbackOnRejection) {
            return result;
        }
        RETICLE_LOG_DEBUG().component("execution").message("Native action unavailable, falling back to click")
            .context("node", candidate.node.id)
            .context("attempts", result.attempts);
    } else {
        result.attempts.push_back({
            {"mechanism", executionMechanismToString(ExecutionMechanism::NATIVE_ACTION)},
            {"status", "skipped"},
            {"detail", "role has no native action"}
        });
    }

    attempt(ExecutionMechanism::SYNTHETIC_CLICK, candidate, point, window, introspector, provider, result);
    return result;
}

ExecutionResult ExecutionDispatcher::executeWith(ExecutionMechanism mechanism, const Candidate& candidate,
                                                 const Point& point, const WindowInfo& window,
                                                 IUiIntrospector& introspector, IActionProvider& provider) {
    ExecutionResult result;
    attempt(mechanism, candidate, point, window, introspector, provider, result);
    return result;
}

} // namespace reticle
