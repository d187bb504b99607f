#ifndef RETICLE_ACTION_PROVIDER_H
#define RETICLE_ACTION_PROVIDER_H

#include <string>
#include "../common/geometry.h"
#include "../introspection/ui_introspector.h"

namespace reticle {

enum class ActionStatus {
    OK,
    UNSUPPORTED,   // The node or the backend cannot do this
    FAILED
};

inline std::string actionStatusToString(ActionStatus status) {
    switch (status) {
        case ActionStatus::OK: return "ok";
        case ActionStatus::UNSUPPORTED: return "unsupported";
        case ActionStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Side-effecting input collaborator
 *
 * Calls may block; callers that need a bound apply it themselves.
 */
class IActionProvider {
public:
    virtual ~IActionProvider() = default;

    /**
     * @brief Perform the node's native press action
     */
    virtual ActionStatus invokeAction(const NodeRef& node) = 0;

    /**
     * @brief Move the pointer to a screen point and click the primary button
     * @return OK or FAILED
     */
    virtual ActionStatus syntheticClick(const Point& point) = 0;

    /**
     * @brief Bring the window's application to the front and raise the window
     */
    virtual ActionStatus activateWindow(const WindowInfo& window) = 0;
};

} // namespace reticle

#endif // RETICLE_ACTION_PROVIDER_H
