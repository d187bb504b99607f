#include "pointer_action_provider.h"
#include "../common/structured_logger.h"
#include <cmath>

namespace reticle {

PointerActionProvider::PointerActionProvider(const ocal::mouse::MouseSettings& settings) {
    ocal::mouse::setSettings(settings);
}

ActionStatus PointerActionProvider::invokeAction(const NodeRef& node) {
    (void)node;
    return ActionStatus::UNSUPPORTED;
}

ActionStatus PointerActionProvider::syntheticClick(const Point& point) {
    if (!ocal::mouse::isSupported()) {
        RETICLE_LOG_WARNING().component("pointer").message("No pointer injection backend in this build");
        return ActionStatus::FAILED;
    }

    ocal::mouse::Point target(static_cast<int>(std::lround(point.x)), static_cast<int>(std::lround(point.y)));
    return ocal::mouse::clickAt(target) ? ActionStatus::OK : ActionStatus::FAILED;
}

ActionStatus PointerActionProvider::activateWindow(const WindowInfo& window) {
    if (!ocal::window::isSupported() || window.processId < 0) {
        return ActionStatus::UNSUPPORTED;
    }
    return ocal::window::bringToFront(window.processId, window.title) ? ActionStatus::OK : ActionStatus::FAILED;
}

} // namespace reticle
