#ifndef RETICLE_POINTER_ACTION_PROVIDER_H
#define RETICLE_POINTER_ACTION_PROVIDER_H

#include "action_provider.h"
#include "mouse_control.h"
#include "window_control.h"

namespace reticle {

/**
 * @brief IActionProvider that drives the OS pointer
 *
 * Native invocation is not available through the pointer, so
 * invokeAction() always answers UNSUPPORTED and the dispatcher falls back
 * to a synthetic click. Windows are raised through the window manager,
 * located by process id and title.
 */
class PointerActionProvider : public IActionProvider {
public:
    PointerActionProvider() = default;
    explicit PointerActionProvider(const ocal::mouse::MouseSettings& settings);

    ActionStatus invokeAction(const NodeRef& node) override;
    ActionStatus syntheticClick(const Point& point) override;
    ActionStatus activateWindow(const WindowInfo& window) override;
};

} // namespace reticle

#endif // RETICLE_POINTER_ACTION_PROVIDER_H
