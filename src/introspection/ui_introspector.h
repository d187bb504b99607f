#ifndef RETICLE_UI_INTROSPECTOR_H
#define RETICLE_UI_INTROSPECTOR_H

#include <string>
#include <vector>
#include <optional>
#include "node_attributes.h"
#include "../common/geometry.h"

namespace reticle {

/**
 * @brief Live top-level window as reported by the introspection backend
 */
struct WindowInfo {
    WindowRef ref;
    std::string appName;
    std::string bundleId;
    int processId = -1;
    std::string title;
    Rect frame;           // Screen coordinates, logical units
    double scale = 1.0;   // Backing scale of the display showing the window
    NodeRef root;
};

/**
 * @brief Read-only access to a live UI tree
 *
 * Implementations wrap one platform accessibility API. Every call may
 * block; callers that need a bound apply it themselves. Calls may throw
 * on backend failure.
 */
class IUiIntrospector {
public:
    virtual ~IUiIntrospector() = default;

    /**
     * @brief Whether this process is allowed to read other applications' UI
     */
    virtual bool isTrusted() = 0;

    /**
     * @brief Visible windows, front-most first
     * @param appName If set, only windows whose application name matches
     *        (case-insensitive)
     */
    virtual std::vector<WindowInfo> listWindows(const std::optional<std::string>& appName) = 0;

    /**
     * @brief Window that currently receives pointer input, or a null ref
     *        when the backend cannot tell
     */
    virtual WindowRef frontmostWindow() = 0;

    /**
     * @brief Fresh information for a window, or nullopt if it is gone
     */
    virtual std::optional<WindowInfo> windowInfo(const WindowRef& window) = 0;

    /**
     * @brief Root node of the window's tree, or a null ref if the window is gone
     */
    virtual NodeRef rootOf(const WindowRef& window) = 0;

    /**
     * @brief Attributes of a node, or nullopt if the node no longer exists
     */
    virtual std::optional<NodeAttributes> attributes(const NodeRef& node) = 0;

    /**
     * @brief Deepest node of `window` containing the screen point, or a null ref
     */
    virtual NodeRef elementAt(const Point& point, const WindowRef& window) = 0;

    virtual std::vector<NodeRef> children(const NodeRef& node) = 0;

    /**
     * @brief Other children of the node's parent, in parent order
     */
    virtual std::vector<NodeRef> siblings(const NodeRef& node) = 0;

    /**
     * @brief Parent node, or a null ref at the window root
     */
    virtual NodeRef parentOf(const NodeRef& node) = 0;
};

} // namespace reticle

#endif // RETICLE_UI_INTROSPECTOR_H
