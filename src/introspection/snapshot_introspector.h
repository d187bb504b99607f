#ifndef RETICLE_SNAPSHOT_INTROSPECTOR_H
#define RETICLE_SNAPSHOT_INTROSPECTOR_H

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>
#include "ui_introspector.h"

namespace reticle {

/**
 * @brief IUiIntrospector over a captured UI state
 *
 * Snapshot document:
 * @code
 * { "trusted": true,
 *   "windows": [ { "id": "w1", "app_name": "Mail", "title": "Inbox",
 *                  "frame": {"x":0,"y":0,"w":1200,"h":800}, "scale": 2.0,
 *                  "root": { "role": "window", "frame": {...},
 *                            "children": [ { "role": "button",
 *                                            "labels": ["Send"], ... } ] } } ] }
 * @endcode
 * Node frames are in screen coordinates. Node ids are optional; missing
 * ids are derived from the node's position in the tree. Windows are listed
 * front-most first; later children are on top of earlier ones. An optional
 * top-level "frontmost" names the window receiving input; it defaults to
 * the first window.
 *
 * Used for offline replays and as the test double for the pipeline. The
 * document can be swapped between calls to model a UI that changes.
 */
class SnapshotIntrospector : public IUiIntrospector {
public:
    SnapshotIntrospector() = default;
    explicit SnapshotIntrospector(const nlohmann::json& snapshot);

    /**
     * @throws ReticleException (FILE_IO_ERROR or SNAPSHOT_FORMAT_ERROR)
     */
    static SnapshotIntrospector fromFile(const std::string& path);

    SnapshotIntrospector(const SnapshotIntrospector& other);
    SnapshotIntrospector& operator=(const SnapshotIntrospector&) = delete;

    /**
     * @brief Replace the whole UI state
     * @throws ReticleException (SNAPSHOT_FORMAT_ERROR) on malformed input;
     *         the previous state is kept
     */
    void load(const nlohmann::json& snapshot);

    void setTrusted(bool trusted);
    void setFrontmost(const WindowRef& window);

    /**
     * @brief Make every call to `method` sleep before answering
     */
    void setCallDelay(const std::string& method, std::chrono::milliseconds delay);

    /**
     * @brief Make every call to `method` throw std::runtime_error
     */
    void setFailure(const std::string& method, bool fail);

    /**
     * @brief Number of calls made to `method` ("elementAt", "children", ...)
     */
    int callCount(const std::string& method) const;
    int totalCalls() const;
    void resetCallCounts();

    // IUiIntrospector
    bool isTrusted() override;
    std::vector<WindowInfo> listWindows(const std::optional<std::string>& appName) override;
    WindowRef frontmostWindow() override;
    std::optional<WindowInfo> windowInfo(const WindowRef& window) override;
    NodeRef rootOf(const WindowRef& window) override;
    std::optional<NodeAttributes> attributes(const NodeRef& node) override;
    NodeRef elementAt(const Point& point, const WindowRef& window) override;
    std::vector<NodeRef> children(const NodeRef& node) override;
    std::vector<NodeRef> siblings(const NodeRef& node) override;
    NodeRef parentOf(const NodeRef& node) override;

private:
    struct Node {
        NodeAttributes attributes;
        std::string parent;
        std::vector<std::string> children;
    };

    struct State {
        bool trusted = true;
        WindowRef frontmost;
        std::vector<WindowInfo> windows;
        std::map<std::string, Node> nodes;
    };

    static State parse(const nlohmann::json& snapshot);
    static std::string addNode(State& state, const nlohmann::json& json,
                               const std::string& parent, const std::string& derivedId);

    void enter(const std::string& method);

    mutable std::mutex m_mutex;
    State m_state;
    std::map<std::string, int> m_calls;
    std::map<std::string, std::chrono::milliseconds> m_delays;
    std::map<std::string, bool> m_failures;
};

} // namespace reticle

#endif // RETICLE_SNAPSHOT_INTROSPECTOR_H
