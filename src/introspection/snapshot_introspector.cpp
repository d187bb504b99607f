#include "snapshot_introspector.h"
#include "../common/error_handler.h"
#include "../common/file_utils.h"
#include "../common/json_utils.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <stdexcept>
#include <thread>

namespace reticle {

using utils::JsonUtils;
using utils::StringUtils;

SnapshotIntrospector::SnapshotIntrospector(const nlohmann::json& snapshot)
    : m_state(parse(snapshot)) {}

SnapshotIntrospector::SnapshotIntrospector(const SnapshotIntrospector& other) {
    std::lock_guard<std::mutex> lock(other.m_mutex);
    m_state = other.m_state;
    m_delays = other.m_delays;
    m_failures = other.m_failures;
}

SnapshotIntrospector SnapshotIntrospector::fromFile(const std::string& path) {
    nlohmann::json snapshot;
    if (!utils::FileUtils::loadJsonFromFile(path, snapshot)) {
        RETICLE_THROW(ErrorType::FILE_IO_ERROR, ErrorSeverity::MEDIUM,
                      "Cannot load UI snapshot", path, "SnapshotIntrospector::fromFile");
    }
    return SnapshotIntrospector(snapshot);
}

void SnapshotIntrospector::load(const nlohmann::json& snapshot) {
    State parsed = parse(snapshot);
    RETICLE_LOG_DEBUG().component("snapshot").message("UI snapshot loaded")
        .context("windows", parsed.windows.size())
        .context("nodes", parsed.nodes.size());
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = std::move(parsed);
}

SnapshotIntrospector::State SnapshotIntrospector::parse(const nlohmann::json& snapshot) {
    nlohmann::json windows;
    if (!snapshot.is_object() || !JsonUtils::getArrayField(snapshot, "windows", windows)) {
        RETICLE_THROW(ErrorType::SNAPSHOT_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Snapshot must be an object with a \"windows\" array", "", "SnapshotIntrospector::parse");
    }

    State state;
    state.trusted = JsonUtils::getBoolField(snapshot, "trusted", true);

    for (size_t i = 0; i < windows.size(); ++i) {
        const auto& w = windows[i];
        if (!w.is_object() || !w.contains("frame") || !w.contains("root")) {
            RETICLE_THROW(ErrorType::SNAPSHOT_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                          "Window needs \"frame\" and \"root\"", "window index " + std::to_string(i),
                          "SnapshotIntrospector::parse");
        }

        WindowInfo info;
        info.ref = WindowRef(JsonUtils::getStringField(w, "id", "w" + std::to_string(i + 1)));
        info.appName = JsonUtils::getStringField(w, "app_name");
        info.bundleId = JsonUtils::getStringField(w, "bundle_id");
        info.processId = JsonUtils::getIntField(w, "pid", -1);
        info.title = JsonUtils::getStringField(w, "title");
        info.scale = JsonUtils::getDoubleField(w, "scale", 1.0);
        try {
            info.frame = w["frame"].get<Rect>();
        } catch (const nlohmann::json::exception& e) {
            RETICLE_THROW(ErrorType::SNAPSHOT_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                          "Malformed window frame", e.what(), "SnapshotIntrospector::parse");
        }
        info.root = NodeRef(addNode(state, w["root"], "", info.ref.id + "/root"));
        state.windows.push_back(info);
    }

    std::string frontmost = JsonUtils::getStringField(snapshot, "frontmost");
    if (!frontmost.empty()) {
        state.frontmost = WindowRef(frontmost);
    } else if (!state.windows.empty()) {
        state.frontmost = state.windows.front().ref;
    }

    return state;
}

std::string SnapshotIntrospector::addNode(State& state, const nlohmann::json& json,
                                          const std::string& parent, const std::string& derivedId) {
    std::string id = JsonUtils::getStringField(json, "id", derivedId);
    if (state.nodes.count(id) > 0) {
        RETICLE_THROW(ErrorType::SNAPSHOT_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Duplicate node id", id, "SnapshotIntrospector::addNode");
    }

    Node node;
    node.attributes = NodeAttributes::fromJson(json);
    node.parent = parent;
    state.nodes.emplace(id, node);

    nlohmann::json children;
    if (JsonUtils::getArrayField(json, "children", children)) {
        std::vector<std::string> childIds;
        for (size_t i = 0; i < children.size(); ++i) {
            childIds.push_back(addNode(state, children[i], id, id + "/" + std::to_string(i)));
        }
        state.nodes[id].children = childIds;
    }
    return id;
}

void SnapshotIntrospector::setTrusted(bool trusted) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state.trusted = trusted;
}

void SnapshotIntrospector::setFrontmost(const WindowRef& window) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state.frontmost = window;
}

void SnapshotIntrospector::setCallDelay(const std::string& method, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_delays[method] = delay;
}

void SnapshotIntrospector::setFailure(const std::string& method, bool fail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failures[method] = fail;
}

int SnapshotIntrospector::callCount(const std::string& method) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_calls.find(method);
    return it == m_calls.end() ? 0 : it->second;
}

int SnapshotIntrospector::totalCalls() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    int total = 0;
    for (const auto& entry : m_calls) {
        total += entry.second;
    }
    return total;
}

void SnapshotIntrospector::resetCallCounts() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_calls.clear();
}

void SnapshotIntrospector::enter(const std::string& method) {
    std::chrono::milliseconds delay(0);
    bool fail = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls[method]++;
        auto d = m_delays.find(method);
        if (d != m_delays.end()) {
            delay = d->second;
        }
        auto f = m_failures.find(method);
        fail = f != m_failures.end() && f->second;
    }

    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
    if (fail) {
        throw std::runtime_error("snapshot backend failure in " + method);
    }
}

bool SnapshotIntrospector::isTrusted() {
    enter("isTrusted");
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.trusted;
}

std::vector<WindowInfo> SnapshotIntrospector::listWindows(const std::optional<std::string>& appName) {
    enter("listWindows");
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!appName) {
        return m_state.windows;
    }

    std::string wanted = StringUtils::normalizeText(*appName);
    std::vector<WindowInfo> matching;
    for (const auto& window : m_state.windows) {
        if (StringUtils::normalizeText(window.appName) == wanted) {
            matching.push_back(window);
        }
    }
    return matching;
}

WindowRef SnapshotIntrospector::frontmostWindow() {
    enter("frontmostWindow");
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.frontmost;
}

std::optional<WindowInfo> SnapshotIntrospector::windowInfo(const WindowRef& window) {
    enter("windowInfo");
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& info : m_state.windows) {
        if (info.ref == window) {
            return info;
        }
    }
    return std::nullopt;
}

NodeRef SnapshotIntrospector::rootOf(const WindowRef& window) {
    enter("rootOf");
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& info : m_state.windows) {
        if (info.ref == window) {
            return info.root;
        }
    }
    return NodeRef();
}

std::optional<NodeAttributes> SnapshotIntrospector::attributes(const NodeRef& node) {
    enter("attributes");
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_state.nodes.find(node.id);
    if (it == m_state.nodes.end()) {
        return std::nullopt;
    }
    return it->second.attributes;
}

NodeRef SnapshotIntrospector::elementAt(const Point& point, const WindowRef& window) {
    enter("elementAt");
    std::lock_guard<std::mutex> lock(m_mutex);

    const WindowInfo* info = nullptr;
    for (const auto& w : m_state.windows) {
        if (w.ref == window) {
            info = &w;
            break;
        }
    }
    if (!info || !info->frame.contains(point)) {
        return NodeRef();
    }

    std::string current = info->root.id;
    auto rootIt = m_state.nodes.find(current);
    if (rootIt == m_state.nodes.end() || !rootIt->second.attributes.frame().contains(point)) {
        return NodeRef();
    }

    bool descended = true;
    while (descended) {
        descended = false;
        const Node& node = m_state.nodes.at(current);
        // Last child is drawn on top
        for (auto child = node.children.rbegin(); child != node.children.rend(); ++child) {
            if (m_state.nodes.at(*child).attributes.frame().contains(point)) {
                current = *child;
                descended = true;
                break;
            }
        }
    }
    return NodeRef(current);
}

std::vector<NodeRef> SnapshotIntrospector::children(const NodeRef& node) {
    enter("children");
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<NodeRef> result;
    auto it = m_state.nodes.find(node.id);
    if (it != m_state.nodes.end()) {
        for (const auto& child : it->second.children) {
            result.emplace_back(child);
        }
    }
    return result;
}

std::vector<NodeRef> SnapshotIntrospector::siblings(const NodeRef& node) {
    enter("siblings");
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<NodeRef> result;
    auto it = m_state.nodes.find(node.id);
    if (it == m_state.nodes.end() || it->second.parent.empty()) {
        return result;
    }
    for (const auto& sibling : m_state.nodes.at(it->second.parent).children) {
        if (sibling != node.id) {
            result.emplace_back(sibling);
        }
    }
    return result;
}

NodeRef SnapshotIntrospector::parentOf(const NodeRef& node) {
    enter("parentOf");
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_state.nodes.find(node.id);
    if (it == m_state.nodes.end()) {
        return NodeRef();
    }
    return NodeRef(it->second.parent);
}

} // namespace reticle
