#ifndef RETICLE_NODE_ATTRIBUTES_H
#define RETICLE_NODE_ATTRIBUTES_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>
#include "../common/geometry.h"

namespace reticle {

/**
 * @brief Opaque reference to a live UI node. An empty id means "no node".
 */
struct NodeRef {
    std::string id;

    NodeRef() = default;
    explicit NodeRef(std::string nodeId) : id(std::move(nodeId)) {}

    bool isNull() const { return id.empty(); }
    bool operator==(const NodeRef& other) const { return id == other.id; }
    bool operator!=(const NodeRef& other) const { return id != other.id; }
    bool operator<(const NodeRef& other) const { return id < other.id; }
};

/**
 * @brief Opaque reference to a live top-level window
 */
struct WindowRef {
    std::string id;

    WindowRef() = default;
    explicit WindowRef(std::string windowId) : id(std::move(windowId)) {}

    bool isNull() const { return id.empty(); }
    bool operator==(const WindowRef& other) const { return id == other.id; }
    bool operator!=(const WindowRef& other) const { return id != other.id; }
};

/**
 * @brief Value of an optional node attribute
 */
using AttributeValue = std::variant<bool, double, std::string, std::vector<std::string>>;

/**
 * @brief Attributes of a live node
 *
 * role, labels and frame are always present. Everything else a backend
 * can report (enabled state, action names, identifiers) goes into the
 * extension map under a well-known key.
 */
class NodeAttributes {
public:
    // Well-known extension keys
    static constexpr const char* kActions = "actions";
    static constexpr const char* kEnabled = "enabled";
    static constexpr const char* kSubrole = "subrole";
    static constexpr const char* kIdentifier = "identifier";

    NodeAttributes() = default;
    NodeAttributes(std::string role, std::vector<std::string> labels, Rect frame);

    const std::string& role() const { return m_role; }
    const std::vector<std::string>& labels() const { return m_labels; }
    const Rect& frame() const { return m_frame; }

    /**
     * @brief First label that is not trivial, or empty
     */
    std::string bestLabel() const;

    void set(const std::string& key, AttributeValue value);
    bool has(const std::string& key) const;

    std::optional<bool> getBool(const std::string& key) const;
    std::optional<double> getNumber(const std::string& key) const;
    std::optional<std::string> getString(const std::string& key) const;
    std::optional<std::vector<std::string>> getStringList(const std::string& key) const;

    const std::map<std::string, AttributeValue>& extensions() const { return m_extensions; }

    nlohmann::json toJson() const;

    /**
     * @brief Build from {"role", "labels" | "title", "frame", ...}; every
     *        other scalar or string array key becomes an extension
     * @throws ReticleException (SNAPSHOT_FORMAT_ERROR) if role or frame is missing
     */
    static NodeAttributes fromJson(const nlohmann::json& json);

private:
    std::string m_role;
    std::vector<std::string> m_labels;
    Rect m_frame;
    std::map<std::string, AttributeValue> m_extensions;
};

/**
 * @brief True for labels that carry no meaning (empty, whitespace, "0.0")
 */
bool isTrivialLabel(const std::string& label);

/**
 * @brief Canonical role name: "AXPopUpButton", "PopUpButton" and
 *        "pop up button" all become "pop up button"
 */
std::string canonicalRole(const std::string& role);

} // namespace reticle

#endif // RETICLE_NODE_ATTRIBUTES_H
