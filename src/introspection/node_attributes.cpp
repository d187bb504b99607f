#include "node_attributes.h"
#include "../common/error_handler.h"
#include "../common/json_utils.h"
#include "../common/string_utils.h"
#include <cctype>

namespace reticle {

using utils::StringUtils;

bool isTrivialLabel(const std::string& label) {
    std::string trimmed = StringUtils::trim(StringUtils::collapseWhitespace(label));
    return trimmed.empty() || trimmed == "0.0";
}

std::string canonicalRole(const std::string& role) {
    std::string trimmed = StringUtils::trim(role);
    if (trimmed.size() > 2 && trimmed[0] == 'A' && trimmed[1] == 'X' &&
        std::isupper(static_cast<unsigned char>(trimmed[2]))) {
        trimmed = trimmed.substr(2);
    }

    std::string spaced;
    spaced.reserve(trimmed.size() + 4);
    for (size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];
        if (c == '_' || c == '-') {
            spaced.push_back(' ');
            continue;
        }
        // "PopUpButton" -> "Pop Up Button"
        if (i > 0 && std::isupper(static_cast<unsigned char>(c)) &&
            std::islower(static_cast<unsigned char>(trimmed[i - 1]))) {
            spaced.push_back(' ');
        }
        spaced.push_back(c);
    }
    return StringUtils::normalizeText(spaced);
}

NodeAttributes::NodeAttributes(std::string role, std::vector<std::string> labels, Rect frame)
    : m_role(std::move(role)), m_labels(std::move(labels)), m_frame(frame) {}

std::string NodeAttributes::bestLabel() const {
    for (const auto& label : m_labels) {
        if (!isTrivialLabel(label)) {
            return StringUtils::trim(label);
        }
    }
    return "";
}

void NodeAttributes::set(const std::string& key, AttributeValue value) {
    m_extensions[key] = std::move(value);
}

bool NodeAttributes::has(const std::string& key) const {
    return m_extensions.count(key) > 0;
}

std::optional<bool> NodeAttributes::getBool(const std::string& key) const {
    auto it = m_extensions.find(key);
    if (it != m_extensions.end()) {
        if (const bool* value = std::get_if<bool>(&it->second)) {
            return *value;
        }
    }
    return std::nullopt;
}

std::optional<double> NodeAttributes::getNumber(const std::string& key) const {
    auto it = m_extensions.find(key);
    if (it != m_extensions.end()) {
        if (const double* value = std::get_if<double>(&it->second)) {
            return *value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> NodeAttributes::getString(const std::string& key) const {
    auto it = m_extensions.find(key);
    if (it != m_extensions.end()) {
        if (const std::string* value = std::get_if<std::string>(&it->second)) {
            return *value;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> NodeAttributes::getStringList(const std::string& key) const {
    auto it = m_extensions.find(key);
    if (it != m_extensions.end()) {
        if (const auto* value = std::get_if<std::vector<std::string>>(&it->second)) {
            return *value;
        }
    }
    return std::nullopt;
}

nlohmann::json NodeAttributes::toJson() const {
    nlohmann::json j;
    j["role"] = m_role;
    j["labels"] = m_labels;
    j["frame"] = m_frame;
    for (const auto& [key, value] : m_extensions) {
        std::visit([&j, &key](const auto& v) { j[key] = v; }, value);
    }
    return j;
}

NodeAttributes NodeAttributes::fromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("role") || !json["role"].is_string()) {
        RETICLE_THROW(ErrorType::SNAPSHOT_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Node is missing a role", json.dump().substr(0, 200), "NodeAttributes::fromJson");
    }
    if (!json.contains("frame") || !json["frame"].is_object()) {
        RETICLE_THROW(ErrorType::SNAPSHOT_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Node is missing a frame", json.dump().substr(0, 200), "NodeAttributes::fromJson");
    }

    Rect frame;
    try {
        frame = json["frame"].get<Rect>();
    } catch (const nlohmann::json::exception& e) {
        RETICLE_THROW(ErrorType::SNAPSHOT_FORMAT_ERROR, ErrorSeverity::MEDIUM,
                      "Malformed node frame", e.what(), "NodeAttributes::fromJson");
    }

    std::vector<std::string> labels = utils::JsonUtils::getStringArrayField(json, "labels");
    if (labels.empty()) {
        for (const char* key : {"title", "description", "value"}) {
            std::string label = utils::JsonUtils::getStringField(json, key);
            if (!label.empty()) {
                labels.push_back(label);
            }
        }
    }

    NodeAttributes attributes(json["role"].get<std::string>(), labels, frame);

    static const char* const kStructuralKeys[] = {
        "id", "role", "labels", "frame", "children", "title", "description", "value"
    };
    for (auto it = json.begin(); it != json.end(); ++it) {
        bool structural = false;
        for (const char* key : kStructuralKeys) {
            if (it.key() == key) {
                structural = true;
                break;
            }
        }
        if (structural) {
            continue;
        }

        const auto& value = it.value();
        if (value.is_boolean()) {
            attributes.set(it.key(), value.get<bool>());
        } else if (value.is_number()) {
            attributes.set(it.key(), value.get<double>());
        } else if (value.is_string()) {
            attributes.set(it.key(), value.get<std::string>());
        } else if (value.is_array()) {
            attributes.set(it.key(), utils::JsonUtils::getStringArrayField(json, it.key()));
        }
    }

    return attributes;
}

} // namespace reticle
