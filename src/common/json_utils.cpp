#include "json_utils.h"
#include "structured_logger.h"
#include "string_utils.h"

namespace reticle {
namespace utils {

bool JsonUtils::isObjectWithField(const nlohmann::json& json, const std::string& fieldName) {
    return json.is_object() && json.contains(fieldName) && !json[fieldName].is_null();
}

std::string JsonUtils::getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue) {
    if (!isObjectWithField(json, fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_string()) {
        return field.get<std::string>();
    }
    if (field.is_number_integer()) {
        return std::to_string(field.get<long long>());
    }
    if (field.is_number()) {
        return field.dump();
    }
    if (field.is_boolean()) {
        return field.get<bool>() ? "true" : "false";
    }

    RETICLE_LOG_DEBUG().message("Field is not a string, returning default value").context("field", fieldName);
    return defaultValue;
}

int JsonUtils::getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue) {
    if (!isObjectWithField(json, fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_number_integer()) {
        return field.get<int>();
    }
    if (field.is_number_float()) {
        return static_cast<int>(field.get<double>());
    }
    if (field.is_string()) {
        try {
            return std::stoi(field.get<std::string>());
        } catch (const std::exception&) {
            RETICLE_LOG_DEBUG().message("Cannot convert string field to integer, returning default").context("field", fieldName);
        }
    }
    return defaultValue;
}

bool JsonUtils::getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue) {
    if (!isObjectWithField(json, fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_boolean()) {
        return field.get<bool>();
    }
    if (field.is_number()) {
        return field.get<double>() != 0.0;
    }
    if (field.is_string()) {
        std::string value = StringUtils::toLowerCase(StringUtils::trim(field.get<std::string>()));
        if (value == "true" || value == "yes" || value == "1") return true;
        if (value == "false" || value == "no" || value == "0") return false;
    }
    return defaultValue;
}

double JsonUtils::getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue) {
    if (!isObjectWithField(json, fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_number()) {
        return field.get<double>();
    }
    if (field.is_string()) {
        try {
            return std::stod(field.get<std::string>());
        } catch (const std::exception&) {
            RETICLE_LOG_DEBUG().message("Cannot convert string field to number, returning default").context("field", fieldName);
        }
    }
    return defaultValue;
}

bool JsonUtils::getObjectField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result) {
    if (!isObjectWithField(json, fieldName) || !json[fieldName].is_object()) {
        return false;
    }
    result = json[fieldName];
    return true;
}

bool JsonUtils::getArrayField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result) {
    if (!isObjectWithField(json, fieldName) || !json[fieldName].is_array()) {
        return false;
    }
    result = json[fieldName];
    return true;
}

std::vector<std::string> JsonUtils::getStringArrayField(const nlohmann::json& json, const std::string& fieldName) {
    std::vector<std::string> values;
    nlohmann::json array;
    if (!getArrayField(json, fieldName, array)) {
        return values;
    }
    for (const auto& item : array) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

bool JsonUtils::hasRequiredFields(const nlohmann::json& json, const std::vector<std::string>& requiredFields,
                                  std::vector<std::string>& missing) {
    missing.clear();
    for (const auto& field : requiredFields) {
        if (!isObjectWithField(json, field)) {
            missing.push_back(field);
        }
    }
    return missing.empty();
}

const nlohmann::json* JsonUtils::findPath(const nlohmann::json& json, const std::string& path) {
    const nlohmann::json* current = &json;
    for (const auto& segment : StringUtils::split(path, ".")) {
        if (!current->is_object() || !current->contains(segment)) {
            return nullptr;
        }
        current = &(*current)[segment];
    }
    return current;
}

nlohmann::json JsonUtils::mergeObjects(const nlohmann::json& base, const nlohmann::json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay.is_null() ? base : overlay;
    }

    nlohmann::json result = base;
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (result.contains(it.key()) && result[it.key()].is_object() && it.value().is_object()) {
            result[it.key()] = mergeObjects(result[it.key()], it.value());
        } else {
            result[it.key()] = it.value();
        }
    }
    return result;
}

} // namespace utils
} // namespace reticle
