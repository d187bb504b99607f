#ifndef RETICLE_JSON_UTILS_H
#define RETICLE_JSON_UTILS_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reticle {
namespace utils {

/**
 * @brief Typed access to loosely structured JSON (recordings, snapshots, config)
 *
 * Getters never throw: a missing field or a field of the wrong type yields
 * the default value.
 */
class JsonUtils {
public:
    /**
     * @brief Get string field, or defaultValue if missing or not a string
     */
    static std::string getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue = "");

    /**
     * @brief Get integer field; floats are truncated
     */
    static int getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue = 0);

    static bool getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue = false);

    /**
     * @brief Get numeric field as double; numeric strings are parsed
     */
    static double getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue = 0.0);

    /**
     * @brief Copy an object field into result
     * @return true if the field exists and is an object
     */
    static bool getObjectField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result);

    /**
     * @brief Copy an array field into result
     * @return true if the field exists and is an array
     */
    static bool getArrayField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result);

    /**
     * @brief String elements of an array field; non-string elements are skipped
     */
    static std::vector<std::string> getStringArrayField(const nlohmann::json& json, const std::string& fieldName);

    /**
     * @brief Check that every required field is present and not null
     * @param missing Names of absent fields (output parameter)
     */
    static bool hasRequiredFields(const nlohmann::json& json, const std::vector<std::string>& requiredFields,
                                  std::vector<std::string>& missing);

    /**
     * @brief Resolve a dot separated path ("pipeline.retry_budget")
     * @return Pointer into json, or nullptr if any segment is missing
     */
    static const nlohmann::json* findPath(const nlohmann::json& json, const std::string& path);

    /**
     * @brief Recursively merge overlay into base; overlay values win
     */
    static nlohmann::json mergeObjects(const nlohmann::json& base, const nlohmann::json& overlay);

private:
    static bool isObjectWithField(const nlohmann::json& json, const std::string& fieldName);
};

} // namespace utils
} // namespace reticle

#endif // RETICLE_JSON_UTILS_H
