#ifndef RETICLE_CONFIG_MANAGER_H
#define RETICLE_CONFIG_MANAGER_H

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include "error_handler.h"
#include "json_utils.h"
#include "string_utils.h"

namespace reticle {

/**
 * @brief Process-wide configuration document
 *
 * Holds tuning for the replay pipeline and logging. Values are read once
 * per run into PipelineSettings; no run state is kept here.
 */
class ConfigManager {
public:
    static ConfigManager& getInstance();

    /**
     * @brief Load a JSON config file and merge it over the defaults
     *
     * A missing file is not an error: defaults are used and written to
     * configPath. An unparsable or invalid file leaves the defaults in place.
     * @return true if the resulting configuration came from configPath or
     *         from defaults because the file did not exist
     */
    bool loadConfig(const std::string& configPath = "config/reticle.json");
    bool saveConfig(const std::string& configPath = "config/reticle.json") const;

    /**
     * @brief Merge an in-memory document over the defaults
     * @throws ReticleException (CONFIGURATION_ERROR) if values are out of range
     */
    void loadFromJson(const nlohmann::json& overrides);
    void resetToDefaults();

    /**
     * @brief Problems found in the current document, empty when valid
     */
    std::vector<std::string> validate() const;

    // Pipeline
    double getHighConfidenceThreshold() const;
    double getAcceptanceThreshold() const;
    double getThresholdStep() const;
    double getThresholdFloor() const;
    int getEscalationBudget() const;
    double getNeighborRadiusPx() const;
    double getNeighborRadiusStepPx() const;
    double getMaxNeighborRadiusPx() const;
    int getHitTestTimeoutMs() const;
    int getActionTimeoutMs() const;
    int getRetryDelayMs() const;
    int getCollaboratorThreads() const;

    // Similarity weights
    nlohmann::json getSimilarityWeights() const;

    // Identity matching
    double getIdentityMinConfidence() const;
    std::map<std::string, std::vector<std::string>> getAppAliases() const;
    std::vector<std::string> getSystemProcessBlacklist() const;
    std::vector<std::string> getGenericTitles() const;

    // Candidate search
    int getTreeMaxDepth() const;
    int getTreeMaxNodes() const;
    double getMinNodeSizePx() const;
    double getLineThicknessPx() const;
    double getLineMinLengthPx() const;

    // Execution
    std::vector<std::string> getClickableRoles() const;
    std::vector<std::string> getPressActionNames() const;

    // Logging
    nlohmann::json getLoggingSection() const;

    /**
     * @brief Effective log level; RETICLE_LOG_LEVEL overrides the file
     */
    std::string getLogLevel() const;

    /**
     * @brief Configure StructuredLogger from the logging section
     */
    void applyLoggingConfig() const;

    std::string getConfigPath() const;
    nlohmann::json snapshot() const;

    /**
     * @brief Typed read of a dot separated key ("pipeline.escalation_budget")
     * @throws ReticleException (CONFIGURATION_ERROR) if the key is missing
     *         or has the wrong type
     */
    template<typename T>
    T get(const std::string& path) const;

    template<typename T>
    void set(const std::string& path, const T& value);

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    mutable std::mutex m_mutex;
    nlohmann::json m_config;
    std::string m_configPath;

    static nlohmann::json defaults();

    double numberAt(const std::string& path, double fallback) const;
    int intAt(const std::string& path, int fallback) const;
    std::vector<std::string> stringsAt(const std::string& path) const;
};

template<typename T>
T ConfigManager::get(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* node = utils::JsonUtils::findPath(m_config, path);
    if (!node) {
        RETICLE_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::MEDIUM,
                      "Configuration key not found: " + path, "", "ConfigManager::get");
    }
    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception& e) {
        RETICLE_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::MEDIUM,
                      "Configuration key has unexpected type: " + path, e.what(), "ConfigManager::get");
    }
}

template<typename T>
void ConfigManager::set(const std::string& path, const T& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config[nlohmann::json::json_pointer("/" + utils::StringUtils::join(
        utils::StringUtils::split(path, "."), "/"))] = value;
}

} // namespace reticle

#endif // RETICLE_CONFIG_MANAGER_H
