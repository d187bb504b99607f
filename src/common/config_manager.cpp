#include "config_manager.h"
#include "structured_logger.h"
#include "file_utils.h"
#include <cstdlib>

namespace reticle {

ConfigManager::ConfigManager() : m_config(defaults()) {}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

nlohmann::json ConfigManager::defaults() {
    return nlohmann::json{
        {"pipeline", {
            {"high_confidence_threshold", 0.85},
            {"acceptance_threshold", 0.70},
            {"threshold_step", 0.05},
            {"threshold_floor", 0.50},
            {"escalation_budget", 3},
            {"neighbor_radius_px", 16.0},
            {"neighbor_radius_step_px", 16.0},
            {"max_neighbor_radius_px", 64.0},
            {"hit_test_timeout_ms", 2000},
            {"action_timeout_ms", 5000},
            {"retry_delay_ms", 150},
            {"collaborator_threads", 2}
        }},
        {"similarity", {
            {"label", 0.50},
            {"role", 0.10},
            {"ancestry", 0.25},
            {"size", 0.15},
            {"partial_label_fraction", 0.60}
        }},
        {"identity", {
            {"min_confidence", 0.60},
            {"app_aliases", {
                {"google chrome", nlohmann::json::array({"chrome", "gmail"})},
                {"visual studio code", nlohmann::json::array({"code"})}
            }},
            {"system_process_blacklist", nlohmann::json::array({
                "loginwindow", "windowserver", "systemuiserver", "controlcenter",
                "notificationcenter", "spotlight", "launchd", "universalaccessd"
            })},
            {"generic_titles", nlohmann::json::array({
                "new tab", "tab", "untitled", "document", "home", "start page"
            })}
        }},
        {"search", {
            {"tree_max_depth", 5},
            {"tree_max_nodes", 800},
            {"min_node_size_px", 12.0},
            {"line_thickness_px", 6.0},
            {"line_min_length_px", 60.0}
        }},
        {"execution", {
            {"clickable_roles", nlohmann::json::array({
                "button", "tab", "radio button", "check box", "link",
                "pop up button", "menu item"
            })},
            {"press_action_names", nlohmann::json::array({"press", "axpress", "invoke", "click"})}
        }},
        {"logging", {
            {"level", "INFO"},
            {"format", "text"},
            {"console", true},
            {"file", ""},
            {"max_size_mb", 10},
            {"max_files", 5},
            {"async", false},
            {"slow_operation_ms", 250}
        }}
    };
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configPath = configPath;
    }

    if (!utils::FileUtils::fileExists(configPath)) {
        RETICLE_LOG_WARNING().component("config")
            .message("Config file not found, using defaults")
            .context("config_path", configPath);
        resetToDefaults();
        if (!saveConfig(configPath)) {
            RETICLE_LOG_WARNING().component("config").message("Could not write default config")
                .context("config_path", configPath);
        }
        return true;
    }

    nlohmann::json fileConfig;
    if (!utils::FileUtils::loadJsonFromFile(configPath, fileConfig) || !fileConfig.is_object()) {
        RETICLE_HANDLE_ERROR(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::MEDIUM,
                             "Config file unreadable, using defaults", configPath, "ConfigManager::loadConfig");
        resetToDefaults();
        return false;
    }

    try {
        loadFromJson(fileConfig);
    } catch (const ReticleException& e) {
        ErrorHandler::getInstance().handleException(e, "ConfigManager::loadConfig");
        resetToDefaults();
        return false;
    }

    RETICLE_LOG_INFO().component("config").message("Configuration loaded").context("config_path", configPath);
    return true;
}

bool ConfigManager::saveConfig(const std::string& configPath) const {
    nlohmann::json copy = snapshot();
    if (!utils::FileUtils::saveJsonToFile(configPath, copy)) {
        RETICLE_LOG_ERROR().component("config").message("Failed to save configuration")
            .context("config_path", configPath);
        return false;
    }
    return true;
}

void ConfigManager::loadFromJson(const nlohmann::json& overrides) {
    nlohmann::json merged = utils::JsonUtils::mergeObjects(defaults(), overrides);
    nlohmann::json previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_config;
        m_config = merged;
    }

    std::vector<std::string> problems = validate();
    if (!problems.empty()) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_config = previous;
        }
        RETICLE_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::MEDIUM,
                      "Invalid configuration", utils::StringUtils::join(problems, "; "),
                      "ConfigManager::loadFromJson");
    }
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = defaults();
}

std::vector<std::string> ConfigManager::validate() const {
    std::vector<std::string> problems;

    auto unit = [&](const std::string& path) {
        double v = numberAt(path, -1.0);
        if (v < 0.0 || v > 1.0) {
            problems.push_back(path + " must be within [0, 1]");
        }
    };
    auto positive = [&](const std::string& path) {
        if (numberAt(path, -1.0) <= 0.0) {
            problems.push_back(path + " must be positive");
        }
    };
    auto nonNegative = [&](const std::string& path) {
        if (numberAt(path, -1.0) < 0.0) {
            problems.push_back(path + " must not be negative");
        }
    };

    unit("pipeline.high_confidence_threshold");
    unit("pipeline.acceptance_threshold");
    unit("pipeline.threshold_step");
    unit("pipeline.threshold_floor");
    unit("identity.min_confidence");
    unit("similarity.partial_label_fraction");
    nonNegative("similarity.label");
    nonNegative("similarity.role");
    nonNegative("similarity.ancestry");
    nonNegative("similarity.size");
    nonNegative("pipeline.escalation_budget");
    nonNegative("pipeline.retry_delay_ms");
    positive("pipeline.neighbor_radius_px");
    nonNegative("pipeline.neighbor_radius_step_px");
    positive("pipeline.max_neighbor_radius_px");
    nonNegative("pipeline.hit_test_timeout_ms");
    nonNegative("pipeline.action_timeout_ms");
    positive("pipeline.collaborator_threads");
    positive("search.tree_max_depth");
    positive("search.tree_max_nodes");

    double weightSum = numberAt("similarity.label", 0.0) + numberAt("similarity.role", 0.0) +
                       numberAt("similarity.ancestry", 0.0) + numberAt("similarity.size", 0.0);
    if (weightSum <= 0.0) {
        problems.push_back("similarity weights must not all be zero");
    }

    if (numberAt("pipeline.acceptance_threshold", 0.0) > numberAt("pipeline.high_confidence_threshold", 1.0)) {
        problems.push_back("pipeline.acceptance_threshold must not exceed pipeline.high_confidence_threshold");
    }
    if (numberAt("pipeline.threshold_floor", 0.0) > numberAt("pipeline.acceptance_threshold", 1.0)) {
        problems.push_back("pipeline.threshold_floor must not exceed pipeline.acceptance_threshold");
    }

    return problems;
}

double ConfigManager::numberAt(const std::string& path, double fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* node = utils::JsonUtils::findPath(m_config, path);
    if (!node || !node->is_number()) {
        return fallback;
    }
    return node->get<double>();
}

int ConfigManager::intAt(const std::string& path, int fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* node = utils::JsonUtils::findPath(m_config, path);
    if (!node || !node->is_number()) {
        return fallback;
    }
    return static_cast<int>(node->get<double>());
}

std::vector<std::string> ConfigManager::stringsAt(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> values;
    const nlohmann::json* node = utils::JsonUtils::findPath(m_config, path);
    if (node && node->is_array()) {
        for (const auto& item : *node) {
            if (item.is_string()) {
                values.push_back(item.get<std::string>());
            }
        }
    }
    return values;
}

// Pipeline
double ConfigManager::getHighConfidenceThreshold() const {
    return numberAt("pipeline.high_confidence_threshold", 0.85);
}

double ConfigManager::getAcceptanceThreshold() const {
    return numberAt("pipeline.acceptance_threshold", 0.70);
}

double ConfigManager::getThresholdStep() const {
    return numberAt("pipeline.threshold_step", 0.05);
}

double ConfigManager::getThresholdFloor() const {
    return numberAt("pipeline.threshold_floor", 0.50);
}

int ConfigManager::getEscalationBudget() const {
    return intAt("pipeline.escalation_budget", 3);
}

double ConfigManager::getNeighborRadiusPx() const {
    return numberAt("pipeline.neighbor_radius_px", 16.0);
}

double ConfigManager::getNeighborRadiusStepPx() const {
    return numberAt("pipeline.neighbor_radius_step_px", 16.0);
}

double ConfigManager::getMaxNeighborRadiusPx() const {
    return numberAt("pipeline.max_neighbor_radius_px", 64.0);
}

int ConfigManager::getHitTestTimeoutMs() const {
    return intAt("pipeline.hit_test_timeout_ms", 2000);
}

int ConfigManager::getActionTimeoutMs() const {
    return intAt("pipeline.action_timeout_ms", 5000);
}

int ConfigManager::getRetryDelayMs() const {
    return intAt("pipeline.retry_delay_ms", 150);
}

int ConfigManager::getCollaboratorThreads() const {
    return intAt("pipeline.collaborator_threads", 2);
}

nlohmann::json ConfigManager::getSimilarityWeights() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config.value("similarity", nlohmann::json::object());
}

// Identity
double ConfigManager::getIdentityMinConfidence() const {
    return numberAt("identity.min_confidence", 0.60);
}

std::map<std::string, std::vector<std::string>> ConfigManager::getAppAliases() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<std::string, std::vector<std::string>> aliases;
    const nlohmann::json* node = utils::JsonUtils::findPath(m_config, "identity.app_aliases");
    if (!node || !node->is_object()) {
        return aliases;
    }
    for (auto it = node->begin(); it != node->end(); ++it) {
        std::vector<std::string>& names = aliases[utils::StringUtils::normalizeText(it.key())];
        if (it.value().is_array()) {
            for (const auto& alias : it.value()) {
                if (alias.is_string()) {
                    names.push_back(utils::StringUtils::normalizeText(alias.get<std::string>()));
                }
            }
        } else if (it.value().is_string()) {
            names.push_back(utils::StringUtils::normalizeText(it.value().get<std::string>()));
        }
    }
    return aliases;
}

std::vector<std::string> ConfigManager::getSystemProcessBlacklist() const {
    return stringsAt("identity.system_process_blacklist");
}

std::vector<std::string> ConfigManager::getGenericTitles() const {
    return stringsAt("identity.generic_titles");
}

// Search
int ConfigManager::getTreeMaxDepth() const {
    return intAt("search.tree_max_depth", 5);
}

int ConfigManager::getTreeMaxNodes() const {
    return intAt("search.tree_max_nodes", 800);
}

double ConfigManager::getMinNodeSizePx() const {
    return numberAt("search.min_node_size_px", 12.0);
}

double ConfigManager::getLineThicknessPx() const {
    return numberAt("search.line_thickness_px", 6.0);
}

double ConfigManager::getLineMinLengthPx() const {
    return numberAt("search.line_min_length_px", 60.0);
}

// Execution
std::vector<std::string> ConfigManager::getClickableRoles() const {
    return stringsAt("execution.clickable_roles");
}

std::vector<std::string> ConfigManager::getPressActionNames() const {
    return stringsAt("execution.press_action_names");
}

// Logging
nlohmann::json ConfigManager::getLoggingSection() const {
    nlohmann::json section;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        section = m_config.value("logging", nlohmann::json::object());
    }
    section["level"] = getLogLevel();
    return section;
}

std::string ConfigManager::getLogLevel() const {
    const char* env = std::getenv("RETICLE_LOG_LEVEL");
    if (env && *env) {
        return env;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* node = utils::JsonUtils::findPath(m_config, "logging.level");
    if (node && node->is_string()) {
        return node->get<std::string>();
    }
    return "INFO";
}

void ConfigManager::applyLoggingConfig() const {
    StructuredLogger::getInstance().configure(getLoggingSection());
}

std::string ConfigManager::getConfigPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configPath;
}

nlohmann::json ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

} // namespace reticle
