#include <iostream>
#include <cstdio>
#include <cstdlib>
#include "test_support.h"
#include "common/config_manager.h"
#include "common/file_utils.h"
#include "common/structured_logger.h"
#include "orchestrator/pipeline_settings.h"

using namespace reticle;

namespace {

void quietLogs() {
    auto& logger = StructuredLogger::getInstance();
    logger.clearSinks();
    logger.addSink(std::make_shared<MemoryLogSink>());
}

}

void testDefaults() {
    std::cout << "[TEST] Default configuration\n";

    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();

    CHECK(config.validate().empty());
    CHECK(config.getHighConfidenceThreshold() == 0.85);
    CHECK(config.getAcceptanceThreshold() == 0.70);
    CHECK(config.getEscalationBudget() == 3);
    CHECK(config.getNeighborRadiusPx() == 16.0);
    CHECK(config.getMaxNeighborRadiusPx() == 64.0);
    CHECK(config.getTreeMaxNodes() == 800);
    CHECK(config.getClickableRoles().size() == 7);
    CHECK(config.getAppAliases()["google chrome"][1] == "gmail");
    CHECK(config.get<int>("pipeline.collaborator_threads") == 2);

    std::cout << "[OK] Default configuration test passed\n\n";
}

void testOverridesMerged() {
    std::cout << "[TEST] Overrides merged over defaults\n";

    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();
    config.loadFromJson({
        {"pipeline", {{"escalation_budget", 5}, {"retry_delay_ms", 0}}},
        {"identity", {{"app_aliases", {{"Mail", "Outlook"}}}}}
    });

    CHECK(config.getEscalationBudget() == 5);
    CHECK(config.getRetryDelayMs() == 0);
    // Untouched keys in the same section keep their defaults
    CHECK(config.getAcceptanceThreshold() == 0.70);
    CHECK(config.getAppAliases()["mail"][0] == "outlook");

    config.set("search.tree_max_depth", 8);
    CHECK(config.getTreeMaxDepth() == 8);

    CHECK_THROWS(config.get<int>("pipeline.no_such_key"));
    CHECK_THROWS(config.get<int>("logging.level"));

    std::cout << "[OK] Override test passed\n\n";
}

void testInvalidValuesRejected() {
    std::cout << "[TEST] Invalid values rejected\n";

    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();
    config.loadFromJson({{"pipeline", {{"escalation_budget", 4}}}});

    bool threw = false;
    try {
        config.loadFromJson({{"pipeline", {{"acceptance_threshold", 0.95}, {"neighbor_radius_px", 0}}}});
    } catch (const ReticleException& e) {
        threw = true;
        CHECK(e.type() == ErrorType::CONFIGURATION_ERROR);
        CHECK(e.getErrorInfo().details.find("neighbor_radius_px") != std::string::npos);
        CHECK(e.getErrorInfo().details.find("must not exceed") != std::string::npos);
    }
    CHECK(threw);
    // The previous document is restored
    CHECK(config.getEscalationBudget() == 4);
    CHECK(config.validate().empty());

    CHECK_THROWS(config.loadFromJson({{"similarity", {{"label", 0}, {"role", 0}, {"ancestry", 0}, {"size", 0}}}}));

    std::cout << "[OK] Invalid value test passed\n\n";
}

void testLoadConfigFile() {
    std::cout << "[TEST] Load config file\n";

    ConfigManager& config = ConfigManager::getInstance();
    const std::string path = "test_config/reticle.json";
    std::remove(path.c_str());

    // A missing file falls back to defaults and writes them out
    CHECK(config.loadConfig(path));
    CHECK(utils::FileUtils::fileExists(path));
    CHECK(config.getConfigPath() == path);

    CHECK(utils::FileUtils::writeStringToFile(path, "{\"pipeline\": {\"escalation_budget\": 2}}\n"));
    CHECK(config.loadConfig(path));
    CHECK(config.getEscalationBudget() == 2);

    CHECK(utils::FileUtils::writeStringToFile(path, "{ not json"));
    CHECK(!config.loadConfig(path));
    CHECK(config.getEscalationBudget() == 3);

    CHECK(utils::FileUtils::writeStringToFile(path, "{\"identity\": {\"min_confidence\": 1.5}}"));
    CHECK(!config.loadConfig(path));
    CHECK(config.getIdentityMinConfidence() == 0.60);

    std::remove(path.c_str());
    std::cout << "[OK] Config file test passed\n\n";
}

void testLogLevelEnvironmentOverride() {
    std::cout << "[TEST] Log level environment override\n";

    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();
    config.set("logging.level", std::string("ERROR"));
    CHECK(config.getLogLevel() == "ERROR");

    setenv("RETICLE_LOG_LEVEL", "DEBUG", 1);
    CHECK(config.getLogLevel() == "DEBUG");
    CHECK(config.getLoggingSection()["level"] == "DEBUG");
    unsetenv("RETICLE_LOG_LEVEL");

    CHECK(config.getLogLevel() == "ERROR");

    std::cout << "[OK] Environment override test passed\n\n";
}

void testPipelineSettingsFromConfig() {
    std::cout << "[TEST] Pipeline settings from config\n";

    ConfigManager& config = ConfigManager::getInstance();
    config.resetToDefaults();
    config.loadFromJson({
        {"pipeline", {{"hit_test_timeout_ms", 750}, {"neighbor_radius_step_px", 8}}},
        {"similarity", {{"label", 0.7}, {"size", 0.0}}},
        {"identity", {{"min_confidence", 0.8}}},
        {"search", {{"tree_max_nodes", 200}}}
    });

    PipelineSettings settings = PipelineSettings::fromConfig(config);
    CHECK(settings.hitTestTimeout.count() == 750);
    CHECK(settings.neighborRadiusStepPx == 8.0);
    CHECK(settings.weights.label == 0.7);
    CHECK(settings.weights.size == 0.0);
    CHECK(settings.weights.role == 0.10);
    CHECK(settings.identity.minConfidence == 0.8);
    CHECK(settings.search.maxNodes == 200);
    CHECK(settings.search.maxDepth == 5);

    nlohmann::json json = settings.toJson();
    CHECK(json["hit_test_timeout_ms"] == 750);
    CHECK(json["tree_max_nodes"] == 200);
    CHECK(json["weights"]["label"] == 0.7);

    config.resetToDefaults();
    std::cout << "[OK] Pipeline settings test passed\n\n";
}

int main() {
    std::cout << "=== Reticle Configuration Test Suite ===\n\n";

    try {
        quietLogs();

        testDefaults();
        testOverridesMerged();
        testInvalidValuesRejected();
        testLoadConfigFile();
        testLogLevelEnvironmentOverride();
        testPipelineSettingsFromConfig();

        StructuredLogger::getInstance().shutdown();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
