#ifndef RETICLE_PIPELINE_SETTINGS_H
#define RETICLE_PIPELINE_SETTINGS_H

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../signature/element_signature.h"
#include "../targeting/identity_matcher.h"
#include "../targeting/search_strategy.h"

namespace reticle {

class ConfigManager;

/**
 * @brief Tuning for one orchestrator, read once from ConfigManager or
 *        filled in directly
 */
struct PipelineSettings {
    double highConfidenceThreshold = 0.85;   // L3 direct hit
    double acceptanceThreshold = 0.70;       // L4
    double thresholdStep = 0.05;
    double thresholdFloor = 0.50;
    int escalationBudget = 3;                // Total attempts, the first included
    double neighborRadiusPx = 16.0;
    double neighborRadiusStepPx = 16.0;
    double maxNeighborRadiusPx = 64.0;
    std::chrono::milliseconds hitTestTimeout{2000};
    std::chrono::milliseconds actionTimeout{5000};
    std::chrono::milliseconds retryDelay{150};
    int collaboratorThreads = 2;

    SimilarityWeights weights;
    IdentitySettings identity = IdentitySettings::defaults();
    SearchLimits search;

    std::vector<std::string> clickableRoles = {
        "button", "tab", "radio button", "check box", "link", "pop up button", "menu item"
    };
    std::vector<std::string> pressActionNames = {"press", "axpress", "invoke", "click"};

    static PipelineSettings fromConfig(const ConfigManager& config);

    nlohmann::json toJson() const;
};

} // namespace reticle

#endif // RETICLE_PIPELINE_SETTINGS_H
