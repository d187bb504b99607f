#include "pipeline_settings.h"
#include "../common/config_manager.h"

namespace reticle {

PipelineSettings PipelineSettings::fromConfig(const ConfigManager& config) {
    PipelineSettings settings;

    settings.highConfidenceThreshold = config.getHighConfidenceThreshold();
    settings.acceptanceThreshold = config.getAcceptanceThreshold();
    settings.thresholdStep = config.getThresholdStep();
    settings.thresholdFloor = config.getThresholdFloor();
    settings.escalationBudget = config.getEscalationBudget();
    settings.neighborRadiusPx = config.getNeighborRadiusPx();
    settings.neighborRadiusStepPx = config.getNeighborRadiusStepPx();
    settings.maxNeighborRadiusPx = config.getMaxNeighborRadiusPx();
    settings.hitTestTimeout = std::chrono::milliseconds(config.getHitTestTimeoutMs());
    settings.actionTimeout = std::chrono::milliseconds(config.getActionTimeoutMs());
    settings.retryDelay = std::chrono::milliseconds(config.getRetryDelayMs());
    settings.collaboratorThreads = config.getCollaboratorThreads();

    settings.weights = SimilarityWeights::fromJson(config.getSimilarityWeights());

    settings.identity.minConfidence = config.getIdentityMinConfidence();
    settings.identity.appAliases = config.getAppAliases();
    settings.identity.systemProcessBlacklist = config.getSystemProcessBlacklist();
    settings.identity.genericTitles = config.getGenericTitles();

    settings.search.maxDepth = config.getTreeMaxDepth();
    settings.search.maxNodes = config.getTreeMaxNodes();
    settings.search.minNodeSizePx = config.getMinNodeSizePx();
    settings.search.lineThicknessPx = config.getLineThicknessPx();
    settings.search.lineMinLengthPx = config.getLineMinLengthPx();

    settings.clickableRoles = config.getClickableRoles();
    settings.pressActionNames = config.getPressActionNames();
    return settings;
}

nlohmann::json PipelineSettings::toJson() const {
    return nlohmann::json{
        {"high_confidence_threshold", highConfidenceThreshold},
        {"acceptance_threshold", acceptanceThreshold},
        {"threshold_step", thresholdStep},
        {"threshold_floor", thresholdFloor},
        {"escalation_budget", escalationBudget},
        {"neighbor_radius_px", neighborRadiusPx},
        {"neighbor_radius_step_px", neighborRadiusStepPx},
        {"max_neighbor_radius_px", maxNeighborRadiusPx},
        {"hit_test_timeout_ms", hitTestTimeout.count()},
        {"action_timeout_ms", actionTimeout.count()},
        {"retry_delay_ms", retryDelay.count()},
        {"collaborator_threads", collaboratorThreads},
        {"weights", weights.toJson()},
        {"identity_min_confidence", identity.minConfidence},
        {"tree_max_depth", search.maxDepth},
        {"tree_max_nodes", search.maxNodes},
        {"clickable_roles", clickableRoles}
    };
}

} // namespace reticle
