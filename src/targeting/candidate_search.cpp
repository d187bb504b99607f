#include "candidate_search.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace reticle {

nlohmann::json PredictionResult::toJson() const {
    nlohmann::json j = {
        {"hit_node", hitNode.id},
        {"bubbled_levels", bubbledLevels},
        {"accepted", accepted},
        {"threshold", threshold}
    };
    if (candidate) {
        j["candidate"] = candidate->toJson();
    }
    return j;
}

nlohmann::json RefinementResult::toJson() const {
    nlohmann::json j = {
        {"found", found()},
        {"threshold", threshold},
        {"strategies", strategies}
    };
    if (chosen) {
        j["chosen"] = chosen->toJson();
        j["strategy"] = strategy;
    }
    if (best) {
        j["best"] = best->toJson();
    }
    return j;
}

CandidateSearch::CandidateSearch(StrategyList refinement) : m_strategies(std::move(refinement)) {}

CandidateSearch::StrategyList CandidateSearch::defaultStrategies() {
    return {
        std::make_shared<ChildrenScanStrategy>(),
        std::make_shared<NeighborScanStrategy>(),
        std::make_shared<TreeSearchStrategy>()
    };
}

std::optional<Candidate> CandidateSearch::bestOf(const std::vector<Candidate>& pool) {
    std::optional<Candidate> best;
    for (const auto& candidate : pool) {
        if (!best || candidate.betterThan(*best)) {
            best = candidate;
        }
    }
    return best;
}

PredictionResult CandidateSearch::predict(const SearchContext& context, CandidateScorer& scorer, double threshold) const {
    PredictionResult result;
    result.threshold = threshold;
    result.hitNode = context.introspector.elementAt(context.projection.point, context.window.ref);
    if (result.hitNode.isNull()) {
        return result;
    }

    NodeRef target = result.hitNode;
    std::optional<NodeAttributes> attributes = scorer.attributesOf(target);
    if (attributes && !scorer.roleMatches(*attributes)) {
        NodeRef current = target;
        for (int level = 1; level <= kMaxBubbleLevels; ++level) {
            current = context.introspector.parentOf(current);
            if (current.isNull()) {
                break;
            }
            std::optional<NodeAttributes> ancestor = scorer.attributesOf(current);
            if (!ancestor) {
                break;
            }
            if (scorer.roleMatches(*ancestor)) {
                target = current;
                result.bubbledLevels = level;
                break;
            }
        }
    }

    if (result.bubbledLevels > 0) {
        RETICLE_LOG_DEBUG().component("search").message("Direct hit climbed to a control with the recorded role")
            .context("hit_node", result.hitNode.id)
            .context("node", target.id)
            .context("levels", result.bubbledLevels);
    }

    result.candidate = scorer.score(target, "direct_hit");
    result.accepted = result.candidate && result.candidate->score >= threshold;
    return result;
}

RefinementResult CandidateSearch::refine(const SearchContext& context, CandidateScorer& scorer, double threshold) const {
    RefinementResult result;
    result.threshold = threshold;

    for (const auto& strategy : m_strategies) {
        StrategyResult pass = strategy->search(context, scorer);
        size_t scored = pass.pool.size();
        pass.pool.erase(std::remove_if(pass.pool.begin(), pass.pool.end(), [&context](const Candidate& c) {
            return std::find(context.excluded.begin(), context.excluded.end(), c.node) != context.excluded.end();
        }), pass.pool.end());
        std::optional<Candidate> best = bestOf(pass.pool);

        nlohmann::json summary = {
            {"strategy", strategy->name()},
            {"available", pass.available},
            {"pool", pass.pool.size()},
            {"detail", pass.detail}
        };
        if (scored != pass.pool.size()) {
            summary["excluded"] = scored - pass.pool.size();
        }
        if (best) {
            summary["best_score"] = best->score;
            summary["best_node"] = best->node.id;
        }
        result.strategies.push_back(summary);

        RETICLE_LOG_DEBUG().component("search").message("Refinement strategy finished")
            .context("summary", summary);

        if (!best) {
            continue;
        }
        if (!result.best || best->betterThan(*result.best)) {
            result.best = best;
        }
        if (best->score >= threshold) {
            result.chosen = best;
            result.strategy = strategy->name();
            break;
        }
    }
    return result;
}

} // namespace reticle
