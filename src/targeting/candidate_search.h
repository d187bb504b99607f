#ifndef RETICLE_CANDIDATE_SEARCH_H
#define RETICLE_CANDIDATE_SEARCH_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "search_strategy.h"

namespace reticle {

/**
 * @brief L3 result
 */
struct PredictionResult {
    NodeRef hitNode;                     // Null when nothing is at the projected point
    std::optional<Candidate> candidate;  // Scored hit node, or its nearest ancestor with the recorded role
    int bubbledLevels = 0;               // Levels climbed from hitNode to the scored node
    bool accepted = false;
    double threshold = 0.0;

    nlohmann::json toJson() const;
};

/**
 * @brief L4 result
 */
struct RefinementResult {
    std::optional<Candidate> chosen;     // Set when a strategy produced a candidate at or above threshold
    std::optional<Candidate> best;       // Best candidate seen by any strategy, for diagnostics
    std::string strategy;                // Strategy that produced `chosen`
    double threshold = 0.0;
    nlohmann::json strategies = nlohmann::json::array();

    bool found() const { return chosen.has_value(); }
    nlohmann::json toJson() const;
};

/**
 * @brief L3 direct prediction and L4 refinement
 */
class CandidateSearch {
public:
    using StrategyList = std::vector<std::shared_ptr<ISearchStrategy>>;

    static constexpr int kMaxBubbleLevels = 5;

    /**
     * @param refinement Strategies tried in order by refine()
     */
    explicit CandidateSearch(StrategyList refinement = defaultStrategies());

    /**
     * @brief Children scan, neighbor scan, tree search
     */
    static StrategyList defaultStrategies();

    /**
     * @brief Ask for the element at the projected point and accept it when
     *        its score reaches `threshold`
     *
     * Hit tests return the deepest node, which is often a label drawn
     * inside the control. When the hit node's role differs from the
     * recorded one, the nearest ancestor (up to kMaxBubbleLevels) with the
     * recorded role is scored instead.
     */
    PredictionResult predict(const SearchContext& context, CandidateScorer& scorer, double threshold) const;

    /**
     * @brief Run the strategies in order; the first strategy whose best
     *        candidate reaches `threshold` wins
     *
     * Candidates for nodes in context.excluded are dropped from every pool.
     */
    RefinementResult refine(const SearchContext& context, CandidateScorer& scorer, double threshold) const;

    const StrategyList& strategies() const { return m_strategies; }

    /**
     * @brief Best candidate of a pool, or nullopt when the pool is empty
     */
    static std::optional<Candidate> bestOf(const std::vector<Candidate>& pool);

private:
    StrategyList m_strategies;
};

} // namespace reticle

#endif // RETICLE_CANDIDATE_SEARCH_H
