#ifndef RETICLE_DIAGNOSTIC_TRACE_H
#define RETICLE_DIAGNOSTIC_TRACE_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reticle {

enum class Stage {
    L0_AUTHORIZATION,
    L1_IDENTITY,
    L2_PROJECTION,
    L3_PREDICTION,
    L4_REFINEMENT,
    L5_CONFIRMATION,
    L6_EXECUTION,
    L7_ESCALATION
};

/**
 * @brief "L0" .. "L7"
 */
std::string stageId(Stage stage);
std::string stageName(Stage stage);

struct TraceEntry {
    Stage stage;
    int attempt = 1;
    bool passed = false;
    std::string strategy;
    std::string detail;
    nlohmann::json data = nlohmann::json::object();

    nlohmann::json toJson() const;
};

/**
 * @brief Append-only record of stage outcomes for one run
 *
 * Holds no wall-clock values, so two identical runs produce equal traces.
 */
class DiagnosticTrace {
public:
    void record(TraceEntry entry);
    void record(Stage stage, int attempt, bool passed, const std::string& detail,
                nlohmann::json data = nlohmann::json::object(), const std::string& strategy = "");

    const std::vector<TraceEntry>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    int count(Stage stage) const;
    bool reached(Stage stage) const { return count(stage) > 0; }

    /**
     * @brief Most recent entry for a stage, or nullptr
     */
    const TraceEntry* last(Stage stage) const;

    nlohmann::json toJson() const;

private:
    std::vector<TraceEntry> m_entries;
};

} // namespace reticle

#endif // RETICLE_DIAGNOSTIC_TRACE_H
