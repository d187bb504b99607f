#include "diagnostic_trace.h"

namespace reticle {

std::string stageId(Stage stage) {
    return "L" + std::to_string(static_cast<int>(stage));
}

std::string stageName(Stage stage) {
    switch (stage) {
        case Stage::L0_AUTHORIZATION: return "authorization";
        case Stage::L1_IDENTITY: return "identity";
        case Stage::L2_PROJECTION: return "projection";
        case Stage::L3_PREDICTION: return "prediction";
        case Stage::L4_REFINEMENT: return "refinement";
        case Stage::L5_CONFIRMATION: return "confirmation";
        case Stage::L6_EXECUTION: return "execution";
        case Stage::L7_ESCALATION: return "escalation";
        default: return "unknown";
    }
}

nlohmann::json TraceEntry::toJson() const {
    nlohmann::json j = {
        {"stage", stageId(stage)},
        {"name", stageName(stage)},
        {"attempt", attempt},
        {"passed", passed},
        {"detail", detail}
    };
    if (!strategy.empty()) {
        j["strategy"] = strategy;
    }
    if (!data.empty()) {
        j["data"] = data;
    }
    return j;
}

void DiagnosticTrace::record(TraceEntry entry) {
    m_entries.push_back(std::move(entry));
}

void DiagnosticTrace::record(Stage stage, int attempt, bool passed, const std::string& detail,
                             nlohmann::json data, const std::string& strategy) {
    TraceEntry entry;
    entry.stage = stage;
    entry.attempt = attempt;
    entry.passed = passed;
    entry.detail = detail;
    entry.data = std::move(data);
    entry.strategy = strategy;
    m_entries.push_back(std::move(entry));
}

int DiagnosticTrace::count(Stage stage) const {
    int n = 0;
    for (const auto& entry : m_entries) {
        if (entry.stage == stage) {
            ++n;
        }
    }
    return n;
}

const TraceEntry* DiagnosticTrace::last(Stage stage) const {
    for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it) {
        if (it->stage == stage) {
            return &*it;
        }
    }
    return nullptr;
}

nlohmann::json DiagnosticTrace::toJson() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : m_entries) {
        j.push_back(entry.toJson());
    }
    return j;
}

} // namespace reticle
