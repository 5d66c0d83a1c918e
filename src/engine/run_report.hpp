#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace steward {

// Immutable result of one reconciliation pass, one outcome per resource in
// traversal order.
class RunReport {
public:
    RunReport(std::string runId,
              std::chrono::system_clock::time_point startedAt,
              std::chrono::system_clock::time_point finishedAt,
              PrivilegeContext context,
              bool dryRun,
              std::vector<ReconciliationOutcome> outcomes);

    const std::string &runId() const { return m_runId; }
    std::chrono::system_clock::time_point startedAt() const { return m_startedAt; }
    std::chrono::system_clock::time_point finishedAt() const { return m_finishedAt; }
    const PrivilegeContext &privilegeContext() const { return m_context; }
    bool dryRun() const { return m_dryRun; }

    const std::vector<ReconciliationOutcome> &outcomes() const { return m_outcomes; }
    const ReconciliationOutcome *find(const std::string &resourceId) const;

    // True iff nothing failed and nothing was skipped because of a failure.
    // Resources left out by user-only mode do not count against a run.
    bool overallSuccess() const;
    int count(OutcomeKind kind) const;
    nlohmann::json counts() const;

    // 0 iff overallSuccess().
    int exitCode() const;

    RunSummary summary() const;

private:
    std::string m_runId;
    std::chrono::system_clock::time_point m_startedAt;
    std::chrono::system_clock::time_point m_finishedAt;
    PrivilegeContext m_context;
    bool m_dryRun = false;
    std::vector<ReconciliationOutcome> m_outcomes;
};

void to_json(nlohmann::json &j, const RunReport &report);

} // namespace steward
