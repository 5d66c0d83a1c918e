#include "engine/run_report.hpp"

#include <algorithm>
#include <utility>

#include "common/json_utils.hpp"

namespace steward {

namespace {

constexpr OutcomeKind kAllKinds[] = {
    OutcomeKind::Unchanged,
    OutcomeKind::Converged,
    OutcomeKind::Planned,
    OutcomeKind::Failed,
    OutcomeKind::SkippedDependencyFailed,
    OutcomeKind::SkippedRunAborted,
    OutcomeKind::SkippedUserOnly,
};

bool isAcceptable(OutcomeKind kind)
{
    switch (kind) {
    case OutcomeKind::Unchanged:
    case OutcomeKind::Converged:
    case OutcomeKind::Planned:
    case OutcomeKind::SkippedUserOnly:
        return true;
    case OutcomeKind::Failed:
    case OutcomeKind::SkippedDependencyFailed:
    case OutcomeKind::SkippedRunAborted:
        return false;
    }
    return false;
}

} // namespace

RunReport::RunReport(std::string runId,
                     std::chrono::system_clock::time_point startedAt,
                     std::chrono::system_clock::time_point finishedAt,
                     PrivilegeContext context,
                     bool dryRun,
                     std::vector<ReconciliationOutcome> outcomes)
    : m_runId(std::move(runId))
    , m_startedAt(startedAt)
    , m_finishedAt(finishedAt)
    , m_context(std::move(context))
    , m_dryRun(dryRun)
    , m_outcomes(std::move(outcomes))
{
}

const ReconciliationOutcome *RunReport::find(const std::string &resourceId) const
{
    const auto it = std::find_if(m_outcomes.begin(), m_outcomes.end(),
                                 [&resourceId](const ReconciliationOutcome &outcome) {
                                     return outcome.resourceId == resourceId;
                                 });
    return it == m_outcomes.end() ? nullptr : &*it;
}

bool RunReport::overallSuccess() const
{
    return std::all_of(m_outcomes.begin(), m_outcomes.end(),
                       [](const ReconciliationOutcome &outcome) {
                           return isAcceptable(outcomeKind(outcome));
                       });
}

int RunReport::count(OutcomeKind kind) const
{
    return static_cast<int>(std::count_if(m_outcomes.begin(), m_outcomes.end(),
                                          [kind](const ReconciliationOutcome &outcome) {
                                              return outcomeKind(outcome) == kind;
                                          }));
}

nlohmann::json RunReport::counts() const
{
    nlohmann::json out = nlohmann::json::object();
    for (const OutcomeKind kind : kAllKinds) {
        out[toKindString(kind)] = count(kind);
    }
    return out;
}

int RunReport::exitCode() const
{
    return overallSuccess() ? 0 : 1;
}

RunSummary RunReport::summary() const
{
    RunSummary summary;
    summary.runId = m_runId;
    summary.startedAt = m_startedAt;
    summary.finishedAt = m_finishedAt;
    summary.dryRun = m_dryRun;
    summary.overallSuccess = overallSuccess();
    summary.userName = m_context.userName;
    summary.elevated = m_context.elevated;
    summary.counts = counts();
    return summary;
}

void to_json(nlohmann::json &j, const RunReport &report)
{
    j = nlohmann::json{
        {"runId", report.runId()},
        {"startedAt", toIso8601Utc(report.startedAt())},
        {"finishedAt", toIso8601Utc(report.finishedAt())},
        {"dryRun", report.dryRun()},
        {"user", report.privilegeContext().userName},
        {"elevated", report.privilegeContext().elevated},
        {"overallSuccess", report.overallSuccess()},
        {"counts", report.counts()},
        {"outcomes", report.outcomes()}
    };
}

} // namespace steward
