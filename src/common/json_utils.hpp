#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace steward {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toPrivilegeString(Privilege privilege)
{
    switch (privilege) {
    case Privilege::User:
        return "user";
    case Privilege::Root:
        return "root";
    }
    return "user";
}

inline std::string toActionString(OutcomeAction action)
{
    switch (action) {
    case OutcomeAction::None:
        return "none";
    case OutcomeAction::Applied:
        return "applied";
    case OutcomeAction::Planned:
        return "planned";
    }
    return "none";
}

inline std::string toResultString(OutcomeResult result)
{
    switch (result) {
    case OutcomeResult::Success:
        return "success";
    case OutcomeResult::Failed:
        return "failed";
    case OutcomeResult::SkippedDependencyFailed:
        return "skippedDependencyFailed";
    case OutcomeResult::SkippedRunAborted:
        return "skippedRunAborted";
    case OutcomeResult::SkippedUserOnly:
        return "skippedUserOnly";
    }
    return "failed";
}

inline std::string toReasonString(FailureReason reason)
{
    switch (reason) {
    case FailureReason::None:
        return "";
    case FailureReason::InsufficientPrivilege:
        return "InsufficientPrivilege";
    case FailureReason::ProbeError:
        return "ProbeError";
    case FailureReason::ApplyError:
        return "ApplyError";
    case FailureReason::VerificationFailed:
        return "VerificationFailed";
    case FailureReason::DependencyFailed:
        return "DependencyFailed";
    case FailureReason::RunAborted:
        return "RunAborted";
    }
    return "";
}

inline std::string toKindString(OutcomeKind kind)
{
    switch (kind) {
    case OutcomeKind::Unchanged:
        return "unchanged";
    case OutcomeKind::Converged:
        return "converged";
    case OutcomeKind::Planned:
        return "planned";
    case OutcomeKind::Failed:
        return "failed";
    case OutcomeKind::SkippedDependencyFailed:
        return "skippedDependencyFailed";
    case OutcomeKind::SkippedRunAborted:
        return "skippedRunAborted";
    case OutcomeKind::SkippedUserOnly:
        return "skippedUserOnly";
    }
    return "failed";
}

inline Privilege parsePrivilegeString(const std::string &value, bool *ok = nullptr)
{
    if (ok) {
        *ok = true;
    }
    if (value == "user") {
        return Privilege::User;
    }
    if (value == "root") {
        return Privilege::Root;
    }
    if (ok) {
        *ok = false;
    }
    return Privilege::User;
}

inline OutcomeAction parseActionString(const std::string &value)
{
    if (value == "applied") {
        return OutcomeAction::Applied;
    }
    if (value == "planned") {
        return OutcomeAction::Planned;
    }
    return OutcomeAction::None;
}

inline OutcomeResult parseResultString(const std::string &value)
{
    if (value == "success") {
        return OutcomeResult::Success;
    }
    if (value == "skippedDependencyFailed") {
        return OutcomeResult::SkippedDependencyFailed;
    }
    if (value == "skippedRunAborted") {
        return OutcomeResult::SkippedRunAborted;
    }
    if (value == "skippedUserOnly") {
        return OutcomeResult::SkippedUserOnly;
    }
    return OutcomeResult::Failed;
}

inline FailureReason parseReasonString(const std::string &value)
{
    if (value == "InsufficientPrivilege") {
        return FailureReason::InsufficientPrivilege;
    }
    if (value == "ProbeError") {
        return FailureReason::ProbeError;
    }
    if (value == "ApplyError") {
        return FailureReason::ApplyError;
    }
    if (value == "VerificationFailed") {
        return FailureReason::VerificationFailed;
    }
    if (value == "DependencyFailed") {
        return FailureReason::DependencyFailed;
    }
    if (value == "RunAborted") {
        return FailureReason::RunAborted;
    }
    return FailureReason::None;
}

inline OutcomeKind outcomeKind(const ReconciliationOutcome &outcome)
{
    switch (outcome.result) {
    case OutcomeResult::Success:
        if (outcome.action == OutcomeAction::Applied) {
            return OutcomeKind::Converged;
        }
        if (outcome.action == OutcomeAction::Planned) {
            return OutcomeKind::Planned;
        }
        return OutcomeKind::Unchanged;
    case OutcomeResult::Failed:
        return OutcomeKind::Failed;
    case OutcomeResult::SkippedDependencyFailed:
        return OutcomeKind::SkippedDependencyFailed;
    case OutcomeResult::SkippedRunAborted:
        return OutcomeKind::SkippedRunAborted;
    case OutcomeResult::SkippedUserOnly:
        return OutcomeKind::SkippedUserOnly;
    }
    return OutcomeKind::Failed;
}

inline void to_json(nlohmann::json &j, const OutcomeAction &action)
{
    j = toActionString(action);
}

inline void from_json(const nlohmann::json &j, OutcomeAction &action)
{
    action = j.is_string() ? parseActionString(j.get<std::string>()) : OutcomeAction::None;
}

inline void to_json(nlohmann::json &j, const OutcomeResult &result)
{
    j = toResultString(result);
}

inline void from_json(const nlohmann::json &j, OutcomeResult &result)
{
    result = j.is_string() ? parseResultString(j.get<std::string>()) : OutcomeResult::Failed;
}

inline void to_json(nlohmann::json &j, const FailureReason &reason)
{
    j = toReasonString(reason);
}

inline void from_json(const nlohmann::json &j, FailureReason &reason)
{
    reason = j.is_string() ? parseReasonString(j.get<std::string>()) : FailureReason::None;
}

inline void to_json(nlohmann::json &j, const ReconciliationOutcome &outcome)
{
    j = nlohmann::json{
        {"resourceId", outcome.resourceId},
        {"kind", toKindString(outcomeKind(outcome))},
        {"desiredState", outcome.desiredState},
        {"startState", outcome.startState},
        {"endState", outcome.endState},
        {"action", outcome.action},
        {"result", outcome.result},
        {"reason", outcome.reason},
        {"error", outcome.error},
        {"probeCount", outcome.probeCount},
        {"applyCount", outcome.applyCount},
        {"durationMs", outcome.duration.count()}
    };
}

inline void from_json(const nlohmann::json &j, ReconciliationOutcome &outcome)
{
    outcome.resourceId = j.value("resourceId", "");
    outcome.desiredState = j.contains("desiredState") ? j.at("desiredState") : nlohmann::json();
    outcome.startState = j.contains("startState") ? j.at("startState") : nlohmann::json();
    outcome.endState = j.contains("endState") ? j.at("endState") : nlohmann::json();
    if (j.contains("action")) {
        outcome.action = j.at("action").get<OutcomeAction>();
    } else {
        outcome.action = OutcomeAction::None;
    }
    if (j.contains("result")) {
        outcome.result = j.at("result").get<OutcomeResult>();
    } else {
        outcome.result = OutcomeResult::Failed;
    }
    if (j.contains("reason")) {
        outcome.reason = j.at("reason").get<FailureReason>();
    } else {
        outcome.reason = FailureReason::None;
    }
    outcome.error = j.value("error", "");
    outcome.probeCount = j.value("probeCount", 0);
    outcome.applyCount = j.value("applyCount", 0);
    outcome.duration = std::chrono::milliseconds(j.value("durationMs", 0LL));
}

inline void to_json(nlohmann::json &j, const RunSummary &summary)
{
    j = nlohmann::json{
        {"runId", summary.runId},
        {"startedAt", toIso8601Utc(summary.startedAt)},
        {"finishedAt", toIso8601Utc(summary.finishedAt)},
        {"dryRun", summary.dryRun},
        {"overallSuccess", summary.overallSuccess},
        {"user", summary.userName},
        {"elevated", summary.elevated},
        {"counts", summary.counts}
    };
}

} // namespace steward
