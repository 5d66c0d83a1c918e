#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace steward {

struct PrivilegeContext {
    int uid = -1;
    int euid = -1;
    std::string userName;
    std::string home;
    bool elevated = false;
};

// Bounded wait-for-readiness applied to the post-apply verification probe.
struct VerificationPolicy {
    int attempts = 1;
    std::chrono::milliseconds delay{0};
};

// ok == false is the Unknown sentinel: the probe itself failed.
struct ProbeResult {
    bool ok = false;
    nlohmann::json state;
    std::string error;
};

struct ApplyResult {
    bool ok = false;
    std::string error;
};

struct ReconciliationOutcome {
    std::string resourceId;
    nlohmann::json desiredState;
    nlohmann::json startState;
    nlohmann::json endState;
    OutcomeAction action = OutcomeAction::None;
    OutcomeResult result = OutcomeResult::Success;
    FailureReason reason = FailureReason::None;
    std::string error;
    int probeCount = 0;
    int applyCount = 0;
    std::chrono::milliseconds duration{0};
};

struct RunSummary {
    std::string runId;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    bool dryRun = false;
    bool overallSuccess = false;
    std::string userName;
    bool elevated = false;
    nlohmann::json counts;
};

} // namespace steward
