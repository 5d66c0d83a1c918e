#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace steward {

/**
 * Probe/applier pair for one managed facility.
 *
 * - probe() is read-only and safe to call repeatedly. A failure to observe
 *   returns ok == false (the Unknown sentinel), never a guessed state.
 * - apply() converges toward the desired value and must itself be idempotent.
 * - matches() is the resource-specific equality used for diff and verify.
 *
 * Implementations may throw std::exception; the engine records it as a probe
 * or apply failure of this resource only.
 */
class ResourceHandler {
public:
    virtual ~ResourceHandler() = default;

    virtual std::string kind() const = 0;
    virtual ProbeResult probe() = 0;
    virtual ApplyResult apply(const nlohmann::json &desired) = 0;

    // Exact match by default.
    virtual bool matches(const nlohmann::json &observed,
                         const nlohmann::json &desired) const;
};

struct ResourceDescriptor {
    std::string id;
    std::string description;
    nlohmann::json desired;
    Privilege privilege = Privilege::User;
    std::vector<std::string> dependsOn;
    VerificationPolicy verify;
    std::shared_ptr<ResourceHandler> handler;
};

ProbeResult observedState(nlohmann::json state);
ProbeResult unknownState(std::string error);
ApplyResult applySucceeded();
ApplyResult applyFailed(std::string error);

} // namespace steward
