#include "engine/resource_handler.hpp"

#include <utility>

#include "engine/state_diff.hpp"

namespace steward {

bool ResourceHandler::matches(const nlohmann::json &observed,
                              const nlohmann::json &desired) const
{
    return scalarEquals(observed, desired);
}

ProbeResult observedState(nlohmann::json state)
{
    ProbeResult result;
    result.ok = true;
    result.state = std::move(state);
    return result;
}

ProbeResult unknownState(std::string error)
{
    ProbeResult result;
    result.ok = false;
    result.error = std::move(error);
    return result;
}

ApplyResult applySucceeded()
{
    ApplyResult result;
    result.ok = true;
    return result;
}

ApplyResult applyFailed(std::string error)
{
    ApplyResult result;
    result.ok = false;
    result.error = std::move(error);
    return result;
}

} // namespace steward
