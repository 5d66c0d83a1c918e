#include "resources/toggle_resource.hpp"

#include <utility>

#include "engine/state_diff.hpp"

namespace steward {

ToggleResource::ToggleResource(CommandRunner &runner, ToggleSpec spec)
    : m_runner(runner)
    , m_spec(std::move(spec))
{
}

ProbeResult ToggleResource::probe()
{
    if (m_spec.query.empty()) {
        return unknownState("toggle has no query command");
    }

    const CommandResult result = m_runner.invoke(m_spec.query);
    if (!result.started || result.timedOut || result.crashed) {
        return unknownState(describeFailure(m_spec.query, result));
    }
    if (result.exitCode != 0) {
        if (m_spec.nonZeroExitMeansOff) {
            return observedState("off");
        }
        return unknownState(describeFailure(m_spec.query, result));
    }

    for (const auto &marker : m_spec.onMarkers) {
        if (result.stdoutText.find(marker) != std::string::npos) {
            return observedState("on");
        }
    }
    return observedState("off");
}

ApplyResult ToggleResource::apply(const nlohmann::json &desired)
{
    const std::string target = scalarToString(desired);
    const auto it = m_spec.applySteps.find(target);
    if (it == m_spec.applySteps.end() || it->second.empty()) {
        return applyFailed("no command configured to switch " + joinArgv(m_spec.query)
                           + " to '" + target + "'");
    }
    return runSteps(m_runner, it->second);
}

} // namespace steward
