#include "resources/executable_resource.hpp"

#include <utility>

#include "engine/state_diff.hpp"

namespace steward {

ExecutableResource::ExecutableResource(CommandRunner &runner,
                                       std::string program,
                                       CommandList installSteps,
                                       std::vector<std::string> searchPaths)
    : m_runner(runner)
    , m_program(std::move(program))
    , m_installSteps(std::move(installSteps))
    , m_searchPaths(std::move(searchPaths))
{
}

ProbeResult ExecutableResource::probe()
{
    const std::string path = findExecutable(m_program, m_searchPaths);
    return observedState(path.empty() ? "absent" : "present");
}

ApplyResult ExecutableResource::apply(const nlohmann::json &desired)
{
    const std::string target = scalarToString(desired);
    if (target == "absent") {
        return applyFailed("removing '" + m_program + "' is not supported");
    }
    if (target != "present") {
        return applyFailed("unsupported desired state '" + target + "'");
    }
    if (m_installSteps.empty()) {
        return applyFailed("no install command configured for '" + m_program + "'");
    }
    return runSteps(m_runner, m_installSteps);
}

} // namespace steward
