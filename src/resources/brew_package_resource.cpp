#include "resources/brew_package_resource.hpp"

#include <sstream>
#include <utility>
#include <vector>

#include "engine/state_diff.hpp"
#include "resources/command_steps.hpp"

namespace steward {

namespace {

constexpr char kInstalledPrefix[] = "installed@";

bool isInstalled(const std::string &state)
{
    return state == "installed" || state.rfind(kInstalledPrefix, 0) == 0;
}

} // namespace

BrewPackageResource::BrewPackageResource(CommandRunner &runner,
                                         std::string package,
                                         std::string brew)
    : m_runner(runner)
    , m_package(std::move(package))
    , m_brew(std::move(brew))
{
}

ProbeResult BrewPackageResource::probe()
{
    const std::vector<std::string> argv{m_brew, "list", "--versions", m_package};
    const CommandResult result = m_runner.invoke(argv);
    if (!result.started || result.timedOut || result.crashed) {
        return unknownState(describeFailure(argv, result));
    }

    // A package that is not installed exits 1 silently; anything on stderr
    // means brew itself could not answer.
    if (result.exitCode != 0) {
        if (!trimCopy(result.stderrText).empty()) {
            return unknownState(describeFailure(argv, result));
        }
        return observedState("absent");
    }

    // "<name> <version> [<version>...]"; the newest version is listed last.
    const std::string line = trimCopy(result.stdoutText);
    if (line.empty()) {
        return observedState("absent");
    }

    std::istringstream tokens(splitLines(line).front());
    std::string token;
    std::string version;
    tokens >> token;
    while (tokens >> token) {
        version = token;
    }
    return observedState(version.empty() ? "installed" : kInstalledPrefix + version);
}

ApplyResult BrewPackageResource::apply(const nlohmann::json &desired)
{
    const std::string target = scalarToString(desired);
    if (target == "absent") {
        return runSteps(m_runner, {{m_brew, "uninstall", m_package}});
    }
    if (!isInstalled(target)) {
        return applyFailed("unsupported desired state '" + target + "'");
    }
    if (target == "installed") {
        return runSteps(m_runner, {{m_brew, "install", m_package}});
    }

    // Pinned version: `brew install` leaves another installed version alone,
    // so an installed package is upgraded instead.
    const ProbeResult current = probe();
    if (!current.ok) {
        return applyFailed(current.error);
    }
    if (isInstalled(scalarToString(current.state))) {
        return runSteps(m_runner, {{m_brew, "upgrade", m_package}});
    }
    return runSteps(m_runner, {{m_brew, "install", m_package}});
}

bool BrewPackageResource::matches(const nlohmann::json &observed,
                                  const nlohmann::json &desired) const
{
    const std::string have = scalarToString(observed);
    const std::string want = scalarToString(desired);
    if (want == "installed") {
        return isInstalled(have);
    }
    return have == want;
}

} // namespace steward
