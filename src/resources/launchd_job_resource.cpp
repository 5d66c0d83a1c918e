#include "resources/launchd_job_resource.hpp"

#include <sstream>
#include <utility>

#include <QFileInfo>
#include <QString>

#include "engine/state_diff.hpp"

namespace steward {

namespace {

// launchctl list prints "PID\tStatus\tLabel" rows.
bool listsLabel(const std::string &output, const std::string &label)
{
    for (const auto &line : splitLines(output)) {
        std::istringstream fields(line);
        std::string field;
        std::string last;
        while (fields >> field) {
            last = field;
        }
        if (last == label) {
            return true;
        }
    }
    return false;
}

} // namespace

LaunchdJobResource::LaunchdJobResource(CommandRunner &runner,
                                       std::string label,
                                       std::string plistPath,
                                       CommandList applySteps)
    : m_runner(runner)
    , m_label(std::move(label))
    , m_plistPath(std::move(plistPath))
    , m_applySteps(std::move(applySteps))
{
}

ProbeResult LaunchdJobResource::probe()
{
    std::string output;
    std::string error;
    if (!queryOutput(m_runner, {"launchctl", "list"}, &output, &error)) {
        return unknownState(error);
    }
    if (listsLabel(output, m_label)) {
        return observedState("loaded");
    }
    if (!m_plistPath.empty() && QFileInfo::exists(QString::fromStdString(m_plistPath))) {
        return observedState("installed");
    }
    return observedState("absent");
}

ApplyResult LaunchdJobResource::apply(const nlohmann::json &desired)
{
    const std::string target = scalarToString(desired);
    if (target != "installed" && target != "loaded") {
        return applyFailed("unsupported desired state '" + target + "' for " + m_label);
    }
    if (m_applySteps.empty()) {
        return applyFailed("no command configured for " + m_label);
    }
    return runSteps(m_runner, m_applySteps);
}

bool LaunchdJobResource::matches(const nlohmann::json &observed,
                                 const nlohmann::json &desired) const
{
    const std::string have = scalarToString(observed);
    const std::string want = scalarToString(desired);
    if (want == "installed") {
        return have == "installed" || have == "loaded";
    }
    return have == want;
}

} // namespace steward
