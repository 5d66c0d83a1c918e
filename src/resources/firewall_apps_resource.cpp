#include "resources/firewall_apps_resource.hpp"

#include <algorithm>
#include <regex>
#include <utility>

#include "engine/state_diff.hpp"
#include "resources/command_steps.hpp"

namespace steward {

namespace {

const std::string kExePrefix = "{exe:";

bool isPlaceholder(const std::string &entry)
{
    return entry.size() > kExePrefix.size() + 1
        && entry.compare(0, kExePrefix.size(), kExePrefix) == 0
        && entry.back() == '}';
}

} // namespace

std::vector<FirewallApp> parseFirewallApps(const std::string &output)
{
    static const std::regex appLine(R"(^\s*\d+\s*:\s*(.*\S)\s*$)");

    std::vector<FirewallApp> apps;
    for (const auto &line : splitLines(output)) {
        std::smatch match;
        if (std::regex_match(line, match, appLine)) {
            FirewallApp app;
            app.path = match[1].str();
            apps.push_back(app);
            continue;
        }
        if (apps.empty()) {
            continue;
        }
        if (line.find("Allow incoming") != std::string::npos) {
            apps.back().allowed = true;
        } else if (line.find("Block incoming") != std::string::npos) {
            apps.back().allowed = false;
        }
    }
    return apps;
}

FirewallAppsResource::FirewallAppsResource(CommandRunner &runner,
                                           std::vector<std::string> searchPaths,
                                           std::string socketFilter)
    : m_runner(runner)
    , m_searchPaths(std::move(searchPaths))
    , m_socketFilter(std::move(socketFilter))
{
}

bool FirewallAppsResource::listApps(std::vector<FirewallApp> *apps, std::string *error)
{
    std::string output;
    if (!queryOutput(m_runner, {m_socketFilter, "--listapps"}, &output, error)) {
        return false;
    }
    *apps = parseFirewallApps(output);
    return true;
}

ProbeResult FirewallAppsResource::probe()
{
    std::vector<FirewallApp> apps;
    std::string error;
    if (!listApps(&apps, &error)) {
        return unknownState(error);
    }

    nlohmann::json allowed = nlohmann::json::array();
    for (const auto &app : apps) {
        if (app.allowed) {
            allowed.push_back(app.path);
        }
    }
    return observedState(std::move(allowed));
}

nlohmann::json FirewallAppsResource::resolveDesired(const nlohmann::json &desired,
                                                    std::string *unresolved) const
{
    nlohmann::json resolved = nlohmann::json::array();
    for (const auto &entry : toStringList(desired)) {
        if (!isPlaceholder(entry)) {
            resolved.push_back(entry);
            continue;
        }
        const std::string name =
            entry.substr(kExePrefix.size(), entry.size() - kExePrefix.size() - 1);
        const std::string path = findExecutable(name, m_searchPaths);
        if (path.empty()) {
            if (unresolved && unresolved->empty()) {
                *unresolved = name;
            }
            continue;
        }
        resolved.push_back(path);
    }
    return resolved;
}

bool FirewallAppsResource::matches(const nlohmann::json &observed,
                                   const nlohmann::json &desired) const
{
    std::string unresolved;
    const nlohmann::json resolved = resolveDesired(desired, &unresolved);
    return unresolved.empty() && listContainsAll(observed, resolved);
}

ApplyResult FirewallAppsResource::apply(const nlohmann::json &desired)
{
    std::string unresolved;
    const nlohmann::json resolved = resolveDesired(desired, &unresolved);
    if (!unresolved.empty()) {
        return applyFailed("cannot locate executable '" + unresolved + "'");
    }

    std::vector<FirewallApp> apps;
    std::string error;
    if (!listApps(&apps, &error)) {
        return applyFailed(error);
    }

    nlohmann::json allowed = nlohmann::json::array();
    std::vector<std::string> listed;
    for (const auto &app : apps) {
        listed.push_back(app.path);
        if (app.allowed) {
            allowed.push_back(app.path);
        }
    }

    CommandList steps;
    for (const auto &path : toStringList(missingEntries(allowed, resolved))) {
        if (std::find(listed.begin(), listed.end(), path) == listed.end()) {
            steps.push_back({m_socketFilter, "--add", path});
        }
        steps.push_back({m_socketFilter, "--unblockapp", path});
    }
    return runSteps(m_runner, steps);
}

} // namespace steward
