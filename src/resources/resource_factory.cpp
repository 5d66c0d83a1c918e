#include "resources/resource_factory.hpp"

#include <utility>

#include "common/errors.hpp"
#include "common/privilege.hpp"
#include "resources/brew_package_resource.hpp"
#include "resources/command_steps.hpp"
#include "resources/dns_servers_resource.hpp"
#include "resources/executable_resource.hpp"
#include "resources/firewall_apps_resource.hpp"
#include "resources/launchd_job_resource.hpp"
#include "resources/pmset_resource.hpp"
#include "resources/toggle_resource.hpp"

namespace steward {

namespace {

std::string requireString(const std::string &type,
                          const nlohmann::json &params,
                          const char *key)
{
    const auto it = params.find(key);
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ConfigError("resource type '" + type + "' requires string param '"
                          + key + "'");
    }
    return it->get<std::string>();
}

std::vector<std::string> stringArray(const std::string &type,
                                     const nlohmann::json &value,
                                     const char *key)
{
    if (!value.is_array()) {
        throw ConfigError("param '" + std::string(key) + "' of resource type '" + type
                          + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto &entry : value) {
        if (!entry.is_string()) {
            throw ConfigError("param '" + std::string(key) + "' of resource type '"
                              + type + "' must be an array of strings");
        }
        out.push_back(entry.get<std::string>());
    }
    return out;
}

// Accepts one argv (["a", "b"]) or a list of them ([["a"], ["b", "c"]]).
CommandList commandsFrom(const std::string &type,
                         const nlohmann::json &value,
                         const char *key,
                         const PrivilegeContext &privilege)
{
    CommandList steps;
    if (value.is_null()) {
        return steps;
    }
    if (!value.is_array()) {
        throw ConfigError("param '" + std::string(key) + "' of resource type '" + type
                          + "' must be a command or list of commands");
    }
    if (!value.empty() && value.front().is_string()) {
        steps.push_back(stringArray(type, value, key));
    } else {
        for (const auto &step : value) {
            steps.push_back(stringArray(type, step, key));
        }
    }
    for (auto &argv : steps) {
        if (!argv.empty()) {
            argv.front() = expandHome(argv.front(), privilege);
        }
    }
    return steps;
}

CommandList commandList(const std::string &type,
                        const nlohmann::json &params,
                        const char *key,
                        const PrivilegeContext &privilege)
{
    const auto it = params.find(key);
    if (it == params.end()) {
        return {};
    }
    return commandsFrom(type, *it, key, privilege);
}

std::vector<std::string> searchPathsFor(const std::string &type,
                                        const nlohmann::json &params,
                                        const HandlerContext &context)
{
    std::vector<std::string> paths;
    const auto it = params.find("searchPaths");
    if (it != params.end()) {
        for (const auto &path : stringArray(type, *it, "searchPaths")) {
            paths.push_back(expandHome(path, context.privilege));
        }
    }
    paths.insert(paths.end(), context.searchPaths.begin(), context.searchPaths.end());
    return paths;
}

ToggleSpec toggleSpec(const std::string &type,
                      const nlohmann::json &params,
                      const PrivilegeContext &privilege)
{
    ToggleSpec spec;
    const auto query = params.find("query");
    if (query == params.end()) {
        throw ConfigError("resource type 'toggle' requires param 'query'");
    }
    spec.query = stringArray(type, *query, "query");
    if (spec.query.empty()) {
        throw ConfigError("resource type 'toggle' requires a non-empty 'query'");
    }
    spec.query.front() = expandHome(spec.query.front(), privilege);

    const auto markers = params.find("onMarkers");
    if (markers == params.end()) {
        throw ConfigError("resource type 'toggle' requires param 'onMarkers'");
    }
    spec.onMarkers = stringArray(type, *markers, "onMarkers");
    spec.nonZeroExitMeansOff = params.value("nonZeroExitMeansOff", false);

    const auto apply = params.find("apply");
    if (apply != params.end()) {
        if (!apply->is_object()) {
            throw ConfigError("param 'apply' of resource type 'toggle' must map values to commands");
        }
        for (auto it = apply->begin(); it != apply->end(); ++it) {
            spec.applySteps[it.key()] = commandsFrom(type, it.value(), "apply", privilege);
        }
    }
    return spec;
}

} // namespace

std::vector<std::string> supportedResourceTypes()
{
    return {"executable", "brew-package", "launchd-job", "toggle",
            "pmset", "firewall-apps", "dns-servers"};
}

std::shared_ptr<ResourceHandler> createHandler(const std::string &type,
                                               const nlohmann::json &params,
                                               const HandlerContext &context)
{
    if (!context.runner) {
        throw ConfigError("no command runner available for resource type '" + type + "'");
    }
    if (!params.is_null() && !params.is_object()) {
        throw ConfigError("params of resource type '" + type + "' must be an object");
    }
    const nlohmann::json p = params.is_null() ? nlohmann::json::object() : params;
    CommandRunner &runner = *context.runner;

    if (type == "executable") {
        return std::make_shared<ExecutableResource>(
            runner,
            requireString(type, p, "program"),
            commandList(type, p, "install", context.privilege),
            searchPathsFor(type, p, context));
    }
    if (type == "brew-package") {
        return std::make_shared<BrewPackageResource>(
            runner, requireString(type, p, "package"), p.value("brew", std::string("brew")));
    }
    if (type == "launchd-job") {
        return std::make_shared<LaunchdJobResource>(
            runner,
            requireString(type, p, "label"),
            expandHome(p.value("plist", std::string()), context.privilege),
            commandList(type, p, "apply", context.privilege));
    }
    if (type == "toggle") {
        return std::make_shared<ToggleResource>(runner, toggleSpec(type, p, context.privilege));
    }
    if (type == "pmset") {
        return std::make_shared<PmsetResource>(runner, requireString(type, p, "setting"));
    }
    if (type == "firewall-apps") {
        return std::make_shared<FirewallAppsResource>(
            runner,
            searchPathsFor(type, p, context),
            p.value("socketFilter",
                    std::string(FirewallAppsResource::kDefaultSocketFilter)));
    }
    if (type == "dns-servers") {
        return std::make_shared<DnsServersResource>(runner, requireString(type, p, "service"));
    }

    throw ConfigError("unknown resource type '" + type + "'");
}

} // namespace steward
