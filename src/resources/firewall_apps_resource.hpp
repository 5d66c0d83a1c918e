#pragma once

#include <string>
#include <vector>

#include "common/command_runner.hpp"
#include "engine/resource_handler.hpp"

namespace steward {

struct FirewallApp {
    std::string path;
    bool allowed = false;
};

// Parses `socketfilterfw --listapps`: "<n> : <path>" rows, each followed by
// an "( Allow incoming connections )" or "( Block incoming connections )" row.
std::vector<FirewallApp> parseFirewallApps(const std::string &output);

/**
 * Application firewall exceptions. Observed state is the list of apps that
 * are listed and allowed; the list is add-only and never pruned.
 *
 * Desired entries may be "{exe:<name>}", resolved to the program's path
 * when needed (the binary may only exist once earlier resources ran).
 */
class FirewallAppsResource : public ResourceHandler {
public:
    static constexpr const char *kDefaultSocketFilter =
        "/usr/libexec/ApplicationFirewall/socketfilterfw";

    FirewallAppsResource(CommandRunner &runner,
                         std::vector<std::string> searchPaths = {},
                         std::string socketFilter = kDefaultSocketFilter);

    std::string kind() const override { return "firewall-apps"; }
    ProbeResult probe() override;
    ApplyResult apply(const nlohmann::json &desired) override;
    bool matches(const nlohmann::json &observed,
                 const nlohmann::json &desired) const override;

    // Resolves placeholders; unresolved is set to the first entry that
    // could not be resolved, if any.
    nlohmann::json resolveDesired(const nlohmann::json &desired,
                                  std::string *unresolved) const;

private:
    bool listApps(std::vector<FirewallApp> *apps, std::string *error);

    CommandRunner &m_runner;
    std::vector<std::string> m_searchPaths;
    std::string m_socketFilter;
};

} // namespace steward
