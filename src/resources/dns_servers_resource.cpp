#include "resources/dns_servers_resource.hpp"

#include <utility>
#include <vector>

#include "engine/state_diff.hpp"
#include "resources/command_steps.hpp"

namespace steward {

DnsServersResource::DnsServersResource(CommandRunner &runner, std::string service)
    : m_runner(runner)
    , m_service(std::move(service))
{
}

ProbeResult DnsServersResource::probe()
{
    const std::vector<std::string> argv{"networksetup", "-getdnsservers", m_service};
    std::string output;
    std::string error;
    if (!queryOutput(m_runner, argv, &output, &error)) {
        return unknownState(error);
    }

    // networksetup reports some errors on stdout with a zero exit status.
    if (output.find("There aren't any DNS Servers") != std::string::npos) {
        return observedState(nlohmann::json::array());
    }
    if (output.find("not a recognized network service") != std::string::npos
        || output.find("Error") != std::string::npos) {
        return unknownState(trimCopy(output));
    }

    nlohmann::json servers = nlohmann::json::array();
    for (const auto &line : splitLines(output)) {
        const std::string server = trimCopy(line);
        if (!server.empty()) {
            servers.push_back(server);
        }
    }
    return observedState(std::move(servers));
}

ApplyResult DnsServersResource::apply(const nlohmann::json &desired)
{
    const ProbeResult current = probe();
    if (!current.ok) {
        return applyFailed(current.error);
    }

    const nlohmann::json merged = mergeListState(current.state, desired);
    std::vector<std::string> argv{"networksetup", "-setdnsservers", m_service};
    for (const auto &server : toStringList(merged)) {
        argv.push_back(server);
    }
    return runSteps(m_runner, {argv});
}

bool DnsServersResource::matches(const nlohmann::json &observed,
                                 const nlohmann::json &desired) const
{
    return listContainsAll(observed, desired);
}

} // namespace steward
