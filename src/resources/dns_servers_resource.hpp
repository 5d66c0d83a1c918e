#pragma once

#include <string>

#include "common/command_runner.hpp"
#include "engine/resource_handler.hpp"

namespace steward {

// Add-only resolver list of one network service. Applying keeps every
// configured server and puts the newly required ones first.
class DnsServersResource : public ResourceHandler {
public:
    DnsServersResource(CommandRunner &runner, std::string service);

    std::string kind() const override { return "dns-servers"; }
    ProbeResult probe() override;
    ApplyResult apply(const nlohmann::json &desired) override;
    bool matches(const nlohmann::json &observed,
                 const nlohmann::json &desired) const override;

    const std::string &service() const { return m_service; }

private:
    CommandRunner &m_runner;
    std::string m_service;
};

} // namespace steward
