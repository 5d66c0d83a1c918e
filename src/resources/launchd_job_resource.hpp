#pragma once

#include <string>

#include "common/command_runner.hpp"
#include "engine/resource_handler.hpp"
#include "resources/command_steps.hpp"

namespace steward {

// "loaded" when launchctl lists the label, "installed" when only the plist
// exists, otherwise "absent". A desired "installed" is also satisfied by a
// loaded job.
class LaunchdJobResource : public ResourceHandler {
public:
    LaunchdJobResource(CommandRunner &runner,
                       std::string label,
                       std::string plistPath,
                       CommandList applySteps);

    std::string kind() const override { return "launchd-job"; }
    ProbeResult probe() override;
    ApplyResult apply(const nlohmann::json &desired) override;
    bool matches(const nlohmann::json &observed,
                 const nlohmann::json &desired) const override;

private:
    CommandRunner &m_runner;
    std::string m_label;
    std::string m_plistPath;
    CommandList m_applySteps;
};

} // namespace steward
