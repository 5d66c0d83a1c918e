#pragma once

#include <string>

#include "common/command_runner.hpp"
#include "engine/resource_handler.hpp"

namespace steward {

// State is "installed@<version>" or "absent". A desired "installed" accepts
// any version; "installed@<version>" pins one, reached by `brew upgrade` when
// another version is installed. The pin is checked by verification, since
// brew only upgrades to its current formula.
class BrewPackageResource : public ResourceHandler {
public:
    BrewPackageResource(CommandRunner &runner, std::string package, std::string brew = "brew");

    std::string kind() const override { return "brew-package"; }
    ProbeResult probe() override;
    ApplyResult apply(const nlohmann::json &desired) override;
    bool matches(const nlohmann::json &observed,
                 const nlohmann::json &desired) const override;

private:
    CommandRunner &m_runner;
    std::string m_package;
    std::string m_brew;
};

} // namespace steward
