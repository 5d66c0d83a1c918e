#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/command_runner.hpp"
#include "engine/resource_handler.hpp"
#include "resources/command_steps.hpp"

namespace steward {

struct ToggleSpec {
    std::vector<std::string> query;
    // Substrings of the query output (case-sensitive, like grep) meaning "on".
    std::vector<std::string> onMarkers;
    // Tools such as `tailscale status` exit non-zero while disconnected.
    bool nonZeroExitMeansOff = false;
    // Desired value ("on" / "off") -> steps that establish it.
    std::map<std::string, CommandList> applySteps;
};

class ToggleResource : public ResourceHandler {
public:
    ToggleResource(CommandRunner &runner, ToggleSpec spec);

    std::string kind() const override { return "toggle"; }
    ProbeResult probe() override;
    ApplyResult apply(const nlohmann::json &desired) override;

private:
    CommandRunner &m_runner;
    ToggleSpec m_spec;
};

} // namespace steward
