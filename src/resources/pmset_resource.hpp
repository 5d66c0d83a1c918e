#pragma once

#include <string>

#include "common/command_runner.hpp"
#include "engine/resource_handler.hpp"

namespace steward {

// One power-management setting as reported by `pmset -g`.
class PmsetResource : public ResourceHandler {
public:
    PmsetResource(CommandRunner &runner, std::string setting);

    std::string kind() const override { return "pmset"; }
    ProbeResult probe() override;
    ApplyResult apply(const nlohmann::json &desired) override;

    const std::string &setting() const { return m_setting; }

private:
    CommandRunner &m_runner;
    std::string m_setting;
};

// Value of `setting` in pmset -g output, or an empty string.
std::string parsePmsetValue(const std::string &output, const std::string &setting);

} // namespace steward
