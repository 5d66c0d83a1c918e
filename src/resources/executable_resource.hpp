#pragma once

#include <string>
#include <vector>

#include "common/command_runner.hpp"
#include "engine/resource_handler.hpp"
#include "resources/command_steps.hpp"

namespace steward {

// "present" when the program resolves on PATH or one of the extra search
// directories, otherwise "absent". Removal is not supported.
class ExecutableResource : public ResourceHandler {
public:
    ExecutableResource(CommandRunner &runner,
                       std::string program,
                       CommandList installSteps,
                       std::vector<std::string> searchPaths = {});

    std::string kind() const override { return "executable"; }
    ProbeResult probe() override;
    ApplyResult apply(const nlohmann::json &desired) override;

    const std::string &program() const { return m_program; }

private:
    CommandRunner &m_runner;
    std::string m_program;
    CommandList m_installSteps;
    std::vector<std::string> m_searchPaths;
};

} // namespace steward
