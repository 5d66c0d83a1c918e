#pragma once

#include <string>
#include <vector>

#include "common/command_runner.hpp"
#include "common/models.hpp"

namespace steward {

using CommandList = std::vector<std::vector<std::string>>;

// Runs each argv in order and stops at the first tool-layer failure.
ApplyResult runSteps(CommandRunner &runner, const CommandList &steps);

// Probe helper: ok iff the command succeeded; otherwise error describes it.
bool queryOutput(CommandRunner &runner,
                 const std::vector<std::string> &argv,
                 std::string *output,
                 std::string *error);

std::vector<std::string> splitLines(const std::string &text);
std::string trimCopy(const std::string &value);

} // namespace steward
