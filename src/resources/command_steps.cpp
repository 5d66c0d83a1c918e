#include "resources/command_steps.hpp"

#include <cctype>
#include <sstream>

#include "engine/resource_handler.hpp"

namespace steward {

ApplyResult runSteps(CommandRunner &runner, const CommandList &steps)
{
    for (const auto &argv : steps) {
        if (argv.empty()) {
            continue;
        }
        const CommandResult result = runner.invoke(argv);
        if (!result.succeeded()) {
            return applyFailed(describeFailure(argv, result));
        }
    }
    return applySucceeded();
}

bool queryOutput(CommandRunner &runner,
                 const std::vector<std::string> &argv,
                 std::string *output,
                 std::string *error)
{
    const CommandResult result = runner.invoke(argv);
    if (!result.succeeded()) {
        if (error) {
            *error = describeFailure(argv, result);
        }
        return false;
    }
    if (output) {
        *output = result.stdoutText;
    }
    return true;
}

std::vector<std::string> splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::string trimCopy(const std::string &value)
{
    std::size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

} // namespace steward
