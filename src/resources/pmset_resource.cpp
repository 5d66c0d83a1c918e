#include "resources/pmset_resource.hpp"

#include <regex>
#include <utility>

#include "engine/state_diff.hpp"
#include "resources/command_steps.hpp"

namespace steward {

namespace {

std::string escapeRegex(const std::string &text)
{
    static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
    return std::regex_replace(text, special, R"(\$&)");
}

} // namespace

std::string parsePmsetValue(const std::string &output, const std::string &setting)
{
    // Anchored on the whole key so "sleep" never matches "disksleep".
    const std::regex pattern("^\\s*" + escapeRegex(setting) + "\\s+(\\S+)");
    for (const auto &line : splitLines(output)) {
        std::smatch match;
        if (std::regex_search(line, match, pattern)) {
            return match[1].str();
        }
    }
    return {};
}

PmsetResource::PmsetResource(CommandRunner &runner, std::string setting)
    : m_runner(runner)
    , m_setting(std::move(setting))
{
}

ProbeResult PmsetResource::probe()
{
    std::string output;
    std::string error;
    if (!queryOutput(m_runner, {"pmset", "-g"}, &output, &error)) {
        return unknownState(error);
    }
    const std::string value = parsePmsetValue(output, m_setting);
    if (value.empty()) {
        return unknownState("pmset -g does not report '" + m_setting + "'");
    }
    return observedState(value);
}

ApplyResult PmsetResource::apply(const nlohmann::json &desired)
{
    const std::string value = scalarToString(desired);
    if (value.empty()) {
        return applyFailed("empty value for pmset setting '" + m_setting + "'");
    }
    return runSteps(m_runner, {{"pmset", "-a", m_setting, value}});
}

} // namespace steward
