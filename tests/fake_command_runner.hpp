#pragma once

#include <deque>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "common/command_runner.hpp"

// Scripted CommandRunner: responses are keyed by the space-joined argv.
// Queued responses are consumed in order; the last one sticks. Unscripted
// commands behave like a program that failed to start.
class FakeCommandRunner : public steward::CommandRunner
{
public:
    static steward::CommandResult ok(const std::string &out = {})
    {
        steward::CommandResult result;
        result.started = true;
        result.exitCode = 0;
        result.stdoutText = out;
        return result;
    }

    static steward::CommandResult exit(int code, const std::string &out = {},
                                       const std::string &err = {})
    {
        steward::CommandResult result;
        result.started = true;
        result.exitCode = code;
        result.stdoutText = out;
        result.stderrText = err;
        return result;
    }

    void script(const std::string &command, steward::CommandResult result)
    {
        m_responses[command].push_back(std::move(result));
    }

    steward::CommandResult invoke(const std::vector<std::string> &argv) override
    {
        const std::string command = steward::joinArgv(argv);
        m_calls.push_back(command);

        auto it = m_responses.find(command);
        if (it == m_responses.end() || it->second.empty()) {
            steward::CommandResult missing;
            missing.stderrText = "not scripted: " + command;
            return missing;
        }
        steward::CommandResult result = it->second.front();
        if (it->second.size() > 1) {
            it->second.pop_front();
        }
        return result;
    }

    const std::vector<std::string> &calls() const { return m_calls; }

    int count(const std::string &command) const
    {
        int n = 0;
        for (const auto &call : m_calls) {
            if (call == command) {
                ++n;
            }
        }
        return n;
    }

private:
    std::map<std::string, std::deque<steward::CommandResult>> m_responses;
    std::vector<std::string> m_calls;
};
