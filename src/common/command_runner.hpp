#pragma once

#include <string>
#include <vector>

namespace steward {

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    bool crashed = false;
    int exitCode = -1;
    std::string stdoutText;
    std::string stderrText;

    bool succeeded() const
    {
        return started && !timedOut && !crashed && exitCode == 0;
    }
};

// Single chokepoint between resource handlers and external tools.
// Every handler receives a runner by reference so tests can script it.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult invoke(const std::vector<std::string> &argv) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
    explicit ProcessCommandRunner(int timeoutMs = 120000,
                                  std::vector<std::string> extraSearchPaths = {});

    CommandResult invoke(const std::vector<std::string> &argv) override;

private:
    int m_timeoutMs;
    std::vector<std::string> m_extraSearchPaths;
};

// Runs commands as the invoking user from an elevated process
// (`sudo -u <user> -H -- <argv>`). Tools such as Homebrew and `go install`
// refuse to run as root or would install into root's home. The program is
// resolved first because sudo replaces PATH with its secure_path.
class UserCommandRunner : public CommandRunner {
public:
    UserCommandRunner(CommandRunner &inner,
                      std::string userName,
                      std::vector<std::string> extraSearchPaths = {});

    CommandResult invoke(const std::vector<std::string> &argv) override;

private:
    CommandRunner &m_inner;
    std::string m_userName;
    std::vector<std::string> m_extraSearchPaths;
};

// One-line description of a failed invocation, suitable for an outcome error.
std::string describeFailure(const std::vector<std::string> &argv,
                            const CommandResult &result);

std::string joinArgv(const std::vector<std::string> &argv);

// PATH lookup first, then extraSearchPaths. Empty when not found.
std::string findExecutable(const std::string &name,
                           const std::vector<std::string> &extraSearchPaths = {});

} // namespace steward
