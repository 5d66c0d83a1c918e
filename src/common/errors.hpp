#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace steward {

// Raised before any resource is touched; a run never reconciles a partial graph.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CycleError : public ConfigError {
public:
    explicit CycleError(std::vector<std::string> resourceIds);

    const std::vector<std::string> &resourceIds() const { return m_resourceIds; }

private:
    std::vector<std::string> m_resourceIds;
};

class UnknownDependencyError : public ConfigError {
public:
    UnknownDependencyError(std::string resourceId, std::string dependencyId);

    const std::string &resourceId() const { return m_resourceId; }
    const std::string &dependencyId() const { return m_dependencyId; }

private:
    std::string m_resourceId;
    std::string m_dependencyId;
};

class DuplicateResourceError : public ConfigError {
public:
    explicit DuplicateResourceError(const std::string &resourceId);
};

class ConfigFileError : public ConfigError {
public:
    ConfigFileError(const std::string &source, const std::string &detail);
};

} // namespace steward
