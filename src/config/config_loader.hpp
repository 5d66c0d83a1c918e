#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/command_runner.hpp"
#include "common/models.hpp"
#include "engine/resource_handler.hpp"

namespace steward {

struct RunSettings {
    bool stopOnFailure = false;
    int commandTimeoutMs = 120000;
    // Extra program directories, "~" already expanded.
    std::vector<std::string> searchPaths;
};

struct LoadedConfig {
    // File path, or the built-in profile name.
    std::string source;
    bool builtIn = false;
    RunSettings settings;
    nlohmann::json document;
};

/**
 * Resolves and parses the resource configuration.
 *
 * Lookup order: explicit path, STEWARD_CONFIG, then
 * ~/.config/steward/steward.json of the invoking user. When none of these
 * names an existing file the built-in profile is used; an explicitly named
 * file that is missing is an error.
 */
class ConfigLoader {
public:
    explicit ConfigLoader(PrivilegeContext privilege);

    LoadedConfig load(const std::string &explicitPath = {}) const;
    LoadedConfig fromDocument(nlohmann::json document, const std::string &source) const;

    // Throws ConfigFileError on malformed entries; graph errors (cycles,
    // unknown dependencies) are left to the engine. When userRunner is set,
    // resources with "user" privilege invoke their tools through it.
    std::vector<ResourceDescriptor> buildDescriptors(const LoadedConfig &config,
                                                     CommandRunner &runner,
                                                     CommandRunner *userRunner = nullptr) const;

    std::string defaultConfigPath() const;

private:
    PrivilegeContext m_privilege;
};

} // namespace steward
