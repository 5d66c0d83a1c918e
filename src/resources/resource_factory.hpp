#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/command_runner.hpp"
#include "common/models.hpp"
#include "engine/resource_handler.hpp"

namespace steward {

struct HandlerContext {
    CommandRunner *runner = nullptr;
    // Runs user-level resources as the invoking user in an elevated run.
    CommandRunner *userRunner = nullptr;
    PrivilegeContext privilege;
    // Extra program directories, "~" already expanded.
    std::vector<std::string> searchPaths;
};

// Builds the handler for a configured resource type. Throws ConfigError for
// an unknown type or missing/malformed params.
std::shared_ptr<ResourceHandler> createHandler(const std::string &type,
                                               const nlohmann::json &params,
                                               const HandlerContext &context);

std::vector<std::string> supportedResourceTypes();

} // namespace steward
