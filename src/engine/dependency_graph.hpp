#pragma once

#include <string>
#include <vector>

#include "engine/resource_handler.hpp"

namespace steward {

/**
 * Order descriptors so that every dependsOn entry comes strictly earlier.
 *
 * Kahn's algorithm; among resources that are ready at the same time the one
 * declared first wins, so identical input always yields identical order.
 *
 * Throws DuplicateResourceError, UnknownDependencyError or CycleError (all
 * ConfigError). On CycleError the offending set contains only resources that
 * sit on a cycle, not everything downstream of one.
 */
std::vector<std::string> orderResources(const std::vector<ResourceDescriptor> &descriptors);

} // namespace steward
