#include "common/errors.hpp"

#include <utility>

namespace steward {

namespace {

std::string joinIds(const std::vector<std::string> &ids)
{
    std::string joined;
    for (const auto &id : ids) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += id;
    }
    return joined;
}

} // namespace

CycleError::CycleError(std::vector<std::string> resourceIds)
    : ConfigError("dependency cycle between resources: " + joinIds(resourceIds))
    , m_resourceIds(std::move(resourceIds))
{
}

UnknownDependencyError::UnknownDependencyError(std::string resourceId,
                                               std::string dependencyId)
    : ConfigError("resource '" + resourceId + "' depends on unknown resource '"
                  + dependencyId + "'")
    , m_resourceId(std::move(resourceId))
    , m_dependencyId(std::move(dependencyId))
{
}

DuplicateResourceError::DuplicateResourceError(const std::string &resourceId)
    : ConfigError("resource '" + resourceId + "' is declared more than once")
{
}

ConfigFileError::ConfigFileError(const std::string &source, const std::string &detail)
    : ConfigError(source + ": " + detail)
{
}

} // namespace steward
