#include "engine/dependency_graph.hpp"

#include <cstddef>
#include <deque>
#include <set>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace steward {

namespace {

struct Graph {
    // prerequisites[i]: resources i depends on. dependents[i]: the reverse.
    std::vector<std::vector<std::size_t>> prerequisites;
    std::vector<std::vector<std::size_t>> dependents;
};

Graph buildGraph(const std::vector<ResourceDescriptor> &descriptors)
{
    std::unordered_map<std::string, std::size_t> indexById;
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        if (!indexById.emplace(descriptors[i].id, i).second) {
            throw DuplicateResourceError(descriptors[i].id);
        }
    }

    Graph graph;
    graph.prerequisites.resize(descriptors.size());
    graph.dependents.resize(descriptors.size());

    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        std::set<std::size_t> seen;
        for (const auto &dependency : descriptors[i].dependsOn) {
            const auto it = indexById.find(dependency);
            if (it == indexById.end()) {
                throw UnknownDependencyError(descriptors[i].id, dependency);
            }
            if (!seen.insert(it->second).second) {
                continue;
            }
            graph.prerequisites[i].push_back(it->second);
            graph.dependents[it->second].push_back(i);
        }
    }
    return graph;
}

// Peel unresolved nodes that nothing unresolved depends on; what is left
// lies on (or between) cycles.
std::vector<std::string> cycleMembers(const std::vector<ResourceDescriptor> &descriptors,
                                      const Graph &graph,
                                      const std::vector<bool> &resolved)
{
    const std::size_t count = descriptors.size();
    std::vector<bool> remaining(count, false);
    std::vector<std::size_t> pendingDependents(count, 0);

    for (std::size_t i = 0; i < count; ++i) {
        remaining[i] = !resolved[i];
    }
    for (std::size_t i = 0; i < count; ++i) {
        if (!remaining[i]) {
            continue;
        }
        for (const std::size_t dependent : graph.dependents[i]) {
            if (remaining[dependent]) {
                ++pendingDependents[i];
            }
        }
    }

    std::deque<std::size_t> leaves;
    for (std::size_t i = 0; i < count; ++i) {
        if (remaining[i] && pendingDependents[i] == 0) {
            leaves.push_back(i);
        }
    }
    while (!leaves.empty()) {
        const std::size_t node = leaves.front();
        leaves.pop_front();
        remaining[node] = false;
        for (const std::size_t prerequisite : graph.prerequisites[node]) {
            if (remaining[prerequisite] && --pendingDependents[prerequisite] == 0) {
                leaves.push_back(prerequisite);
            }
        }
    }

    std::vector<std::string> members;
    for (std::size_t i = 0; i < count; ++i) {
        if (remaining[i]) {
            members.push_back(descriptors[i].id);
        }
    }
    return members;
}

} // namespace

std::vector<std::string> orderResources(const std::vector<ResourceDescriptor> &descriptors)
{
    const Graph graph = buildGraph(descriptors);
    const std::size_t count = descriptors.size();

    std::vector<std::size_t> inDegree(count, 0);
    for (std::size_t i = 0; i < count; ++i) {
        inDegree[i] = graph.prerequisites[i].size();
    }

    // Ordered by declaration index: the earliest-declared ready node goes next.
    std::set<std::size_t> ready;
    for (std::size_t i = 0; i < count; ++i) {
        if (inDegree[i] == 0) {
            ready.insert(i);
        }
    }

    std::vector<std::string> order;
    order.reserve(count);
    std::vector<bool> resolved(count, false);

    while (!ready.empty()) {
        const std::size_t node = *ready.begin();
        ready.erase(ready.begin());
        resolved[node] = true;
        order.push_back(descriptors[node].id);

        for (const std::size_t dependent : graph.dependents[node]) {
            if (--inDegree[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (order.size() != count) {
        std::vector<std::string> members = cycleMembers(descriptors, graph, resolved);
        SLOG_ERROR(QStringLiteral("DependencyGraph"),
                   QStringLiteral("orderResources"),
                   QStringLiteral("dependency_cycle"),
                   QStringLiteral("config_validation"),
                   QStringLiteral("kahn_topological_sort"),
                   steward::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"resources", members}});
        throw CycleError(std::move(members));
    }

    SLOG_DEBUG(QStringLiteral("DependencyGraph"),
               QStringLiteral("orderResources"),
               QStringLiteral("order_resolved"),
               QStringLiteral("config_validation"),
               QStringLiteral("kahn_topological_sort"),
               steward::logging::defaultWho(),
               QString(),
               nlohmann::json{{"order", order}});
    return order;
}

} // namespace steward
