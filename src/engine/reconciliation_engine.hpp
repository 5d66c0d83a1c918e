#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/models.hpp"
#include "engine/resource_handler.hpp"
#include "engine/run_report.hpp"

namespace steward {

struct ReconcileOptions {
    // Probe and diff only; drifted resources are reported as planned.
    bool dryRun = false;
    // Root-required resources are left out instead of failing.
    bool userOnly = false;
    // After the first failed resource, remaining resources are not scheduled.
    bool stopOnFailure = false;
};

/**
 * ReconciliationEngine drives one pass over a descriptor set:
 * order -> (skip | gate | probe -> diff -> apply -> verify) per resource.
 *
 * Execution is strictly sequential in dependency order. Nothing is cached
 * between passes; every run re-probes live state. Per-resource failures are
 * recorded in the report and never thrown; configuration errors throw
 * ConfigError before any probe.
 */
class ReconciliationEngine {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using ProgressCallback =
        std::function<void(const ResourceDescriptor &, const ReconciliationOutcome &)>;

    explicit ReconciliationEngine(PrivilegeContext context, ReconcileOptions options = {});

    // Replaces the blocking wait used between verification attempts.
    void setSleeper(Sleeper sleeper);
    void setProgressCallback(ProgressCallback callback);


    RunReport run(const std::vector<ResourceDescriptor> &descriptors) const;

private:
    using OutcomeIndex = std::unordered_map<std::string, std::size_t>;

    ReconciliationOutcome reconcile(const ResourceDescriptor &descriptor,
                                    const std::vector<ReconciliationOutcome> &previous,
                                    const OutcomeIndex &index) const;
    void verify(const ResourceDescriptor &descriptor, ReconciliationOutcome &outcome) const;

    PrivilegeContext m_context;
    ReconcileOptions m_options;
    Sleeper m_sleeper;
    ProgressCallback m_progress;
};

} // namespace steward
