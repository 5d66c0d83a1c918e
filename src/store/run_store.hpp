#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace steward {

class RunReport;

// RunStore is the SQLite history of completed runs and their per-resource
// outcomes. It is append-only and only feeds reporting; no run ever reads
// it to decide what to probe.
class RunStore {
public:
    explicit RunStore(const std::string &databasePath);
    ~RunStore();

    RunStore(const RunStore &) = delete;
    RunStore &operator=(const RunStore &) = delete;

    void addRun(const RunReport &report);

    // Newest first.
    std::vector<RunSummary> listRuns(int limit) const;
    std::optional<RunSummary> getRun(const std::string &runId) const;
    std::vector<ReconciliationOutcome> getRunOutcomes(const std::string &runId) const;

    bool integrityCheck(std::string *message) const;

    static std::string defaultDatabasePath(const std::string &home);

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace steward
