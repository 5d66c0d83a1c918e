#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <QString>
#include <QStringList>

#include "common/command_runner.hpp"
#include "common/models.hpp"
#include "engine/reconciliation_engine.hpp"

namespace steward {

class StewardCli
{
public:
    // CLI dispatcher for apply, plan, order and history.
    // returns exit code: 0 success, 1 run failures, 2 config or usage error
    int run(int argc, char *argv[]);

    // Overrides for tests; the defaults inspect the real process and host.
    void setCommandRunner(CommandRunner *runner) { m_runner = runner; }
    void setPrivilegeContext(PrivilegeContext context) { m_privilege = std::move(context); }
    void setDatabasePath(std::string path) { m_databasePath = std::move(path); }
    void setSleeper(ReconciliationEngine::Sleeper sleeper) { m_sleeper = std::move(sleeper); }

private:
    int runApply(const QStringList &args, bool dryRun);
    int runOrder(const QStringList &args);
    int runHistory(const QStringList &args);

    PrivilegeContext privilegeContext() const;
    std::string databasePath() const;

    CommandRunner *m_runner = nullptr;
    std::optional<PrivilegeContext> m_privilege;
    std::string m_databasePath;
    ReconciliationEngine::Sleeper m_sleeper;
};

} // namespace steward
