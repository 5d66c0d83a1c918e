#include "cli/StewardCli.hpp"

#include <iostream>
#include <vector>

#include <QDateTime>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/privilege.hpp"
#include "config/config_loader.hpp"
#include "engine/dependency_graph.hpp"
#include "engine/run_report.hpp"
#include "store/run_store.hpp"

namespace steward {

namespace {

constexpr int kExitUsage = 2;
constexpr int kDefaultHistoryLimit = 20;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  steward apply [--dry-run] [--user-only] [--stop-on-failure] [--config PATH]\n"
        "                [--format markdown|json] [--verbose]\n"
        "  steward plan [--user-only] [--config PATH] [--format markdown|json] [--verbose]\n"
        "  steward order [--config PATH] [--format markdown|json]\n"
        "  steward history [--limit N] [--run ID] [--format markdown|json]\n"
        "\n"
        "Global options: --trace (structured trace log), --help, --version\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool validFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count(),
        Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString("yyyy-MM-dd HH:mm:ss").toStdString();
}

std::string describeState(const nlohmann::json &state)
{
    if (state.is_string()) {
        return state.get<std::string>();
    }
    if (state.is_null()) {
        return "unknown";
    }
    return state.dump();
}

std::string resourceLabel(const ResourceDescriptor &descriptor)
{
    if (descriptor.description.empty()) {
        return descriptor.id;
    }
    return descriptor.id + " (" + descriptor.description + ")";
}

// Console progress while a run is in flight, in the style of the old
// provisioning script: "[INFO] ..." for checks, "  -> ..." for actions.
void printProgress(const ResourceDescriptor &descriptor, const ReconciliationOutcome &outcome)
{
    const std::string label = resourceLabel(descriptor);
    switch (outcomeKind(outcome)) {
    case OutcomeKind::Unchanged:
        std::cout << "[INFO] " << label << ": already " << describeState(outcome.endState)
                  << "\n";
        break;
    case OutcomeKind::Converged:
        std::cout << "  -> " << label << ": changed " << describeState(outcome.startState)
                  << " -> " << describeState(outcome.endState) << "\n";
        break;
    case OutcomeKind::Planned:
        std::cout << "  -> " << label << ": would change "
                  << describeState(outcome.startState) << " -> "
                  << describeState(outcome.desiredState) << "\n";
        break;
    case OutcomeKind::Failed:
        std::cout << "[ERROR] " << label << ": " << toReasonString(outcome.reason) << ": "
                  << outcome.error << "\n";
        break;
    case OutcomeKind::SkippedDependencyFailed:
    case OutcomeKind::SkippedRunAborted:
    case OutcomeKind::SkippedUserOnly:
        std::cout << "[INFO] " << label << ": skipped (" << toResultString(outcome.result)
                  << ")\n";
        break;
    }
}

void renderReportMarkdown(const RunReport &report, const std::string &source, bool verbose)
{
    std::cout << "\n# Steward Run Report\n\n";
    std::cout << "Run: " << report.runId() << "\n";
    std::cout << "Config: " << source << "\n";
    std::cout << "Started: " << formatLocalTime(report.startedAt()) << "\n";
    std::cout << "Finished: " << formatLocalTime(report.finishedAt()) << "\n";
    std::cout << "Mode: " << (report.dryRun() ? "dry run" : "apply") << "\n";
    std::cout << "User: " << report.privilegeContext().userName
              << (report.privilegeContext().elevated ? " (root)" : " (unprivileged)") << "\n";
    std::cout << "Result: " << (report.overallSuccess() ? "success" : "failed") << "\n\n";

    std::cout << "## Summary\n\n";
    const nlohmann::json counts = report.counts();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        if (it.value().get<int>() > 0) {
            std::cout << "- " << it.key() << ": " << it.value().get<int>() << "\n";
        }
    }

    std::cout << "\n## Resources\n\n";
    if (report.outcomes().empty()) {
        std::cout << "No resources configured.\n";
        return;
    }
    for (const auto &outcome : report.outcomes()) {
        std::cout << "- [" << toKindString(outcomeKind(outcome)) << "] " << outcome.resourceId;
        if (!outcome.error.empty()) {
            std::cout << ": ";
            if (outcome.reason != FailureReason::None) {
                std::cout << toReasonString(outcome.reason) << ": ";
            }
            std::cout << outcome.error;
        }
        std::cout << "\n";
        if (verbose) {
            std::cout << "  - desired: " << describeState(outcome.desiredState) << "\n";
            std::cout << "  - before: " << describeState(outcome.startState) << "\n";
            std::cout << "  - after: " << describeState(outcome.endState) << "\n";
            std::cout << "  - probes: " << outcome.probeCount
                      << ", applies: " << outcome.applyCount
                      << ", duration: " << outcome.duration.count() << " ms\n";
        }
    }
}

void renderHistoryMarkdown(const std::vector<RunSummary> &runs)
{
    std::cout << "# Steward Run History\n\n";
    if (runs.empty()) {
        std::cout << "No runs recorded.\n";
        return;
    }
    for (const auto &run : runs) {
        std::cout << "- [" << formatLocalTime(run.startedAt) << "] " << run.runId << " "
                  << (run.dryRun ? "dry run" : "apply") << ", "
                  << (run.overallSuccess ? "success" : "failed");
        if (!run.userName.empty()) {
            std::cout << ", " << run.userName;
        }
        std::cout << "\n";
    }
}

void renderRunMarkdown(const RunSummary &run, const std::vector<ReconciliationOutcome> &outcomes)
{
    std::cout << "# Steward Run " << run.runId << "\n\n";
    std::cout << "Started: " << formatLocalTime(run.startedAt) << "\n";
    std::cout << "Mode: " << (run.dryRun ? "dry run" : "apply") << "\n";
    std::cout << "Result: " << (run.overallSuccess ? "success" : "failed") << "\n\n";
    for (const auto &outcome : outcomes) {
        std::cout << "- [" << toKindString(outcomeKind(outcome)) << "] " << outcome.resourceId;
        if (!outcome.error.empty()) {
            std::cout << ": " << outcome.error;
        }
        std::cout << "\n";
    }
}

} // namespace

PrivilegeContext StewardCli::privilegeContext() const
{
    return m_privilege.has_value() ? *m_privilege : currentPrivilegeContext();
}

std::string StewardCli::databasePath() const
{
    if (!m_databasePath.empty()) {
        return m_databasePath;
    }
    return RunStore::defaultDatabasePath(privilegeContext().home);
}

int StewardCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to its handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kExitUsage;
    }

    const QString command = args.at(1);
    SLOG_INFO(QStringLiteral("StewardCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              steward::logging::defaultWho(),
              QString(),
              nlohmann::json{{"command", command.toStdString()}});

    if (command == QStringLiteral("--help") || command == QStringLiteral("help")) {
        std::cout << usageText().toStdString();
        return 0;
    }
    if (command == QStringLiteral("--version")) {
        std::cout << "steward " << STEWARD_VERSION << "\n";
        return 0;
    }
    if (command == QStringLiteral("apply")) {
        return runApply(args, args.contains(QStringLiteral("--dry-run")));
    }
    if (command == QStringLiteral("plan")) {
        return runApply(args, true);
    }
    if (command == QStringLiteral("order")) {
        return runOrder(args);
    }
    if (command == QStringLiteral("history")) {
        return runHistory(args);
    }

    std::cerr << usageText().toStdString();
    return kExitUsage;
}

int StewardCli::runApply(const QStringList &args, bool dryRun)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return kExitUsage;
    }
    const bool userOnly = args.contains(QStringLiteral("--user-only"));
    const bool verbose = args.contains(QStringLiteral("--verbose"));
    const PrivilegeContext privilege = privilegeContext();

    if (!userOnly && !privilege.elevated) {
        std::cerr << "System operations require root. Run with sudo or use --user-only."
                  << std::endl;
        return 1;
    }

    const ConfigLoader loader(privilege);
    LoadedConfig config;
    try {
        config = loader.load(getArgValue(args, QStringLiteral("--config")).toStdString());
    } catch (const ConfigError &ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return kExitUsage;
    }

    std::unique_ptr<ProcessCommandRunner> ownedRunner;
    CommandRunner *runner = m_runner;
    if (!runner) {
        ownedRunner = std::make_unique<ProcessCommandRunner>(config.settings.commandTimeoutMs,
                                                             config.settings.searchPaths);
        runner = ownedRunner.get();
    }

    // Under sudo, user-level resources (Homebrew, go install) run as the
    // invoking user; root-level ones run as root.
    std::unique_ptr<UserCommandRunner> userRunner;
    if (actsForInvokingUser(privilege)) {
        userRunner = std::make_unique<UserCommandRunner>(*runner, privilege.userName,
                                                         config.settings.searchPaths);
        SLOG_INFO(QStringLiteral("StewardCli"),
                  QStringLiteral("runApply"),
                  QStringLiteral("user_resources_delegated"),
                  QStringLiteral("elevated_via_sudo"),
                  QStringLiteral("sudo_u"),
                  steward::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"user", privilege.userName}}));
    }

    ReconcileOptions options;
    options.dryRun = dryRun;
    options.userOnly = userOnly;
    options.stopOnFailure = args.contains(QStringLiteral("--stop-on-failure"))
        || config.settings.stopOnFailure;

    ReconciliationEngine engine(privilege, options);
    if (m_sleeper) {
        engine.setSleeper(m_sleeper);
    }
    if (format == QStringLiteral("markdown")) {
        std::cout << "--- Steward: reconciling " << config.source
                  << (dryRun ? " (dry run)" : "") << " ---\n";
        engine.setProgressCallback(printProgress);
    }

    std::unique_ptr<RunReport> report;
    try {
        const std::vector<ResourceDescriptor> descriptors =
            loader.buildDescriptors(config, *runner, userRunner.get());
        report = std::make_unique<RunReport>(engine.run(descriptors));
    } catch (const ConfigError &ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return kExitUsage;
    }

    // History is best-effort; a run never fails because it could not be recorded.
    try {
        RunStore store(databasePath());
        store.addRun(*report);
    } catch (const std::exception &ex) {
        SLOG_WARN(QStringLiteral("StewardCli"),
                  QStringLiteral("runApply"),
                  QStringLiteral("history_write_failed"),
                  QStringLiteral("sqlite_error"),
                  QStringLiteral("run_store"),
                  steward::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"error", ex.what()}, {"path", databasePath()}}));
        std::cerr << "Warning: could not record run history: " << ex.what() << std::endl;
    }

    SLOG_INFO(QStringLiteral("StewardCli"),
              QStringLiteral("runApply"),
              QStringLiteral("apply_finished"),
              QStringLiteral("user_invocation"),
              QStringLiteral("reconciliation_engine"),
              steward::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"runId", report->runId()},
                              {"overallSuccess", report->overallSuccess()},
                              {"format", format.toStdString()}}));

    if (format == QStringLiteral("json")) {
        nlohmann::json payload = *report;
        payload["config"] = config.source;
        std::cout << payload.dump(2) << std::endl;
    } else {
        renderReportMarkdown(*report, config.source, verbose);
    }
    return report->exitCode();
}

int StewardCli::runOrder(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return kExitUsage;
    }

    const ConfigLoader loader(privilegeContext());
    ProcessCommandRunner unusedRunner;
    std::vector<std::string> order;
    std::string source;
    try {
        const LoadedConfig config =
            loader.load(getArgValue(args, QStringLiteral("--config")).toStdString());
        source = config.source;
        order = orderResources(
            loader.buildDescriptors(config, m_runner ? *m_runner : unusedRunner));
    } catch (const ConfigError &ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return kExitUsage;
    }

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json{{"config", source}, {"order", order}}.dump(2) << std::endl;
    } else {
        std::cout << "# Reconciliation Order\n\n";
        std::cout << "Config: " << source << "\n\n";
        int position = 1;
        for (const auto &id : order) {
            std::cout << position++ << ". " << id << "\n";
        }
    }
    return 0;
}

int StewardCli::runHistory(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return kExitUsage;
    }

    int limit = kDefaultHistoryLimit;
    const QString limitValue = getArgValue(args, QStringLiteral("--limit"));
    if (!limitValue.isEmpty()) {
        bool ok = false;
        limit = limitValue.toInt(&ok);
        if (!ok || limit <= 0) {
            std::cerr << "Invalid --limit. Use a positive number." << std::endl;
            return kExitUsage;
        }
    }
    const QString runId = getArgValue(args, QStringLiteral("--run"));

    try {
        RunStore store(databasePath());
        if (!runId.isEmpty()) {
            const auto run = store.getRun(runId.toStdString());
            if (!run.has_value()) {
                std::cerr << "Run not found." << std::endl;
                return 1;
            }
            const auto outcomes = store.getRunOutcomes(run->runId);
            if (format == QStringLiteral("json")) {
                nlohmann::json payload = *run;
                payload["outcomes"] = outcomes;
                std::cout << payload.dump(2) << std::endl;
            } else {
                renderRunMarkdown(*run, outcomes);
            }
            return 0;
        }

        const auto runs = store.listRuns(limit);
        SLOG_INFO(QStringLiteral("StewardCli"),
                  QStringLiteral("runHistory"),
                  QStringLiteral("history_listed"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("sqlite_query"),
                  steward::logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"runs", runs.size()}, {"format", format.toStdString()}}));
        if (format == QStringLiteral("json")) {
            std::cout << nlohmann::json{{"runs", runs}}.dump(2) << std::endl;
        } else {
            renderHistoryMarkdown(runs);
        }
    } catch (const std::runtime_error &ex) {
        std::cerr << "Cannot read run history: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace steward
