#include "store/run_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include <sqlite3.h>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/run_report.hpp"

namespace steward {

namespace {

constexpr const char *kCreateRunsTable =
    "CREATE TABLE IF NOT EXISTS runs ("
    "    id TEXT PRIMARY KEY,"
    "    started_at INTEGER NOT NULL,"
    "    finished_at INTEGER NOT NULL,"
    "    dry_run INTEGER NOT NULL,"
    "    overall_success INTEGER NOT NULL,"
    "    user_name TEXT,"
    "    elevated INTEGER NOT NULL,"
    "    counts TEXT"
    ");";

constexpr const char *kCreateOutcomesTable =
    "CREATE TABLE IF NOT EXISTS outcomes ("
    "    run_id TEXT NOT NULL REFERENCES runs(id),"
    "    position INTEGER NOT NULL,"
    "    resource_id TEXT NOT NULL,"
    "    action TEXT NOT NULL,"
    "    result TEXT NOT NULL,"
    "    reason TEXT,"
    "    error TEXT,"
    "    desired_state TEXT,"
    "    start_state TEXT,"
    "    end_state TEXT,"
    "    probe_count INTEGER NOT NULL,"
    "    apply_count INTEGER NOT NULL,"
    "    duration_ms INTEGER NOT NULL,"
    "    PRIMARY KEY (run_id, position)"
    ");";

constexpr const char *kRunColumns =
    "SELECT id, started_at, finished_at, dry_run, overall_success, user_name, "
    "elevated, counts FROM runs";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{value})};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

void bindJson(sqlite3_stmt *stmt, int index, const nlohmann::json &value)
{
    if (value.is_null()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value.dump());
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nullptr;
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &) {
        return nullptr;
    }
}

RunSummary readSummary(sqlite3_stmt *stmt)
{
    RunSummary summary;
    summary.runId = columnText(stmt, 0);
    summary.startedAt = fromEpochMillis(sqlite3_column_int64(stmt, 1));
    summary.finishedAt = fromEpochMillis(sqlite3_column_int64(stmt, 2));
    summary.dryRun = sqlite3_column_int(stmt, 3) != 0;
    summary.overallSuccess = sqlite3_column_int(stmt, 4) != 0;
    summary.userName = columnText(stmt, 5);
    summary.elevated = sqlite3_column_int(stmt, 6) != 0;
    summary.counts = columnJson(stmt, 7);
    if (summary.counts.is_null()) {
        summary.counts = nlohmann::json::object();
    }
    return summary;
}

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

} // namespace

struct RunStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
};

std::string RunStore::defaultDatabasePath(const std::string &home)
{
    std::filesystem::path basePath = home.empty() ? "." : home;
    basePath /= ".local/share/steward/steward.db";
    return basePath.string();
}

RunStore::RunStore(const std::string &databasePath)
    : impl(std::make_unique<Impl>())
{
    impl->path = databasePath;
    const std::filesystem::path parent = std::filesystem::path(databasePath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(databasePath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open steward database: " + message);
    }

    try {
        execOrThrow(impl->db, kCreateRunsTable);
        execOrThrow(impl->db, kCreateOutcomesTable);
    } catch (const std::runtime_error &) {
        // The destructor does not run for a throwing constructor.
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

RunStore::~RunStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

void RunStore::addRun(const RunReport &report)
{
    Transaction transaction(impl->db);

    {
        Statement stmt(impl->db,
                       "INSERT INTO runs (id, started_at, finished_at, dry_run, "
                       "overall_success, user_name, elevated, counts) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        bindText(stmt.get(), 1, report.runId());
        sqlite3_bind_int64(stmt.get(), 2, toEpochMillis(report.startedAt()));
        sqlite3_bind_int64(stmt.get(), 3, toEpochMillis(report.finishedAt()));
        sqlite3_bind_int(stmt.get(), 4, report.dryRun() ? 1 : 0);
        sqlite3_bind_int(stmt.get(), 5, report.overallSuccess() ? 1 : 0);
        bindOptionalText(stmt.get(), 6, report.privilegeContext().userName);
        sqlite3_bind_int(stmt.get(), 7, report.privilegeContext().elevated ? 1 : 0);
        bindJson(stmt.get(), 8, report.counts());
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("failed to insert run: ")
                                     + sqlite3_errmsg(impl->db));
        }
    }

    int position = 0;
    for (const auto &outcome : report.outcomes()) {
        Statement stmt(impl->db,
                       "INSERT INTO outcomes (run_id, position, resource_id, action, "
                       "result, reason, error, desired_state, start_state, end_state, "
                       "probe_count, apply_count, duration_ms) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        bindText(stmt.get(), 1, report.runId());
        sqlite3_bind_int(stmt.get(), 2, position++);
        bindText(stmt.get(), 3, outcome.resourceId);
        bindText(stmt.get(), 4, toActionString(outcome.action));
        bindText(stmt.get(), 5, toResultString(outcome.result));
        bindOptionalText(stmt.get(), 6, toReasonString(outcome.reason));
        bindOptionalText(stmt.get(), 7, outcome.error);
        bindJson(stmt.get(), 8, outcome.desiredState);
        bindJson(stmt.get(), 9, outcome.startState);
        bindJson(stmt.get(), 10, outcome.endState);
        sqlite3_bind_int(stmt.get(), 11, outcome.probeCount);
        sqlite3_bind_int(stmt.get(), 12, outcome.applyCount);
        sqlite3_bind_int64(stmt.get(), 13, outcome.duration.count());
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("failed to insert outcome: ")
                                     + sqlite3_errmsg(impl->db));
        }
    }

    transaction.commit();

    SLOG_DEBUG(QStringLiteral("RunStore"),
               QStringLiteral("addRun"),
               QStringLiteral("run_recorded"),
               QStringLiteral("history"),
               QStringLiteral("sqlite_insert"),
               steward::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"runId", report.runId()},
                               {"outcomes", report.outcomes().size()},
                               {"path", impl->path}}));
}

std::vector<RunSummary> RunStore::listRuns(int limit) const
{
    const std::string sql = std::string(kRunColumns)
        + " ORDER BY started_at DESC, rowid DESC LIMIT ?;";
    Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int(stmt.get(), 1, limit > 0 ? limit : -1);

    std::vector<RunSummary> runs;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        runs.push_back(readSummary(stmt.get()));
    }
    return runs;
}

std::optional<RunSummary> RunStore::getRun(const std::string &runId) const
{
    const std::string sql = std::string(kRunColumns) + " WHERE id = ? LIMIT 1;";
    Statement stmt(impl->db, sql.c_str());
    bindText(stmt.get(), 1, runId);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readSummary(stmt.get());
}

std::vector<ReconciliationOutcome> RunStore::getRunOutcomes(const std::string &runId) const
{
    Statement stmt(impl->db,
                   "SELECT resource_id, action, result, reason, error, desired_state, "
                   "start_state, end_state, probe_count, apply_count, duration_ms "
                   "FROM outcomes WHERE run_id = ? ORDER BY position ASC;");
    bindText(stmt.get(), 1, runId);

    std::vector<ReconciliationOutcome> outcomes;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        ReconciliationOutcome outcome;
        outcome.resourceId = columnText(stmt.get(), 0);
        outcome.action = parseActionString(columnText(stmt.get(), 1));
        outcome.result = parseResultString(columnText(stmt.get(), 2));
        outcome.reason = parseReasonString(columnText(stmt.get(), 3));
        outcome.error = columnText(stmt.get(), 4);
        outcome.desiredState = columnJson(stmt.get(), 5);
        outcome.startState = columnJson(stmt.get(), 6);
        outcome.endState = columnJson(stmt.get(), 7);
        outcome.probeCount = sqlite3_column_int(stmt.get(), 8);
        outcome.applyCount = sqlite3_column_int(stmt.get(), 9);
        outcome.duration = std::chrono::milliseconds(sqlite3_column_int64(stmt.get(), 10));
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

bool RunStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace steward
