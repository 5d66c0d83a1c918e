#include <QtTest/QtTest>

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/run_report.hpp"
#include "store/run_store.hpp"

using nlohmann::json;

namespace {

steward::PrivilegeContext adminContext()
{
    steward::PrivilegeContext context;
    context.uid = 501;
    context.euid = 0;
    context.userName = "admin";
    context.home = "/Users/admin";
    context.elevated = true;
    return context;
}

steward::RunReport makeReport(const std::string &runId,
                              std::chrono::system_clock::time_point startedAt,
                              bool failing)
{
    steward::ReconciliationOutcome converged;
    converged.resourceId = "go";
    converged.desiredState = "installed";
    converged.startState = "absent";
    converged.endState = "installed@1.22.1";
    converged.action = steward::OutcomeAction::Applied;
    converged.result = steward::OutcomeResult::Success;
    converged.probeCount = 2;
    converged.applyCount = 1;
    converged.duration = std::chrono::milliseconds(1500);

    steward::ReconciliationOutcome dns;
    dns.resourceId = "dns";
    dns.desiredState = json{"100.100.100.100"};
    dns.startState = json::array();
    dns.probeCount = 1;
    if (failing) {
        dns.action = steward::OutcomeAction::Applied;
        dns.result = steward::OutcomeResult::Failed;
        dns.reason = steward::FailureReason::ApplyError;
        dns.error = "'networksetup -setdnsservers Wi-Fi 100.100.100.100' exited with status 4";
        dns.applyCount = 1;
    } else {
        dns.endState = json::array();
        dns.action = steward::OutcomeAction::Planned;
    }

    return steward::RunReport(runId, startedAt, startedAt + std::chrono::seconds(3),
                              adminContext(), !failing, {converged, dns});
}

} // namespace

class RunStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void testCreatesDatabaseAndParents();
    void testRoundTripSummary();
    void testListRunsNewestFirst();
    void testOutcomesKeepOrderAndStates();
    void testUnknownRun();
    void testUnreadableDatabaseThrows();
    void testDefaultPath();
};

void RunStoreTests::testCreatesDatabaseAndParents()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + QStringLiteral("/nested/state/steward.db");

    steward::RunStore store(path.toStdString());
    QVERIFY(QFileInfo::exists(path));

    std::string message;
    QVERIFY(store.integrityCheck(&message));
    QCOMPARE(message, std::string("ok"));
    QVERIFY(store.listRuns(10).empty());
}

void RunStoreTests::testRoundTripSummary()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    steward::RunStore store((dir.path() + QStringLiteral("/steward.db")).toStdString());

    const auto startedAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
    const steward::RunReport report = makeReport("run-1", startedAt, true);
    store.addRun(report);

    const auto summary = store.getRun("run-1");
    QVERIFY(summary.has_value());
    QCOMPARE(summary->runId, std::string("run-1"));
    QVERIFY(summary->startedAt == startedAt);
    QVERIFY(summary->finishedAt == startedAt + std::chrono::seconds(3));
    QVERIFY(!summary->dryRun);
    QVERIFY(!summary->overallSuccess);
    QCOMPARE(summary->userName, std::string("admin"));
    QVERIFY(summary->elevated);
    QCOMPARE(summary->counts, report.counts());
}

void RunStoreTests::testListRunsNewestFirst()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    steward::RunStore store((dir.path() + QStringLiteral("/steward.db")).toStdString());

    const auto base = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000000LL));
    store.addRun(makeReport("older", base, false));
    store.addRun(makeReport("newest", base + std::chrono::hours(2), true));
    store.addRun(makeReport("middle", base + std::chrono::hours(1), false));

    const auto runs = store.listRuns(10);
    QCOMPARE(runs.size(), std::size_t(3));
    QCOMPARE(runs[0].runId, std::string("newest"));
    QCOMPARE(runs[1].runId, std::string("middle"));
    QCOMPARE(runs[2].runId, std::string("older"));

    const auto limited = store.listRuns(1);
    QCOMPARE(limited.size(), std::size_t(1));
    QCOMPARE(limited[0].runId, std::string("newest"));
}

void RunStoreTests::testOutcomesKeepOrderAndStates()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    steward::RunStore store((dir.path() + QStringLiteral("/steward.db")).toStdString());

    const auto startedAt = std::chrono::system_clock::now();
    store.addRun(makeReport("run-2", startedAt, true));

    const auto outcomes = store.getRunOutcomes("run-2");
    QCOMPARE(outcomes.size(), std::size_t(2));

    QCOMPARE(outcomes[0].resourceId, std::string("go"));
    QCOMPARE(outcomes[0].action, steward::OutcomeAction::Applied);
    QCOMPARE(outcomes[0].result, steward::OutcomeResult::Success);
    QCOMPARE(outcomes[0].startState, json("absent"));
    QCOMPARE(outcomes[0].endState, json("installed@1.22.1"));
    QCOMPARE(outcomes[0].probeCount, 2);
    QCOMPARE(outcomes[0].applyCount, 1);
    QCOMPARE(outcomes[0].duration.count(), 1500LL);

    QCOMPARE(outcomes[1].resourceId, std::string("dns"));
    QCOMPARE(outcomes[1].result, steward::OutcomeResult::Failed);
    QCOMPARE(outcomes[1].reason, steward::FailureReason::ApplyError);
    QCOMPARE(outcomes[1].desiredState, (json{"100.100.100.100"}));
    QCOMPARE(outcomes[1].startState, json::array());
    QVERIFY(outcomes[1].endState.is_null());
    QVERIFY(outcomes[1].error.find("status 4") != std::string::npos);
}

void RunStoreTests::testUnknownRun()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    steward::RunStore store((dir.path() + QStringLiteral("/steward.db")).toStdString());

    QVERIFY(!store.getRun("missing").has_value());
    QVERIFY(store.getRunOutcomes("missing").empty());
}

void RunStoreTests::testUnreadableDatabaseThrows()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + QStringLiteral("/steward.db");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(QByteArray(4096, 'x'));
    file.close();

    // Opening succeeds lazily; the schema bootstrap is what fails.
    bool thrown = false;
    try {
        steward::RunStore store(path.toStdString());
    } catch (const std::runtime_error &) {
        thrown = true;
    }
    QVERIFY(thrown);

    // The failed attempt left no handle behind holding the file.
    QVERIFY(QFile::remove(path));
    steward::RunStore fresh(path.toStdString());
    QVERIFY(fresh.listRuns(1).empty());
}

void RunStoreTests::testDefaultPath()
{
    QCOMPARE(steward::RunStore::defaultDatabasePath("/Users/admin"),
             std::string("/Users/admin/.local/share/steward/steward.db"));
}

QTEST_MAIN(RunStoreTests)
#include "test_run_store.moc"
