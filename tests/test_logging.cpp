#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace {

QList<nlohmann::json> readEvents(const QString &path)
{
    QList<nlohmann::json> events;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return events;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            events.push_back(nlohmann::json::parse(line.toStdString()));
        }
    }
    return events;
}

bool containsWhat(const QList<nlohmann::json> &events, const std::string &what)
{
    for (const auto &event : events) {
        if (event.value("what", "") == what) {
            return true;
        }
    }
    return false;
}

} // namespace

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugOnlyWhenTracing();
    void testTraceWrites();
    void testCorrelationScope();
    void testLogDirectoryOverride();

private:
    QString logDir() const;

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QByteArray m_prevLogDir;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    m_prevLogDir = qgetenv("STEWARD_LOG_DIR");
    qputenv("HOME", m_tempDir.path().toUtf8());
    qunsetenv("STEWARD_LOG_DIR");
    steward::logging::setLogDirectory(QString());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
    if (!m_prevLogDir.isEmpty()) {
        qputenv("STEWARD_LOG_DIR", m_prevLogDir);
    }
}

QString LoggingTests::logDir() const
{
    return m_tempDir.path() + QStringLiteral("/.local/share/steward/logs");
}

void LoggingTests::testLogEventWrites()
{
    steward::logging::initLogging(QStringLiteral("steward-test"), false);
    QCOMPARE(steward::logging::logDirectory(), logDir());

    steward::logging::logEvent(steward::logging::LogLevel::Info,
                               QStringLiteral("steward-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testLogEventWrites"),
                               QStringLiteral("test_log"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               steward::logging::defaultWho(),
                               QStringLiteral("corr-1"),
                               nlohmann::json{{"key", "value"}});

    const auto events = readEvents(logDir() + QStringLiteral("/steward-test.log"));
    QVERIFY(!events.isEmpty());
    const auto &parsed = events.back();
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(parsed.at("context").value("key", ""), std::string("value"));
}

void LoggingTests::testDebugOnlyWhenTracing()
{
    steward::logging::initLogging(QStringLiteral("steward-quiet"), false);
    SLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testDebugOnlyWhenTracing"),
               QStringLiteral("quiet_debug"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               steward::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    QVERIFY(!containsWhat(readEvents(logDir() + QStringLiteral("/steward-quiet.log")),
                          "quiet_debug"));
    QVERIFY(!QFile::exists(logDir() + QStringLiteral("/steward-quiet-trace.log")));
}

void LoggingTests::testTraceWrites()
{
    steward::logging::initLogging(QStringLiteral("steward-test"), true);
    QVERIFY(steward::logging::isTraceEnabled());

    steward::logging::logEvent(steward::logging::LogLevel::Debug,
                               QStringLiteral("steward-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testTraceWrites"),
                               QStringLiteral("test_trace"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               steward::logging::defaultWho(),
                               QStringLiteral("corr-2"),
                               nlohmann::json::object());

    QVERIFY(containsWhat(readEvents(logDir() + QStringLiteral("/steward-test-trace.log")),
                         "test_trace"));
    QVERIFY(containsWhat(readEvents(logDir() + QStringLiteral("/steward-test.log")),
                         "test_trace"));
    steward::logging::initLogging(QStringLiteral("steward-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    steward::logging::initLogging(QStringLiteral("steward-corr"), false);
    QVERIFY(steward::logging::currentCorrelationId().isEmpty());
    {
        steward::logging::CorrelationScope outer(QStringLiteral("run-outer"));
        {
            steward::logging::CorrelationScope inner(QStringLiteral("run-inner"));
            SLOG_INFO(QStringLiteral("Test"),
                      QStringLiteral("testCorrelationScope"),
                      QStringLiteral("scoped_event"),
                      QStringLiteral("unit_test"),
                      QStringLiteral("macro"),
                      steward::logging::defaultWho(),
                      QString(),
                      nlohmann::json::object());
        }
        QCOMPARE(steward::logging::currentCorrelationId(), QStringLiteral("run-outer"));
    }
    QVERIFY(steward::logging::currentCorrelationId().isEmpty());

    const auto events = readEvents(logDir() + QStringLiteral("/steward-corr.log"));
    QVERIFY(!events.isEmpty());
    QCOMPARE(events.back().value("corr", ""), std::string("run-inner"));
    QCOMPARE(events.back().value("process", ""), std::string("steward-corr"));
}

void LoggingTests::testLogDirectoryOverride()
{
    const QString custom = m_tempDir.path() + QStringLiteral("/custom-logs");
    steward::logging::setLogDirectory(custom);
    steward::logging::initLogging(QStringLiteral("steward-custom"), false);
    SLOG_WARN(QStringLiteral("Test"),
              QStringLiteral("testLogDirectoryOverride"),
              QStringLiteral("custom_dir"),
              QStringLiteral("unit_test"),
              QStringLiteral("macro"),
              steward::logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    steward::logging::setLogDirectory(QString());

    QVERIFY(containsWhat(readEvents(custom + QStringLiteral("/steward-custom.log")),
                         "custom_dir"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
