#include "common/command_runner.hpp"

#include <QElapsedTimer>
#include <QProcess>
#include <QStandardPaths>
#include <QStringList>

#include <utility>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace steward {

namespace {

constexpr std::size_t kMaxErrorSnippet = 400;

std::string trimmed(const std::string &value)
{
    return QString::fromStdString(value).trimmed().toStdString();
}

std::string snippet(const std::string &value)
{
    const std::string text = trimmed(value);
    if (text.size() <= kMaxErrorSnippet) {
        return text;
    }
    return text.substr(0, kMaxErrorSnippet) + "...";
}

QStringList toQStringList(const std::vector<std::string> &values)
{
    QStringList list;
    list.reserve(static_cast<int>(values.size()));
    for (const auto &value : values) {
        list.push_back(QString::fromStdString(value));
    }
    return list;
}

} // namespace

ProcessCommandRunner::ProcessCommandRunner(int timeoutMs,
                                           std::vector<std::string> extraSearchPaths)
    : m_timeoutMs(timeoutMs)
    , m_extraSearchPaths(std::move(extraSearchPaths))
{
}

CommandResult ProcessCommandRunner::invoke(const std::vector<std::string> &argv)
{
    CommandResult result;
    if (argv.empty()) {
        return result;
    }

    // Absolute paths pass through; bare names may live outside the
    // inherited PATH (e.g. /opt/homebrew/bin under sudo).
    std::string program = argv.front();
    if (program.find('/') == std::string::npos) {
        const std::string resolved = findExecutable(program, m_extraSearchPaths);
        if (!resolved.empty()) {
            program = resolved;
        }
    }

    const QStringList arguments =
        toQStringList(std::vector<std::string>(argv.begin() + 1, argv.end()));

    SLOG_DEBUG(QStringLiteral("CommandRunner"),
               QStringLiteral("invoke"),
               QStringLiteral("command_start"),
               QStringLiteral("resource_protocol"),
               QStringLiteral("qprocess"),
               steward::logging::defaultWho(),
               QString(),
               nlohmann::json{{"argv", argv}, {"program", program}});

    QElapsedTimer timer;
    timer.start();

    QProcess process;
    process.start(QString::fromStdString(program), arguments);
    if (!process.waitForStarted()) {
        result.stderrText = process.errorString().toStdString();
        SLOG_WARN(QStringLiteral("CommandRunner"),
                  QStringLiteral("invoke"),
                  QStringLiteral("command_not_started"),
                  QStringLiteral("resource_protocol"),
                  QStringLiteral("qprocess"),
                  steward::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"argv", argv}, {"error", result.stderrText}});
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    if (!process.waitForFinished(m_timeoutMs)) {
        result.timedOut = true;
        process.kill();
        process.waitForFinished(1000);
    }

    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput()).toStdString();
    result.stderrText = QString::fromUtf8(process.readAllStandardError()).toStdString();

    if (!result.timedOut) {
        result.crashed = process.exitStatus() != QProcess::NormalExit;
        result.exitCode = process.exitCode();
    }

    SLOG_DEBUG(QStringLiteral("CommandRunner"),
               QStringLiteral("invoke"),
               QStringLiteral("command_finished"),
               QStringLiteral("resource_protocol"),
               QStringLiteral("qprocess"),
               steward::logging::defaultWho(),
               QString(),
               nlohmann::json{{"argv", argv},
                              {"exitCode", result.exitCode},
                              {"timedOut", result.timedOut},
                              {"crashed", result.crashed},
                              {"elapsedMs", timer.elapsed()}});
    return result;
}

UserCommandRunner::UserCommandRunner(CommandRunner &inner,
                                     std::string userName,
                                     std::vector<std::string> extraSearchPaths)
    : m_inner(inner)
    , m_userName(std::move(userName))
    , m_extraSearchPaths(std::move(extraSearchPaths))
{
}

CommandResult UserCommandRunner::invoke(const std::vector<std::string> &argv)
{
    if (argv.empty()) {
        return m_inner.invoke(argv);
    }

    std::vector<std::string> wrapped{"sudo", "-u", m_userName, "-H", "--"};
    std::string program = argv.front();
    if (program.find('/') == std::string::npos) {
        const std::string resolved = findExecutable(program, m_extraSearchPaths);
        if (!resolved.empty()) {
            program = resolved;
        }
    }
    wrapped.push_back(program);
    wrapped.insert(wrapped.end(), argv.begin() + 1, argv.end());
    return m_inner.invoke(wrapped);
}

std::string joinArgv(const std::vector<std::string> &argv)
{
    std::string joined;
    for (const auto &arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

std::string describeFailure(const std::vector<std::string> &argv,
                            const CommandResult &result)
{
    const std::string command = joinArgv(argv);
    if (!result.started) {
        std::string message = "failed to start '" + command + "'";
        if (!result.stderrText.empty()) {
            message += ": " + snippet(result.stderrText);
        }
        return message;
    }
    if (result.timedOut) {
        return "'" + command + "' timed out";
    }
    if (result.crashed) {
        return "'" + command + "' crashed";
    }

    std::string message = "'" + command + "' exited with status "
        + std::to_string(result.exitCode);
    const std::string detail = !trimmed(result.stderrText).empty()
        ? snippet(result.stderrText)
        : snippet(result.stdoutText);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

std::string findExecutable(const std::string &name,
                           const std::vector<std::string> &extraSearchPaths)
{
    const QString qName = QString::fromStdString(name);
    QString found = QStandardPaths::findExecutable(qName);
    if (found.isEmpty() && !extraSearchPaths.empty()) {
        found = QStandardPaths::findExecutable(qName, toQStringList(extraSearchPaths));
    }
    return found.toStdString();
}

} // namespace steward
