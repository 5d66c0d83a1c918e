#include <vector>

#include <QCoreApplication>

#include "cli/StewardCli.hpp"
#include "common/logging.hpp"
#include "common/privilege.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    bool trace = qEnvironmentVariableIntValue("STEWARD_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }

    // Under sudo, logs belong to the invoking user rather than root.
    const steward::PrivilegeContext privilege = steward::currentPrivilegeContext();
    if (qEnvironmentVariable("STEWARD_LOG_DIR").isEmpty() && !privilege.home.empty()) {
        steward::logging::setLogDirectory(QString::fromStdString(privilege.home)
                                          + QStringLiteral("/.local/share/steward/logs"));
    }
    steward::logging::initLogging(QStringLiteral("steward"), trace);
    SLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              steward::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", filteredArgs.size()}, {"trace", trace}}));

    steward::StewardCli cli;
    cli.setPrivilegeContext(privilege);
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
