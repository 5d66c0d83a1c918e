#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "config/config_loader.hpp"
#include "config/default_profile.hpp"
#include "engine/dependency_graph.hpp"
#include "fake_command_runner.hpp"

using nlohmann::json;

class ConfigLoaderTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testBuiltInProfileWhenNoFile();
    void testBuiltInProfileOrder();
    void testUserConfigFile();
    void testExplicitMissingFile();
    void testEnvironmentOverride();
    void testInvalidJson();
    void testUnknownResourceType();
    void testInvalidPrivilege();
    void testUserResourcesUseUserRunner();
    void testVerifyPolicy();
    void testInvalidVerifyPolicy();
    void testOptions();

private:
    steward::PrivilegeContext context() const;
    QString writeConfig(const QString &relativePath, const QByteArray &contents) const;

    QTemporaryDir m_tempDir;
    QString m_home;
};

void ConfigLoaderTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    steward::logging::setLogDirectory(m_tempDir.path() + QStringLiteral("/logs"));
    steward::logging::initLogging(QStringLiteral("steward-test"), false);
}

void ConfigLoaderTests::init()
{
    static int counter = 0;
    m_home = m_tempDir.path() + QStringLiteral("/home%1").arg(++counter);
    QDir().mkpath(m_home);
    qunsetenv("STEWARD_CONFIG");
}

void ConfigLoaderTests::cleanup()
{
    qunsetenv("STEWARD_CONFIG");
}

steward::PrivilegeContext ConfigLoaderTests::context() const
{
    steward::PrivilegeContext ctx;
    ctx.uid = 501;
    ctx.euid = 0;
    ctx.userName = "admin";
    ctx.home = m_home.toStdString();
    ctx.elevated = true;
    return ctx;
}

QString ConfigLoaderTests::writeConfig(const QString &relativePath, const QByteArray &contents) const
{
    const QString path = m_home + QLatin1Char('/') + relativePath;
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(contents);
        file.close();
    }
    return path;
}

void ConfigLoaderTests::testBuiltInProfileWhenNoFile()
{
    steward::ConfigLoader loader(context());
    const steward::LoadedConfig config = loader.load();
    QVERIFY(config.builtIn);
    QCOMPARE(config.source, std::string(steward::kDefaultProfileName));
    QCOMPARE(config.settings.commandTimeoutMs, 120000);
    QVERIFY(!config.settings.stopOnFailure);

    // "~/go/bin" follows the invoking user's home.
    const std::string goBin = m_home.toStdString() + "/go/bin";
    bool found = false;
    for (const auto &path : config.settings.searchPaths) {
        found = found || path == goBin;
    }
    QVERIFY(found);

    FakeCommandRunner runner;
    const auto descriptors = loader.buildDescriptors(config, runner);
    QCOMPARE(descriptors.size(), steward::defaultProfile().at("resources").size());
    for (const auto &descriptor : descriptors) {
        QVERIFY(descriptor.handler != nullptr);
    }
    QVERIFY(runner.calls().empty());
}

void ConfigLoaderTests::testBuiltInProfileOrder()
{
    steward::ConfigLoader loader(context());
    FakeCommandRunner runner;
    const auto descriptors = loader.buildDescriptors(loader.load(), runner);
    const std::vector<std::string> order = steward::orderResources(descriptors);

    auto position = [&order](const std::string &id) {
        for (std::size_t i = 0; i < order.size(); ++i) {
            if (order[i] == id) {
                return static_cast<int>(i);
            }
        }
        return -1;
    };

    QVERIFY(position("homebrew") >= 0);
    QVERIFY(position("homebrew") < position("go"));
    QVERIFY(position("go") < position("tailscale"));
    QVERIFY(position("tailscale") < position("tailscale-daemon"));
    QVERIFY(position("tailscale-daemon") < position("tailscale-connected"));
    QVERIFY(position("firewall") < position("firewall-exceptions"));
    QVERIFY(position("tailscale") < position("firewall-exceptions"));
    QVERIFY(position("tailscale-connected") < position("dns-magicdns"));
}

void ConfigLoaderTests::testUserConfigFile()
{
    writeConfig(QStringLiteral(".config/steward/steward.json"),
                R"({"resources": [
                      {"id": "jq", "type": "brew-package", "desired": "installed",
                       "params": {"package": "jq"}}
                    ]})");

    steward::ConfigLoader loader(context());
    const steward::LoadedConfig config = loader.load();
    QVERIFY(!config.builtIn);
    QCOMPARE(config.source, loader.defaultConfigPath());

    FakeCommandRunner runner;
    const auto descriptors = loader.buildDescriptors(config, runner);
    QCOMPARE(descriptors.size(), std::size_t(1));
    QCOMPARE(descriptors[0].id, std::string("jq"));
    QCOMPARE(descriptors[0].privilege, steward::Privilege::User);
    QCOMPARE(descriptors[0].handler->kind(), std::string("brew-package"));
}

void ConfigLoaderTests::testExplicitMissingFile()
{
    steward::ConfigLoader loader(context());
    bool thrown = false;
    try {
        loader.load((m_home + QStringLiteral("/nope.json")).toStdString());
    } catch (const steward::ConfigFileError &ex) {
        thrown = true;
        QVERIFY(std::string(ex.what()).find("no such file") != std::string::npos);
    }
    QVERIFY(thrown);
}

void ConfigLoaderTests::testEnvironmentOverride()
{
    const QString path = writeConfig(QStringLiteral("custom.json"),
                                     R"({"resources": []})");
    qputenv("STEWARD_CONFIG", path.toUtf8());

    steward::ConfigLoader loader(context());
    const steward::LoadedConfig config = loader.load();
    QVERIFY(!config.builtIn);
    QCOMPARE(config.source, path.toStdString());

    // An explicit path still wins over the environment.
    const QString other = writeConfig(QStringLiteral("other.json"),
                                      R"({"resources": [], "options": {"stopOnFailure": true}})");
    const steward::LoadedConfig explicitConfig = loader.load(other.toStdString());
    QCOMPARE(explicitConfig.source, other.toStdString());
    QVERIFY(explicitConfig.settings.stopOnFailure);
}

void ConfigLoaderTests::testInvalidJson()
{
    const QString path = writeConfig(QStringLiteral("broken.json"), "{\"resources\": [");
    steward::ConfigLoader loader(context());
    bool thrown = false;
    try {
        loader.load(path.toStdString());
    } catch (const steward::ConfigError &ex) {
        thrown = true;
        QVERIFY(std::string(ex.what()).find("invalid JSON") != std::string::npos);
    }
    QVERIFY(thrown);

    thrown = false;
    try {
        loader.fromDocument(json{{"resources", "none"}}, "inline");
    } catch (const steward::ConfigError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void ConfigLoaderTests::testUnknownResourceType()
{
    steward::ConfigLoader loader(context());
    const auto config = loader.fromDocument(
        json::parse(R"({"resources": [{"id": "x", "type": "teleporter", "desired": "on"}]})"),
        "inline");

    FakeCommandRunner runner;
    bool thrown = false;
    try {
        loader.buildDescriptors(config, runner);
    } catch (const steward::ConfigFileError &ex) {
        thrown = true;
        QVERIFY(std::string(ex.what()).find("resource 'x'") != std::string::npos);
    }
    QVERIFY(thrown);
}

void ConfigLoaderTests::testInvalidPrivilege()
{
    steward::ConfigLoader loader(context());
    const auto config = loader.fromDocument(
        json::parse(R"({"resources": [{"id": "x", "type": "pmset", "desired": "0",
                                        "privilege": "superuser",
                                        "params": {"setting": "sleep"}}]})"),
        "inline");

    FakeCommandRunner runner;
    bool thrown = false;
    try {
        loader.buildDescriptors(config, runner);
    } catch (const steward::ConfigError &ex) {
        thrown = true;
        QVERIFY(std::string(ex.what()).find("superuser") != std::string::npos);
    }
    QVERIFY(thrown);
}

void ConfigLoaderTests::testUserResourcesUseUserRunner()
{
    steward::ConfigLoader loader(context());
    const auto config = loader.fromDocument(
        json::parse(R"({"resources": [
            {"id": "jq", "type": "brew-package", "desired": "installed",
             "params": {"package": "jq"}},
            {"id": "sleep", "type": "pmset", "desired": "0", "privilege": "root",
             "params": {"setting": "sleep"}}
        ]})"),
        "inline");

    FakeCommandRunner runner;
    FakeCommandRunner userRunner;
    const auto descriptors = loader.buildDescriptors(config, runner, &userRunner);
    QCOMPARE(descriptors.size(), std::size_t(2));

    descriptors[0].handler->probe();
    descriptors[1].handler->probe();
    QCOMPARE(userRunner.calls(), std::vector<std::string>{"brew list --versions jq"});
    QCOMPARE(runner.calls(), std::vector<std::string>{"pmset -g"});
}

void ConfigLoaderTests::testVerifyPolicy()
{
    steward::ConfigLoader loader(context());
    const auto config = loader.fromDocument(
        json::parse(R"({"resources": [
            {"id": "daemon", "type": "launchd-job", "desired": "loaded", "privilege": "root",
             "dependsOn": ["tool"],
             "verify": {"attempts": 10, "delayMs": 500},
             "params": {"label": "com.example.daemon"}},
            {"id": "tool", "type": "executable", "desired": "present",
             "params": {"program": "tool"}}
        ]})"),
        "inline");

    FakeCommandRunner runner;
    const auto descriptors = loader.buildDescriptors(config, runner);
    QCOMPARE(descriptors.size(), std::size_t(2));
    QCOMPARE(descriptors[0].privilege, steward::Privilege::Root);
    QCOMPARE(descriptors[0].verify.attempts, 10);
    QCOMPARE(descriptors[0].verify.delay.count(), 500LL);
    QCOMPARE(descriptors[0].dependsOn, std::vector<std::string>{"tool"});
    QCOMPARE(descriptors[1].verify.attempts, 1);

    QCOMPARE(steward::orderResources(descriptors),
             (std::vector<std::string>{"tool", "daemon"}));
}

void ConfigLoaderTests::testInvalidVerifyPolicy()
{
    steward::ConfigLoader loader(context());
    const auto config = loader.fromDocument(
        json::parse(R"({"resources": [
            {"id": "x", "type": "pmset", "desired": "0", "verify": {"attempts": 0},
             "params": {"setting": "sleep"}}
        ]})"),
        "inline");

    FakeCommandRunner runner;
    bool thrown = false;
    try {
        loader.buildDescriptors(config, runner);
    } catch (const steward::ConfigFileError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void ConfigLoaderTests::testOptions()
{
    steward::ConfigLoader loader(context());
    const auto config = loader.fromDocument(
        json::parse(R"({"options": {"stopOnFailure": true, "commandTimeoutMs": 5000,
                                     "searchPaths": ["~/bin", "/opt/tools"]},
                        "resources": []})"),
        "inline");
    QVERIFY(config.settings.stopOnFailure);
    QCOMPARE(config.settings.commandTimeoutMs, 5000);
    QCOMPARE(config.settings.searchPaths,
             (std::vector<std::string>{m_home.toStdString() + "/bin", "/opt/tools"}));

    bool thrown = false;
    try {
        loader.fromDocument(json::parse(R"({"options": {"commandTimeoutMs": 0},
                                            "resources": []})"),
                            "inline");
    } catch (const steward::ConfigFileError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

QTEST_MAIN(ConfigLoaderTests)
#include "test_config_loader.moc"
