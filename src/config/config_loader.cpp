#include "config/config_loader.hpp"

#include <chrono>
#include <cstddef>
#include <utility>

#include <QFile>
#include <QFileInfo>
#include <QString>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/privilege.hpp"
#include "config/default_profile.hpp"
#include "resources/resource_factory.hpp"

namespace steward {

namespace {

nlohmann::json readDocument(const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigFileError(path, "cannot open: " + file.errorString().toStdString());
    }
    const QByteArray bytes = file.readAll();
    try {
        return nlohmann::json::parse(bytes.constData(), bytes.constData() + bytes.size());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigFileError(path, std::string("invalid JSON: ") + ex.what());
    }
}

std::vector<std::string> stringList(const nlohmann::json &value,
                                    const std::string &source,
                                    const std::string &what)
{
    if (!value.is_array()) {
        throw ConfigFileError(source, what + " must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto &entry : value) {
        if (!entry.is_string()) {
            throw ConfigFileError(source, what + " must be an array of strings");
        }
        out.push_back(entry.get<std::string>());
    }
    return out;
}

VerificationPolicy parseVerify(const nlohmann::json &value,
                               const std::string &source,
                               const std::string &id)
{
    VerificationPolicy policy;
    if (value.is_null()) {
        return policy;
    }
    if (!value.is_object()) {
        throw ConfigFileError(source, "resource '" + id + "': verify must be an object");
    }
    const int attempts = value.value("attempts", 1);
    const int delayMs = value.value("delayMs", 0);
    if (attempts < 1 || delayMs < 0) {
        throw ConfigFileError(source, "resource '" + id
                              + "': verify needs attempts >= 1 and delayMs >= 0");
    }
    policy.attempts = attempts;
    policy.delay = std::chrono::milliseconds(delayMs);
    return policy;
}

ResourceDescriptor parseResource(const nlohmann::json &entry,
                                 const std::string &source,
                                 std::size_t position,
                                 const HandlerContext &context)
{
    if (!entry.is_object()) {
        throw ConfigFileError(source, "resources[" + std::to_string(position)
                              + "] must be an object");
    }

    ResourceDescriptor descriptor;
    const auto id = entry.find("id");
    if (id == entry.end() || !id->is_string() || id->get<std::string>().empty()) {
        throw ConfigFileError(source, "resources[" + std::to_string(position)
                              + "] needs a non-empty string id");
    }
    descriptor.id = id->get<std::string>();

    const auto type = entry.find("type");
    if (type == entry.end() || !type->is_string()) {
        throw ConfigFileError(source, "resource '" + descriptor.id + "' needs a type");
    }

    const auto desired = entry.find("desired");
    if (desired == entry.end() || desired->is_null()) {
        throw ConfigFileError(source, "resource '" + descriptor.id + "' needs a desired state");
    }
    descriptor.desired = *desired;
    descriptor.description = entry.value("description", std::string());

    const std::string privilege = entry.value("privilege", std::string("user"));
    bool ok = false;
    descriptor.privilege = parsePrivilegeString(privilege, &ok);
    if (!ok) {
        throw ConfigFileError(source, "resource '" + descriptor.id
                              + "' has invalid privilege '" + privilege + "'");
    }

    const auto dependsOn = entry.find("dependsOn");
    if (dependsOn != entry.end()) {
        descriptor.dependsOn = stringList(*dependsOn, source,
                                          "dependsOn of '" + descriptor.id + "'");
    }
    descriptor.verify = parseVerify(entry.value("verify", nlohmann::json()), source,
                                    descriptor.id);

    HandlerContext resourceContext = context;
    if (descriptor.privilege == Privilege::User && context.userRunner) {
        resourceContext.runner = context.userRunner;
    }

    try {
        descriptor.handler = createHandler(type->get<std::string>(),
                                           entry.value("params", nlohmann::json()),
                                           resourceContext);
    } catch (const ConfigError &ex) {
        throw ConfigFileError(source, "resource '" + descriptor.id + "': " + ex.what());
    }
    return descriptor;
}

} // namespace

ConfigLoader::ConfigLoader(PrivilegeContext privilege)
    : m_privilege(std::move(privilege))
{
}

std::string ConfigLoader::defaultConfigPath() const
{
    return m_privilege.home + "/.config/steward/steward.json";
}

LoadedConfig ConfigLoader::load(const std::string &explicitPath) const
{
    std::string path = explicitPath;
    if (path.empty()) {
        path = qEnvironmentVariable("STEWARD_CONFIG").toStdString();
    }

    if (!path.empty()) {
        path = expandHome(path, m_privilege);
        if (!QFileInfo::exists(QString::fromStdString(path))) {
            throw ConfigFileError(path, "no such file");
        }
        return fromDocument(readDocument(path), path);
    }

    const std::string fallback = defaultConfigPath();
    if (!m_privilege.home.empty() && QFileInfo::exists(QString::fromStdString(fallback))) {
        return fromDocument(readDocument(fallback), fallback);
    }

    SLOG_INFO(QStringLiteral("ConfigLoader"),
              QStringLiteral("load"),
              QStringLiteral("builtin_profile_selected"),
              QStringLiteral("no_config_file"),
              QStringLiteral("default_profile"),
              steward::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"profile", kDefaultProfileName}, {"lookedAt", fallback}}));
    LoadedConfig config = fromDocument(defaultProfile(), kDefaultProfileName);
    config.builtIn = true;
    return config;
}

LoadedConfig ConfigLoader::fromDocument(nlohmann::json document,
                                        const std::string &source) const
{
    if (!document.is_object()) {
        throw ConfigFileError(source, "top level must be an object");
    }
    const auto resources = document.find("resources");
    if (resources == document.end() || !resources->is_array()) {
        throw ConfigFileError(source, "'resources' must be an array");
    }

    LoadedConfig config;
    config.source = source;

    const nlohmann::json options = document.value("options", nlohmann::json::object());
    if (!options.is_object()) {
        throw ConfigFileError(source, "'options' must be an object");
    }
    try {
        config.settings.stopOnFailure = options.value("stopOnFailure", false);
        config.settings.commandTimeoutMs = options.value("commandTimeoutMs", 120000);
    } catch (const nlohmann::json::exception &ex) {
        throw ConfigFileError(source, std::string("invalid options: ") + ex.what());
    }
    if (config.settings.commandTimeoutMs <= 0) {
        throw ConfigFileError(source, "commandTimeoutMs must be positive");
    }
    const auto searchPaths = options.find("searchPaths");
    if (searchPaths != options.end()) {
        for (const auto &path : stringList(*searchPaths, source, "searchPaths")) {
            config.settings.searchPaths.push_back(expandHome(path, m_privilege));
        }
    }

    config.document = std::move(document);
    return config;
}

std::vector<ResourceDescriptor> ConfigLoader::buildDescriptors(const LoadedConfig &config,
                                                               CommandRunner &runner,
                                                               CommandRunner *userRunner) const
{
    HandlerContext context;
    context.runner = &runner;
    context.userRunner = userRunner;
    context.privilege = m_privilege;
    context.searchPaths = config.settings.searchPaths;

    std::vector<ResourceDescriptor> descriptors;
    const nlohmann::json &resources = config.document.at("resources");
    for (std::size_t i = 0; i < resources.size(); ++i) {
        try {
            descriptors.push_back(parseResource(resources[i], config.source, i, context));
        } catch (const nlohmann::json::exception &ex) {
            throw ConfigFileError(config.source, "resources[" + std::to_string(i)
                                  + "]: " + ex.what());
        }
    }

    SLOG_DEBUG(QStringLiteral("ConfigLoader"),
               QStringLiteral("buildDescriptors"),
               QStringLiteral("descriptors_built"),
               QStringLiteral("config_load"),
               QStringLiteral("resource_factory"),
               steward::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"source", config.source}, {"count", descriptors.size()}}));
    return descriptors;
}

} // namespace steward
