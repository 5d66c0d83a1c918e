#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace steward::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Overrides $HOME/.local/share/steward/logs. Empty restores the default.
// STEWARD_LOG_DIR takes the same role from the environment.
void setLogDirectory(const QString &path);
QString logDirectory();

// Thread-local correlation support for linking the events of one run.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace steward::logging

#define SLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::steward::logging::logEvent(::steward::logging::LogLevel::Debug, \
                                 ::steward::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::steward::logging::logEvent(::steward::logging::LogLevel::Info, \
                                 ::steward::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::steward::logging::logEvent(::steward::logging::LogLevel::Warn, \
                                 ::steward::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::steward::logging::logEvent(::steward::logging::LogLevel::Error, \
                                 ::steward::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
