#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace pagewatch::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize diagnostic logging for the current process. Call early in main(),
// before the configuration is known; configure() refines it afterwards.
void initLogging(const QString &processName, bool traceEnabled);

// Applies the resolved configuration: log directory and minimum level.
// An empty directory keeps $HOME/.local/share/pagewatch/logs. Tracing
// always writes Debug lines regardless of the minimum level.
void configure(const QString &logsDir, LogLevel minimumLevel);

bool isTraceEnabled();
LogLevel minimumLevel();

// Directory holding the per-process diagnostic log files.
QString logsDirPath();

// "debug", "info", "warn"/"warning", "error"; case-insensitive.
std::optional<LogLevel> parseLogLevel(const QString &value);
QString levelName(LogLevel level);

// Thread-local correlation support: every line of one check cycle carries
// the cycle id, including lines written from pool workers.
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
// "host:<name>,uid:<uid>", computed once per process.
QString defaultWho();

} // namespace pagewatch::logging

#define PWLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::pagewatch::logging::logEvent(::pagewatch::logging::LogLevel::Debug, \
                                   ::pagewatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PWLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::pagewatch::logging::logEvent(::pagewatch::logging::LogLevel::Info, \
                                   ::pagewatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PWLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::pagewatch::logging::logEvent(::pagewatch::logging::LogLevel::Warn, \
                                   ::pagewatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define PWLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::pagewatch::logging::logEvent(::pagewatch::logging::LogLevel::Error, \
                                   ::pagewatch::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
