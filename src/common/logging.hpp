#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace sprout::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    // Empty means $HOME/.local/share/sprout/logs.
    QString directory;
    LogLevel minimumLevel = LogLevel::Info;
    bool echoToStderr = false;
    bool traceEnabled = false;
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);
void initLogging(const QString &processName, const LogOptions &options);

bool isTraceEnabled();
QString logsDirPath();
std::optional<LogLevel> parseLogLevel(const QString &value);

// Thread-local correlation support for linking related log events.
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

} // namespace sprout::logging

#define SLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::sprout::logging::logEvent(::sprout::logging::LogLevel::Debug, \
                                ::sprout::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::sprout::logging::logEvent(::sprout::logging::LogLevel::Info, \
                                ::sprout::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::sprout::logging::logEvent(::sprout::logging::LogLevel::Warn, \
                                ::sprout::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::sprout::logging::logEvent(::sprout::logging::LogLevel::Error, \
                                ::sprout::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
