#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace sprout::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
QString g_processName;
LogOptions g_options;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

int levelRank(LogLevel level)
{
    return static_cast<int>(level);
}

QString logFilePath(const QString &dir, const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("sprout")
        : processName;
    return dir + QDir::separator() + base + suffix;
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString &dir, const QString &path, const QString &line)
{
    QDir().mkpath(dir);
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LogOptions options;
    options.traceEnabled = traceEnabled;
    initLogging(processName, options);
}

void initLogging(const QString &processName, const LogOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_options = options;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_options.traceEnabled;
}

QString logsDirPath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (!g_options.directory.isEmpty()) {
        return g_options.directory;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/sprout/logs");
    }
    return home + QStringLiteral("/.local/share/sprout/logs");
}

std::optional<LogLevel> parseLogLevel(const QString &value)
{
    const QString upper = value.trimmed().toUpper();
    if (upper == QStringLiteral("DEBUG")) {
        return LogLevel::Debug;
    }
    if (upper == QStringLiteral("INFO")) {
        return LogLevel::Info;
    }
    if (upper == QStringLiteral("WARN") || upper == QStringLiteral("WARNING")) {
        return LogLevel::Warn;
    }
    if (upper == QStringLiteral("ERROR")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_processName.isEmpty()) {
            return g_processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("sprout");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    const QString line = QString::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString dir = logsDirPath();
    const QString mainPath = logFilePath(dir, process, QStringLiteral(".log"));
    const QString tracePath = logFilePath(dir, process, QStringLiteral("-trace.log"));

    std::lock_guard<std::mutex> lock(g_logMutex);
    const bool aboveMinimum = levelRank(level) >= levelRank(g_options.minimumLevel);
    if (aboveMinimum || g_options.traceEnabled) {
        writeLine(dir, mainPath, line);
        if (g_options.echoToStderr) {
            fprintf(stderr, "%s\n", line.toUtf8().constData());
        }
    }

    if (g_options.traceEnabled) {
        writeLine(dir, tracePath, line);
    }
}

} // namespace sprout::logging
