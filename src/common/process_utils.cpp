#include "common/process_utils.hpp"

#include <QFileInfo>
#include <QLocalSocket>
#include <QProcess>
#include <QStandardPaths>

#include <unistd.h>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace sprout {

CommandResult runCommand(const QString &program,
                         const QStringList &arguments,
                         int timeoutMs)
{
    CommandResult result;
    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        SLOG_WARN(QStringLiteral("ProcessUtils"),
                  QStringLiteral("runCommand"),
                  QStringLiteral("command_start_failed"),
                  QStringLiteral("external_command"),
                  QStringLiteral("qprocess"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"program", program.toStdString()},
                                 {"error", process.errorString().toStdString()}});
        return result;
    }
    result.started = true;

    process.closeWriteChannel();
    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        result.timedOut = true;
        SLOG_WARN(QStringLiteral("ProcessUtils"),
                  QStringLiteral("runCommand"),
                  QStringLiteral("command_timeout"),
                  QStringLiteral("external_command"),
                  QStringLiteral("kill"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"program", program.toStdString()},
                                 {"timeoutMs", timeoutMs}});
        return result;
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit
        ? process.exitCode()
        : -1;
    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    result.standardError = QString::fromUtf8(process.readAllStandardError());
    return result;
}

QString findExecutable(const QString &program)
{
    if (program.contains(QLatin1Char('/'))) {
        QFileInfo info(program);
        return info.exists() && info.isExecutable() ? info.absoluteFilePath() : QString();
    }
    return QStandardPaths::findExecutable(program);
}

QString daemonSocketPath()
{
    const QString overrideName = qEnvironmentVariable("SPROUT_SOCKET_NAME");
    if (!overrideName.isEmpty()) {
        return overrideName;
    }
    const QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir + QStringLiteral("/sprout.sock");
    }
    return QStringLiteral("/run/user/%1/sprout.sock").arg(getuid());
}

bool isDaemonRunning()
{
    QLocalSocket socket;
    socket.connectToServer(daemonSocketPath());
    if (socket.waitForConnected(200)) {
        socket.disconnectFromServer();
        return true;
    }
    return false;
}

} // namespace sprout
