#pragma once

#include <QString>
#include <QStringList>

namespace sprout {

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QString standardOutput;
    QString standardError;

    bool ok() const { return started && !timedOut && exitCode == 0; }
};

// Runs `program` to completion, killing it after `timeoutMs`.
CommandResult runCommand(const QString &program,
                         const QStringList &arguments,
                         int timeoutMs);

QString findExecutable(const QString &program);

bool isDaemonRunning();
QString daemonSocketPath();

} // namespace sprout
