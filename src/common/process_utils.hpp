#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

class QProcess;

namespace tether {

constexpr int kDefaultTerminateGraceMs = 2000;

struct ProcessCommand {
    QString program;
    QStringList arguments;
};

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QByteArray standardOutput;
    QString standardError;

    bool succeeded() const
    {
        return started && !timedOut && exitCode == 0;
    }
};

// Run a command to completion, capturing both output channels. A command that
// does not finish within timeoutMs is terminated and reported as timed out.
CommandResult runCommand(const ProcessCommand &command, int timeoutMs);

// Graceful terminate, then a forced kill if the process is still alive after
// graceMs. Safe to call on a process that never started or already exited.
void terminateProcess(QProcess &process, int graceMs = kDefaultTerminateGraceMs);

QString findExecutable(const QString &name);

} // namespace tether
