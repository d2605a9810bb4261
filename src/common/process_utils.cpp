#include "common/process_utils.hpp"

#include <QProcess>
#include <QStandardPaths>

#include "common/logging.hpp"

namespace tether {

CommandResult runCommand(const ProcessCommand &command, int timeoutMs)
{
    CommandResult result;

    QProcess process;
    process.start(command.program, command.arguments);
    if (!process.waitForStarted(timeoutMs)) {
        result.standardError = process.errorString();
        TLOG_DEBUG(QStringLiteral("ProcessUtils"),
                   QStringLiteral("runCommand"),
                   QStringLiteral("command_start_failed"),
                   QStringLiteral("spawn_error"),
                   QStringLiteral("qprocess"),
                   tether::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"program", command.program.toStdString()},
                                   {"error", result.standardError.toStdString()}}));
        return result;
    }
    result.started = true;
    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        result.timedOut = true;
        result.standardError = QStringLiteral("timeout after %1ms").arg(timeoutMs);
        terminateProcess(process);
        return result;
    }

    result.standardOutput = process.readAllStandardOutput();
    const QString stderrText = QString::fromUtf8(process.readAllStandardError());
    result.standardError = stderrText;
    if (process.exitStatus() == QProcess::NormalExit) {
        result.exitCode = process.exitCode();
    }
    return result;
}

void terminateProcess(QProcess &process, int graceMs)
{
    if (process.state() == QProcess::NotRunning) {
        return;
    }

    process.terminate();
    if (process.waitForFinished(graceMs)) {
        return;
    }

    TLOG_DEBUG(QStringLiteral("ProcessUtils"),
               QStringLiteral("terminateProcess"),
               QStringLiteral("process_kill"),
               QStringLiteral("terminate_grace_expired"),
               QStringLiteral("sigkill"),
               tether::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"program", process.program().toStdString()},
                               {"graceMs", graceMs}}));
    process.kill();
    process.waitForFinished(graceMs);
}

QString findExecutable(const QString &name)
{
    return QStandardPaths::findExecutable(name);
}

} // namespace tether
