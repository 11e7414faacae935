#include "devdeck/command_runner.hpp"

#include <QProcess>

#include "devdeck/journal.hpp"

namespace devdeck {

QString describe(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "ok";
        case ErrorKind::ToolNotFound:
            return "tool not found";
        case ErrorKind::CommandFailed:
            return "command failed";
        case ErrorKind::Timeout:
            return "command timed out";
        case ErrorKind::Cancelled:
            return "command cancelled";
    }
    return "unknown error";
}

CommandResult CommandRunner::run(
    const QString& program,
    const QStringList& args,
    int timeoutMs) {
    ScopedDuration duration("commands.duration_ms");
    QProcess process;

    process.start(program, args);

    CommandResult result;
    if (!process.waitForStarted(timeoutMs < 0 ? 30000 : timeoutMs)) {
        result.error = ErrorKind::ToolNotFound;
        result.stderrText = QString("Failed to start %1: %2").arg(program, process.errorString());
        Journal::instance().incrementCounter("commands.start_failures");
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(500);
        result.error = ErrorKind::Timeout;
        result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
        result.stderrText = QString("%1 timed out after %2 ms.").arg(program).arg(timeoutMs);
        Journal::instance().incrementCounter("commands.timeouts");
        return result;
    }

    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
    result.stderrText = QString::fromUtf8(process.readAllStandardError());
    if (process.exitStatus() == QProcess::CrashExit) {
        result.error = ErrorKind::CommandFailed;
        if (result.stderrText.isEmpty()) {
            result.stderrText = QString("%1 crashed.").arg(program);
        }
    } else {
        result.exitCode = process.exitCode();
        if (result.exitCode != 0) {
            result.error = ErrorKind::CommandFailed;
        }
    }

    Journal::instance().incrementCounter("commands.count");
    if (result.error == ErrorKind::CommandFailed) {
        Journal::instance().incrementCounter("commands.non_zero_exit");
    }
    return result;
}

bool CommandRunner::isAvailable(const QString& program, int timeoutMs) {
    return run(program, {"--version"}, timeoutMs).success();
}

CommandResult ProcessCommandExecutor::run(const QString& program, const QStringList& args) {
    return CommandRunner::run(program, args, timeoutMs_);
}

}  // namespace devdeck
