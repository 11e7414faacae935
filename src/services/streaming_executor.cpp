#include "devdeck/streaming_executor.hpp"

#include <QByteArray>
#include <QElapsedTimer>
#include <QJsonObject>
#include <QThread>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <memory>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "devdeck/journal.hpp"

extern char** environ;

namespace {

QString decodeLine(QByteArray raw) {
    if (raw.endsWith('\r')) {
        raw.chop(1);
    }
    return QString::fromUtf8(raw);
}

void pumpLines(int fd, devdeck::LineChannel& channel) {
    QByteArray pending;
    char chunk[4096];
    for (;;) {
        const ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        pending.append(chunk, static_cast<int>(n));
        int newline = pending.indexOf('\n');
        while (newline >= 0) {
            channel.push(decodeLine(pending.left(newline)));
            pending.remove(0, newline + 1);
            newline = pending.indexOf('\n');
        }
    }
    if (!pending.isEmpty()) {
        channel.push(decodeLine(pending));
    }
    ::close(fd);
    channel.producerDone();
}

void closePipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

int waitForExit(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return status;
}

}  // namespace

namespace devdeck {

bool StreamingExecutor::isErrorLine(const QString& line) {
    return line.contains(QLatin1String("FAILED")) || line.contains(QLatin1String("error"));
}

StreamingResult StreamingExecutor::run(
    const QString& program,
    const QStringList& args,
    const LineHandler& onLine,
    const CancellationToken* token,
    int timeoutMs) {
    StreamingResult result;
    QElapsedTimer elapsed;
    elapsed.start();

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0) {
        const int pipeErrno = errno;
        closePipe(outPipe);
        closePipe(errPipe);
        result.error = ErrorKind::CommandFailed;
        result.aggregatedError = QString("Failed to create pipes for %1: %2")
                                     .arg(program, QString::fromLocal8Bit(::strerror(pipeErrno)));
        Journal::instance().incrementCounter("streams.start_failures");
        return result;
    }

    std::vector<QByteArray> argStorage;
    argStorage.reserve(static_cast<size_t>(args.size()) + 1);
    argStorage.push_back(program.toLocal8Bit());
    for (const QString& arg : args) {
        argStorage.push_back(arg.toLocal8Bit());
    }
    std::vector<char*> argv;
    argv.reserve(argStorage.size() + 1);
    for (QByteArray& arg : argStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, outPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errPipe[1], STDERR_FILENO);

    // Own process group so a kill reaches helpers that inherited the pipes.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    pid_t pid = -1;
    const int spawnRc = ::posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    outPipe[1] = -1;
    errPipe[1] = -1;

    if (spawnRc != 0) {
        closePipe(outPipe);
        closePipe(errPipe);
        result.error = ErrorKind::ToolNotFound;
        result.aggregatedError =
            QString("Failed to start %1: %2").arg(program, QString::fromLocal8Bit(::strerror(spawnRc)));
        Journal::instance().incrementCounter("streams.start_failures");
        Journal::instance().recordEvent("stream_failed", {{"program", program}});
        return result;
    }

    Journal::instance().recordEvent(
        "stream_started",
        {
            {"program", program},
            {"args", args.join(' ')},
            {"pid", static_cast<double>(pid)},
        });

    LineChannel channel(2);
    const int stdoutFd = outPipe[0];
    const int stderrFd = errPipe[0];
    std::unique_ptr<QThread> stdoutReader(
        QThread::create([stdoutFd, &channel]() { pumpLines(stdoutFd, channel); }));
    std::unique_ptr<QThread> stderrReader(
        QThread::create([stderrFd, &channel]() { pumpLines(stderrFd, channel); }));
    stdoutReader->start();
    stderrReader->start();

    QStringList outputLines;
    QStringList errorLines;
    bool killed = false;
    for (;;) {
        if (!killed) {
            const bool cancelled = token != nullptr && token->isCancelled();
            const bool expired = timeoutMs >= 0 && elapsed.elapsed() > timeoutMs;
            if (cancelled || expired) {
                ::kill(-pid, SIGKILL);
                killed = true;
                result.error = cancelled ? ErrorKind::Cancelled : ErrorKind::Timeout;
            }
        }

        QString line;
        const LineChannel::PopStatus status = channel.pop(line, kPollIntervalMs);
        if (status == LineChannel::PopStatus::Closed) {
            break;
        }
        if (status == LineChannel::PopStatus::Timeout) {
            continue;
        }

        result.lineCount++;
        if (onLine) {
            onLine(line);
        }
        if (isErrorLine(line)) {
            errorLines.append(line);
        } else {
            outputLines.append(line);
        }
    }

    stdoutReader->wait();
    stderrReader->wait();

    const int status = waitForExit(pid);
    if (status >= 0 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    if (!killed) {
        result.success = result.exitCode == 0;
        if (!result.success) {
            result.error = ErrorKind::CommandFailed;
        }
    }

    result.aggregatedOutput = outputLines.join('\n');
    if (!errorLines.isEmpty()) {
        result.aggregatedError = errorLines.join('\n');
    }

    Journal::instance().incrementCounter("streams.count");
    Journal::instance().recordDurationMs("streams.duration_ms", elapsed.elapsed());
    Journal::instance().recordEvent(
        "stream_finished",
        {
            {"program", program},
            {"exit_code", result.exitCode},
            {"line_count", result.lineCount},
            {"outcome", describe(result.error)},
        });
    return result;
}

}  // namespace devdeck
