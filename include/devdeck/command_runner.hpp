#pragma once

#include <QString>
#include <QStringList>

namespace devdeck {

enum class ErrorKind {
    None,
    ToolNotFound,
    CommandFailed,
    Timeout,
    Cancelled,
};

QString describe(ErrorKind kind);

struct CommandResult {
    int exitCode = -1;
    QString stdoutText;
    QString stderrText;
    ErrorKind error = ErrorKind::None;

    [[nodiscard]] bool success() const { return error == ErrorKind::None && exitCode == 0; }
};

class CommandRunner {
public:
    // timeoutMs < 0 waits for the process without a deadline.
    static CommandResult run(
        const QString& program,
        const QStringList& args = {},
        int timeoutMs = 10000);

    static bool isAvailable(const QString& program, int timeoutMs = 3000);
};

// Seam between the device-facing services and the process boundary.
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    virtual CommandResult run(const QString& program, const QStringList& args) = 0;
};

class ProcessCommandExecutor final : public CommandExecutor {
public:
    explicit ProcessCommandExecutor(int timeoutMs = 10000) : timeoutMs_(timeoutMs) {}

    CommandResult run(const QString& program, const QStringList& args) override;

    [[nodiscard]] int timeoutMs() const { return timeoutMs_; }
    void setTimeoutMs(int timeoutMs) { timeoutMs_ = timeoutMs; }

private:
    int timeoutMs_;
};

}  // namespace devdeck
