#pragma once

#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

#include "devdeck/command_runner.hpp"
#include "devdeck/line_channel.hpp"

namespace devdeck {

struct StreamingResult {
    bool success = false;
    QString aggregatedOutput;
    std::optional<QString> aggregatedError;
    int exitCode = -1;
    ErrorKind error = ErrorKind::None;
    int lineCount = 0;
};

// Runs a long-lived tool with stdout and stderr drained by two reader threads.
// Every line is handed to onLine on the calling thread, in channel order.
class StreamingExecutor {
public:
    using LineHandler = std::function<void(const QString&)>;

    static StreamingResult run(
        const QString& program,
        const QStringList& args,
        const LineHandler& onLine,
        const CancellationToken* token = nullptr,
        int timeoutMs = -1);

    // Lines mentioning FAILED or error go to the error aggregate.
    static bool isErrorLine(const QString& line);

private:
    static constexpr int kPollIntervalMs = 50;
};

}  // namespace devdeck
