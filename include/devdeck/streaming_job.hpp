#pragma once

#include <QMutex>
#include <QObject>
#include <QQueue>
#include <QString>
#include <QStringList>
#include <QThread>

#include <memory>

#include "devdeck/line_channel.hpp"
#include "devdeck/streaming_executor.hpp"

namespace devdeck {

// Lines produced off-thread, consumed by the event-loop thread once per tick.
class LineEventQueue {
public:
    void push(const QString& line);
    QStringList drainAll();
    [[nodiscard]] int size() const;

private:
    mutable QMutex mutex_;
    QQueue<QString> lines_;
};

// Background streaming run (logcat, flash progress). The worker thread only
// touches the queue; all state visible to callers changes on the owner thread.
class StreamingJob final : public QObject {
    Q_OBJECT

public:
    explicit StreamingJob(QObject* parent = nullptr);
    ~StreamingJob() override;

    bool start(const QString& program, const QStringList& args, int timeoutMs = -1);
    void stop();
    bool waitForFinished(int timeoutMs = -1);
    QStringList drain();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] const StreamingResult& lastResult() const { return lastResult_; }
    [[nodiscard]] QString program() const { return program_; }

signals:
    void finished(const devdeck::StreamingResult& result);

private:
    void onWorkerFinished();

    LineEventQueue queue_;
    CancellationToken token_;
    std::unique_ptr<QThread> worker_;
    QMutex resultMutex_;
    StreamingResult pendingResult_;
    StreamingResult lastResult_;
    QString program_;
    bool running_ = false;
};

}  // namespace devdeck
