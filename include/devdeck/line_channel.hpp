#pragma once

#include <QAtomicInt>
#include <QMutex>
#include <QQueue>
#include <QString>
#include <QWaitCondition>

namespace devdeck {

class CancellationToken {
public:
    void cancel() { cancelled_.storeRelease(1); }
    void reset() { cancelled_.storeRelease(0); }
    [[nodiscard]] bool isCancelled() const { return cancelled_.loadAcquire() != 0; }

private:
    QAtomicInt cancelled_{0};
};

// Multi-producer, single-consumer line hand-off. Closes once every producer
// has called producerDone() and the queue is empty.
class LineChannel {
public:
    enum class PopStatus {
        Line,
        Timeout,
        Closed,
    };

    explicit LineChannel(int producers);

    void push(const QString& line);
    void producerDone();
    PopStatus pop(QString& line, int timeoutMs);

    [[nodiscard]] int pending() const;

private:
    mutable QMutex mutex_;
    QWaitCondition ready_;
    QQueue<QString> lines_;
    int producers_;
};

}  // namespace devdeck
