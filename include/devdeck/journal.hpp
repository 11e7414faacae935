#pragma once

#include <QElapsedTimer>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QQueue>
#include <QString>

#include <utility>

namespace devdeck {

// Process-wide activity journal: counters, gauges, durations and a bounded event log.
// Safe to call from reader and worker threads.
class Journal final {
public:
    static Journal& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void setGauge(const QString& key, double value);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});
    void setMaxEvents(int maxEvents);
    void reset();

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] QJsonArray events() const;
    [[nodiscard]] QJsonObject snapshot() const;
    QJsonObject exportToFile(const QString& filePath) const;

private:
    struct DurationStats {
        qint64 count = 0;
        qint64 totalMs = 0;
        qint64 minMs = 0;
        qint64 maxMs = 0;
    };

    struct Event {
        quint64 sequence = 0;
        qint64 epochMs = 0;
        QString type;
        QJsonObject payload;
    };

    Journal() = default;

    static QJsonObject eventToJson(const Event& event);
    QJsonArray eventsLocked() const;

    mutable QMutex mutex_;
    QHash<QString, qint64> counters_;
    QHash<QString, double> gauges_;
    QHash<QString, DurationStats> durations_;
    QQueue<Event> events_;
    quint64 nextSequence_ = 1;
    qint64 droppedEvents_ = 0;

    int maxEvents_ = 1500;
};

// Records the lifetime of the enclosing scope under one duration key.
class ScopedDuration final {
public:
    explicit ScopedDuration(QString key) : key_(std::move(key)) { timer_.start(); }
    ~ScopedDuration() { Journal::instance().recordDurationMs(key_, timer_.elapsed()); }

    ScopedDuration(const ScopedDuration&) = delete;
    ScopedDuration& operator=(const ScopedDuration&) = delete;

    [[nodiscard]] qint64 elapsedMs() const { return timer_.elapsed(); }

private:
    QString key_;
    QElapsedTimer timer_;
};

}  // namespace devdeck
