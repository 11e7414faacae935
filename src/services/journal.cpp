#include "devdeck/journal.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>

namespace devdeck {

Journal& Journal::instance() {
    static Journal journal;
    return journal;
}

void Journal::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    counters_[key] += delta;
}

void Journal::setGauge(const QString& key, double value) {
    QMutexLocker lock(&mutex_);
    gauges_.insert(key, value);
}

void Journal::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    DurationStats& stats = durations_[key];
    stats.minMs = stats.count == 0 ? durationMs : qMin(stats.minMs, durationMs);
    stats.maxMs = qMax(stats.maxMs, durationMs);
    stats.totalMs += durationMs;
    stats.count++;
}

void Journal::recordEvent(const QString& type, const QJsonObject& payload) {
    QMutexLocker lock(&mutex_);
    Event event;
    event.sequence = nextSequence_++;
    event.epochMs = QDateTime::currentMSecsSinceEpoch();
    event.type = type;
    event.payload = payload;
    events_.enqueue(event);
    while (events_.size() > maxEvents_) {
        events_.dequeue();
        droppedEvents_++;
    }
}

void Journal::setMaxEvents(int maxEvents) {
    QMutexLocker lock(&mutex_);
    maxEvents_ = qMax(1, maxEvents);
    while (events_.size() > maxEvents_) {
        events_.dequeue();
        droppedEvents_++;
    }
}

void Journal::reset() {
    QMutexLocker lock(&mutex_);
    counters_.clear();
    gauges_.clear();
    durations_.clear();
    events_.clear();
    nextSequence_ = 1;
    droppedEvents_ = 0;
}

qint64 Journal::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return counters_.value(key, 0);
}

QJsonObject Journal::eventToJson(const Event& event) {
    QJsonObject row = event.payload;
    row.insert("type", event.type);
    row.insert("seq", static_cast<double>(event.sequence));
    row.insert("epoch_ms", static_cast<double>(event.epochMs));
    row.insert(
        "timestamp_utc",
        QDateTime::fromMSecsSinceEpoch(event.epochMs, Qt::UTC).toString(Qt::ISODateWithMs));
    return row;
}

QJsonArray Journal::eventsLocked() const {
    QJsonArray out;
    for (const Event& event : events_) {
        out.append(eventToJson(event));
    }
    return out;
}

QJsonArray Journal::events() const {
    QMutexLocker lock(&mutex_);
    return eventsLocked();
}

QJsonObject Journal::snapshot() const {
    QMutexLocker lock(&mutex_);

    QJsonObject counters;
    for (auto it = counters_.constBegin(); it != counters_.constEnd(); ++it) {
        counters.insert(it.key(), static_cast<double>(it.value()));
    }
    QJsonObject gauges;
    for (auto it = gauges_.constBegin(); it != gauges_.constEnd(); ++it) {
        gauges.insert(it.key(), it.value());
    }
    QJsonObject durations;
    for (auto it = durations_.constBegin(); it != durations_.constEnd(); ++it) {
        const DurationStats& stats = it.value();
        durations.insert(
            it.key(),
            QJsonObject{
                {"count", static_cast<double>(stats.count)},
                {"total_ms", static_cast<double>(stats.totalMs)},
                {"min_ms", static_cast<double>(stats.minMs)},
                {"max_ms", static_cast<double>(stats.maxMs)},
                {"avg_ms", stats.count > 0 ? static_cast<double>(stats.totalMs) / stats.count : 0.0},
            });
    }

    QJsonObject out;
    out.insert("counters", counters);
    out.insert("gauges", gauges);
    out.insert("durations", durations);
    out.insert("events", eventsLocked());
    out.insert("dropped_events", static_cast<double>(droppedEvents_));
    out.insert("captured_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    return out;
}

QJsonObject Journal::exportToFile(const QString& filePath) const {
    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        return {
            {"success", false},
            {"error", "Cannot create the journal directory."},
            {"path", filePath},
        };
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"error", QString("Cannot write journal: %1").arg(file.errorString())},
            {"path", filePath},
        };
    }
    const QByteArray body = QJsonDocument(snapshot()).toJson(QJsonDocument::Indented);
    if (file.write(body) != body.size()) {
        return {
            {"success", false},
            {"error", QString("Short write to journal: %1").arg(file.errorString())},
            {"path", filePath},
        };
    }
    return {
        {"success", true},
        {"path", filePath},
        {"bytes", static_cast<double>(body.size())},
    };
}

}  // namespace devdeck
