#pragma once

#include <QJsonObject>
#include <QMap>
#include <QQueue>
#include <QString>
#include <QVector>

namespace devdeck {

enum class MetricId {
    CpuLoad,
    MemoryUsage,
    BatteryLevel,
    BatteryTemperature,
    ThermalTemperature,
};

QString metricName(MetricId metric);
const QVector<MetricId>& allMetrics();

struct Sample {
    double timestamp = 0.0;  // seconds since the sampling session started
    double value = 0.0;
};

// Bounded FIFO history for one metric. size() never exceeds capacity().
class MetricSeries {
public:
    explicit MetricSeries(int capacity = 1000);

    void push(const Sample& sample);
    void setCapacity(int capacity);
    void clear();

    [[nodiscard]] int size() const { return samples_.size(); }
    [[nodiscard]] int capacity() const { return capacity_; }
    [[nodiscard]] bool isEmpty() const { return samples_.isEmpty(); }
    [[nodiscard]] QVector<Sample> samples() const;

private:
    void evictExcess();

    QQueue<Sample> samples_;
    int capacity_;
};

class RingBufferStore {
public:
    explicit RingBufferStore(int defaultCapacity = 1000);

    void push(MetricId metric, const Sample& sample);
    void setCapacity(MetricId metric, int capacity);
    void setCapacityAll(int capacity);
    void clear(MetricId metric);
    void clearAll();

    [[nodiscard]] QVector<Sample> read(MetricId metric) const;
    [[nodiscard]] int size(MetricId metric) const;
    [[nodiscard]] int capacity(MetricId metric) const;
    [[nodiscard]] int defaultCapacity() const { return defaultCapacity_; }
    [[nodiscard]] QJsonObject toJson() const;

private:
    QMap<MetricId, MetricSeries> series_;
    int defaultCapacity_;
};

}  // namespace devdeck
