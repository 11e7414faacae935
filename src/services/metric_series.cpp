#include "devdeck/metric_series.hpp"

#include <QJsonArray>

namespace devdeck {

QString metricName(MetricId metric) {
    switch (metric) {
        case MetricId::CpuLoad:
            return "cpu_load";
        case MetricId::MemoryUsage:
            return "memory_usage_percent";
        case MetricId::BatteryLevel:
            return "battery_level_percent";
        case MetricId::BatteryTemperature:
            return "battery_temperature_c";
        case MetricId::ThermalTemperature:
            return "thermal_zone_c";
    }
    return "unknown";
}

const QVector<MetricId>& allMetrics() {
    static const QVector<MetricId> metrics = {
        MetricId::CpuLoad,
        MetricId::MemoryUsage,
        MetricId::BatteryLevel,
        MetricId::BatteryTemperature,
        MetricId::ThermalTemperature,
    };
    return metrics;
}

MetricSeries::MetricSeries(int capacity)
    : capacity_(qMax(1, capacity)) {}

void MetricSeries::evictExcess() {
    while (samples_.size() > capacity_) {
        samples_.dequeue();
    }
}

void MetricSeries::push(const Sample& sample) {
    samples_.enqueue(sample);
    evictExcess();
}

void MetricSeries::setCapacity(int capacity) {
    capacity_ = qMax(1, capacity);
    evictExcess();
}

void MetricSeries::clear() {
    samples_.clear();
}

QVector<Sample> MetricSeries::samples() const {
    QVector<Sample> out;
    out.reserve(samples_.size());
    for (const Sample& sample : samples_) {
        out.append(sample);
    }
    return out;
}

RingBufferStore::RingBufferStore(int defaultCapacity)
    : defaultCapacity_(qMax(1, defaultCapacity)) {
    for (const MetricId metric : allMetrics()) {
        series_.insert(metric, MetricSeries(defaultCapacity_));
    }
}

void RingBufferStore::push(MetricId metric, const Sample& sample) {
    series_[metric].push(sample);
}

void RingBufferStore::setCapacity(MetricId metric, int capacity) {
    series_[metric].setCapacity(capacity);
}

void RingBufferStore::setCapacityAll(int capacity) {
    defaultCapacity_ = qMax(1, capacity);
    for (auto it = series_.begin(); it != series_.end(); ++it) {
        it.value().setCapacity(defaultCapacity_);
    }
}

void RingBufferStore::clear(MetricId metric) {
    series_[metric].clear();
}

void RingBufferStore::clearAll() {
    for (auto it = series_.begin(); it != series_.end(); ++it) {
        it.value().clear();
    }
}

QVector<Sample> RingBufferStore::read(MetricId metric) const {
    return series_.value(metric).samples();
}

int RingBufferStore::size(MetricId metric) const {
    return series_.value(metric).size();
}

int RingBufferStore::capacity(MetricId metric) const {
    return series_.value(metric, MetricSeries(defaultCapacity_)).capacity();
}

QJsonObject RingBufferStore::toJson() const {
    QJsonObject out;
    for (auto it = series_.constBegin(); it != series_.constEnd(); ++it) {
        QJsonArray points;
        for (const Sample& sample : it.value().samples()) {
            points.append(QJsonArray{sample.timestamp, sample.value});
        }
        QJsonObject series;
        series.insert("capacity", it.value().capacity());
        series.insert("points", points);
        out.insert(metricName(it.key()), series);
    }
    return out;
}

}  // namespace devdeck
