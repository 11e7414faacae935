#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "devdeck/command_runner.hpp"
#include "devdeck/device_registry.hpp"
#include "devdeck/metric_parsers.hpp"
#include "devdeck/metric_series.hpp"

namespace devdeck {

// Latest text views of the selected device, refreshed by each sample pass.
struct DeviceSnapshot {
    QString loadText;
    std::optional<double> cpuLoad;
    std::optional<int> cpuCores;
    std::optional<MemoryInfo> memory;
    std::optional<BatteryInfo> battery;
    std::optional<double> thermalC;
    QVector<InterfaceTraffic> network;
    QVector<ProcessInfo> processes;
    QString lastUpdateUtc = "Never";

    [[nodiscard]] QJsonObject toJson() const;
};

// Interval-gated sampler. tick() is cheap when the interval has not elapsed;
// a pass runs every metric fetch independently so one failure never blocks the rest.
class TelemetrySampler {
public:
    TelemetrySampler(
        CommandExecutor& executor,
        const DeviceRegistry& registry,
        int capacity = 1000,
        double intervalSeconds = 1.0);

    void setEnabled(bool enabled, qint64 nowMs);
    [[nodiscard]] bool isEnabled() const { return enabled_; }

    // Returns true when the interval gate fired on this tick.
    bool tick(qint64 nowMs);
    bool samplePassNow(qint64 nowMs);
    void clear(qint64 nowMs);

    void setInterval(double seconds);
    [[nodiscard]] double interval() const { return intervalSeconds_; }
    void setCapacity(int capacity);
    void setTrackedInterfaces(const QStringList& interfaces) { trackedInterfaces_ = interfaces; }

    [[nodiscard]] const RingBufferStore& store() const { return store_; }
    [[nodiscard]] const DeviceSnapshot& snapshot() const { return snapshot_; }
    [[nodiscard]] std::optional<qint64> startTimeMs() const { return startTimeMs_; }
    [[nodiscard]] std::optional<qint64> lastSampleMs() const { return lastSampleMs_; }
    [[nodiscard]] int passCount() const { return passCount_; }

private:
    bool runPass(qint64 nowMs);
    CommandResult shell(const QStringList& remoteArgs);
    void appendSample(MetricId metric, double value, double timestamp);
    void noteFailure(const QString& metric, bool commandFailed);

    void sampleCpu(double timestamp);
    void sampleMemory(double timestamp);
    void sampleBattery(double timestamp);
    void sampleThermal(double timestamp);
    void sampleNetwork();
    void sampleProcesses();

    CommandExecutor& executor_;
    const DeviceRegistry& registry_;
    RingBufferStore store_;
    DeviceSnapshot snapshot_;
    QStringList trackedInterfaces_ = {"wlan0", "rmnet0", "eth0"};

    bool enabled_ = false;
    double intervalSeconds_;
    std::optional<qint64> startTimeMs_;
    std::optional<qint64> lastSampleMs_;
    int passCount_ = 0;
};

}  // namespace devdeck
