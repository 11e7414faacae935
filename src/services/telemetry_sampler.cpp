#include "devdeck/telemetry_sampler.hpp"

#include <QDateTime>
#include <QJsonArray>

#include "devdeck/journal.hpp"

namespace devdeck {

namespace {

constexpr double kMinIntervalSeconds = 0.1;
constexpr double kMaxIntervalSeconds = 60.0;

QJsonValue optionalNumber(const std::optional<double>& value) {
    return value.has_value() ? QJsonValue(*value) : QJsonValue();
}

}  // namespace

QJsonObject DeviceSnapshot::toJson() const {
    QJsonArray network;
    for (const InterfaceTraffic& row : this->network) {
        network.append(QJsonObject{
            {"interface", row.name},
            {"rx", parsers::formatBytes(row.rxBytes)},
            {"tx", parsers::formatBytes(row.txBytes)},
            {"rx_bytes", static_cast<double>(row.rxBytes)},
            {"tx_bytes", static_cast<double>(row.txBytes)},
        });
    }
    QJsonArray processes;
    for (const ProcessInfo& process : this->processes) {
        processes.append(process.toJson());
    }

    QJsonObject out;
    out.insert("load_text", loadText);
    out.insert("cpu_load", optionalNumber(cpuLoad));
    out.insert("cpu_cores", cpuCores.has_value() ? QJsonValue(*cpuCores) : QJsonValue());
    out.insert("memory", memory.has_value() ? QJsonValue(memory->toJson()) : QJsonValue());
    out.insert("battery", battery.has_value() ? QJsonValue(battery->toJson()) : QJsonValue());
    out.insert("thermal_c", optionalNumber(thermalC));
    out.insert("network", network);
    out.insert("processes", processes);
    out.insert("last_update", lastUpdateUtc);
    return out;
}

TelemetrySampler::TelemetrySampler(
    CommandExecutor& executor,
    const DeviceRegistry& registry,
    int capacity,
    double intervalSeconds)
    : executor_(executor),
      registry_(registry),
      store_(capacity),
      intervalSeconds_(qBound(kMinIntervalSeconds, intervalSeconds, kMaxIntervalSeconds)) {}

void TelemetrySampler::setEnabled(bool enabled, qint64 nowMs) {
    if (enabled == enabled_) {
        return;
    }
    enabled_ = enabled;
    if (enabled_) {
        startTimeMs_ = nowMs;
        Journal::instance().recordEvent(
            "sampling_started",
            {
                {"family", registry_.family().name},
                {"interval_s", intervalSeconds_},
            });
        runPass(nowMs);
        lastSampleMs_ = nowMs;
    } else {
        lastSampleMs_.reset();
        Journal::instance().recordEvent("sampling_stopped", {{"passes", passCount_}});
    }
}

bool TelemetrySampler::tick(qint64 nowMs) {
    if (!enabled_) {
        return false;
    }
    if (lastSampleMs_.has_value()) {
        const double elapsed = static_cast<double>(nowMs - *lastSampleMs_) / 1000.0;
        if (elapsed < intervalSeconds_) {
            return false;
        }
    }
    runPass(nowMs);
    lastSampleMs_ = nowMs;
    return true;
}

bool TelemetrySampler::samplePassNow(qint64 nowMs) {
    const bool ran = runPass(nowMs);
    lastSampleMs_ = nowMs;
    return ran;
}

void TelemetrySampler::clear(qint64 nowMs) {
    store_.clearAll();
    if (enabled_) {
        startTimeMs_ = nowMs;
    } else {
        startTimeMs_.reset();
    }
}

void TelemetrySampler::setInterval(double seconds) {
    intervalSeconds_ = qBound(kMinIntervalSeconds, seconds, kMaxIntervalSeconds);
}

void TelemetrySampler::setCapacity(int capacity) {
    store_.setCapacityAll(capacity);
}

CommandResult TelemetrySampler::shell(const QStringList& remoteArgs) {
    QStringList args = registry_.deviceArgs();
    args << "shell" << remoteArgs;
    return executor_.run(registry_.family().program, args);
}

void TelemetrySampler::appendSample(MetricId metric, double value, double timestamp) {
    if (!startTimeMs_.has_value()) {
        return;
    }
    store_.push(metric, Sample{timestamp, value});
}

void TelemetrySampler::noteFailure(const QString& metric, bool commandFailed) {
    Journal::instance().incrementCounter(
        commandFailed ? "sampler.command_failures" : "sampler.parse_failures");
    Journal::instance().incrementCounter("sampler." + metric + ".failures");
}

void TelemetrySampler::sampleCpu(double timestamp) {
    const CommandResult load = shell({"cat", "/proc/loadavg"});
    if (!load.success()) {
        snapshot_.cpuLoad.reset();
        snapshot_.loadText = "CPU usage unavailable";
        noteFailure("cpu", true);
    } else {
        snapshot_.cpuLoad = parsers::parseLoadAverage(load.stdoutText);
        const QStringList parts = load.stdoutText.simplified().split(' ', Qt::SkipEmptyParts);
        if (parts.size() >= 3) {
            snapshot_.loadText =
                QString("Load: %1 %2 %3 (1m 5m 15m)").arg(parts[0], parts[1], parts[2]);
        }
        if (snapshot_.cpuLoad.has_value()) {
            appendSample(MetricId::CpuLoad, *snapshot_.cpuLoad, timestamp);
        } else {
            noteFailure("cpu", false);
        }
    }

    const CommandResult cpuinfo = shell({"cat", "/proc/cpuinfo"});
    snapshot_.cpuCores = cpuinfo.success() ? parsers::parseCpuCoreCount(cpuinfo.stdoutText) : std::nullopt;
    if (snapshot_.cpuCores.has_value() && !snapshot_.loadText.isEmpty()) {
        snapshot_.loadText += QString(" | %1 cores").arg(*snapshot_.cpuCores);
    }
}

void TelemetrySampler::sampleMemory(double timestamp) {
    const CommandResult result = shell({"cat", "/proc/meminfo"});
    if (!result.success()) {
        snapshot_.memory.reset();
        noteFailure("memory", true);
        return;
    }
    snapshot_.memory = parsers::parseMemInfo(result.stdoutText);
    if (!snapshot_.memory.has_value()) {
        noteFailure("memory", false);
        return;
    }
    appendSample(MetricId::MemoryUsage, snapshot_.memory->usagePercent, timestamp);
}

void TelemetrySampler::sampleBattery(double timestamp) {
    const CommandResult result = shell({"dumpsys", "battery"});
    if (!result.success()) {
        snapshot_.battery.reset();
        noteFailure("battery", true);
        return;
    }
    snapshot_.battery = parsers::parseBattery(result.stdoutText);
    if (!snapshot_.battery.has_value()) {
        noteFailure("battery", false);
        return;
    }
    if (snapshot_.battery->levelPercent.has_value()) {
        appendSample(MetricId::BatteryLevel, *snapshot_.battery->levelPercent, timestamp);
    }
    if (snapshot_.battery->temperatureC.has_value()) {
        appendSample(MetricId::BatteryTemperature, *snapshot_.battery->temperatureC, timestamp);
    }
}

void TelemetrySampler::sampleThermal(double timestamp) {
    const CommandResult result = shell({"cat", "/sys/class/thermal/thermal_zone0/temp"});
    if (!result.success()) {
        snapshot_.thermalC.reset();
        noteFailure("thermal", true);
        return;
    }
    snapshot_.thermalC = parsers::parseThermalZone(result.stdoutText);
    if (!snapshot_.thermalC.has_value()) {
        noteFailure("thermal", false);
        return;
    }
    appendSample(MetricId::ThermalTemperature, *snapshot_.thermalC, timestamp);
}

void TelemetrySampler::sampleNetwork() {
    snapshot_.network.clear();
    const CommandResult result = shell({"cat", "/proc/net/dev"});
    if (!result.success()) {
        noteFailure("network", true);
        return;
    }
    const auto rows = parsers::parseNetDev(result.stdoutText, trackedInterfaces_);
    if (!rows.has_value()) {
        noteFailure("network", false);
        return;
    }
    snapshot_.network = *rows;
}

void TelemetrySampler::sampleProcesses() {
    snapshot_.processes.clear();
    const CommandResult columns = shell({"ps", "-A", "-o", "PID,NAME,%CPU,RSS,USER,S"});
    if (columns.success()) {
        const auto parsed = parsers::parseProcessList(columns.stdoutText, ProcessLayout::Columns);
        if (parsed.has_value()) {
            snapshot_.processes = *parsed;
            return;
        }
    }

    const CommandResult plain = shell({"ps"});
    if (!plain.success()) {
        noteFailure("processes", true);
        return;
    }
    const auto parsed = parsers::parseProcessList(plain.stdoutText, ProcessLayout::Default);
    if (!parsed.has_value()) {
        noteFailure("processes", false);
        return;
    }
    snapshot_.processes = *parsed;
}

bool TelemetrySampler::runPass(qint64 nowMs) {
    if (!registry_.family().hasShell || !registry_.selectedId().has_value()) {
        Journal::instance().incrementCounter("sampler.device_unavailable");
        return false;
    }

    ScopedDuration duration("sampler.pass_ms");
    const double timestamp = startTimeMs_.has_value()
        ? static_cast<double>(nowMs - *startTimeMs_) / 1000.0
        : 0.0;

    sampleCpu(timestamp);
    sampleMemory(timestamp);
    sampleBattery(timestamp);
    sampleThermal(timestamp);
    sampleNetwork();
    sampleProcesses();

    snapshot_.lastUpdateUtc = QDateTime::currentDateTimeUtc().toString("HH:mm:ss");
    passCount_++;
    Journal::instance().incrementCounter("sampler.passes");
    Journal::instance().setGauge(
        "sampler.series_points",
        static_cast<double>(store_.size(MetricId::CpuLoad)));
    return true;
}

}  // namespace devdeck
