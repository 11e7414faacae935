#include "devdeck/metric_parsers.hpp"

#include <QMap>

#include <algorithm>

namespace {

QJsonValue optionalNumber(const std::optional<double>& value) {
    return value.has_value() ? QJsonValue(*value) : QJsonValue();
}

QStringList tokenize(const QString& line) {
    return line.simplified().split(' ', Qt::SkipEmptyParts);
}

uint pidSortKey(const QString& pid) {
    bool ok = false;
    const uint value = pid.toUInt(&ok);
    return ok ? value : 0;
}

}  // namespace

namespace devdeck {

QJsonObject MemoryInfo::toJson() const {
    return {
        {"total_kb", static_cast<double>(totalKb)},
        {"free_kb", static_cast<double>(freeKb)},
        {"available_kb", static_cast<double>(availableKb)},
        {"buffers_kb", static_cast<double>(buffersKb)},
        {"cached_kb", static_cast<double>(cachedKb)},
        {"swap_total_kb", static_cast<double>(swapTotalKb)},
        {"swap_free_kb", static_cast<double>(swapFreeKb)},
        {"usage_percent", usagePercent},
    };
}

QJsonObject BatteryInfo::toJson() const {
    return {
        {"level_percent", optionalNumber(levelPercent)},
        {"temperature_c", optionalNumber(temperatureC)},
        {"voltage_v", optionalNumber(voltageV)},
        {"health", health},
        {"status", status},
        {"ac_powered", acPowered},
        {"usb_powered", usbPowered},
        {"wireless_powered", wirelessPowered},
    };
}

QJsonObject ProcessInfo::toJson() const {
    return {
        {"pid", pid},
        {"name", name},
        {"cpu_percent", cpuPercent},
        {"memory", memory},
        {"user", user},
        {"state", state},
    };
}

namespace parsers {

std::optional<double> parseLoadAverage(const QString& text) {
    const QString first = text.trimmed().split('\n').value(0);
    for (const QString& token : tokenize(first)) {
        bool ok = false;
        const double value = token.toDouble(&ok);
        if (ok) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<int> parseCpuCoreCount(const QString& text) {
    int count = 0;
    for (const QString& line : text.split('\n', Qt::SkipEmptyParts)) {
        if (line.startsWith("processor")) {
            count++;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return count;
}

std::optional<MemoryInfo> parseMemInfo(const QString& text) {
    QMap<QString, qulonglong> values;
    for (const QString& line : text.split('\n', Qt::SkipEmptyParts)) {
        const int idx = line.indexOf(':');
        if (idx <= 0) {
            continue;
        }
        bool ok = false;
        const qulonglong value = tokenize(line.mid(idx + 1)).value(0).toULongLong(&ok);
        if (ok) {
            values.insert(line.left(idx).trimmed(), value);
        }
    }

    if (values.value("MemTotal") == 0 || !values.contains("MemAvailable")) {
        return std::nullopt;
    }

    MemoryInfo info;
    info.totalKb = values.value("MemTotal");
    info.freeKb = values.value("MemFree");
    info.availableKb = values.value("MemAvailable");
    info.buffersKb = values.value("Buffers");
    info.cachedKb = values.value("Cached");
    info.swapTotalKb = values.value("SwapTotal");
    info.swapFreeKb = values.value("SwapFree");
    const qulonglong used = info.totalKb > info.availableKb ? info.totalKb - info.availableKb : 0;
    info.usagePercent = static_cast<double>(used) / static_cast<double>(info.totalKb) * 100.0;
    return info;
}

std::optional<BatteryInfo> parseBattery(const QString& text) {
    BatteryInfo info;
    bool recognised = false;
    for (const QString& line : text.split('\n', Qt::SkipEmptyParts)) {
        const int idx = line.indexOf(':');
        if (idx <= 0) {
            continue;
        }
        const QString key = line.left(idx).trimmed();
        const QString value = line.mid(idx + 1).trimmed();
        bool ok = false;

        if (key == "level") {
            const double level = value.toDouble(&ok);
            if (ok) {
                info.levelPercent = level;
                recognised = true;
            }
        } else if (key == "temperature") {
            const double raw = value.toDouble(&ok);
            if (ok) {
                info.temperatureC = raw / 10.0;
                recognised = true;
            }
        } else if (key == "voltage") {
            const double raw = value.toDouble(&ok);
            if (ok) {
                info.voltageV = raw / 1000.0;
                recognised = true;
            }
        } else if (key == "health") {
            info.health = value;
            recognised = true;
        } else if (key == "status") {
            info.status = value;
            recognised = true;
        } else if (key == "AC powered") {
            info.acPowered = value;
            recognised = true;
        } else if (key == "USB powered") {
            info.usbPowered = value;
            recognised = true;
        } else if (key == "Wireless powered") {
            info.wirelessPowered = value;
            recognised = true;
        }
    }
    if (!recognised) {
        return std::nullopt;
    }
    return info;
}

std::optional<double> parseThermalZone(const QString& text) {
    bool ok = false;
    const double raw = text.trimmed().toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return raw / 1000.0;
}

std::optional<QVector<InterfaceTraffic>> parseNetDev(
    const QString& text,
    const QStringList& interfaces) {
    QVector<InterfaceTraffic> rows;
    bool sawRow = false;
    for (const QString& line : text.split('\n', Qt::SkipEmptyParts)) {
        if (line.contains('|')) {
            continue;
        }
        const int idx = line.indexOf(':');
        if (idx <= 0) {
            continue;
        }
        const QString name = line.left(idx).trimmed();
        const QStringList fields = tokenize(line.mid(idx + 1));
        if (name.isEmpty() || fields.size() < 9) {
            continue;
        }
        bool rxOk = false;
        bool txOk = false;
        const qulonglong rx = fields[0].toULongLong(&rxOk);
        const qulonglong tx = fields[8].toULongLong(&txOk);
        if (!rxOk || !txOk) {
            continue;
        }
        sawRow = true;
        if (!interfaces.isEmpty() && !interfaces.contains(name)) {
            continue;
        }

        auto it = std::find_if(rows.begin(), rows.end(), [&name](const InterfaceTraffic& row) {
            return row.name == name;
        });
        if (it == rows.end()) {
            InterfaceTraffic row;
            row.name = name;
            row.rxBytes = rx;
            row.txBytes = tx;
            rows.append(row);
        } else {
            it->rxBytes += rx;
            it->txBytes += tx;
        }
    }
    if (!sawRow) {
        return std::nullopt;
    }
    return rows;
}

std::optional<QVector<ProcessInfo>> parseProcessList(const QString& text, ProcessLayout layout) {
    QVector<ProcessInfo> processes;
    const QStringList lines = text.split('\n', Qt::SkipEmptyParts);
    for (int i = 0; i < lines.size(); ++i) {
        const QStringList parts = tokenize(lines[i]);
        if (i == 0 && parts.contains("PID")) {
            continue;
        }

        ProcessInfo process;
        if (layout == ProcessLayout::Columns) {
            if (parts.size() < 6) {
                continue;
            }
            process.pid = parts[0];
            process.name = parts[1];
            process.cpuPercent = parts[2];
            process.memory = parts[3] + " KB";
            process.user = parts[4];
            process.state = parts[5];
        } else {
            if (parts.size() < 9) {
                continue;
            }
            process.user = parts[0];
            process.pid = parts[1];
            process.memory = parts[4] + " KB";
            process.state = parts[7];
            process.name = parts[8];
            process.cpuPercent = "N/A";
        }
        processes.append(process);
    }

    if (processes.isEmpty()) {
        return std::nullopt;
    }
    std::stable_sort(processes.begin(), processes.end(), [](const ProcessInfo& a, const ProcessInfo& b) {
        return pidSortKey(a.pid) < pidSortKey(b.pid);
    });
    return processes;
}

QString formatBytes(qulonglong bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr int kLastUnit = 4;

    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < kLastUnit) {
        size /= 1024.0;
        unit++;
    }

    if (unit == 0) {
        return QString("%1 %2").arg(bytes).arg(kUnits[unit]);
    }
    return QString("%1 %2").arg(size, 0, 'f', 2).arg(kUnits[unit]);
}

}  // namespace parsers

}  // namespace devdeck
