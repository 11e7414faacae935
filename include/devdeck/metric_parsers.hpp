#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace devdeck {

struct MemoryInfo {
    qulonglong totalKb = 0;
    qulonglong freeKb = 0;
    qulonglong availableKb = 0;
    qulonglong buffersKb = 0;
    qulonglong cachedKb = 0;
    qulonglong swapTotalKb = 0;
    qulonglong swapFreeKb = 0;
    double usagePercent = 0.0;

    [[nodiscard]] QJsonObject toJson() const;
};

struct BatteryInfo {
    std::optional<double> levelPercent;
    std::optional<double> temperatureC;
    std::optional<double> voltageV;
    QString health;
    QString status;
    QString acPowered;
    QString usbPowered;
    QString wirelessPowered;

    [[nodiscard]] QJsonObject toJson() const;
};

struct InterfaceTraffic {
    QString name;
    qulonglong rxBytes = 0;
    qulonglong txBytes = 0;
};

struct ProcessInfo {
    QString pid;
    QString name;
    QString cpuPercent;
    QString memory;
    QString user;
    QString state;

    [[nodiscard]] QJsonObject toJson() const;
};

enum class ProcessLayout {
    // ps -A -o PID,NAME,%CPU,RSS,USER,S
    Columns,
    // toybox ps default: USER PID PPID VSZ RSS WCHAN ADDR S NAME
    Default,
};

// Narrow text -> value parsers. An empty optional means the text did not have
// the expected shape.
namespace parsers {

std::optional<double> parseLoadAverage(const QString& text);
std::optional<int> parseCpuCoreCount(const QString& text);
std::optional<MemoryInfo> parseMemInfo(const QString& text);
std::optional<BatteryInfo> parseBattery(const QString& text);
std::optional<double> parseThermalZone(const QString& text);
std::optional<QVector<InterfaceTraffic>> parseNetDev(
    const QString& text,
    const QStringList& interfaces = {});
std::optional<QVector<ProcessInfo>> parseProcessList(
    const QString& text,
    ProcessLayout layout = ProcessLayout::Columns);

QString formatBytes(qulonglong bytes);

}  // namespace parsers

}  // namespace devdeck
