#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "devdeck/command_runner.hpp"

namespace devdeck {

struct Device {
    QString identifier;
    QString status;
    QMap<QString, QString> attributes;

    [[nodiscard]] QJsonObject toJson() const;
};

// Describes how one tool family lists its devices and addresses one of them.
struct DeviceFamily {
    QString name;
    QString program;
    QStringList listArgs;
    QStringList headerMarkers;
    QStringList requiredMarkers;
    QString selectorFlag;
    QMap<QString, QString> attributeDefaults;
    int minimumTokens = 2;
    // Only families with a remote shell can feed the telemetry sampler.
    bool hasShell = false;

    static DeviceFamily adb(const QString& program = "adb");
    static DeviceFamily fastboot(const QString& program = "fastboot");
    static DeviceFamily edl(const QString& program = "qdl-rs");
    static DeviceFamily ramdump(const QString& program = "qramdump");
};

class DeviceRegistry {
public:
    DeviceRegistry(CommandExecutor& executor, DeviceFamily family);

    QVector<Device> refresh();
    bool select(const std::optional<QString>& identifier);

    [[nodiscard]] std::optional<Device> selected() const;
    [[nodiscard]] std::optional<QString> selectedId() const { return selected_; }
    [[nodiscard]] const QVector<Device>& devices() const { return devices_; }
    [[nodiscard]] const DeviceFamily& family() const { return family_; }
    [[nodiscard]] QString lastError() const { return lastError_; }
    [[nodiscard]] QString lastRefreshUtc() const { return lastRefreshUtc_; }

    // Selector prefix for commands aimed at the selected device; empty when none is selected.
    [[nodiscard]] QStringList deviceArgs() const;
    [[nodiscard]] QJsonObject toJson() const;

    static QVector<Device> parseListing(const QString& text, const DeviceFamily& family);

private:
    void applySelectionPolicy();

    CommandExecutor& executor_;
    DeviceFamily family_;
    QVector<Device> devices_;
    std::optional<QString> selected_;
    QString lastError_;
    QString lastRefreshUtc_ = "Never";
};

}  // namespace devdeck
