#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace devdeck {

struct ToolboxSettings {
    double monitorIntervalSeconds = 1.0;
    int maxPoints = 1000;
    int commandTimeoutMs = 10000;
    int tickMs = 100;
    QString adbPath = "adb";
    QString fastbootPath = "fastboot";
    QString qdlPath = "qdl-rs";
    QString qramdumpPath = "qramdump";
    QStringList trackedInterfaces = {"wlan0", "rmnet0", "eth0"};

    static ToolboxSettings fromJson(const QJsonObject& object);
    [[nodiscard]] QJsonObject toJson() const;

    // Returns {"success", "error", "path"}; out is only touched on success.
    static QJsonObject loadFromFile(const QString& filePath, ToolboxSettings& out);
    QJsonObject saveToFile(const QString& filePath) const;
};

}  // namespace devdeck
