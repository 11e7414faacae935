#include "devdeck/toolbox_settings.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>

namespace devdeck {

ToolboxSettings ToolboxSettings::fromJson(const QJsonObject& object) {
    ToolboxSettings settings;
    settings.monitorIntervalSeconds =
        qBound(0.1, object.value("monitor_interval_s").toDouble(settings.monitorIntervalSeconds), 60.0);
    settings.maxPoints = qBound(10, object.value("max_points").toInt(settings.maxPoints), 10000);

    const int timeout = object.value("command_timeout_ms").toInt(settings.commandTimeoutMs);
    settings.commandTimeoutMs = timeout < 0 ? -1 : qMax(100, timeout);
    settings.tickMs = qBound(10, object.value("tick_ms").toInt(settings.tickMs), 1000);

    settings.adbPath = object.value("adb_path").toString(settings.adbPath);
    settings.fastbootPath = object.value("fastboot_path").toString(settings.fastbootPath);
    settings.qdlPath = object.value("qdl_path").toString(settings.qdlPath);
    settings.qramdumpPath = object.value("qramdump_path").toString(settings.qramdumpPath);

    if (object.value("tracked_interfaces").isArray()) {
        settings.trackedInterfaces.clear();
        for (const QJsonValue& value : object.value("tracked_interfaces").toArray()) {
            const QString name = value.toString().trimmed();
            if (!name.isEmpty()) {
                settings.trackedInterfaces.append(name);
            }
        }
    }
    return settings;
}

QJsonObject ToolboxSettings::toJson() const {
    return {
        {"monitor_interval_s", monitorIntervalSeconds},
        {"max_points", maxPoints},
        {"command_timeout_ms", commandTimeoutMs},
        {"tick_ms", tickMs},
        {"adb_path", adbPath},
        {"fastboot_path", fastbootPath},
        {"qdl_path", qdlPath},
        {"qramdump_path", qramdumpPath},
        {"tracked_interfaces", QJsonArray::fromStringList(trackedInterfaces)},
    };
}

QJsonObject ToolboxSettings::loadFromFile(const QString& filePath, ToolboxSettings& out) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open settings file."},
            {"path", filePath},
        };
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return {
            {"success", false},
            {"error", "Settings file must contain a JSON object."},
            {"path", filePath},
        };
    }

    out = fromJson(doc.object());
    return {
        {"success", true},
        {"path", filePath},
    };
}

QJsonObject ToolboxSettings::saveToFile(const QString& filePath) const {
    QFile file(filePath);
    QDir dir = QFileInfo(file).absoluteDir();
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"error", "Failed to open settings path for writing."},
            {"path", filePath},
        };
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    file.close();
    return {
        {"success", true},
        {"path", filePath},
    };
}

}  // namespace devdeck
