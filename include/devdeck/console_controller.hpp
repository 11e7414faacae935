#pragma once

#include <QElapsedTimer>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <QTimer>

#include <optional>

#include "devdeck/command_runner.hpp"
#include "devdeck/device_registry.hpp"
#include "devdeck/streaming_job.hpp"
#include "devdeck/telemetry_sampler.hpp"
#include "devdeck/toolbox_settings.hpp"

namespace devdeck {

// Console front end: owns the gateway, registry, sampler and streaming job and
// drives them from one QTimer tick on the event-loop thread.
class ConsoleController final : public QObject {
    Q_OBJECT

public:
    ConsoleController(const ToolboxSettings& settings, const DeviceFamily& family, QObject* parent = nullptr);

    static std::optional<DeviceFamily> familyByName(const QString& name, const ToolboxSettings& settings);

    // Refreshes the registry and applies an explicit selection when one is given.
    QJsonObject connectDevice(const std::optional<QString>& identifier);

    bool startMonitor(double seconds);
    bool startStream(const QStringList& args);

    [[nodiscard]] const DeviceRegistry& registry() const { return registry_; }
    [[nodiscard]] const TelemetrySampler& sampler() const { return sampler_; }

signals:
    void done(int exitCode);

private:
    void onTick();
    void finishMonitor();
    void printLine(const QString& line);

    ToolboxSettings settings_;
    ProcessCommandExecutor executor_;
    DeviceRegistry registry_;
    TelemetrySampler sampler_;
    StreamingJob job_;
    QTimer* tickTimer_ = nullptr;
    QElapsedTimer clock_;
    QTextStream out_;

    qint64 monitorDeadlineMs_ = -1;
    bool streaming_ = false;
};

}  // namespace devdeck
