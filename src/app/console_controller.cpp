#include "devdeck/console_controller.hpp"

#include <QJsonDocument>

#include <cstdio>

#include "devdeck/journal.hpp"

namespace devdeck {

namespace {

QString indentedJson(const QJsonObject& object) {
    return QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Indented));
}

}  // namespace

ConsoleController::ConsoleController(
    const ToolboxSettings& settings,
    const DeviceFamily& family,
    QObject* parent)
    : QObject(parent),
      settings_(settings),
      executor_(settings.commandTimeoutMs),
      registry_(executor_, family),
      sampler_(executor_, registry_, settings.maxPoints, settings.monitorIntervalSeconds),
      out_(stdout) {
    sampler_.setTrackedInterfaces(settings_.trackedInterfaces);

    tickTimer_ = new QTimer(this);
    tickTimer_->setInterval(settings_.tickMs);
    connect(tickTimer_, &QTimer::timeout, this, &ConsoleController::onTick);

    connect(&job_, &StreamingJob::finished, this, [this](const StreamingResult& result) {
        for (const QString& line : job_.drain()) {
            printLine(line);
        }
        streaming_ = false;
        if (monitorDeadlineMs_ < 0) {
            tickTimer_->stop();
        }

        std::fprintf(
            stderr,
            "stream finished: %s (exit %d, %d lines)\n",
            result.success ? "ok" : qPrintable(describe(result.error)),
            result.exitCode,
            result.lineCount);
        if (result.aggregatedError.has_value()) {
            std::fprintf(stderr, "%s\n", qPrintable(*result.aggregatedError));
        }
        emit done(result.success ? 0 : 1);
    });

    clock_.start();
}

std::optional<DeviceFamily> ConsoleController::familyByName(
    const QString& name,
    const ToolboxSettings& settings) {
    const QString key = name.trimmed().toLower();
    if (key == "adb") {
        return DeviceFamily::adb(settings.adbPath);
    }
    if (key == "fastboot") {
        return DeviceFamily::fastboot(settings.fastbootPath);
    }
    if (key == "edl") {
        return DeviceFamily::edl(settings.qdlPath);
    }
    if (key == "ramdump") {
        return DeviceFamily::ramdump(settings.qramdumpPath);
    }
    return std::nullopt;
}

QJsonObject ConsoleController::connectDevice(const std::optional<QString>& identifier) {
    registry_.refresh();
    if (identifier.has_value() && !registry_.select(identifier)) {
        QJsonObject out = registry_.toJson();
        out.insert("success", false);
        out.insert("error", QString("Device %1 is not connected.").arg(*identifier));
        return out;
    }
    QJsonObject out = registry_.toJson();
    out.insert("success", registry_.lastError().isEmpty());
    if (!registry_.lastError().isEmpty()) {
        out.insert("error", registry_.lastError());
        out.insert("tool_available", CommandRunner::isAvailable(registry_.family().program));
    }
    return out;
}

bool ConsoleController::startMonitor(double seconds) {
    if (!registry_.family().hasShell) {
        Journal::instance().recordEvent("monitor_rejected", {{"family", registry_.family().name}});
        return false;
    }
    const qint64 now = clock_.elapsed();
    monitorDeadlineMs_ = now + static_cast<qint64>(qMax(0.0, seconds) * 1000.0);
    sampler_.setEnabled(true, now);
    tickTimer_->start();
    return true;
}

bool ConsoleController::startStream(const QStringList& args) {
    QStringList fullArgs = registry_.deviceArgs();
    fullArgs << args;
    if (!job_.start(registry_.family().program, fullArgs)) {
        return false;
    }
    streaming_ = true;
    tickTimer_->start();
    return true;
}

void ConsoleController::onTick() {
    const qint64 now = clock_.elapsed();
    if (sampler_.isEnabled()) {
        sampler_.tick(now);
        if (monitorDeadlineMs_ >= 0 && now >= monitorDeadlineMs_) {
            finishMonitor();
        }
    }
    if (streaming_) {
        for (const QString& line : job_.drain()) {
            printLine(line);
        }
    }
}

void ConsoleController::finishMonitor() {
    sampler_.setEnabled(false, clock_.elapsed());
    monitorDeadlineMs_ = -1;
    if (!streaming_) {
        tickTimer_->stop();
    }

    QJsonObject report;
    report.insert("device", registry_.toJson());
    report.insert("snapshot", sampler_.snapshot().toJson());
    report.insert("series", sampler_.store().toJson());
    report.insert("passes", sampler_.passCount());
    printLine(indentedJson(report));
    Journal::instance().setGauge("monitor.passes", sampler_.passCount());
    emit done(0);
}

void ConsoleController::printLine(const QString& line) {
    out_ << line << Qt::endl;
}

}  // namespace devdeck
