#include "devdeck/device_registry.hpp"

#include <QDateTime>
#include <QJsonArray>
#include <QSet>

#include <algorithm>
#include <utility>

#include "devdeck/journal.hpp"

namespace {

bool containsAny(const QString& line, const QStringList& markers) {
    for (const QString& marker : markers) {
        if (line.contains(marker)) {
            return true;
        }
    }
    return false;
}

}  // namespace

namespace devdeck {

QJsonObject Device::toJson() const {
    QJsonObject attrs;
    for (auto it = attributes.constBegin(); it != attributes.constEnd(); ++it) {
        attrs.insert(it.key(), it.value());
    }
    return {
        {"id", identifier},
        {"status", status},
        {"attributes", attrs},
    };
}

DeviceFamily DeviceFamily::adb(const QString& program) {
    DeviceFamily family;
    family.name = "adb";
    family.program = program;
    family.listArgs = {"devices", "-l"};
    family.headerMarkers = {"List of devices", "* daemon"};
    family.selectorFlag = "-s";
    family.hasShell = true;
    return family;
}

DeviceFamily DeviceFamily::fastboot(const QString& program) {
    DeviceFamily family;
    family.name = "fastboot";
    family.program = program;
    family.listArgs = {"devices"};
    family.selectorFlag = "-s";
    return family;
}

DeviceFamily DeviceFamily::edl(const QString& program) {
    DeviceFamily family;
    family.name = "edl";
    family.program = program;
    family.listArgs = {"--list-devices"};
    family.requiredMarkers = {"9008", "EDL", "QDLoader"};
    family.selectorFlag = "--port";
    family.attributeDefaults = {
        {"mode", "EDL"},
        {"vid", "05c6"},
        {"pid", "9008"},
    };
    family.minimumTokens = 3;
    return family;
}

DeviceFamily DeviceFamily::ramdump(const QString& program) {
    DeviceFamily family;
    family.name = "ramdump";
    family.program = program;
    family.listArgs = {"--list-devices"};
    family.requiredMarkers = {"crash", "ramdump"};
    family.selectorFlag = "--port";
    family.attributeDefaults = {{"mode", "Ramdump"}};
    family.minimumTokens = 3;
    return family;
}

DeviceRegistry::DeviceRegistry(CommandExecutor& executor, DeviceFamily family)
    : executor_(executor),
      family_(std::move(family)) {}

QVector<Device> DeviceRegistry::parseListing(const QString& text, const DeviceFamily& family) {
    QVector<Device> devices;
    QSet<QString> seen;
    for (const QString& rawLine : text.split('\n', Qt::SkipEmptyParts)) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || containsAny(line, family.headerMarkers)) {
            continue;
        }
        if (!family.requiredMarkers.isEmpty() && !containsAny(line, family.requiredMarkers)) {
            continue;
        }

        const QStringList tokens = line.simplified().split(' ', Qt::SkipEmptyParts);
        if (tokens.size() < qMax(2, family.minimumTokens)) {
            continue;
        }
        if (seen.contains(tokens[0])) {
            continue;
        }

        Device device;
        device.identifier = tokens[0];
        device.status = tokens[1];
        for (int i = 2; i < tokens.size(); ++i) {
            const int idx = tokens[i].indexOf(':');
            if (idx <= 0) {
                continue;
            }
            device.attributes.insert(tokens[i].left(idx), tokens[i].mid(idx + 1));
        }
        for (auto it = family.attributeDefaults.constBegin(); it != family.attributeDefaults.constEnd(); ++it) {
            if (!device.attributes.contains(it.key())) {
                device.attributes.insert(it.key(), it.value());
            }
        }
        seen.insert(device.identifier);
        devices.append(device);
    }
    return devices;
}

QVector<Device> DeviceRegistry::refresh() {
    const CommandResult result = executor_.run(family_.program, family_.listArgs);
    lastRefreshUtc_ = QDateTime::currentDateTimeUtc().toString("HH:mm:ss");

    if (result.success()) {
        devices_ = parseListing(result.stdoutText, family_);
        lastError_.clear();
    } else {
        devices_.clear();
        lastError_ = result.stderrText.trimmed().isEmpty()
            ? describe(result.error)
            : result.stderrText.trimmed();
        Journal::instance().incrementCounter("devices.refresh_failures");
        Journal::instance().recordEvent(
            "device_refresh_failed",
            {
                {"family", family_.name},
                {"error", lastError_},
            });
    }

    applySelectionPolicy();
    Journal::instance().setGauge("devices." + family_.name + ".count", devices_.size());
    return devices_;
}

void DeviceRegistry::applySelectionPolicy() {
    if (devices_.size() == 1) {
        const QString id = devices_.first().identifier;
        if (selected_ != id) {
            Journal::instance().recordEvent(
                "device_autoconnected",
                {
                    {"family", family_.name},
                    {"device", id},
                });
        }
        selected_ = id;
        return;
    }

    if (!selected_.has_value()) {
        return;
    }

    const bool stillPresent = std::any_of(
        devices_.constBegin(),
        devices_.constEnd(),
        [this](const Device& device) { return device.identifier == *selected_; });
    if (!stillPresent) {
        Journal::instance().recordEvent(
            "device_selection_cleared",
            {
                {"family", family_.name},
                {"device", *selected_},
            });
        selected_.reset();
    }
}

bool DeviceRegistry::select(const std::optional<QString>& identifier) {
    if (!identifier.has_value()) {
        selected_.reset();
        return true;
    }
    for (const Device& device : devices_) {
        if (device.identifier == *identifier) {
            selected_ = device.identifier;
            return true;
        }
    }
    return false;
}

std::optional<Device> DeviceRegistry::selected() const {
    if (!selected_.has_value()) {
        return std::nullopt;
    }
    for (const Device& device : devices_) {
        if (device.identifier == *selected_) {
            return device;
        }
    }
    return std::nullopt;
}

QStringList DeviceRegistry::deviceArgs() const {
    if (!selected_.has_value()) {
        return {};
    }
    return {family_.selectorFlag, *selected_};
}

QJsonObject DeviceRegistry::toJson() const {
    QJsonArray devices;
    for (const Device& device : devices_) {
        devices.append(device.toJson());
    }
    QJsonObject out;
    out.insert("family", family_.name);
    out.insert("devices", devices);
    out.insert("selected", selected_.has_value() ? QJsonValue(*selected_) : QJsonValue());
    out.insert("last_refresh", lastRefreshUtc_);
    if (!lastError_.isEmpty()) {
        out.insert("error", lastError_);
    }
    return out;
}

}  // namespace devdeck
