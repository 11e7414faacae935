#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QJsonDocument>

#include <cstdio>
#include <optional>

#include "devdeck/command_line.hpp"
#include "devdeck/console_controller.hpp"
#include "devdeck/journal.hpp"
#include "devdeck/toolbox_settings.hpp"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("DevDeck");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    const devdeck::CommandLineOptions options;
    devdeck::configureParser(parser, options);
    parser.process(app);

    const QString journalPath = parser.isSet(options.journal)
        ? parser.value(options.journal)
        : QDir(QDir::currentPath()).filePath("logs/devdeck_last_exit.json");
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [journalPath]() {
        devdeck::Journal::instance().exportToFile(journalPath);
    });

    devdeck::ToolboxSettings settings;
    if (parser.isSet(options.config)) {
        const QJsonObject status = devdeck::ToolboxSettings::loadFromFile(parser.value(options.config), settings);
        if (!status.value("success").toBool(false)) {
            std::fprintf(
                stderr,
                "%s (%s)\n",
                qPrintable(status.value("error").toString()),
                qPrintable(status.value("path").toString()));
            return 2;
        }
    }

    const auto family = devdeck::ConsoleController::familyByName(parser.value(options.family), settings);
    if (!family.has_value()) {
        std::fprintf(stderr, "Unknown tool family: %s\n", qPrintable(parser.value(options.family)));
        return 2;
    }
    if (parser.isSet(options.monitor) && !family->hasShell) {
        std::fprintf(
            stderr,
            "Telemetry monitoring needs a shell-capable family (adb), not %s.\n",
            qPrintable(family->name));
        return 2;
    }

    devdeck::ConsoleController controller(settings, *family);
    std::optional<QString> deviceId;
    if (parser.isSet(options.device)) {
        deviceId = parser.value(options.device);
    }
    const QJsonObject connection = controller.connectDevice(deviceId);

    const bool monitor = parser.isSet(options.monitor);
    const bool stream = parser.isSet(options.stream);
    double monitorSeconds = 0.0;
    if (monitor) {
        bool ok = false;
        monitorSeconds = parser.value(options.monitor).toDouble(&ok);
        if (!ok || monitorSeconds < 0.0) {
            std::fprintf(stderr, "--monitor expects a non-negative number of seconds.\n");
            return 2;
        }
    }
    if (parser.isSet(options.list) || (!monitor && !stream)) {
        std::fprintf(stdout, "%s", QJsonDocument(connection).toJson(QJsonDocument::Indented).constData());
    }
    if (!connection.value("success").toBool(false) && (monitor || deviceId.has_value())) {
        std::fprintf(stderr, "%s\n", qPrintable(connection.value("error").toString()));
        devdeck::Journal::instance().exportToFile(journalPath);
        return 1;
    }
    if (!monitor && !stream) {
        devdeck::Journal::instance().exportToFile(journalPath);
        return 0;
    }

    int pending = (monitor ? 1 : 0) + (stream ? 1 : 0);
    int exitCode = 0;
    QObject::connect(&controller, &devdeck::ConsoleController::done, &app, [&pending, &exitCode](int code) {
        exitCode = qMax(exitCode, code);
        if (--pending == 0) {
            QCoreApplication::exit(exitCode);
        }
    });

    if (stream && !controller.startStream(parser.positionalArguments())) {
        std::fprintf(stderr, "A streaming job is already running.\n");
        return 1;
    }
    if (monitor && !controller.startMonitor(monitorSeconds)) {
        std::fprintf(stderr, "Telemetry monitoring is not available for %s.\n", qPrintable(family->name));
        return 2;
    }

    return QCoreApplication::exec();
}
