#pragma once

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace devdeck {

struct CommandLineOptions {
    QCommandLineOption config{"config", "Settings JSON file.", "file"};
    QCommandLineOption family{"family", "Tool family: adb, fastboot, edl or ramdump.", "name", "adb"};
    QCommandLineOption device{"device", "Select this device after discovery.", "id"};
    QCommandLineOption list{"list", "Print discovered devices and the selection."};
    QCommandLineOption monitor{"monitor", "Sample telemetry for the given wall time.", "seconds"};
    QCommandLineOption stream{
        "stream",
        "Run the family tool with the positional arguments, streaming its output."};
    QCommandLineOption journal{"journal", "Export the activity journal on exit.", "file"};
};

// Everything after the first positional argument belongs to the streamed tool,
// so "--stream logcat -v brief" forwards "-v" instead of printing our version.
void configureParser(QCommandLineParser& parser, const CommandLineOptions& options);

}  // namespace devdeck
