#include "devdeck/command_line.hpp"

namespace devdeck {

void configureParser(QCommandLineParser& parser, const CommandLineOptions& options) {
    parser.setApplicationDescription(
        "Android and Qualcomm device toolbox: discovery, telemetry and streaming tool runs.");
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("args", "Tool arguments for --stream.", "[args...]");
    parser.addOptions({
        options.config,
        options.family,
        options.device,
        options.list,
        options.monitor,
        options.stream,
        options.journal,
    });
}

}  // namespace devdeck
