#include "daemon/daemon_options.h"

#include "core/config_loader.h"
#include "core/daemon_constants.h"

#include <iostream>

namespace diarizer {
namespace daemon_core {

void printDaemonHelp(std::string_view programName) {
    std::cout << "Usage: " << programName << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <path>    JSON config (default: " << DEFAULT_CONFIG_FILE << ")\n"
              << "  -e, --endpoint <ep>    ZeroMQ endpoint (default: "
              << DaemonConstants::ZEROMQ_ENDPOINT << ")\n"
              << "  -p, --pid-file <path>  Single-instance lock file\n"
              << "  -V, --version          Print version and exit\n"
              << "  -h, --help             Show this help\n\n"
              << "Signals: SIGINT/SIGTERM stop, SIGHUP reloads the configuration.\n";
}

ParseDaemonOptionsResult parseDaemonOptions(int argc, char** argv) {
    DaemonOptions opt{};
    ParseDaemonOptionsResult result{};

    auto fail = [&](const std::string& message) {
        result.hasError = true;
        result.errorMessage = message;
        return result;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "-h" || arg == "--help") {
            result.showHelp = true;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            result.showVersion = true;
            return result;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            opt.configPath = argv[++i];
        } else if ((arg == "-e" || arg == "--endpoint") && i + 1 < argc) {
            opt.endpoint = argv[++i];
            if (opt.endpoint.find("://") == std::string::npos) {
                return fail("Endpoint must look like tcp://host:port or ipc:///path");
            }
        } else if ((arg == "-p" || arg == "--pid-file") && i + 1 < argc) {
            opt.pidFile = argv[++i];
        } else {
            return fail("Unknown or incomplete option: " + std::string(arg));
        }
    }

    result.options = opt;
    return result;
}

}  // namespace daemon_core
}  // namespace diarizer
