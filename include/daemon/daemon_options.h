#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace diarizer {
namespace daemon_core {

struct DaemonOptions {
    std::string configPath;  // empty = DEFAULT_CONFIG_FILE
    std::string endpoint;    // empty = config value
    std::string pidFile;     // empty = config value
};

struct ParseDaemonOptionsResult {
    std::optional<DaemonOptions> options;
    bool showHelp{false};
    bool showVersion{false};
    bool hasError{false};
    std::string errorMessage;
};

ParseDaemonOptionsResult parseDaemonOptions(int argc, char** argv);

void printDaemonHelp(std::string_view programName);

}  // namespace daemon_core
}  // namespace diarizer
