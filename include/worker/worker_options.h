#pragma once

#include "worker/worker_entry.h"

#include <optional>
#include <string>
#include <string_view>

namespace diarizer {
namespace worker {

struct WorkerOptions {
    WorkerArgs job;
    std::string configPath;  // empty = DEFAULT_CONFIG_FILE when present
    bool checkOnly = false;  // --check: report pipeline backend availability and exit
};

struct ParseWorkerOptionsResult {
    std::optional<WorkerOptions> options;
    bool showHelp{false};
    bool hasError{false};
    std::string errorMessage;
};

ParseWorkerOptionsResult parseWorkerOptions(int argc, char** argv);

void printWorkerHelp(std::string_view programName);

}  // namespace worker
}  // namespace diarizer
