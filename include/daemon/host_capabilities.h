#pragma once

#include <string>
#include <vector>

namespace diarizer {
namespace daemon_core {

/**
 * @brief What the host offers, probed once when the daemon starts.
 *
 * The daemon never initializes a compute context itself: the accelerator
 * count comes from NVML, the pipeline backend from `diarizer_worker --check`.
 */
struct HostCapabilities {
    bool acceleratorAvailable = false;
    int acceleratorCount = 0;
    std::string acceleratorName;
    unsigned int cpuCount = 1;
    bool backendAvailable = false;
};

// NVML device count (HAVE_NVML), -1 when NVML is not built in or fails
int queryAcceleratorCount(std::string* firstDeviceName = nullptr);

// Runs "<workerCommand...> --check" and reports whether it exited 0
bool queryWorkerBackend(const std::vector<std::string>& workerCommand);

HostCapabilities probeHostCapabilities(const std::vector<std::string>& workerCommand);

}  // namespace daemon_core
}  // namespace diarizer
