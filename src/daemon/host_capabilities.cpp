#include "daemon/host_capabilities.h"

#include "logging/logger.h"
#include "process/child_process.h"

#include <system_error>
#include <thread>

#ifdef HAVE_NVML
#include <nvml.h>
#endif

namespace diarizer {
namespace daemon_core {

int queryAcceleratorCount(std::string* firstDeviceName) {
#ifdef HAVE_NVML
    nvmlReturn_t result = nvmlInit();
    if (result != NVML_SUCCESS) {
        LOG_WARN("Failed to initialize NVML: {}", nvmlErrorString(result));
        return -1;
    }

    unsigned int count = 0;
    result = nvmlDeviceGetCount(&count);
    if (result != NVML_SUCCESS) {
        LOG_WARN("Failed to get NVML device count: {}", nvmlErrorString(result));
        nvmlShutdown();
        return -1;
    }

    if (count > 0 && firstDeviceName) {
        nvmlDevice_t device = nullptr;
        char name[NVML_DEVICE_NAME_BUFFER_SIZE] = {};
        if (nvmlDeviceGetHandleByIndex(0, &device) == NVML_SUCCESS &&
            nvmlDeviceGetName(device, name, sizeof(name)) == NVML_SUCCESS) {
            *firstDeviceName = name;
        }
    }

    nvmlShutdown();
    return static_cast<int>(count);
#else
    (void)firstDeviceName;
    return -1;
#endif
}

bool queryWorkerBackend(const std::vector<std::string>& workerCommand) {
    if (workerCommand.empty()) {
        return false;
    }
    std::vector<std::string> args = workerCommand;
    args.push_back("--check");
    try {
        auto status = process::runToCompletion(args);
        return status.exited && status.code == 0;
    } catch (const std::system_error& e) {
        LOG_WARN("Cannot run {} --check: {}", workerCommand.front(), e.what());
        return false;
    }
}

HostCapabilities probeHostCapabilities(const std::vector<std::string>& workerCommand) {
    HostCapabilities caps;

    unsigned int cpus = std::thread::hardware_concurrency();
    caps.cpuCount = cpus > 0 ? cpus : 1;

    int count = queryAcceleratorCount(&caps.acceleratorName);
    if (count >= 0) {
        caps.acceleratorCount = count;
        caps.acceleratorAvailable = count > 0;
    } else {
#ifdef HAVE_CUDA_BACKEND
        // No NVML: assume present, the worker's self-test decides per job
        caps.acceleratorAvailable = true;
        caps.acceleratorCount = 1;
#endif
    }

    caps.backendAvailable = queryWorkerBackend(workerCommand);

    LOG_INFO("Host: {} cpu(s), accelerator {} ({} device(s){}{}), pipeline backend {}",
             caps.cpuCount, caps.acceleratorAvailable ? "available" : "unavailable",
             caps.acceleratorCount, caps.acceleratorName.empty() ? "" : ", ",
             caps.acceleratorName, caps.backendAvailable ? "available" : "unavailable");
    return caps;
}

}  // namespace daemon_core
}  // namespace diarizer
