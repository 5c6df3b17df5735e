#include "worker/execution_wrapper.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <malloc.h>
#include <new>

#ifdef HAVE_CUDA_BACKEND
#include "gpu/cuda_accelerator.h"
#endif

namespace diarizer {
namespace worker {

namespace {

class HostDeviceCache final : public DeviceCache {
   public:
    void clear(const Device& /*device*/) override {}
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

FailureKind classifyFailure(const std::string& message) {
    const std::string lower = toLower(message);
    if (lower.find("out of memory") != std::string::npos ||
        lower.find("memory") != std::string::npos) {
        return FailureKind::Memory;
    }
    return FailureKind::Fatal;
}

std::shared_ptr<DeviceCache> createDeviceCache() {
#ifdef HAVE_CUDA_BACKEND
    return std::make_shared<gpu::CudaDeviceCache>();
#else
    return std::make_shared<HostDeviceCache>();
#endif
}

void trimHeap() {
    malloc_trim(0);
}

ExecutionWrapper::ExecutionWrapper(std::shared_ptr<DeviceCache> cache) : cache_(std::move(cache)) {}

void ExecutionWrapper::releaseMemory(const Device& device) {
    if (cache_) {
        cache_->clear(device);
    }
    trimHeap();
}

pipeline::Annotation ExecutionWrapper::run(pipeline::DiarizationPipeline& pipeline,
                                           const std::string& input, const Device& device) {
    releaseMemory(device);

    std::string message;
    try {
        pipeline::Annotation result = pipeline.run(input);
        releaseMemory(device);
        return result;
    } catch (const std::bad_alloc& e) {
        message = std::string("host out of memory: ") + e.what();
    } catch (const std::exception& e) {
        message = e.what();
    }

    releaseMemory(device);

    if (classifyFailure(message) == FailureKind::Memory) {
        LOG_WARN("ExecutionWrapper: memory failure on {}: {}", device.name(), message);
        throw MemoryError(message);
    }
    LOG_ERROR("ExecutionWrapper: inference failed on {}: {}", device.name(), message);
    throw FatalWorkerError(message);
}

}  // namespace worker
}  // namespace diarizer
