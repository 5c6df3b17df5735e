#pragma once

#include "core/device.h"
#include "pipeline/diarization_pipeline.h"

#include <memory>
#include <string>

namespace diarizer {
namespace worker {

enum class FailureKind { Memory, Fatal };

/**
 * @brief Classify an inference failure from its message.
 *
 * Case-insensitive: anything mentioning "out of memory" or "memory" is a
 * memory failure, everything else is fatal. This is the only place that
 * interprets backend error wording.
 */
FailureKind classifyFailure(const std::string& message);

/**
 * @brief Device-side cached allocations.
 */
class DeviceCache {
   public:
    virtual ~DeviceCache() = default;
    virtual void clear(const Device& device) = 0;
};

// CUDA cache when built with HAVE_CUDA_BACKEND, otherwise a no-op cache
std::shared_ptr<DeviceCache> createDeviceCache();

// Return freed heap pages to the OS (malloc_trim)
void trimHeap();

/**
 * @brief Wraps one inference call with cache clearing and failure classification.
 *
 * Before and after the call, on success and on failure alike, the device
 * cache is cleared and the heap is trimmed.
 */
class ExecutionWrapper {
   public:
    explicit ExecutionWrapper(std::shared_ptr<DeviceCache> cache);

    /**
     * @throws MemoryError when the failure is classified as memory related
     * @throws FatalWorkerError for any other failure
     */
    pipeline::Annotation run(pipeline::DiarizationPipeline& pipeline, const std::string& input,
                             const Device& device);

   private:
    void releaseMemory(const Device& device);

    std::shared_ptr<DeviceCache> cache_;
};

}  // namespace worker
}  // namespace diarizer
