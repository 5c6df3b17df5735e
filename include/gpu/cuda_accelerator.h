#ifndef GPU_CUDA_ACCELERATOR_H
#define GPU_CUDA_ACCELERATOR_H

#include "worker/device_selector.h"
#include "worker/execution_wrapper.h"

#include <cuda_runtime.h>
#include <cufft.h>

namespace diarizer {
namespace gpu {

// Throw std::runtime_error carrying the CUDA / cuFFT error text
void checkCudaError(cudaError_t error, const char* context);
void checkCufftError(cufftResult result, const char* context);

class CudaAcceleratorProbe final : public worker::AcceleratorProbe {
   public:
    explicit CudaAcceleratorProbe(int deviceIndex) : deviceIndex_(deviceIndex) {}

    bool available() override;
    Device device() const override {
        return Device::cuda(deviceIndex_);
    }

    // 16-point cuFFT on a freshly allocated buffer, then a cache purge
    void selfTest() override;

   private:
    int deviceIndex_;
};

/**
 * @brief Releases cached device memory of the default memory pool.
 */
class CudaDeviceCache final : public worker::DeviceCache {
   public:
    void clear(const Device& device) override;
};

}  // namespace gpu
}  // namespace diarizer

#endif  // GPU_CUDA_ACCELERATOR_H
