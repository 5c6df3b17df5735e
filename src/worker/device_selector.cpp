#include "worker/device_selector.h"

#include "logging/logger.h"

#include <exception>

#ifdef HAVE_CUDA_BACKEND
#include "gpu/cuda_accelerator.h"
#endif

namespace diarizer {
namespace worker {

namespace {

class NoAcceleratorProbe final : public AcceleratorProbe {
   public:
    bool available() override {
        return false;
    }

    Device device() const override {
        return Device::cpu();
    }

    void selfTest() override {}
};

}  // namespace

std::unique_ptr<AcceleratorProbe> createAcceleratorProbe() {
#ifdef HAVE_CUDA_BACKEND
    return std::make_unique<gpu::CudaAcceleratorProbe>(0);
#else
    return std::make_unique<NoAcceleratorProbe>();
#endif
}

DeviceSelector::DeviceSelector(std::shared_ptr<AcceleratorProbe> probe)
    : probe_(std::move(probe)) {}

Device DeviceSelector::select(bool preferAccelerated) {
    if (!preferAccelerated) {
        LOG_INFO("DeviceSelector: accelerator not requested, using cpu");
        return Device::cpu();
    }
    if (!probe_ || !probe_->available()) {
        LOG_INFO("DeviceSelector: no accelerator available, using cpu");
        return Device::cpu();
    }

    const Device accelerator = probe_->device();
    try {
        probe_->selfTest();
    } catch (const std::exception& e) {
        LOG_WARN("DeviceSelector: {} self-test failed ({}), using cpu", accelerator.name(),
                 e.what());
        return Device::cpu();
    }

    LOG_INFO("DeviceSelector: using {}", accelerator.name());
    return accelerator;
}

}  // namespace worker
}  // namespace diarizer
