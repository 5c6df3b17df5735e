#pragma once

#include "core/device.h"

#include <memory>

namespace diarizer {
namespace worker {

/**
 * @brief Runtime view of the accelerator, as seen from inside the worker.
 */
class AcceleratorProbe {
   public:
    virtual ~AcceleratorProbe() = default;

    // Capability report; may be optimistic
    virtual bool available() = 0;

    virtual Device device() const = 0;

    /**
     * @brief Allocate a small buffer on the device, run one operation on it,
     *        release it and purge the device cache.
     * @throws std::exception on any device error
     */
    virtual void selfTest() = 0;
};

// CUDA probe when built with HAVE_CUDA_BACKEND, otherwise a probe reporting no accelerator
std::unique_ptr<AcceleratorProbe> createAcceleratorProbe();

/**
 * @brief Picks the device for one job.
 *
 * The accelerator is returned only when it is preferred, reported available
 * and passes one self-test. A failed self-test is final: no retry.
 */
class DeviceSelector {
   public:
    explicit DeviceSelector(std::shared_ptr<AcceleratorProbe> probe);

    Device select(bool preferAccelerated);

   private:
    std::shared_ptr<AcceleratorProbe> probe_;
};

}  // namespace worker
}  // namespace diarizer
