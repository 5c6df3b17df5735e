#include "gpu/cuda_accelerator.h"

#include "logging/logger.h"

#include <stdexcept>
#include <string>

namespace diarizer {
namespace gpu {

namespace {

constexpr int SELF_TEST_POINTS = 16;

const char* cufftResultName(cufftResult result) {
    switch (result) {
    case CUFFT_SUCCESS:
        return "CUFFT_SUCCESS";
    case CUFFT_INVALID_PLAN:
        return "CUFFT_INVALID_PLAN";
    case CUFFT_ALLOC_FAILED:
        return "CUFFT_ALLOC_FAILED (out of memory)";
    case CUFFT_INVALID_VALUE:
        return "CUFFT_INVALID_VALUE";
    case CUFFT_INTERNAL_ERROR:
        return "CUFFT_INTERNAL_ERROR";
    case CUFFT_EXEC_FAILED:
        return "CUFFT_EXEC_FAILED";
    case CUFFT_SETUP_FAILED:
        return "CUFFT_SETUP_FAILED";
    default:
        return "CUFFT_UNKNOWN_ERROR";
    }
}

void purgeDevice(int deviceIndex) {
    checkCudaError(cudaDeviceSynchronize(), "cudaDeviceSynchronize");
    cudaMemPool_t pool = nullptr;
    if (cudaDeviceGetDefaultMemPool(&pool, deviceIndex) == cudaSuccess && pool != nullptr) {
        checkCudaError(cudaMemPoolTrimTo(pool, 0), "cudaMemPoolTrimTo");
    }
}

}  // namespace

void checkCudaError(cudaError_t error, const char* context) {
    if (error != cudaSuccess) {
        throw std::runtime_error(std::string(context) + ": " + cudaGetErrorString(error));
    }
}

void checkCufftError(cufftResult result, const char* context) {
    if (result != CUFFT_SUCCESS) {
        throw std::runtime_error(std::string(context) + ": " + cufftResultName(result));
    }
}

bool CudaAcceleratorProbe::available() {
    int count = 0;
    cudaError_t error = cudaGetDeviceCount(&count);
    if (error != cudaSuccess) {
        LOG_DEBUG("cudaGetDeviceCount failed: {}", cudaGetErrorString(error));
        return false;
    }
    return count > deviceIndex_;
}

void CudaAcceleratorProbe::selfTest() {
    checkCudaError(cudaSetDevice(deviceIndex_), "cudaSetDevice");

    cufftComplex* buffer = nullptr;
    checkCudaError(cudaMalloc(&buffer, sizeof(cufftComplex) * SELF_TEST_POINTS), "cudaMalloc");

    cufftHandle plan = 0;
    bool planCreated = false;
    try {
        checkCudaError(cudaMemset(buffer, 0, sizeof(cufftComplex) * SELF_TEST_POINTS),
                       "cudaMemset");
        checkCufftError(cufftPlan1d(&plan, SELF_TEST_POINTS, CUFFT_C2C, 1), "cufftPlan1d");
        planCreated = true;
        checkCufftError(cufftExecC2C(plan, buffer, buffer, CUFFT_FORWARD), "cufftExecC2C");
        checkCudaError(cudaDeviceSynchronize(), "cudaDeviceSynchronize");
    } catch (const std::runtime_error&) {
        if (planCreated) {
            cufftDestroy(plan);
        }
        cudaFree(buffer);
        throw;
    }

    cufftDestroy(plan);
    checkCudaError(cudaFree(buffer), "cudaFree");
    purgeDevice(deviceIndex_);
}

void CudaDeviceCache::clear(const Device& device) {
    if (device.kind != DeviceKind::Cuda) {
        return;
    }
    try {
        purgeDevice(device.index);
    } catch (const std::runtime_error& e) {
        LOG_WARN("CUDA cache clear on {} failed: {}", device.name(), e.what());
    }
}

}  // namespace gpu
}  // namespace diarizer
