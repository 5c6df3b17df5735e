#pragma once

#include "core/device.h"

#include <memory>
#include <string>
#include <vector>

namespace diarizer {
namespace pipeline {

// One speaker turn as produced by a pipeline
struct Turn {
    double start = 0.0;
    double end = 0.0;
    std::string label;
};

using Annotation = std::vector<Turn>;

/**
 * @brief Opaque diarization unit of work.
 *
 * Implementations throw std::exception subclasses on any failure; the
 * execution wrapper decides whether a failure is memory related.
 */
class DiarizationPipeline {
   public:
    virtual ~DiarizationPipeline() = default;

    virtual const char* name() const = 0;

    // Rebind to device. Takes effect on the next run().
    virtual void to(const Device& device) = 0;

    // Number of chunks per inference call
    virtual void setBatchSize(int batchSize) = 0;

    // wavPath must be 16 kHz mono WAV
    virtual Annotation run(const std::string& wavPath) = 0;
};

struct PipelineOptions {
    std::string modelPath;
    int intraOpThreads = 0;  // 0 = runtime default
};

// Whether this build carries a pipeline implementation
bool pipelineBackendAvailable();

/**
 * @brief Build the segmentation pipeline on the cpu device.
 * @throws FatalWorkerError (JOB_BACKEND_UNAVAILABLE) when built without ONNX Runtime
 *         or when the model cannot be loaded
 */
std::unique_ptr<DiarizationPipeline> createPipeline(const PipelineOptions& options);

}  // namespace pipeline
}  // namespace diarizer
