#pragma once

#include "job/job_types.h"
#include "pipeline/diarization_pipeline.h"
#include "worker/device_selector.h"
#include "worker/execution_wrapper.h"
#include "worker/transcoder.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace diarizer {
namespace worker {

enum class WorkerState {
    Init,
    DeviceBound,
    Converting,
    Inferring,
    MemoryFailure,
    RetryingCpu,
    Extracting,
    Done,
    Failed,
};

const char* workerStateName(WorkerState state);

// Process exit codes of diarizer_worker
constexpr int EXIT_JOB_SUCCEEDED = 0;
constexpr int EXIT_JOB_FAILED = 1;          // failure recorded in the artifact
constexpr int EXIT_ARTIFACT_WRITE_FAILED = 2;
constexpr int EXIT_USAGE = 64;

struct WorkerArgs {
    std::string inputPath;
    std::string outputPath;  // result artifact
    bool preferAccelerated = true;
    std::optional<int> batchSize;  // accelerator only; 16 when unset
};

using PipelineFactory = std::function<std::unique_ptr<pipeline::DiarizationPipeline>()>;

struct WorkerDependencies {
    std::shared_ptr<AcceleratorProbe> probe;
    PipelineFactory pipelineFactory;
    std::shared_ptr<Transcoder> transcoder;
    std::shared_ptr<DeviceCache> cache;
};

/**
 * @brief Body of the worker process: one job, one artifact.
 *
 * Init -> DeviceBound -> Converting -> Inferring -> Extracting -> Done, with
 * one CPU retry (MemoryFailure -> RetryingCpu) after a memory failure and
 * Failed on any other error. The converted audio is removed on every path.
 */
class WorkerEntry {
   public:
    explicit WorkerEntry(WorkerDependencies deps);

    // Run the job to a Success or Failure without touching the artifact
    std::variant<job::Success, job::Failure> execute(const WorkerArgs& args);

    // execute() and publish the artifact; returns the process exit code
    int run(const WorkerArgs& args);

    WorkerState state() const {
        return state_;
    }

    const std::vector<WorkerState>& history() const {
        return history_;
    }

    // Where the converted audio for an artifact path is written
    static std::string convertedPathFor(const std::string& outputPath);

   private:
    void transition(WorkerState next);
    job::Success extract(const pipeline::Annotation& annotation, const Device& device,
                         bool fallbackUsed, double processingTime);

    WorkerDependencies deps_;
    WorkerState state_ = WorkerState::Init;
    std::vector<WorkerState> history_;
};

}  // namespace worker
}  // namespace diarizer
