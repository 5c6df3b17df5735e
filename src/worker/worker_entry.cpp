#include "worker/worker_entry.h"

#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "job/result_channel.h"
#include "logging/logger.h"
#include "pipeline/powerset_decoder.h"

#include <chrono>
#include <filesystem>
#include <system_error>

namespace diarizer {
namespace worker {

namespace {

// Removes the converted audio when the job leaves scope, whatever the path
class ScopedFileRemover {
   public:
    explicit ScopedFileRemover(std::string path) : path_(std::move(path)) {}
    ~ScopedFileRemover() {
        std::error_code ec;
        if (std::filesystem::remove(path_, ec)) {
            LOG_DEBUG("Removed converted audio {}", path_);
        } else if (ec) {
            LOG_WARN("Failed to remove converted audio {}: {}", path_, ec.message());
        }
    }

    ScopedFileRemover(const ScopedFileRemover&) = delete;
    ScopedFileRemover& operator=(const ScopedFileRemover&) = delete;

   private:
    std::string path_;
};

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

const char* workerStateName(WorkerState state) {
    switch (state) {
    case WorkerState::Init:
        return "Init";
    case WorkerState::DeviceBound:
        return "DeviceBound";
    case WorkerState::Converting:
        return "Converting";
    case WorkerState::Inferring:
        return "Inferring";
    case WorkerState::MemoryFailure:
        return "MemoryFailure";
    case WorkerState::RetryingCpu:
        return "RetryingCpu";
    case WorkerState::Extracting:
        return "Extracting";
    case WorkerState::Done:
        return "Done";
    case WorkerState::Failed:
        return "Failed";
    }
    return "Unknown";
}

WorkerEntry::WorkerEntry(WorkerDependencies deps) : deps_(std::move(deps)) {
    history_.push_back(state_);
}

std::string WorkerEntry::convertedPathFor(const std::string& outputPath) {
    return outputPath + DaemonConstants::CONVERTED_AUDIO_SUFFIX;
}

void WorkerEntry::transition(WorkerState next) {
    LOG_DEBUG("Worker: {} -> {}", workerStateName(state_), workerStateName(next));
    state_ = next;
    history_.push_back(next);
}

job::Success WorkerEntry::extract(const pipeline::Annotation& annotation, const Device& device,
                                  bool fallbackUsed, double processingTime) {
    transition(WorkerState::Extracting);

    pipeline::Annotation ordered = annotation;
    pipeline::sortAnnotation(ordered);

    job::Success success;
    success.segments.reserve(ordered.size());
    for (const auto& turn : ordered) {
        success.segments.push_back(job::Segment{turn.start, turn.end, turn.label});
    }
    success.speakers = job::collectSpeakers(success.segments);
    success.deviceUsed = device.name();
    success.fallbackUsed = fallbackUsed;
    success.processingTime = processingTime;

    LOG_INFO("Worker: {} speaker(s), {} segment(s) on {} in {:.2f}s{}", success.speakers.size(),
             success.segments.size(), success.deviceUsed, processingTime,
             fallbackUsed ? " (cpu fallback)" : "");
    transition(WorkerState::Done);
    return success;
}

std::variant<job::Success, job::Failure> WorkerEntry::execute(const WorkerArgs& args) {
    const std::string convertedPath = convertedPathFor(args.outputPath);
    ScopedFileRemover removeConverted(convertedPath);

    std::unique_ptr<pipeline::DiarizationPipeline> pipeline;
    Device device = Device::cpu();
    try {
        DeviceSelector selector(deps_.probe);
        device = selector.select(args.preferAccelerated);

        if (!deps_.pipelineFactory) {
            throw FatalWorkerError("no pipeline factory configured",
                                   ErrorCode::JOB_BACKEND_UNAVAILABLE);
        }
        pipeline = deps_.pipelineFactory();
        pipeline->to(device);
        if (device.isAccelerator()) {
            pipeline->setBatchSize(args.batchSize.value_or(DaemonConstants::DEFAULT_BATCH_SIZE));
        }
        transition(WorkerState::DeviceBound);

        transition(WorkerState::Converting);
        if (!deps_.transcoder) {
            throw FatalWorkerError("no transcoder configured");
        }
        deps_.transcoder->convert(args.inputPath, convertedPath);
    } catch (const std::exception& e) {
        LOG_ERROR("Worker: {} failed: {}", workerStateName(state_), e.what());
        transition(WorkerState::Failed);
        return job::Failure{e.what()};
    }

    transition(WorkerState::Inferring);
    const auto started = std::chrono::steady_clock::now();
    ExecutionWrapper wrapper(deps_.cache);
    try {
        auto annotation = wrapper.run(*pipeline, convertedPath, device);
        return extract(annotation, device, false, secondsSince(started));
    } catch (const MemoryError& e) {
        transition(WorkerState::MemoryFailure);
        LOG_WARN("Worker: memory failure on {} ({}), retrying once on cpu", device.name(),
                 e.what());
    } catch (const std::exception& e) {
        transition(WorkerState::Failed);
        return job::Failure{e.what()};
    }

    transition(WorkerState::RetryingCpu);
    try {
        const Device cpu = Device::cpu();
        pipeline->to(cpu);
        auto annotation = pipeline->run(convertedPath);
        return extract(annotation, cpu, true, secondsSince(started));
    } catch (const std::exception& e) {
        LOG_ERROR("Worker: cpu fallback failed: {}", e.what());
        transition(WorkerState::Failed);
        return job::Failure{std::string("cpu fallback failed: ") + e.what()};
    }
}

int WorkerEntry::run(const WorkerArgs& args) {
    LOG_INFO("Worker: job {} -> {} (accelerated={}, batch={})", args.inputPath, args.outputPath,
             args.preferAccelerated,
             args.batchSize ? std::to_string(*args.batchSize) : std::string("default"));

    auto result = execute(args);
    const bool succeeded = std::holds_alternative<job::Success>(result);

    try {
        if (succeeded) {
            job::writeArtifact(args.outputPath, job::toArtifactJson(std::get<job::Success>(result)));
        } else {
            job::writeArtifact(args.outputPath, job::toArtifactJson(std::get<job::Failure>(result)));
        }
    } catch (const std::system_error& e) {
        LOG_CRITICAL("Worker: cannot write result artifact {}: {}", args.outputPath, e.what());
        return EXIT_ARTIFACT_WRITE_FAILED;
    }

    return succeeded ? EXIT_JOB_SUCCEEDED : EXIT_JOB_FAILED;
}

}  // namespace worker
}  // namespace diarizer
