#include "job/process_supervisor.h"

#include "core/error_codes.h"
#include "job/result_channel.h"
#include "logging/logger.h"
#include "process/child_process.h"

#include <csignal>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace diarizer {
namespace job {

ProcessSupervisor::ProcessSupervisor(SupervisorConfig config) : config_(std::move(config)) {
    if (config_.workerCommand.empty()) {
        throw std::invalid_argument("ProcessSupervisor: worker command is empty");
    }
}

std::vector<std::string> ProcessSupervisor::buildWorkerArgs(const JobRequest& request,
                                                            const std::string& artifactPath) const {
    std::vector<std::string> args = config_.workerCommand;
    args.insert(args.end(), {"--input", request.inputPath, "--output", artifactPath, "--device",
                             request.preferAccelerated ? "accelerated" : "cpu", "--batch-size",
                             std::to_string(request.batchSize)});
    return args;
}

std::chrono::milliseconds ProcessSupervisor::worstCaseDuration(
    std::chrono::milliseconds deadline) const {
    return deadline + config_.terminateGrace + config_.killGrace;
}

JobOutcome ProcessSupervisor::execute(const std::string& inputPath, bool preferAccelerated,
                                      int batchSize, std::chrono::milliseconds deadline) const {
    JobRequest request;
    request.inputPath = inputPath;
    request.preferAccelerated = preferAccelerated;
    request.batchSize = batchSize;
    request.deadline = deadline;
    return execute(request);
}

JobOutcome ProcessSupervisor::execute(const JobRequest& request) const {
    request.validate();

    ResultChannel channel(config_.artifactDir);

    std::unique_ptr<process::ChildProcess> child;
    try {
        child = process::ChildProcess::spawn(buildWorkerArgs(request, channel.path()));
    } catch (const std::system_error& e) {
        LOG_ERROR("Supervisor: failed to spawn worker: {}", e.what());
        return Failure{std::string("failed to start worker: ") + e.what()};
    }

    LOG_INFO("Supervisor: worker {} started for {} (device={}, batch={}, deadline={}ms)",
             child->pid(), request.inputPath, request.preferAccelerated ? "accelerated" : "cpu",
             request.batchSize, request.deadline.count());

    auto status = child->waitFor(request.deadline);
    if (!status) {
        LOG_WARN("Supervisor: worker {} exceeded deadline of {}ms, sending SIGTERM", child->pid(),
                 request.deadline.count());
        child->sendSignal(SIGTERM);
        status = child->waitFor(config_.terminateGrace);
        if (!status) {
            LOG_WARN("Supervisor: worker {} ignored SIGTERM for {}ms, sending SIGKILL",
                     child->pid(), config_.terminateGrace.count());
            child->sendSignal(SIGKILL);
            status = child->waitFor(config_.killGrace);
            if (!status) {
                // Unreapable (e.g. stuck in uninterruptible I/O); the handle kills and reaps it
                LOG_ERROR("Supervisor: worker {} still alive {}ms after SIGKILL", child->pid(),
                          config_.killGrace.count());
            }
        }
        channel.discard();
        return Timeout{};
    }

    if (!status->exited || status->code != 0) {
        LOG_WARN("Supervisor: worker {} finished with {}", child->pid(), status->describe());
    }

    auto outcome = channel.collect();
    if (!outcome) {
        CrashedOrUnknown crashed;
        if (status->exited) {
            crashed.exitCode = status->code;
        } else if (status->signaled) {
            crashed.exitCode = -status->signal;
        }
        LOG_ERROR("Supervisor: worker {} left no readable result ({})", child->pid(),
                  status->describe());
        return crashed;
    }

    LOG_INFO("Supervisor: worker {} outcome={}", child->pid(), outcomeName(*outcome));
    return *outcome;
}

}  // namespace job
}  // namespace diarizer
