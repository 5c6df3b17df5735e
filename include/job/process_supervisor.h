#pragma once

#include "job/job_types.h"

#include <chrono>
#include <string>
#include <vector>

namespace diarizer {
namespace job {

struct SupervisorConfig {
    // argv prefix of the worker; --input/--output/--device/--batch-size are appended
    std::vector<std::string> workerCommand = {"diarizer_worker"};
    std::string artifactDir = "/tmp";
    std::chrono::milliseconds terminateGrace{5000};  // wait after SIGTERM
    std::chrono::milliseconds killGrace{2000};       // wait after SIGKILL
};

/**
 * @brief Runs one diarization job in a disposable worker process.
 *
 * execute() spawns the worker, blocks until it exits or the deadline passes,
 * escalates SIGTERM -> SIGKILL on timeout, and maps the result artifact to a
 * JobOutcome. The artifact is removed on every path. Invocations share no
 * state, so one supervisor may be used from many threads at once.
 */
class ProcessSupervisor {
   public:
    explicit ProcessSupervisor(SupervisorConfig config);

    /**
     * @throws ValidationError if the request is invalid (nothing is spawned)
     */
    JobOutcome execute(const JobRequest& request) const;

    JobOutcome execute(const std::string& inputPath, bool preferAccelerated, int batchSize,
                       std::chrono::milliseconds deadline) const;

    // Upper bound of the time execute() may block for the given deadline
    std::chrono::milliseconds worstCaseDuration(std::chrono::milliseconds deadline) const;

    const SupervisorConfig& config() const {
        return config_;
    }

   private:
    std::vector<std::string> buildWorkerArgs(const JobRequest& request,
                                             const std::string& artifactPath) const;

    SupervisorConfig config_;
};

}  // namespace job
}  // namespace diarizer
