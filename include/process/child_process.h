#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace diarizer {
namespace process {

struct ExitStatus {
    bool exited = false;    // normal exit, code is valid
    int code = -1;
    bool signaled = false;  // terminated by signal
    int signal = 0;

    std::string describe() const;
};

struct SpawnOptions {
    // Put the child in its own process group so signals reach its descendants
    // (e.g. a transcoder it launched) as well.
    bool newProcessGroup = true;
};

/**
 * @brief RAII handle for one spawned child process.
 *
 * The child is started with posix_spawnp, default signal dispositions and an
 * empty signal mask. Waiting blocks on a pidfd when the kernel provides one
 * and falls back to WNOHANG polling otherwise. A child still running when
 * the handle is destroyed is killed and reaped, so no handle outlives its
 * process.
 */
class ChildProcess {
    // Only spawn() can name this, so only spawn() can construct
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

   public:
    /**
     * @brief Spawn args[0] (PATH lookup) with args as argv.
     * @throws std::system_error if the process cannot be started
     * @throws std::invalid_argument if args is empty
     */
    static std::unique_ptr<ChildProcess> spawn(const std::vector<std::string>& args,
                                               const SpawnOptions& options = SpawnOptions{});

    ChildProcess(PrivateTag, pid_t pid, int pidfd, bool ownGroup);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const {
        return pid_;
    }

    // Non-blocking check; reaps the child if it has exited
    bool running();

    /**
     * @brief Wait up to timeout for the child to exit.
     * @return Exit status, or std::nullopt if still running after timeout
     */
    std::optional<ExitStatus> waitFor(std::chrono::milliseconds timeout);

    // Wait without bound
    ExitStatus wait();

    /**
     * @brief Send sig to the child (and its group when spawned with one).
     * @return false if the child is already reaped or kill() failed
     */
    bool sendSignal(int sig);

    const std::optional<ExitStatus>& exitStatus() const {
        return status_;
    }

   private:
    bool tryReap(bool block);
    void closePidfd();

    pid_t pid_;
    int pidfd_;
    bool ownGroup_;
    std::optional<ExitStatus> status_;
};

/**
 * @brief Run a command to completion and return its status.
 * @throws std::system_error if the process cannot be started
 */
ExitStatus runToCompletion(const std::vector<std::string>& args);

}  // namespace process
}  // namespace diarizer
