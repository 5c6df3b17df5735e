#include "process/child_process.h"

#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <limits>
#include <memory>
#include <poll.h>
#include <spawn.h>
#include <stdexcept>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace diarizer {
namespace process {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);

int openPidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    int fd = static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
    if (fd < 0) {
        LOG_DEBUG("pidfd_open({}) failed: {}, falling back to polling", pid, std::strerror(errno));
    }
    return fd;
#else
    (void)pid;
    return -1;
#endif
}

ExitStatus decodeStatus(int status) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exited = true;
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signaled = true;
        result.signal = WTERMSIG(status);
    }
    return result;
}

// RAII holders for the posix_spawn attribute objects
struct SpawnAttr {
    posix_spawnattr_t attr;
    SpawnAttr() {
        posix_spawnattr_init(&attr);
    }
    ~SpawnAttr() {
        posix_spawnattr_destroy(&attr);
    }
};

}  // namespace

std::string ExitStatus::describe() const {
    if (exited) {
        return "exit code " + std::to_string(code);
    }
    if (signaled) {
        return std::string("signal ") + std::to_string(signal) + " (" + strsignal(signal) + ")";
    }
    return "unknown status";
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::vector<std::string>& args,
                                                  const SpawnOptions& options) {
    if (args.empty()) {
        throw std::invalid_argument("ChildProcess::spawn: empty argument list");
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    SpawnAttr spawnAttr;
    sigset_t defaults;
    sigset_t emptyMask;
    sigfillset(&defaults);
    sigemptyset(&emptyMask);
    posix_spawnattr_setsigdefault(&spawnAttr.attr, &defaults);
    posix_spawnattr_setsigmask(&spawnAttr.attr, &emptyMask);

    short flags = POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK;
    if (options.newProcessGroup) {
        flags |= POSIX_SPAWN_SETPGROUP;
        posix_spawnattr_setpgroup(&spawnAttr.attr, 0);
    }
    posix_spawnattr_setflags(&spawnAttr.attr, flags);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, args[0].c_str(), nullptr, &spawnAttr.attr, argv.data(), environ);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "posix_spawnp " + args[0]);
    }

    LOG_DEBUG("Spawned {} (pid {})", args[0], pid);
    return std::make_unique<ChildProcess>(PrivateTag{}, pid, openPidfd(pid),
                                          options.newProcessGroup);
}

ChildProcess::ChildProcess(PrivateTag, pid_t pid, int pidfd, bool ownGroup)
    : pid_(pid), pidfd_(pidfd), ownGroup_(ownGroup) {}

ChildProcess::~ChildProcess() {
    if (!status_) {
        LOG_WARN("Child {} still running at handle destruction, killing it", pid_);
        sendSignal(SIGKILL);
        tryReap(true);
    }
    closePidfd();
}

bool ChildProcess::tryReap(bool block) {
    if (status_) {
        return true;
    }
    int status = 0;
    pid_t ret;
    do {
        ret = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (ret < 0 && errno == EINTR);

    if (ret == pid_) {
        status_ = decodeStatus(status);
        if (ownGroup_) {
            // Descendants left in the group (e.g. a transcoder) do not outlive the child
            ::kill(-pid_, SIGKILL);
        }
        closePidfd();
        return true;
    }
    if (ret < 0) {
        // ECHILD: reaped elsewhere, the status is lost
        LOG_WARN("waitpid({}) failed: {}", pid_, std::strerror(errno));
        status_ = ExitStatus{};
        closePidfd();
        return true;
    }
    return false;
}

void ChildProcess::closePidfd() {
    if (pidfd_ >= 0) {
        ::close(pidfd_);
        pidfd_ = -1;
    }
}

bool ChildProcess::running() {
    return !tryReap(false);
}

std::optional<ExitStatus> ChildProcess::waitFor(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!tryReap(false)) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }

        if (pidfd_ >= 0) {
            struct pollfd pfd;
            pfd.fd = pidfd_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            // +1 so rounding never wakes us just before the deadline
            const auto timeoutMs = std::min<std::chrono::milliseconds::rep>(
                remaining.count(), std::numeric_limits<int>::max() - 1);
            int rc = ::poll(&pfd, 1, static_cast<int>(timeoutMs) + 1);
            if (rc < 0 && errno != EINTR) {
                LOG_WARN("poll on pidfd {} failed: {}", pidfd_, std::strerror(errno));
                closePidfd();
            }
        } else {
            std::this_thread::sleep_for(std::min(remaining, POLL_INTERVAL));
        }
    }
    return status_;
}

ExitStatus ChildProcess::wait() {
    tryReap(true);
    return *status_;
}

bool ChildProcess::sendSignal(int sig) {
    if (status_) {
        return false;
    }
    if (ownGroup_ && ::kill(-pid_, sig) == 0) {
        return true;
    }
    if (::kill(pid_, sig) != 0) {
        LOG_WARN("kill({}, {}) failed: {}", pid_, sig, std::strerror(errno));
        return false;
    }
    return true;
}

ExitStatus runToCompletion(const std::vector<std::string>& args) {
    SpawnOptions options;
    options.newProcessGroup = false;
    auto child = ChildProcess::spawn(args, options);
    return child->wait();
}

}  // namespace process
}  // namespace diarizer
