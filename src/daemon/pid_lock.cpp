#include "daemon/pid_lock.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace diarizer {
namespace daemon_core {

namespace {

bool writeOwnPid(int fd) {
    const std::string text = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) != 0 || lseek(fd, 0, SEEK_SET) != 0) {
        return false;
    }
    size_t offset = 0;
    while (offset < text.size()) {
        ssize_t n = write(fd, text.data() + offset, text.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return fsync(fd) == 0;
}

}  // namespace

int PidLock::readOwner(const std::string& path) {
    std::ifstream in(path);
    int pid = 0;
    if (!(in >> pid) || pid < 0) {
        return 0;
    }
    return pid;
}

std::optional<PidLock> PidLock::tryAcquire(const std::string& path) {
    const int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        LOG_ERROR("PID file {}: {}", path, strerror(errno));
        return std::nullopt;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        close(fd);
        if (err != EWOULDBLOCK) {
            LOG_ERROR("Cannot lock PID file {}: {}", path, strerror(err));
            return std::nullopt;
        }
        const int owner = readOwner(path);
        if (owner > 0) {
            LOG_ERROR("diarizerd is already running (PID: {}, lock {})", owner, path);
        } else {
            LOG_ERROR("diarizerd is already running (lock {})", path);
        }
        return std::nullopt;
    }

    if (!writeOwnPid(fd)) {
        LOG_WARN("Cannot record PID in {}: {}", path, strerror(errno));
    }
    LOG_DEBUG("Holding single-instance lock {}", path);
    return PidLock(path, fd);
}

PidLock::PidLock(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

PidLock::PidLock(PidLock&& other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)) {}

PidLock& PidLock::operator=(PidLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

PidLock::~PidLock() {
    release();
}

void PidLock::release() noexcept {
    const int fd = std::exchange(fd_, -1);
    if (fd < 0) {
        return;
    }
    // Unlink while still locked
    if (!path_.empty()) {
        unlink(path_.c_str());
    }
    flock(fd, LOCK_UN);
    close(fd);
}

}  // namespace daemon_core
}  // namespace diarizer
