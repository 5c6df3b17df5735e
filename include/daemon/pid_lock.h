#pragma once

#include <optional>
#include <string>

namespace diarizer {
namespace daemon_core {

/**
 * @brief Single-instance lock: an flock()ed file holding the daemon's PID.
 *
 * Released (and the file removed) on destruction.
 */
class PidLock {
   public:
    static std::optional<PidLock> tryAcquire(const std::string& path);

    // PID written in an existing lock file, 0 if unreadable
    static int readOwner(const std::string& path);

    PidLock(const PidLock&) = delete;
    PidLock& operator=(const PidLock&) = delete;

    PidLock(PidLock&& other) noexcept;
    PidLock& operator=(PidLock&& other) noexcept;

    ~PidLock();

    const std::string& path() const {
        return path_;
    }

   private:
    PidLock(std::string path, int fd);

    void release() noexcept;

    std::string path_;
    int fd_ = -1;
};

}  // namespace daemon_core
}  // namespace diarizer
