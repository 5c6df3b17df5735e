#pragma once

#include <string>

namespace diarizer {

enum class DeviceKind { Cpu, Cuda };

/**
 * @brief Compute device a job targets. Chosen once per job.
 */
struct Device {
    DeviceKind kind = DeviceKind::Cpu;
    int index = 0;

    static Device cpu() {
        return Device{};
    }
    static Device cuda(int index = 0) {
        return Device{DeviceKind::Cuda, index};
    }

    bool isAccelerator() const {
        return kind != DeviceKind::Cpu;
    }

    // "cpu" or "cuda:<index>"
    std::string name() const;
};

inline bool operator==(const Device& a, const Device& b) {
    return a.kind == b.kind && (a.kind == DeviceKind::Cpu || a.index == b.index);
}

inline bool operator!=(const Device& a, const Device& b) {
    return !(a == b);
}

}  // namespace diarizer
