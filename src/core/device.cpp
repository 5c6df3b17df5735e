#include "core/device.h"

namespace diarizer {

std::string Device::name() const {
    if (kind == DeviceKind::Cuda) {
        return "cuda:" + std::to_string(index);
    }
    return "cpu";
}

}  // namespace diarizer
