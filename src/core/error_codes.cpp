#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace diarizer {

namespace {

struct ErrorCodeInfo {
    const char* name;
    int httpStatus;
};

const std::unordered_map<ErrorCode, ErrorCodeInfo>& errorTable() {
    static const std::unordered_map<ErrorCode, ErrorCodeInfo> table = {
        {ErrorCode::OK, {"OK", 200}},

        // Job execution
        {ErrorCode::JOB_WORKER_FAILED, {"JOB_WORKER_FAILED", 500}},
        {ErrorCode::JOB_TIMEOUT, {"JOB_TIMEOUT", 500}},
        {ErrorCode::JOB_WORKER_CRASHED, {"JOB_WORKER_CRASHED", 500}},
        {ErrorCode::JOB_TRANSCODE_FAILED, {"JOB_TRANSCODE_FAILED", 500}},
        {ErrorCode::JOB_BACKEND_UNAVAILABLE, {"JOB_BACKEND_UNAVAILABLE", 503}},
        {ErrorCode::JOB_SPAWN_FAILED, {"JOB_SPAWN_FAILED", 500}},

        // IPC/ZeroMQ
        {ErrorCode::IPC_INVALID_COMMAND, {"IPC_INVALID_COMMAND", 404}},
        {ErrorCode::IPC_INVALID_PARAMS, {"IPC_INVALID_PARAMS", 400}},
        {ErrorCode::IPC_PROTOCOL_ERROR, {"IPC_PROTOCOL_ERROR", 400}},
        {ErrorCode::IPC_TIMEOUT, {"IPC_TIMEOUT", 504}},

        // GPU/CUDA
        {ErrorCode::GPU_INIT_FAILED, {"GPU_INIT_FAILED", 500}},
        {ErrorCode::GPU_DEVICE_NOT_FOUND, {"GPU_DEVICE_NOT_FOUND", 500}},
        {ErrorCode::GPU_MEMORY_ERROR, {"GPU_MEMORY_ERROR", 500}},

        // Validation
        {ErrorCode::VALIDATION_MISSING_AUDIO, {"VALIDATION_MISSING_AUDIO", 400}},
        {ErrorCode::VALIDATION_EMPTY_FILENAME, {"VALIDATION_EMPTY_FILENAME", 400}},
        {ErrorCode::VALIDATION_UNSUPPORTED_EXTENSION, {"VALIDATION_UNSUPPORTED_EXTENSION", 400}},
        {ErrorCode::VALIDATION_INVALID_PARAMS, {"VALIDATION_INVALID_PARAMS", 400}},
        {ErrorCode::VALIDATION_FILE_NOT_FOUND, {"VALIDATION_FILE_NOT_FOUND", 404}},
        {ErrorCode::VALIDATION_FILE_TOO_LARGE, {"VALIDATION_FILE_TOO_LARGE", 413}},

        // Internal
        {ErrorCode::INTERNAL_UNKNOWN, {"INTERNAL_UNKNOWN", 500}},
    };
    return table;
}

}  // namespace

const char* errorCodeToString(ErrorCode code) {
    const auto& table = errorTable();
    auto it = table.find(code);
    if (it != table.end()) {
        return it->second.name;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isJobError(code)) {
        return "job";
    }
    if (isIpcError(code)) {
        return "ipc_zeromq";
    }
    if (isGpuError(code)) {
        return "gpu_cuda";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

int toHttpStatus(ErrorCode code) {
    const auto& table = errorTable();
    auto it = table.find(code);
    if (it != table.end()) {
        return it->second.httpStatus;
    }
    return 500;  // Default to Internal Server Error
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    for (const auto& entry : errorTable()) {
        if (str == entry.second.name) {
            return entry.first;
        }
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace diarizer
