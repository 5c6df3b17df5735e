#ifndef ERROR_CODES_H
#define ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace diarizer {

/**
 * @brief Error codes for the diarization service.
 *
 * Categories use upper 12 bits (0xF000 mask):
 * - 0x1xxx: Job execution (worker / supervisor)
 * - 0x3xxx: IPC/ZeroMQ
 * - 0x4xxx: GPU/CUDA
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Job execution (0x1000)
    JOB_WORKER_FAILED = 0x1001,
    JOB_TIMEOUT = 0x1002,
    JOB_WORKER_CRASHED = 0x1003,
    JOB_TRANSCODE_FAILED = 0x1004,
    JOB_BACKEND_UNAVAILABLE = 0x1005,
    JOB_SPAWN_FAILED = 0x1006,

    // IPC/ZeroMQ (0x3000)
    IPC_INVALID_COMMAND = 0x3001,
    IPC_INVALID_PARAMS = 0x3002,
    IPC_PROTOCOL_ERROR = 0x3003,
    IPC_TIMEOUT = 0x3004,

    // GPU/CUDA (0x4000)
    GPU_INIT_FAILED = 0x4001,
    GPU_DEVICE_NOT_FOUND = 0x4002,
    GPU_MEMORY_ERROR = 0x4003,

    // Validation (0x5000)
    VALIDATION_MISSING_AUDIO = 0x5001,
    VALIDATION_EMPTY_FILENAME = 0x5002,
    VALIDATION_UNSUPPORTED_EXTENSION = 0x5003,
    VALIDATION_INVALID_PARAMS = 0x5004,
    VALIDATION_FILE_NOT_FOUND = 0x5005,
    VALIDATION_FILE_TOO_LARGE = 0x5006,

    // Internal (0xF000) - Reserved for fallback
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "JOB_TIMEOUT"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "job"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to HTTP status code.
 * @return HTTP status code (e.g., 400, 404, 413, 500), or 500 for unknown codes
 */
int toHttpStatus(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x1002").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isJobError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isGpuError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if a request failing with this code may be resubmitted as-is.
 *
 * Timeouts and crashes depend on device contention at the time of the job;
 * validation errors never succeed on retry.
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::JOB_TIMEOUT || code == ErrorCode::JOB_WORKER_CRASHED ||
           code == ErrorCode::IPC_TIMEOUT;
}

// ============================================================
// Exception taxonomy
// ============================================================

/**
 * @brief Base class for errors carrying an ErrorCode.
 */
class DiarizerError : public std::runtime_error {
   public:
    DiarizerError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

// Bad input shape or parameters. Caller's fault, never retried.
class ValidationError : public DiarizerError {
   public:
    explicit ValidationError(const std::string& message,
                             ErrorCode code = ErrorCode::VALIDATION_INVALID_PARAMS)
        : DiarizerError(code, message) {}
};

// Accelerator resource exhaustion. Recoverable by one CPU retry.
class MemoryError : public DiarizerError {
   public:
    explicit MemoryError(const std::string& message)
        : DiarizerError(ErrorCode::GPU_MEMORY_ERROR, message) {}
};

// Any other failure during conversion or inference. Not retried.
class FatalWorkerError : public DiarizerError {
   public:
    explicit FatalWorkerError(const std::string& message,
                              ErrorCode code = ErrorCode::JOB_WORKER_FAILED)
        : DiarizerError(code, message) {}
};

// Non-zero exit of the external transcoder.
class TranscodeError : public FatalWorkerError {
   public:
    explicit TranscodeError(const std::string& message)
        : FatalWorkerError(message, ErrorCode::JOB_TRANSCODE_FAILED) {}
};

}  // namespace diarizer

#endif  // ERROR_CODES_H
