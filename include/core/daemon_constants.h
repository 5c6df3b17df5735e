#ifndef DAEMON_CONSTANTS_H
#define DAEMON_CONSTANTS_H

#include <cstddef>  // for size_t

// Common constants shared by the daemon, the worker and the supervisor

namespace DaemonConstants {

constexpr const char* VERSION = "1.0.0";

// Audio format expected by the segmentation model
constexpr int MODEL_SAMPLE_RATE = 16000;
constexpr int MODEL_CHANNELS = 1;

// Request defaults
constexpr bool DEFAULT_PREFER_ACCELERATED = true;
constexpr int DEFAULT_BATCH_SIZE = 16;  // Smaller than the model default to bound GPU memory
constexpr int DEFAULT_TIMEOUT_SECONDS = 600;

// Escalating shutdown of a worker that missed its deadline
constexpr int DEFAULT_TERMINATE_GRACE_MS = 5000;  // SIGTERM -> wait
constexpr int DEFAULT_KILL_GRACE_MS = 2000;       // SIGKILL -> wait

// Upload limits
constexpr size_t DEFAULT_MAX_UPLOAD_BYTES = static_cast<size_t>(500) * 1024 * 1024;  // 500 MB

// Executables
constexpr const char* DEFAULT_WORKER_EXECUTABLE = "diarizer_worker";
constexpr const char* DEFAULT_TRANSCODER = "ffmpeg";
constexpr const char* DEFAULT_MODEL_PATH = "models/segmentation.onnx";

// Result channel artifact naming
constexpr const char* ARTIFACT_PREFIX = "diarizer_result_";
constexpr const char* ARTIFACT_SUFFIX = ".json";
// 16 kHz mono copy of the input, written next to the artifact by the worker
constexpr const char* CONVERTED_AUDIO_SUFFIX = ".16k.wav";

// ZeroMQ endpoints
constexpr const char* ZEROMQ_ENDPOINT = "tcp://0.0.0.0:5000";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";

}  // namespace DaemonConstants

#endif  // DAEMON_CONSTANTS_H
