#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <filesystem>
#include <string>
#include <vector>

namespace diarizer {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct AppConfig {
    std::string endpoint = DaemonConstants::ZEROMQ_ENDPOINT;
    int workers = 0;  // 0 = hardware concurrency
    std::string workerExecutable = DaemonConstants::DEFAULT_WORKER_EXECUTABLE;
    std::string transcoder = DaemonConstants::DEFAULT_TRANSCODER;
    std::string artifactDir = "";  // Empty = system temp dir
    std::string uploadDir = "";    // Empty = system temp dir
    std::string modelPath = DaemonConstants::DEFAULT_MODEL_PATH;
    int intraOpThreads = 0;  // 0 = ONNX Runtime default
    size_t maxUploadBytes = DaemonConstants::DEFAULT_MAX_UPLOAD_BYTES;
    std::vector<std::string> allowedExtensions = {"wav", "mp3", "m4a", "flac", "aac", "ogg"};

    // Per-request defaults when the caller omits a field
    struct RequestDefaults {
        bool preferAccelerated = DaemonConstants::DEFAULT_PREFER_ACCELERATED;
        int batchSize = DaemonConstants::DEFAULT_BATCH_SIZE;
        int timeoutSeconds = DaemonConstants::DEFAULT_TIMEOUT_SECONDS;
    } defaults;

    struct SupervisorConfig {
        int terminateGraceMs = DaemonConstants::DEFAULT_TERMINATE_GRACE_MS;
        int killGraceMs = DaemonConstants::DEFAULT_KILL_GRACE_MS;
    } supervisor;

    std::string pidFile = "";  // Empty = no single-instance lock

    logging::LogConfig logging;
};

// Load configuration from JSON file.
// Missing keys keep defaults; invalid values are replaced by defaults with a warning.
// Returns false if the file is missing or not valid JSON (outConfig holds defaults).
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

// Resolve empty directory settings to the system temp dir and workers == 0 to the CPU count
void resolveRuntimeDefaults(AppConfig& config, unsigned int cpuCount);

// Lower-cased extension without the dot ("a/b.WAV" -> "wav"), empty if none
std::string fileExtension(const std::string& filename);

bool isExtensionAllowed(const AppConfig& config, const std::string& filename);

}  // namespace diarizer

#endif  // CONFIG_LOADER_H
