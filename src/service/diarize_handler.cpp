#include "service/diarize_handler.h"

#include "core/base64.h"
#include "core/daemon_constants.h"
#include "logging/logger.h"
#include "service/zmq_server.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace diarizer {
namespace daemon_ipc {
namespace {

constexpr const char* kUploadPrefix = "diarizer_upload_";
constexpr const char* kFallbackWarning =
    "Accelerator ran out of memory, processed on CPU instead";

std::string joinExtensions(const std::vector<std::string>& extensions) {
    std::string joined;
    for (const auto& ext : extensions) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += ext;
    }
    return joined;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Accepts a JSON bool or a "true"/"false"-style string (anything else reads as false)
bool readFlag(const nlohmann::json& params, const char* key, bool fallback) {
    if (!params.contains(key) || params[key].is_null()) {
        return fallback;
    }
    const auto& value = params[key];
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        return toLower(value.get<std::string>()) == "true";
    }
    throw ValidationError(std::string(key) + " must be a boolean");
}

// Accepts a JSON integer or a decimal string; must be > 0
int readPositiveInt(const nlohmann::json& params, const char* key, int fallback) {
    if (!params.contains(key) || params[key].is_null()) {
        return fallback;
    }
    const auto& value = params[key];
    long long parsed = 0;
    if (value.is_number_integer()) {
        parsed = value.get<long long>();
    } else if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text.empty() || text.size() > 9 ||
            !std::all_of(text.begin(), text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw ValidationError(std::string(key) + " must be a positive integer");
        }
        parsed = std::stoll(text);
    } else {
        throw ValidationError(std::string(key) + " must be a positive integer");
    }
    if (parsed <= 0 || parsed > 1000000000LL) {
        throw ValidationError(std::string(key) + " must be a positive integer");
    }
    return static_cast<int>(parsed);
}

std::string readString(const nlohmann::json& params, const char* key) {
    const auto& value = params[key];
    if (!value.is_string()) {
        throw ValidationError(std::string(key) + " must be a string");
    }
    return value.get<std::string>();
}

std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

nlohmann::json errorResponse(const DiarizerError& e, double requestTime) {
    auto body = ZmqCommandServer::errorBody(e.code(), e.what());
    body["request_time"] = requestTime;
    return body;
}

class UploadRemover {
   public:
    explicit UploadRemover(std::string path) : path_(std::move(path)) {}
    ~UploadRemover() {
        if (path_.empty()) {
            return;
        }
        std::error_code ec;
        if (std::filesystem::remove(path_, ec)) {
            LOG_DEBUG("Removed upload {}", path_);
        } else if (ec) {
            LOG_WARN("Cannot remove upload {}: {}", path_, ec.message());
        }
    }

    UploadRemover(const UploadRemover&) = delete;
    UploadRemover& operator=(const UploadRemover&) = delete;

   private:
    std::string path_;
};

}  // namespace

DiarizeHandler::DiarizeHandler(AppConfig config, daemon_core::HostCapabilities capabilities,
                               JobExecutor executor, EventPublisher publisher)
    : config_(std::move(config)),
      capabilities_(std::move(capabilities)),
      executor_(std::move(executor)),
      publisher_(std::move(publisher)) {
    if (!executor_) {
        throw std::invalid_argument("DiarizeHandler requires a job executor");
    }
}

DiarizeHandler::ParsedRequest DiarizeHandler::parseRequest(const nlohmann::json& params) const {
    ParsedRequest request;

    const bool hasAudio = params.contains("audio") && !params["audio"].is_null();
    const bool hasPath = params.contains("audio_path") && !params["audio_path"].is_null();
    if (!hasAudio && !hasPath) {
        throw ValidationError("No audio provided: send \"audio\" (base64) or \"audio_path\"",
                              ErrorCode::VALIDATION_MISSING_AUDIO);
    }
    if (hasAudio && hasPath) {
        throw ValidationError("Send either \"audio\" or \"audio_path\", not both");
    }

    if (hasPath) {
        request.audioPath = readString(params, "audio_path");
        if (request.audioPath.empty()) {
            throw ValidationError("audio_path is empty", ErrorCode::VALIDATION_MISSING_AUDIO);
        }
    }

    if (params.contains("filename") && !params["filename"].is_null()) {
        request.filename = readString(params, "filename");
    } else if (hasPath) {
        request.filename = std::filesystem::path(request.audioPath).filename().string();
    }
    if (request.filename.empty()) {
        throw ValidationError("Empty filename", ErrorCode::VALIDATION_EMPTY_FILENAME);
    }
    if (!isExtensionAllowed(config_, request.filename)) {
        throw ValidationError(
            "Unsupported file format. Allowed: " + joinExtensions(config_.allowedExtensions),
            ErrorCode::VALIDATION_UNSUPPORTED_EXTENSION);
    }

    request.preferAccelerated =
        params.contains("prefer_accelerated")
            ? readFlag(params, "prefer_accelerated", config_.defaults.preferAccelerated)
            : readFlag(params, "use_mps", config_.defaults.preferAccelerated);
    request.batchSize = readPositiveInt(params, "batch_size", config_.defaults.batchSize);
    request.timeoutSeconds = readPositiveInt(params, "timeout", config_.defaults.timeoutSeconds);

    const std::string tooLarge =
        "File too large. Maximum size: " + std::to_string(config_.maxUploadBytes) + " bytes";

    if (hasAudio) {
        const std::string encoded = readString(params, "audio");
        // Reject before decoding; the bound is exact for unwrapped, padded input
        if (encoded.find_first_of(" \t\r\n") == std::string::npos) {
            size_t padding = 0;
            while (padding < 2 && padding < encoded.size() &&
                   encoded[encoded.size() - 1 - padding] == '=') {
                ++padding;
            }
            const size_t decoded = Base64::decodedSizeUpperBound(encoded.size()) - 3 - padding;
            if (encoded.size() % 4 == 0 && decoded > config_.maxUploadBytes) {
                throw ValidationError(tooLarge, ErrorCode::VALIDATION_FILE_TOO_LARGE);
            }
        }
        if (!Base64::decode(encoded, request.audioBytes)) {
            throw ValidationError("audio is not valid base64");
        }
        if (request.audioBytes.empty()) {
            throw ValidationError("Uploaded audio is empty", ErrorCode::VALIDATION_MISSING_AUDIO);
        }
        if (request.audioBytes.size() > config_.maxUploadBytes) {
            throw ValidationError(tooLarge, ErrorCode::VALIDATION_FILE_TOO_LARGE);
        }
        request.inlineUpload = true;
    } else {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(request.audioPath, ec)) {
            throw ValidationError("Audio file not found: " + request.audioPath,
                                  ErrorCode::VALIDATION_FILE_NOT_FOUND);
        }
        auto size = std::filesystem::file_size(request.audioPath, ec);
        if (ec) {
            throw ValidationError("Cannot stat " + request.audioPath + ": " + ec.message(),
                                  ErrorCode::VALIDATION_FILE_NOT_FOUND);
        }
        if (size > config_.maxUploadBytes) {
            throw ValidationError(tooLarge, ErrorCode::VALIDATION_FILE_TOO_LARGE);
        }
    }

    return request;
}

std::string DiarizeHandler::persistUpload(const ParsedRequest& request) const {
    const std::string suffix = "." + fileExtension(request.filename);
    std::string pattern =
        (std::filesystem::path(config_.uploadDir) / (std::string(kUploadPrefix) + "XXXXXX"))
            .string() +
        suffix;

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    int fd = ::mkostemps(buffer.data(), static_cast<int>(suffix.size()), O_CLOEXEC);
    if (fd < 0) {
        throw DiarizerError(ErrorCode::INTERNAL_UNKNOWN,
                            "Cannot create upload file in " + config_.uploadDir + ": " +
                                std::strerror(errno));
    }
    std::string path(buffer.data());

    const uint8_t* data = request.audioBytes.data();
    size_t remaining = request.audioBytes.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ::close(fd);
            ::unlink(path.c_str());
            throw DiarizerError(ErrorCode::INTERNAL_UNKNOWN,
                                "Cannot write upload " + path + ": " + std::strerror(err));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(path.c_str());
        throw DiarizerError(ErrorCode::INTERNAL_UNKNOWN,
                            "Cannot close upload " + path + ": " + std::strerror(err));
    }
    return path;
}

nlohmann::json DiarizeHandler::outcomeToResponse(const job::JobOutcome& outcome) {
    if (const auto* success = std::get_if<job::Success>(&outcome)) {
        nlohmann::json segments = nlohmann::json::array();
        for (const auto& seg : success->segments) {
            segments.push_back({{"start", seg.start}, {"end", seg.end}, {"speaker", seg.speaker}});
        }
        nlohmann::json body = {{"status", "ok"},
                               {"success", true},
                               {"http_status", 200},
                               {"processing_time", success->processingTime},
                               {"speakers", success->speakers},
                               {"segments", segments},
                               {"total_segments", success->segments.size()},
                               {"device_used", success->deviceUsed},
                               {"fallback_cpu", success->fallbackUsed}};
        if (success->fallbackUsed) {
            body["warning"] = kFallbackWarning;
        }
        return body;
    }
    if (const auto* failure = std::get_if<job::Failure>(&outcome)) {
        return ZmqCommandServer::errorBody(ErrorCode::JOB_WORKER_FAILED, failure->reason);
    }
    if (std::holds_alternative<job::Timeout>(outcome)) {
        return ZmqCommandServer::errorBody(ErrorCode::JOB_TIMEOUT,
                                           "Diarization timed out and the worker was stopped");
    }
    const auto& crashed = std::get<job::CrashedOrUnknown>(outcome);
    std::string message = "Worker exited without a result";
    if (crashed.exitCode) {
        message += *crashed.exitCode < 0
                       ? " (killed by signal " + std::to_string(-*crashed.exitCode) + ")"
                       : " (exit code " + std::to_string(*crashed.exitCode) + ")";
    }
    return ZmqCommandServer::errorBody(ErrorCode::JOB_WORKER_CRASHED, message);
}

void DiarizeHandler::publishCompletion(const job::JobOutcome& outcome, double requestTime) const {
    if (!publisher_) {
        return;
    }
    nlohmann::json event = {{"event", "diarization.completed"},
                            {"outcome", job::outcomeName(outcome)},
                            {"request_time", requestTime},
                            {"timestamp", isoTimestamp()}};
    if (const auto* success = std::get_if<job::Success>(&outcome)) {
        event["device_used"] = success->deviceUsed;
    } else {
        event["device_used"] = nullptr;
    }
    publisher_(event);
}

nlohmann::json DiarizeHandler::handleDiarize(const nlohmann::json& params) const {
    const auto start = std::chrono::steady_clock::now();

    ParsedRequest parsed;
    try {
        parsed = parseRequest(params.is_object() ? params : nlohmann::json::object());
    } catch (const ValidationError& e) {
        LOG_WARN("DIARIZE rejected: {}", e.what());
        return errorResponse(e, secondsSince(start));
    }

    if (!capabilities_.backendAvailable) {
        return errorResponse(DiarizerError(ErrorCode::JOB_BACKEND_UNAVAILABLE,
                                           "Diarization backend is not available"),
                             secondsSince(start));
    }

    LOG_INFO("DIARIZE {}: accelerated={}, batch_size={}, timeout={}s", parsed.filename,
             parsed.preferAccelerated, parsed.batchSize, parsed.timeoutSeconds);

    std::string inputPath = parsed.audioPath;
    if (parsed.inlineUpload) {
        try {
            inputPath = persistUpload(parsed);
        } catch (const DiarizerError& e) {
            LOG_ERROR("{}", e.what());
            return errorResponse(e, secondsSince(start));
        }
        LOG_DEBUG("Upload saved to {} ({} bytes)", inputPath, parsed.audioBytes.size());
    }
    UploadRemover remover(parsed.inlineUpload ? inputPath : std::string());

    if (parsed.preferAccelerated && !capabilities_.acceleratorAvailable) {
        LOG_ONCE(WARN, "No accelerator on this host, accelerated requests run on CPU");
    }

    job::JobRequest request;
    request.inputPath = inputPath;
    request.preferAccelerated = parsed.preferAccelerated && capabilities_.acceleratorAvailable;
    request.batchSize = parsed.batchSize;
    request.deadline = std::chrono::seconds(parsed.timeoutSeconds);

    job::JobOutcome outcome = executor_(request);
    const double requestTime = secondsSince(start);

    nlohmann::json body = outcomeToResponse(outcome);
    body["request_time"] = requestTime;

    if (const auto* success = std::get_if<job::Success>(&outcome)) {
        LOG_INFO("DIARIZE {} done in {:.1f}s on {}: {} speaker(s), {} segment(s)",
                 parsed.filename, requestTime, success->deviceUsed, success->speakers.size(),
                 success->segments.size());
        if (success->fallbackUsed) {
            LOG_WARN("DIARIZE {} fell back to CPU after an accelerator memory failure",
                     parsed.filename);
        }
    } else {
        LOG_ERROR("DIARIZE {} failed ({}): {}", parsed.filename, job::outcomeName(outcome),
                  body.value("error", std::string()));
    }

    publishCompletion(outcome, requestTime);
    return body;
}

nlohmann::json DiarizeHandler::handleHealth() const {
    return {{"status", "ok"},
            {"timestamp", isoTimestamp()},
            {"workers", config_.workers},
            {"accelerator_available", capabilities_.acceleratorAvailable},
            {"accelerator_count", capabilities_.acceleratorCount},
            {"accelerator_name", capabilities_.acceleratorName},
            {"backend_available", capabilities_.backendAvailable},
            {"cpu_count", capabilities_.cpuCount},
            {"version", DaemonConstants::VERSION}};
}

nlohmann::json DiarizeHandler::handleInfo() const {
    return {{"status", "ok"},
            {"command", "DIARIZE"},
            {"endpoint", config_.endpoint},
            {"events", ZmqCommandServer::derivePubEndpoint(config_.endpoint)},
            {"required_fields",
             {{"audio", "base64 audio bytes (or audio_path: file readable by the daemon)"},
              {"filename", "original file name, extension must be allowed"}}},
            {"optional_fields",
             {{"use_mps",
               {{"default", config_.defaults.preferAccelerated},
                {"description", "use the accelerator when available (alias prefer_accelerated)"}}},
              {"batch_size",
               {{"default", config_.defaults.batchSize},
                {"description", "chunks per inference call on the accelerator"}}},
              {"timeout",
               {{"default", config_.defaults.timeoutSeconds},
                {"description", "seconds before the worker is stopped"}}}}},
            {"allowed_extensions", config_.allowedExtensions},
            {"max_upload_bytes", config_.maxUploadBytes},
            {"example", {{"cmd", "DIARIZE"},
                         {"params", {{"filename", "meeting.wav"}, {"audio", "<base64>"}}}}}};
}

void DiarizeHandler::registerWith(ZmqCommandServer& server) {
    if (!publisher_) {
        publisher_ = [&server](const nlohmann::json& event) {
            if (!server.publish(ZmqCommandServer::dumpResponse(event))) {
                LOG_DEBUG("Event not published: {}", event.value("event", std::string()));
            }
        };
    }
    server.registerCommand("DIARIZE", [this](const ZmqRequest& request) {
        return ZmqCommandServer::dumpResponse(handleDiarize(request.params()));
    });
    server.registerCommand("HEALTH", [this](const ZmqRequest&) {
        return ZmqCommandServer::dumpResponse(handleHealth());
    });
    server.registerCommand("INFO", [this](const ZmqRequest&) {
        return ZmqCommandServer::dumpResponse(handleInfo());
    });
}

}  // namespace daemon_ipc
}  // namespace diarizer
