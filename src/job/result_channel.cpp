#include "job/result_channel.h"

#include "core/daemon_constants.h"
#include "logging/logger.h"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace diarizer {
namespace job {

namespace {

constexpr const char* kTempSuffix = ".tmp";

std::string tempPathFor(const std::string& path) {
    return path + kTempSuffix;
}

void removeQuietly(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        LOG_WARN("ResultChannel: failed to remove {}: {}", path, ec.message());
    }
}

std::optional<Segment> parseSegment(const nlohmann::json& item) {
    if (!item.is_object() || !item.contains("start") || !item.contains("end") ||
        !item.contains("speaker")) {
        return std::nullopt;
    }
    if (!item["start"].is_number() || !item["end"].is_number() || !item["speaker"].is_string()) {
        return std::nullopt;
    }
    Segment segment;
    segment.start = item["start"].get<double>();
    segment.end = item["end"].get<double>();
    segment.speaker = item["speaker"].get<std::string>();
    if (segment.end < segment.start) {
        return std::nullopt;
    }
    return segment;
}

}  // namespace

nlohmann::json toArtifactJson(const Success& success) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& segment : success.segments) {
        segments.push_back(
            {{"start", segment.start}, {"end", segment.end}, {"speaker", segment.speaker}});
    }

    nlohmann::json doc;
    doc["success"] = true;
    doc["speakers"] = success.speakers;
    doc["segments"] = segments;
    doc["total_segments"] = success.segments.size();
    doc["device_used"] = success.deviceUsed;
    doc["processing_time"] = success.processingTime;
    if (success.fallbackUsed) {
        doc["fallback_cpu"] = true;
    }
    return doc;
}

nlohmann::json toArtifactJson(const Failure& failure) {
    return {{"success", false}, {"error", failure.reason}};
}

std::optional<JobOutcome> parseArtifact(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("success") || !doc["success"].is_boolean()) {
        return std::nullopt;
    }

    if (!doc["success"].get<bool>()) {
        Failure failure;
        if (doc.contains("error") && doc["error"].is_string()) {
            failure.reason = doc["error"].get<std::string>();
        } else {
            failure.reason = "worker reported failure without a reason";
        }
        return JobOutcome{failure};
    }

    if (!doc.contains("speakers") || !doc["speakers"].is_array() || !doc.contains("segments") ||
        !doc["segments"].is_array() || !doc.contains("device_used") ||
        !doc["device_used"].is_string() || !doc.contains("processing_time") ||
        !doc["processing_time"].is_number()) {
        return std::nullopt;
    }

    Success success;
    for (const auto& speaker : doc["speakers"]) {
        if (!speaker.is_string()) {
            return std::nullopt;
        }
        success.speakers.push_back(speaker.get<std::string>());
    }
    for (const auto& item : doc["segments"]) {
        auto segment = parseSegment(item);
        if (!segment) {
            return std::nullopt;
        }
        success.segments.push_back(*segment);
    }
    if (doc.contains("total_segments")) {
        const auto& total = doc["total_segments"];
        if (!total.is_number_integer() ||
            total.get<long long>() != static_cast<long long>(success.segments.size())) {
            return std::nullopt;
        }
    }
    success.deviceUsed = doc["device_used"].get<std::string>();
    success.processingTime = doc["processing_time"].get<double>();
    if (doc.contains("fallback_cpu")) {
        if (!doc["fallback_cpu"].is_boolean()) {
            return std::nullopt;
        }
        success.fallbackUsed = doc["fallback_cpu"].get<bool>();
    }
    return JobOutcome{success};
}

void writeArtifact(const std::string& path, const nlohmann::json& doc) {
    const std::string tempPath = tempPathFor(path);
    const std::string body = doc.dump(2);

    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + tempPath);
    }

    size_t written = 0;
    while (written < body.size()) {
        ssize_t rc = ::write(fd, body.data() + written, body.size() - written);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ::close(fd);
            ::unlink(tempPath.c_str());
            throw std::system_error(err, std::generic_category(), "write " + tempPath);
        }
        written += static_cast<size_t>(rc);
    }

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        ::unlink(tempPath.c_str());
        throw std::system_error(err, std::generic_category(), "fsync " + tempPath);
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tempPath.c_str());
        throw std::system_error(err, std::generic_category(), "close " + tempPath);
    }
    if (::rename(tempPath.c_str(), path.c_str()) != 0) {
        int err = errno;
        ::unlink(tempPath.c_str());
        throw std::system_error(err, std::generic_category(), "rename " + tempPath);
    }
}

std::string makeArtifactPath(const std::string& directory) {
    thread_local std::mt19937_64 rng{std::random_device{}() ^
                                     (static_cast<uint64_t>(::getpid()) << 32)};

    const std::filesystem::path dir(directory);
    for (;;) {
        std::ostringstream name;
        name << DaemonConstants::ARTIFACT_PREFIX << ::getpid() << '_' << std::hex
             << std::setfill('0') << std::setw(16) << rng() << DaemonConstants::ARTIFACT_SUFFIX;
        const auto candidate = dir / name.str();
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate.string();
        }
    }
}

ResultChannel::ResultChannel(const std::string& directory)
    : path_(makeArtifactPath(directory)) {}

ResultChannel::~ResultChannel() {
    discard();
}

std::optional<JobOutcome> ResultChannel::collect() {
    if (collected_) {
        return std::nullopt;
    }
    collected_ = true;

    std::ifstream file(path_);
    if (!file.is_open()) {
        LOG_DEBUG("ResultChannel: no artifact at {}", path_);
        discard();
        return std::nullopt;
    }

    std::optional<JobOutcome> outcome;
    try {
        nlohmann::json doc;
        file >> doc;
        outcome = parseArtifact(doc);
        if (!outcome) {
            LOG_WARN("ResultChannel: artifact {} does not have the expected shape", path_);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("ResultChannel: malformed artifact {}: {}", path_, e.what());
    }
    file.close();

    discard();
    return outcome;
}

void ResultChannel::discard() {
    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
        removeQuietly(path_);
    }
    const std::string tempPath = tempPathFor(path_);
    if (std::filesystem::exists(tempPath, ec)) {
        removeQuietly(tempPath);
    }
    // A killed worker never reaches its own cleanup
    const std::string convertedPath = path_ + DaemonConstants::CONVERTED_AUDIO_SUFFIX;
    if (std::filesystem::exists(convertedPath, ec)) {
        removeQuietly(convertedPath);
    }
}

}  // namespace job
}  // namespace diarizer
