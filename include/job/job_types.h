#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace diarizer {
namespace job {

/**
 * @brief One diarization job as handed to the supervisor.
 *
 * Immutable once validated; the supervisor only reads it.
 */
struct JobRequest {
    std::string inputPath;
    bool preferAccelerated = true;
    int batchSize = 16;
    std::chrono::milliseconds deadline{600000};

    // Throws ValidationError for an empty path, batchSize <= 0 or deadline <= 0
    void validate() const;
};

struct Segment {
    double start = 0.0;  // seconds
    double end = 0.0;    // seconds, >= start
    std::string speaker;
};

bool operator==(const Segment& a, const Segment& b);

// Job outcome variants. Exactly one is produced per job.
struct Success {
    std::vector<std::string> speakers;  // sorted, unique
    std::vector<Segment> segments;      // ordered by start
    std::string deviceUsed;
    bool fallbackUsed = false;
    double processingTime = 0.0;  // seconds
};

struct Failure {
    std::string reason;
};

struct Timeout {};

struct CrashedOrUnknown {
    std::optional<int> exitCode;
};

using JobOutcome = std::variant<Success, Failure, Timeout, CrashedOrUnknown>;

bool operator==(const Success& a, const Success& b);

// "success", "failure", "timeout" or "crashed"
const char* outcomeName(const JobOutcome& outcome);

/**
 * @brief Deduplicated, lexicographically sorted speaker labels of segments.
 */
std::vector<std::string> collectSpeakers(const std::vector<Segment>& segments);

}  // namespace job
}  // namespace diarizer
