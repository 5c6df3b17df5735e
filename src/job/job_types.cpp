#include "job/job_types.h"

#include "core/error_codes.h"

#include <algorithm>
#include <set>

namespace diarizer {
namespace job {

void JobRequest::validate() const {
    if (inputPath.empty()) {
        throw ValidationError("input path is empty", ErrorCode::VALIDATION_MISSING_AUDIO);
    }
    if (batchSize <= 0) {
        throw ValidationError("batch size must be a positive integer, got " +
                              std::to_string(batchSize));
    }
    if (deadline.count() <= 0) {
        throw ValidationError("deadline must be positive, got " +
                              std::to_string(deadline.count()) + "ms");
    }
}

bool operator==(const Segment& a, const Segment& b) {
    return a.start == b.start && a.end == b.end && a.speaker == b.speaker;
}

bool operator==(const Success& a, const Success& b) {
    return a.speakers == b.speakers && a.segments == b.segments && a.deviceUsed == b.deviceUsed &&
           a.fallbackUsed == b.fallbackUsed && a.processingTime == b.processingTime;
}

namespace {

struct OutcomeNameVisitor {
    const char* operator()(const Success&) const {
        return "success";
    }
    const char* operator()(const Failure&) const {
        return "failure";
    }
    const char* operator()(const Timeout&) const {
        return "timeout";
    }
    const char* operator()(const CrashedOrUnknown&) const {
        return "crashed";
    }
};

}  // namespace

const char* outcomeName(const JobOutcome& outcome) {
    return std::visit(OutcomeNameVisitor{}, outcome);
}

std::vector<std::string> collectSpeakers(const std::vector<Segment>& segments) {
    std::set<std::string> unique;
    for (const auto& segment : segments) {
        unique.insert(segment.speaker);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

}  // namespace job
}  // namespace diarizer
