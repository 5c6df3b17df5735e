#include "worker/transcoder.h"

#include "core/daemon_constants.h"
#include "core/error_codes.h"
#include "logging/logger.h"
#include "process/child_process.h"

#include <system_error>

namespace diarizer {
namespace worker {

FfmpegTranscoder::FfmpegTranscoder(std::string executable) : executable_(std::move(executable)) {}

std::vector<std::string> FfmpegTranscoder::buildCommand(const std::string& input,
                                                        const std::string& output) const {
    return {executable_,
            "-nostdin",
            "-hide_banner",
            "-loglevel",
            "error",
            "-i",
            input,
            "-ar",
            std::to_string(DaemonConstants::MODEL_SAMPLE_RATE),
            "-ac",
            std::to_string(DaemonConstants::MODEL_CHANNELS),
            "-f",
            "wav",
            "-y",
            output};
}

void FfmpegTranscoder::convert(const std::string& input, const std::string& output) {
    process::ExitStatus status;
    try {
        status = process::runToCompletion(buildCommand(input, output));
    } catch (const std::system_error& e) {
        throw TranscodeError(std::string("failed to start ") + executable_ + ": " + e.what());
    }

    if (!status.exited || status.code != 0) {
        throw TranscodeError(executable_ + " failed on " + input + " (" + status.describe() + ")");
    }
    LOG_DEBUG("Transcoded {} -> {}", input, output);
}

}  // namespace worker
}  // namespace diarizer
