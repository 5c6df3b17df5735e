#pragma once

#include <string>
#include <vector>

namespace diarizer {
namespace worker {

class Transcoder {
   public:
    virtual ~Transcoder() = default;

    /**
     * @brief Convert input to a 16 kHz mono WAV at output (overwriting it).
     * @throws TranscodeError when the converter cannot be started or exits non-zero
     */
    virtual void convert(const std::string& input, const std::string& output) = 0;
};

/**
 * @brief Runs ffmpeg as a black box and judges it by exit code only.
 */
class FfmpegTranscoder final : public Transcoder {
   public:
    explicit FfmpegTranscoder(std::string executable = "ffmpeg");

    void convert(const std::string& input, const std::string& output) override;

    std::vector<std::string> buildCommand(const std::string& input,
                                          const std::string& output) const;

   private:
    std::string executable_;
};

}  // namespace worker
}  // namespace diarizer
