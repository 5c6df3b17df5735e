#pragma once

#include "job/job_types.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace diarizer {
namespace job {

// ============================================================
// Artifact format (child -> parent handoff)
// ============================================================

nlohmann::json toArtifactJson(const Success& success);
nlohmann::json toArtifactJson(const Failure& failure);

/**
 * @brief Parse an artifact document.
 *
 * @return Success or Failure, or std::nullopt when the document does not have
 *         the artifact shape (missing/mistyped fields, total_segments mismatch,
 *         a segment ending before it starts).
 */
std::optional<JobOutcome> parseArtifact(const nlohmann::json& doc);

/**
 * @brief Atomically publish an artifact at path.
 *
 * Writes "<path>.tmp", fsyncs, closes and renames it over path, so a reader
 * never sees a partially written document. Throws std::system_error on I/O failure.
 */
void writeArtifact(const std::string& path, const nlohmann::json& doc);

/**
 * @brief Unique, not yet existing artifact path inside directory.
 */
std::string makeArtifactPath(const std::string& directory);

/**
 * @brief Parent side of the result channel for one supervisor invocation.
 *
 * Owns the artifact path: the file is read at most once and removed when
 * collected, discarded, or when the channel goes out of scope.
 */
class ResultChannel {
   public:
    explicit ResultChannel(const std::string& directory);
    ~ResultChannel();

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    const std::string& path() const {
        return path_;
    }

    // Read and remove the artifact. Later calls return std::nullopt without touching the disk.
    std::optional<JobOutcome> collect();

    // Remove the artifact, any partial temp file and the worker's converted audio. Idempotent.
    void discard();

   private:
    std::string path_;
    bool collected_ = false;
};

}  // namespace job
}  // namespace diarizer
