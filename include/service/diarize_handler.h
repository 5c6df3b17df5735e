#pragma once

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "daemon/host_capabilities.h"
#include "job/job_types.h"

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace diarizer {
namespace daemon_ipc {

class ZmqCommandServer;

/**
 * @brief Request-handling layer of the DIARIZE/HEALTH/INFO commands.
 *
 * Validates the request, persists an inline upload to uploadDir, hands a
 * JobRequest to the executor (the process supervisor in production) and maps
 * the outcome to a response body. Stateless apart from configuration, so one
 * instance serves all command threads.
 */
class DiarizeHandler {
   public:
    using JobExecutor = std::function<job::JobOutcome(const job::JobRequest&)>;
    using EventPublisher = std::function<void(const nlohmann::json&)>;

    DiarizeHandler(AppConfig config, daemon_core::HostCapabilities capabilities,
                   JobExecutor executor, EventPublisher publisher = {});

    nlohmann::json handleDiarize(const nlohmann::json& params) const;
    nlohmann::json handleHealth() const;
    nlohmann::json handleInfo() const;

    // Registers DIARIZE, HEALTH and INFO; the server's publish() becomes the event sink
    void registerWith(ZmqCommandServer& server);

    // Body for a finished job; request_time is added by the caller
    static nlohmann::json outcomeToResponse(const job::JobOutcome& outcome);

    const AppConfig& config() const {
        return config_;
    }
    const daemon_core::HostCapabilities& capabilities() const {
        return capabilities_;
    }

   private:
    struct ParsedRequest {
        std::string filename;
        std::string audioPath;            // server-local file
        std::vector<uint8_t> audioBytes;  // inline upload
        bool inlineUpload = false;
        bool preferAccelerated = true;
        int batchSize = 16;
        int timeoutSeconds = 600;
    };

    ParsedRequest parseRequest(const nlohmann::json& params) const;
    std::string persistUpload(const ParsedRequest& request) const;
    void publishCompletion(const job::JobOutcome& outcome, double requestTime) const;

    AppConfig config_;
    daemon_core::HostCapabilities capabilities_;
    JobExecutor executor_;
    EventPublisher publisher_;
};

}  // namespace daemon_ipc
}  // namespace diarizer
