#pragma once

#include "core/daemon_constants.h"
#include "core/error_codes.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace diarizer {
namespace daemon_ipc {

struct ZmqRequest {
    std::string raw;
    std::optional<nlohmann::json> json;
    std::string command;
    std::string payload;  // text after "CMD:" for plain-text requests
    bool isJson = false;
    std::string parseError;

    // "params" object of a JSON request, or an empty object
    nlohmann::json params() const;
};

/**
 * @brief Request/reply command server with an event PUB socket.
 *
 * Clients talk REQ (or DEALER) to a ROUTER socket at endpoint; a proxy hands
 * requests to workerThreads REP threads, so up to workerThreads commands run
 * concurrently. Handlers must therefore be thread-safe. Commands are
 * registered before start().
 */
class ZmqCommandServer {
   public:
    using Handler = std::function<std::string(const ZmqRequest&)>;

    explicit ZmqCommandServer(std::string endpoint = DaemonConstants::ZEROMQ_ENDPOINT,
                              int workerThreads = 1, int recvTimeoutMs = 200);
    ~ZmqCommandServer();

    ZmqCommandServer(const ZmqCommandServer&) = delete;
    ZmqCommandServer& operator=(const ZmqCommandServer&) = delete;

    void registerCommand(const std::string& command, Handler handler);

    bool start();

    // Stops accepting requests and joins all threads; in-flight handlers finish first
    void stop();

    bool isRunning() const {
        return running_.load();
    }
    bool hasBindError() const {
        return bindFailed_.load();
    }

    bool publish(const std::string& message);

    const std::string& endpoint() const {
        return endpoint_;
    }
    const std::string& pubEndpoint() const {
        return pubEndpoint_;
    }
    int workerThreads() const {
        return workerThreads_;
    }

    // {"status":"error","success":false,"http_status":...,"error_code":...,"error":...}
    static nlohmann::json errorBody(ErrorCode code, const std::string& message);

    // Serializes a reply; invalid UTF-8 copied from a request becomes U+FFFD instead of throwing
    static std::string dumpResponse(const nlohmann::json& body);

    static std::string derivePubEndpoint(const std::string& endpoint);

   private:
    ZmqRequest buildRequest(const std::string& raw) const;
    std::string dispatchRequest(const ZmqRequest& request);
    std::string buildErrorResponse(const ZmqRequest& request, ErrorCode code,
                                   const std::string& message) const;
    void proxyLoop();
    void workerLoop(int index);
    void cleanupSockets();
    void cleanupIpcPath(const std::string& endpoint) const;

    std::string endpoint_;
    std::string pubEndpoint_;
    std::string backendEndpoint_;
    std::string controlEndpoint_;
    int workerThreads_;
    int recvTimeoutMs_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> frontend_;
    std::unique_ptr<zmq::socket_t> backend_;
    std::unique_ptr<zmq::socket_t> control_;
    std::unique_ptr<zmq::socket_t> pubSocket_;
    std::thread proxyThread_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> bindFailed_{false};
    std::map<std::string, Handler> handlers_;
    mutable std::mutex pubMutex_;
};

}  // namespace daemon_ipc
}  // namespace diarizer
