#include "service/zmq_server.h"

#include "logging/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <exception>
#include <sstream>
#include <unistd.h>
#include <zmq.hpp>

namespace diarizer {
namespace daemon_ipc {
namespace {

constexpr const char* kJsonErrorStatus = "error";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string makeInprocName(const char* role) {
    static std::atomic<int> counter{0};
    std::ostringstream oss;
    oss << "inproc://diarizer-" << role << "-" << ::getpid() << "-" << counter++;
    return oss.str();
}

}  // namespace

nlohmann::json ZmqRequest::params() const {
    if (json && json->is_object() && json->contains("params") && (*json)["params"].is_object()) {
        return (*json)["params"];
    }
    return nlohmann::json::object();
}

ZmqCommandServer::ZmqCommandServer(std::string endpoint, int workerThreads, int recvTimeoutMs)
    : endpoint_(std::move(endpoint)),
      pubEndpoint_(derivePubEndpoint(endpoint_)),
      backendEndpoint_(makeInprocName("workers")),
      controlEndpoint_(makeInprocName("control")),
      workerThreads_(std::max(1, workerThreads)),
      recvTimeoutMs_(recvTimeoutMs) {}

ZmqCommandServer::~ZmqCommandServer() {
    stop();
}

void ZmqCommandServer::registerCommand(const std::string& command, Handler handler) {
    handlers_[command] = std::move(handler);
}

bool ZmqCommandServer::start() {
    if (running_.load()) {
        return true;
    }

    try {
        context_ = std::make_unique<zmq::context_t>(1);

        frontend_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::router);
        frontend_->set(zmq::sockopt::linger, 0);
        cleanupIpcPath(endpoint_);
        frontend_->bind(endpoint_);

        backend_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::dealer);
        backend_->set(zmq::sockopt::linger, 0);
        backend_->bind(backendEndpoint_);

        control_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pair);
        control_->bind(controlEndpoint_);

        pubSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
        pubSocket_->set(zmq::sockopt::linger, 0);
        cleanupIpcPath(pubEndpoint_);
        pubSocket_->bind(pubEndpoint_);
    } catch (const zmq::error_t& e) {
        LOG_ERROR("ZeroMQ: Fatal error - {}", e.what());
        bindFailed_.store(true);
        cleanupSockets();
        return false;
    }

    running_.store(true);
    bindFailed_.store(false);
    proxyThread_ = std::thread(&ZmqCommandServer::proxyLoop, this);
    for (int i = 0; i < workerThreads_; ++i) {
        workers_.emplace_back(&ZmqCommandServer::workerLoop, this, i);
    }

    LOG_INFO("ZeroMQ: Listening on {} ({} handler threads)", endpoint_, workerThreads_);
    LOG_INFO("ZeroMQ: PUB socket on {}", pubEndpoint_);
    return true;
}

void ZmqCommandServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    try {
        zmq::socket_t terminate(*context_, zmq::socket_type::pair);
        terminate.connect(controlEndpoint_);
        terminate.send(zmq::str_buffer("TERMINATE"), zmq::send_flags::none);
    } catch (const zmq::error_t& e) {
        LOG_WARN("ZeroMQ: failed to signal proxy termination: {}", e.what());
    }

    if (proxyThread_.joinable()) {
        proxyThread_.join();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    cleanupSockets();
    cleanupIpcPath(endpoint_);
    cleanupIpcPath(pubEndpoint_);
    LOG_INFO("ZeroMQ: server on {} stopped", endpoint_);
}

bool ZmqCommandServer::publish(const std::string& message) {
    std::lock_guard<std::mutex> lock(pubMutex_);
    if (!pubSocket_) {
        return false;
    }

    try {
        pubSocket_->send(zmq::buffer(message), zmq::send_flags::dontwait);
        return true;
    } catch (const zmq::error_t& e) {
        LOG_WARN("ZeroMQ: PUB send failed: {}", e.what());
        return false;
    }
}

ZmqRequest ZmqCommandServer::buildRequest(const std::string& raw) const {
    ZmqRequest request;
    request.raw = raw;

    if (raw.empty()) {
        return request;
    }

    if (raw.front() == '{') {
        request.isJson = true;
        try {
            request.json = nlohmann::json::parse(raw);
            if (request.json->contains("cmd") && (*request.json)["cmd"].is_string()) {
                request.command = (*request.json)["cmd"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            request.parseError = e.what();
        }
        return request;
    }

    auto colonPos = raw.find(':');
    if (colonPos != std::string::npos) {
        request.command = raw.substr(0, colonPos);
        request.payload = raw.substr(colonPos + 1);
    } else {
        request.command = raw;
    }

    auto trimNull = [](std::string& value) {
        auto pos = value.find('\0');
        if (pos != std::string::npos) {
            value.erase(pos);
        }
    };
    trimNull(request.command);
    trimNull(request.payload);

    return request;
}

std::string ZmqCommandServer::dispatchRequest(const ZmqRequest& request) {
    if (!request.parseError.empty()) {
        return buildErrorResponse(request, ErrorCode::IPC_PROTOCOL_ERROR,
                                  "JSON parse error: " + request.parseError);
    }

    auto it = handlers_.find(request.command);
    if (it == handlers_.end()) {
        std::string name = request.command.empty() ? "<empty>" : request.command;
        return buildErrorResponse(request, ErrorCode::IPC_INVALID_COMMAND,
                                  "Unknown command: " + name);
    }

    try {
        return it->second(request);
    } catch (const DiarizerError& e) {
        return buildErrorResponse(request, e.code(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("ZeroMQ: handler for {} threw: {}", request.command, e.what());
        return buildErrorResponse(request, ErrorCode::INTERNAL_UNKNOWN,
                                  std::string("Handler exception: ") + e.what());
    }
}

std::string ZmqCommandServer::dumpResponse(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json ZmqCommandServer::errorBody(ErrorCode code, const std::string& message) {
    nlohmann::json resp;
    resp["status"] = kJsonErrorStatus;
    resp["success"] = false;
    resp["http_status"] = toHttpStatus(code);
    resp["error_code"] = errorCodeToString(code);
    resp["error"] = message;
    return resp;
}

std::string ZmqCommandServer::buildErrorResponse(const ZmqRequest& request, ErrorCode code,
                                                 const std::string& message) const {
    if (request.isJson) {
        return dumpResponse(errorBody(code, message));
    }
    return "ERR:" + message;
}

void ZmqCommandServer::proxyLoop() {
    try {
        zmq::proxy_steerable(*frontend_, *backend_, zmq::socket_ref(), *control_);
    } catch (const zmq::error_t& e) {
        if (running_.load()) {
            LOG_ERROR("ZeroMQ: proxy error - {}", e.what());
        }
    }
}

void ZmqCommandServer::workerLoop(int index) {
    zmq::socket_t socket(*context_, zmq::socket_type::rep);
    socket.set(zmq::sockopt::rcvtimeo, recvTimeoutMs_);
    socket.set(zmq::sockopt::linger, 0);
    socket.connect(backendEndpoint_);
    LOG_DEBUG("ZeroMQ: handler thread {} ready", index);

    while (running_.load()) {
        try {
            zmq::message_t request;
            auto recvResult = socket.recv(request, zmq::recv_flags::none);
            if (!recvResult) {
                continue;
            }

            std::string raw(static_cast<char*>(request.data()), request.size());
            std::string response;
            try {
                response = dispatchRequest(buildRequest(raw));
            } catch (const std::exception& e) {
                // A REP socket must answer before it can receive again
                LOG_ERROR("ZeroMQ: handler thread {} failed on a request: {}", index, e.what());
                response = dumpResponse(
                    errorBody(ErrorCode::INTERNAL_UNKNOWN, "Internal error while handling request"));
            }
            socket.send(zmq::buffer(response), zmq::send_flags::none);
        } catch (const zmq::error_t& e) {
            if (e.num() == ETERM) {
                break;
            }
            if (running_.load()) {
                LOG_WARN("ZeroMQ: handler thread {} error - {}", index, e.what());
            }
        }
    }
    socket.close();
}

void ZmqCommandServer::cleanupSockets() {
    for (auto* socket : {&frontend_, &backend_, &control_, &pubSocket_}) {
        if (*socket) {
            (*socket)->close();
            socket->reset();
        }
    }
    context_.reset();
}

void ZmqCommandServer::cleanupIpcPath(const std::string& endpoint) const {
    if (!startsWith(endpoint, "ipc://")) {
        return;
    }
    std::string path = endpoint.substr(6);
    if (path.empty()) {
        return;
    }
    std::remove(path.c_str());
}

std::string ZmqCommandServer::derivePubEndpoint(const std::string& endpoint) {
    if (startsWith(endpoint, "ipc://")) {
        return endpoint + DaemonConstants::ZEROMQ_PUB_SUFFIX;
    }

    if (startsWith(endpoint, "tcp://")) {
        auto colonPos = endpoint.rfind(':');
        if (colonPos != std::string::npos) {
            const std::string portText = endpoint.substr(colonPos + 1);
            if (!portText.empty() &&
                std::all_of(portText.begin(), portText.end(),
                            [](unsigned char c) { return std::isdigit(c) != 0; })) {
                int port = std::stoi(portText);
                return endpoint.substr(0, colonPos + 1) + std::to_string(port + 1);
            }
        }
    }

    return endpoint + DaemonConstants::ZEROMQ_PUB_SUFFIX;
}

}  // namespace daemon_ipc
}  // namespace diarizer
