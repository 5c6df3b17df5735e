/**
 * @file test_zmq_server.cpp
 * @brief Command server tests over an ipc endpoint with a REQ client
 */

#include "core/error_codes.h"
#include "service/zmq_server.h"

#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <zmq.hpp>

using namespace diarizer;

namespace {

std::string make_ipc_endpoint() {
    static std::atomic<int> counter{0};
    std::ostringstream oss;
    oss << "ipc:///tmp/diarizer_zmq_server_test_" << ::getpid() << "_" << counter++ << ".sock";
    return oss.str();
}

std::string read_message(zmq::socket_t& socket) {
    zmq::message_t reply;
    auto result = socket.recv(reply, zmq::recv_flags::none);
    if (!result) {
        return {};
    }
    return std::string(static_cast<char*>(reply.data()), reply.size());
}

std::string request_once(const std::string& endpoint, const std::string& message) {
    zmq::context_t ctx(1);
    zmq::socket_t req(ctx, zmq::socket_type::req);
    req.set(zmq::sockopt::rcvtimeo, 5000);
    req.set(zmq::sockopt::linger, 0);
    req.connect(endpoint);
    req.send(zmq::buffer(message), zmq::send_flags::none);
    return read_message(req);
}

class ZmqServerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        endpoint_ = make_ipc_endpoint();
        server_ = std::make_unique<daemon_ipc::ZmqCommandServer>(endpoint_, 2);
    }

    std::string endpoint_;
    std::unique_ptr<daemon_ipc::ZmqCommandServer> server_;
};

}  // namespace

TEST_F(ZmqServerTest, DispatchesRawAndJsonCommands) {
    server_->registerCommand("PING", [](const daemon_ipc::ZmqRequest&) {
        return std::string("PONG");
    });
    server_->registerCommand("HELLO", [](const daemon_ipc::ZmqRequest& request) {
        nlohmann::json resp;
        resp["status"] = "ok";
        std::string name = request.params().value("name", "");
        resp["message"] = "Hello " + (name.empty() ? std::string("world") : name);
        return resp.dump();
    });
    ASSERT_TRUE(server_->start());

    EXPECT_EQ(request_once(endpoint_, "PING"), "PONG");

    nlohmann::json cmd;
    cmd["cmd"] = "HELLO";
    cmd["params"]["name"] = "ZMQ";
    auto reply = request_once(endpoint_, cmd.dump());
    ASSERT_FALSE(reply.empty());
    auto respJson = nlohmann::json::parse(reply);
    EXPECT_EQ(respJson["status"], "ok");
    EXPECT_EQ(respJson["message"], "Hello ZMQ");
}

TEST_F(ZmqServerTest, PublishesEvents) {
    ASSERT_TRUE(server_->start());

    zmq::context_t ctx(1);
    zmq::socket_t sub(ctx, zmq::socket_type::sub);
    sub.set(zmq::sockopt::subscribe, "");
    sub.set(zmq::sockopt::rcvtimeo, 200);
    sub.connect(server_->pubEndpoint());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const std::string payload = "{\"event\":\"diarization.completed\"}";
    ASSERT_TRUE(server_->publish(payload));

    zmq::message_t msg;
    bool received = false;
    for (int i = 0; i < 5 && !received; ++i) {
        if (sub.recv(msg, zmq::recv_flags::none)) {
            received = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    ASSERT_TRUE(received);
    EXPECT_EQ(std::string(static_cast<char*>(msg.data()), msg.size()), payload);
}

TEST_F(ZmqServerTest, ReturnsJsonErrorOnParseFailure) {
    ASSERT_TRUE(server_->start());

    auto resp = nlohmann::json::parse(request_once(endpoint_, "{invalid"));
    EXPECT_EQ(resp["status"], "error");
    EXPECT_EQ(resp["error_code"], "IPC_PROTOCOL_ERROR");
    EXPECT_EQ(resp["http_status"], 400);
}

TEST_F(ZmqServerTest, InvalidUtf8RequestGetsProtocolErrorAndServerSurvives) {
    server_->registerCommand("PING", [](const daemon_ipc::ZmqRequest&) {
        return std::string("PONG");
    });
    ASSERT_TRUE(server_->start());

    auto reply = request_once(endpoint_, std::string("{\"cmd\": \"\xFF\"}"));
    ASSERT_FALSE(reply.empty());
    auto resp = nlohmann::json::parse(reply);
    EXPECT_EQ(resp["error_code"], "IPC_PROTOCOL_ERROR");
    EXPECT_EQ(resp["http_status"], 400);

    EXPECT_EQ(request_once(endpoint_, "PING"), "PONG");
}

TEST_F(ZmqServerTest, HandlerErrorWithInvalidUtf8StillReplies) {
    server_->registerCommand("BAD", [](const daemon_ipc::ZmqRequest&) -> std::string {
        throw ValidationError(std::string("Unsupported file format: a\xFE.wav"));
    });
    ASSERT_TRUE(server_->start());

    auto resp = nlohmann::json::parse(request_once(endpoint_, R"({"cmd":"BAD"})"));
    EXPECT_EQ(resp["error_code"], "VALIDATION_INVALID_PARAMS");
    EXPECT_NE(resp["error"].get<std::string>().find("Unsupported file format"), std::string::npos);
}

TEST_F(ZmqServerTest, UnknownCommandIsNotFound) {
    ASSERT_TRUE(server_->start());

    auto resp = nlohmann::json::parse(request_once(endpoint_, R"({"cmd":"TRANSCRIBE"})"));
    EXPECT_FALSE(resp["success"].get<bool>());
    EXPECT_EQ(resp["error_code"], "IPC_INVALID_COMMAND");
    EXPECT_EQ(resp["http_status"], 404);

    EXPECT_EQ(request_once(endpoint_, "TRANSCRIBE"), "ERR:Unknown command: TRANSCRIBE");
}

TEST_F(ZmqServerTest, HandlerExceptionsBecomeErrorBodies) {
    server_->registerCommand("VALIDATE", [](const daemon_ipc::ZmqRequest&) -> std::string {
        throw ValidationError("batch_size must be a positive integer");
    });
    server_->registerCommand("BOOM", [](const daemon_ipc::ZmqRequest&) -> std::string {
        throw std::runtime_error("unexpected");
    });
    ASSERT_TRUE(server_->start());

    auto validation = nlohmann::json::parse(request_once(endpoint_, R"({"cmd":"VALIDATE"})"));
    EXPECT_EQ(validation["error_code"], "VALIDATION_INVALID_PARAMS");
    EXPECT_EQ(validation["http_status"], 400);

    auto boom = nlohmann::json::parse(request_once(endpoint_, R"({"cmd":"BOOM"})"));
    EXPECT_EQ(boom["error_code"], "INTERNAL_UNKNOWN");
    EXPECT_EQ(boom["http_status"], 500);
}

TEST_F(ZmqServerTest, HandlersRunConcurrently) {
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
    server_->registerCommand("SLOW", [&](const daemon_ipc::ZmqRequest&) {
        int now = ++inFlight;
        int seen = maxInFlight.load();
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        --inFlight;
        return std::string("DONE");
    });
    ASSERT_TRUE(server_->start());
    // Let both handler threads connect before the requests are dealt out
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto first = std::async(std::launch::async, [this] { return request_once(endpoint_, "SLOW"); });
    auto second =
        std::async(std::launch::async, [this] { return request_once(endpoint_, "SLOW"); });
    EXPECT_EQ(first.get(), "DONE");
    EXPECT_EQ(second.get(), "DONE");
    EXPECT_EQ(maxInFlight.load(), 2);
}

TEST_F(ZmqServerTest, StopAndRestartOnSameEndpoint) {
    server_->registerCommand("PING", [](const daemon_ipc::ZmqRequest&) {
        return std::string("PONG");
    });
    ASSERT_TRUE(server_->start());
    EXPECT_TRUE(server_->isRunning());
    server_->stop();
    EXPECT_FALSE(server_->isRunning());

    daemon_ipc::ZmqCommandServer again(endpoint_, 1);
    again.registerCommand("PING", [](const daemon_ipc::ZmqRequest&) {
        return std::string("PONG");
    });
    ASSERT_TRUE(again.start());
    EXPECT_EQ(request_once(endpoint_, "PING"), "PONG");
}

TEST(ZmqServerEndpoints, DerivePubEndpoint) {
    using daemon_ipc::ZmqCommandServer;
    EXPECT_EQ(ZmqCommandServer::derivePubEndpoint("tcp://0.0.0.0:5000"), "tcp://0.0.0.0:5001");
    EXPECT_EQ(ZmqCommandServer::derivePubEndpoint("ipc:///tmp/diarizer.sock"),
              "ipc:///tmp/diarizer.sock.pub");
}

TEST(ZmqServerEndpoints, ErrorBody) {
    auto body = daemon_ipc::ZmqCommandServer::errorBody(ErrorCode::VALIDATION_FILE_TOO_LARGE,
                                                        "File too large");
    EXPECT_EQ(body["status"], "error");
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_EQ(body["http_status"], 413);
    EXPECT_EQ(body["error_code"], "VALIDATION_FILE_TOO_LARGE");
    EXPECT_EQ(body["error"], "File too large");
}

TEST(ZmqServerEndpoints, DumpResponseReplacesInvalidUtf8) {
    nlohmann::json body = {{"error", std::string("bad byte \xFF here")}};
    std::string text;
    ASSERT_NO_THROW(text = daemon_ipc::ZmqCommandServer::dumpResponse(body));
    auto parsed = nlohmann::json::parse(text);
    EXPECT_EQ(parsed["error"], "bad byte \xEF\xBF\xBD here");
}

TEST(ZmqServerEndpoints, BindFailureIsReported) {
    daemon_ipc::ZmqCommandServer server("tcp://256.0.0.1:5000");
    EXPECT_FALSE(server.start());
    EXPECT_TRUE(server.hasBindError());
}
