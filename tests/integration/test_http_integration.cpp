/**
 * HTTP and WebSocket integration tests
 *
 * Starts the full liverun service on an ephemeral port and drives it over
 * real sockets: JSON endpoints, channel subscriptions and live events.
 */

#include <gtest/gtest.h>
#include "../../src/channel_hub.h"
#include "../../src/execution_engine.h"
#include "../../src/file_utils.h"
#include "../../src/http_server.h"
#include "../../src/protocol.h"
#include "../../src/service_routes.h"
#include "../../src/websocket.h"
#include <json/json.h>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

using namespace liverun;
using namespace std::chrono_literals;

namespace {

Json::Value parse_json(const std::string& text) {
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    EXPECT_TRUE(Json::parseFromStream(builder, stream, &json, &errors)) << errors << ": " << text;
    return json;
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class HttpIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (FileUtils::find_executable("python3").empty()) {
            GTEST_SKIP() << "python3 not installed";
        }

        root = std::filesystem::temp_directory_path() /
               ("liverun_http_test_" + FileUtils::random_hex(4));

        EngineConfig config;
        config.workspace_root = root.string();
        engine = std::make_unique<ExecutionEngine>(config, hub);
        dispatcher = std::make_unique<SubmissionDispatcher>(*engine);

        server = std::make_unique<HttpServer>(0);
        install_routes(*server, hub, *engine, *dispatcher);
        port = server->listen();
        server_thread = std::thread([this]() { server->serve(); });
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
        if (engine) {
            engine->shutdown();
        }
        server.reset();
        dispatcher.reset();
        engine.reset();
        if (!root.empty()) {
            std::filesystem::remove_all(root);
        }
    }

    // Helper: Connect to server
    int connect_to_server() {
        int sock = socket(AF_INET, SOCK_STREAM, 0);
        if (sock < 0) return -1;

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        struct timeval tv;
        tv.tv_sec = 10;
        tv.tv_usec = 0;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(sock);
            return -1;
        }
        return sock;
    }

    // Helper: Send a raw request and read until the server closes
    std::string send_request(const std::string& request) {
        int sock = connect_to_server();
        if (sock < 0) {
            return "CONNECTION_FAILED";
        }
        if (send(sock, request.data(), request.size(), MSG_NOSIGNAL) < 0) {
            close(sock);
            return "SEND_FAILED";
        }

        std::string response;
        char buffer[4096];
        ssize_t n;
        while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
            response.append(buffer, static_cast<size_t>(n));
        }
        close(sock);
        return response;
    }

    std::string post(const std::string& path, const std::string& body) {
        return send_request("POST " + path + " HTTP/1.1\r\n"
                            "Host: localhost\r\n"
                            "Content-Type: application/json\r\n"
                            "Content-Length: " + std::to_string(body.size()) + "\r\n"
                            "\r\n" + body);
    }

    static Json::Value body_json(const std::string& response) {
        size_t header_end = response.find("\r\n\r\n");
        EXPECT_NE(header_end, std::string::npos) << response;
        return parse_json(header_end == std::string::npos ? "" : response.substr(header_end + 4));
    }

    // Helper: Open a WebSocket on a channel; returns the socket or -1
    int open_channel(const std::string& channel_id, std::string* handshake = nullptr) {
        int sock = connect_to_server();
        if (sock < 0) return -1;

        std::string request =
            "GET /channel/" + channel_id + " HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Upgrade: websocket\r\n"
            "Connection: Upgrade\r\n"
            "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
            "Sec-WebSocket-Version: 13\r\n"
            "\r\n";
        send(sock, request.data(), request.size(), MSG_NOSIGNAL);

        // Read the handshake byte by byte so no frame data is consumed
        std::string response;
        char c;
        while (response.find("\r\n\r\n") == std::string::npos && recv(sock, &c, 1, 0) == 1) {
            response += c;
        }
        if (handshake) *handshake = response;
        if (response.rfind("HTTP/1.1 101", 0) != 0) {
            close(sock);
            return -1;
        }

        // Wait until the connection thread has subscribed
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (hub.subscriber_count(channel_id) == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        return sock;
    }

    // Client frames must be masked
    static void send_ws_text(int sock, const std::string& payload) {
        const uint8_t mask[4] = {0xA1, 0xB2, 0xC3, 0xD4};
        std::vector<uint8_t> frame = {0x81};
        if (payload.size() <= 125) {
            frame.push_back(0x80 | static_cast<uint8_t>(payload.size()));
        } else {
            frame.push_back(0x80 | 126);
            frame.push_back((payload.size() >> 8) & 0xFF);
            frame.push_back(payload.size() & 0xFF);
        }
        frame.insert(frame.end(), mask, mask + 4);
        for (size_t i = 0; i < payload.size(); i++) {
            frame.push_back(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);
        }
        send(sock, frame.data(), frame.size(), MSG_NOSIGNAL);
    }

    // Read events until a complete event for execution_id (or the socket fails)
    static std::vector<Json::Value> read_until_complete(int sock, const std::string& execution_id) {
        std::vector<Json::Value> events;
        WSFrame frame;
        while (WebSocketManager::read_frame(sock, frame, MAX_REQUEST_SIZE)) {
            if (frame.opcode != WSOpcode::TEXT) continue;
            Json::Value event = parse_json(frame.payload);
            events.push_back(event);
            if (event["event"].asString() == "complete" &&
                event["executionId"].asString() == execution_id) {
                break;
            }
        }
        return events;
    }

    static std::string joined_output(const std::vector<Json::Value>& events, const std::string& kind) {
        std::string text;
        for (const auto& event : events) {
            if (event["event"].asString() == "output" && event["kind"].asString() == kind) {
                text += event["text"].asString();
            }
        }
        return text;
    }

    std::filesystem::path root;
    ChannelHub hub;
    std::unique_ptr<ExecutionEngine> engine;
    std::unique_ptr<SubmissionDispatcher> dispatcher;
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;
    int port = 0;
};

// ============================================================================
// JSON endpoints
// ============================================================================

TEST_F(HttpIntegrationTest, ServiceInfo) {
    std::string response = send_request("GET / HTTP/1.1\r\nHost: localhost\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK", 0), 0u) << response;
    EXPECT_EQ(body_json(response)["service"].asString(), "liverun");
}

TEST_F(HttpIntegrationTest, HealthReportsActiveExecutions) {
    std::string response = send_request("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");

    Json::Value health = body_json(response);
    EXPECT_EQ(health["status"].asString(), "ok");
    EXPECT_EQ(health["activeExecutions"].asUInt64(), 0u);
}

TEST_F(HttpIntegrationTest, UnknownRouteIs404) {
    std::string response = send_request("GET /nope HTTP/1.1\r\nHost: localhost\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 404", 0), 0u) << response;
}

TEST_F(HttpIntegrationTest, RunCodeStartsExecution) {
    // Given: A start request over plain HTTP
    std::string response = post("/run_code", R"x({"code":"print('hi')","timeoutSeconds":10})x");

    // Then: The response identifies the new run
    Json::Value body = body_json(response);
    EXPECT_EQ(body["status"].asString(), "started");
    EXPECT_FALSE(body["executionId"].asString().empty());
    EXPECT_EQ(body["timeoutSeconds"].asInt(), 10);
    EXPECT_EQ(body["runtimeBackend"].asString(), "local");
}

TEST_F(HttpIntegrationTest, RunCodeWithoutCodeIsError) {
    Json::Value body = body_json(post("/run_code", R"({"channelId":"x"})"));

    EXPECT_EQ(body["status"].asString(), "error");
    EXPECT_EQ(body["message"].asString(), "code is required");
}

TEST_F(HttpIntegrationTest, ProvideInputToUnknownExecution) {
    Json::Value body = body_json(post("/provide_input", R"({"executionId":"ghost","inputLine":"1"})"));

    EXPECT_EQ(body["status"].asString(), "error");
    EXPECT_EQ(body["message"].asString(), "process not found");
}

TEST_F(HttpIntegrationTest, OversizedRequestIs413) {
    std::string response = send_request(
        "POST /run_code HTTP/1.1\r\nHost: localhost\r\nContent-Length: " +
        std::to_string(MAX_REQUEST_SIZE + 1) + "\r\n\r\n{");

    EXPECT_EQ(response.rfind("HTTP/1.1 413", 0), 0u) << response;
}

// ============================================================================
// WebSocket channels
// ============================================================================

TEST_F(HttpIntegrationTest, HandshakeAcceptsKey) {
    std::string handshake;
    int sock = open_channel("room-hs", &handshake);
    ASSERT_GE(sock, 0) << handshake;

    EXPECT_NE(handshake.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo="), std::string::npos);
    EXPECT_EQ(hub.subscriber_count("room-hs"), 1u);
    close(sock);
}

TEST_F(HttpIntegrationTest, SubmitOverWebSocketStreamsEvents) {
    // Given: A client subscribed to a channel
    int sock = open_channel("room-ws");
    ASSERT_GE(sock, 0);

    // When: It submits a run as a text frame
    send_ws_text(sock, R"x({"code":"print('Hello, World!')"})x");

    // Then: It sees the response, then the run's events up to completion
    WSFrame frame;
    std::string execution_id;
    std::vector<Json::Value> early;
    while (execution_id.empty() && WebSocketManager::read_frame(sock, frame, MAX_REQUEST_SIZE)) {
        Json::Value event = parse_json(frame.payload);
        early.push_back(event);
        if (event["event"].asString() == "response") {
            EXPECT_EQ(event["status"].asString(), "started");
            execution_id = event["executionId"].asString();
        }
    }
    ASSERT_FALSE(execution_id.empty());

    std::vector<Json::Value> events = early;
    bool finished = false;
    for (const auto& event : early) {
        if (event["event"].asString() == "complete") finished = true;
    }
    if (!finished) {
        auto rest = read_until_complete(sock, execution_id);
        events.insert(events.end(), rest.begin(), rest.end());
    }

    EXPECT_EQ(joined_output(events, "stdout"), "Hello, World!\n");
    Json::Value completion;
    for (const auto& event : events) {
        if (event["event"].asString() == "complete") completion = event;
    }
    EXPECT_EQ(completion["status"].asString(), "completed");
    close(sock);
}

TEST_F(HttpIntegrationTest, HttpSubmissionWithWebSocketInput) {
    // Given: A subscriber and an interactive run started over HTTP
    int sock = open_channel("room-io");
    ASSERT_GE(sock, 0);

    Json::Value started = body_json(post("/run_code",
        R"x({"code":"x = input()\nprint('echo:', x)","channelId":"room-io"})x"));
    ASSERT_EQ(started["status"].asString(), "started");
    EXPECT_TRUE(started["needsInput"].asBool());
    std::string id = started["executionId"].asString();

    // When: Input is fed through the input endpoint
    Json::Value request;
    request["executionId"] = id;
    request["inputLine"] = "5";
    Json::Value fed = body_json(post("/provide_input", to_json_string(request)));
    EXPECT_EQ(fed["status"].asString(), "input_sent");

    // Then: The subscriber sees the acknowledgement and the echoed value
    auto events = read_until_complete(sock, id);
    bool acknowledged = false;
    for (const auto& event : events) {
        if (event["event"].asString() == "input_received") acknowledged = true;
    }
    EXPECT_TRUE(acknowledged);
    EXPECT_EQ(joined_output(events, "stdout"), "echo: 5\n");
    close(sock);
}

TEST_F(HttpIntegrationTest, OtherChannelsSeeNothing) {
    int watcher = open_channel("room-a");
    int bystander = open_channel("room-b");
    ASSERT_GE(watcher, 0);
    ASSERT_GE(bystander, 0);

    Json::Value started = body_json(post("/run_code", R"x({"code":"print(1)","channelId":"room-a"})x"));
    read_until_complete(watcher, started["executionId"].asString());

    // The bystander has nothing waiting
    struct timeval tv{0, 200000};
    setsockopt(bystander, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    char byte;
    EXPECT_LT(recv(bystander, &byte, 1, 0), 1);

    close(watcher);
    close(bystander);
}

TEST_F(HttpIntegrationTest, DisconnectUnsubscribes) {
    int sock = open_channel("room-gone");
    ASSERT_GE(sock, 0);
    ASSERT_EQ(hub.subscriber_count("room-gone"), 1u);

    close(sock);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (hub.subscriber_count("room-gone") != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(hub.subscriber_count("room-gone"), 0u);
}

TEST_F(HttpIntegrationTest, MissingKeyIsRejected) {
    std::string response = send_request(
        "GET /channel/room HTTP/1.1\r\nHost: localhost\r\n"
        "Upgrade: websocket\r\nConnection: Upgrade\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 400", 0), 0u) << response;
}

TEST_F(HttpIntegrationTest, StopClosesOpenChannels) {
    // Given: An open subscription
    int sock = open_channel("room-stop");
    ASSERT_GE(sock, 0);

    // When: The server stops
    auto start = std::chrono::steady_clock::now();
    server->stop();
    server_thread.join();

    // Then: The client sees the connection end promptly
    char byte;
    EXPECT_LE(recv(sock, &byte, 1, 0), 0);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
    close(sock);
}
