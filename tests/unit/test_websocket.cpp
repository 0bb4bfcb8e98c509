#include <gtest/gtest.h>
#include "websocket.h"
#include <map>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <unistd.h>

using namespace liverun;

// ============================================================================
// Upgrade detection and handshake
// ============================================================================

class WebSocketHandshakeTest : public ::testing::Test {
protected:
    std::map<std::string, std::string> headers(const std::string& upgrade,
                                               const std::string& connection) {
        std::map<std::string, std::string> result;
        if (!upgrade.empty()) result["Upgrade"] = upgrade;
        if (!connection.empty()) result["Connection"] = connection;
        return result;
    }
};

TEST_F(WebSocketHandshakeTest, DetectsUpgrade) {
    EXPECT_TRUE(WebSocketManager::is_websocket_upgrade(headers("websocket", "Upgrade")));
    EXPECT_TRUE(WebSocketManager::is_websocket_upgrade(headers("WebSocket", "keep-alive, upgrade")));
}

TEST_F(WebSocketHandshakeTest, HeaderNamesAreCaseInsensitive) {
    std::map<std::string, std::string> lower = {{"upgrade", "websocket"}, {"connection", "Upgrade"}};

    EXPECT_TRUE(WebSocketManager::is_websocket_upgrade(lower));
}

TEST_F(WebSocketHandshakeTest, RejectsPlainRequests) {
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(headers("", "Upgrade")));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(headers("websocket", "")));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(headers("h2c", "Upgrade")));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(headers("websocket", "keep-alive")));
}

TEST_F(WebSocketHandshakeTest, AcceptKeyMatchesRfcExample) {
    // Given: The sample nonce from RFC 6455 section 1.3
    // Then: The documented accept value comes back
    EXPECT_EQ(WebSocketManager::compute_accept_key("dGhlIHNhbXBsZSBub25jZQ=="),
              "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_F(WebSocketHandshakeTest, HandshakeResponse) {
    std::string response = WebSocketManager::create_handshake_response("dGhlIHNhbXBsZSBub25jZQ==");

    EXPECT_EQ(response.rfind("HTTP/1.1 101 Switching Protocols\r\n", 0), 0u);
    EXPECT_NE(response.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"),
              std::string::npos);
    EXPECT_EQ(response.substr(response.size() - 4), "\r\n\r\n");
}

// ============================================================================
// Framing
// ============================================================================

TEST(WebSocketFrameTest, ShortFrameHeader) {
    auto frame = WebSocketManager::create_frame(WSOpcode::TEXT, "hi");

    ASSERT_EQ(frame.size(), 4u);
    EXPECT_EQ(frame[0], 0x81);
    EXPECT_EQ(frame[1], 2);
    EXPECT_EQ(frame[2], 'h');
}

TEST(WebSocketFrameTest, ExtendedLengths) {
    auto medium = WebSocketManager::create_frame(WSOpcode::TEXT, std::string(300, 'a'));
    EXPECT_EQ(medium[1], 126);
    EXPECT_EQ((medium[2] << 8) | medium[3], 300);
    EXPECT_EQ(medium.size(), 4u + 300u);

    auto large = WebSocketManager::create_frame(WSOpcode::BINARY, std::string(70000, 'b'));
    EXPECT_EQ(large[0], 0x82);
    EXPECT_EQ(large[1], 127);
    EXPECT_EQ(large.size(), 10u + 70000u);
}

// Socket pair standing in for a client connection; client frames are masked
class WebSocketStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    }

    void TearDown() override {
        if (fds[0] >= 0) close(fds[0]);
        if (fds[1] >= 0) close(fds[1]);
    }

    int server() const { return fds[0]; }
    int client() const { return fds[1]; }

    void client_send(WSOpcode opcode, const std::string& payload, bool fin = true) {
        const uint8_t mask[4] = {0x12, 0x34, 0x56, 0x78};
        std::vector<uint8_t> frame;
        frame.push_back((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode));
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
        ASSERT_EQ(write(client(), frame.data(), frame.size()), static_cast<ssize_t>(frame.size()));
    }

    int fds[2] = {-1, -1};
};

TEST_F(WebSocketStreamTest, ReadsMaskedTextMessage) {
    client_send(WSOpcode::TEXT, R"x({"code":"print(1)"})x");

    std::string message;
    ASSERT_TRUE(WebSocketManager::read_message(server(), message, 1024));
    EXPECT_EQ(message, R"x({"code":"print(1)"})x");
}

TEST_F(WebSocketStreamTest, ReassemblesFragments) {
    // Given: A message split across a text frame and two continuations
    client_send(WSOpcode::TEXT, "Hel", false);
    client_send(WSOpcode::CONTINUATION, "lo, ", false);
    client_send(WSOpcode::CONTINUATION, "World");

    // When: Reading one message
    std::string message;
    ASSERT_TRUE(WebSocketManager::read_message(server(), message, 1024));

    // Then: The fragments are joined
    EXPECT_EQ(message, "Hello, World");
}

TEST_F(WebSocketStreamTest, AnswersPingThroughReplyHook) {
    // Given: A ping followed by a text message
    client_send(WSOpcode::PING, "are you there");
    client_send(WSOpcode::TEXT, "after ping");

    // When: Reading with a reply hook
    std::vector<std::pair<WSOpcode, std::string>> replies;
    auto reply = [&](WSOpcode opcode, const std::string& payload) {
        replies.emplace_back(opcode, payload);
        return true;
    };
    std::string message;
    ASSERT_TRUE(WebSocketManager::read_message(server(), message, 1024, reply));

    // Then: The pong echoes the ping payload and the message still arrives
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].first, WSOpcode::PONG);
    EXPECT_EQ(replies[0].second, "are you there");
    EXPECT_EQ(message, "after ping");
}

TEST_F(WebSocketStreamTest, PingWithoutHookWritesPong) {
    client_send(WSOpcode::PING, "p");
    client_send(WSOpcode::TEXT, "x");

    std::string message;
    ASSERT_TRUE(WebSocketManager::read_message(server(), message, 1024));

    WSFrame pong;
    ASSERT_TRUE(WebSocketManager::read_frame(client(), pong, 1024));
    EXPECT_EQ(pong.opcode, WSOpcode::PONG);
    EXPECT_EQ(pong.payload, "p");
}

TEST_F(WebSocketStreamTest, CloseEndsConnection) {
    client_send(WSOpcode::CLOSE, "");

    std::string message;
    EXPECT_FALSE(WebSocketManager::read_message(server(), message, 1024));

    // The close is answered
    WSFrame reply;
    ASSERT_TRUE(WebSocketManager::read_frame(client(), reply, 1024));
    EXPECT_EQ(reply.opcode, WSOpcode::CLOSE);
}

TEST_F(WebSocketStreamTest, OversizedFrameIsRejected) {
    client_send(WSOpcode::TEXT, std::string(200, 'x'));

    std::string message;
    EXPECT_FALSE(WebSocketManager::read_message(server(), message, 100));
}

TEST_F(WebSocketStreamTest, StrayContinuationIsRejected) {
    client_send(WSOpcode::CONTINUATION, "orphan");

    std::string message;
    EXPECT_FALSE(WebSocketManager::read_message(server(), message, 1024));
}

TEST_F(WebSocketStreamTest, PeerHangupEndsRead) {
    close(fds[1]);
    fds[1] = -1;

    std::string message;
    EXPECT_FALSE(WebSocketManager::read_message(server(), message, 1024));
}

TEST_F(WebSocketStreamTest, ServerFramesReachClient) {
    ASSERT_TRUE(WebSocketManager::send_text(server(), "{\"event\":\"started\"}"));

    WSFrame frame;
    ASSERT_TRUE(WebSocketManager::read_frame(client(), frame, 1024));
    EXPECT_TRUE(frame.fin);
    EXPECT_EQ(frame.opcode, WSOpcode::TEXT);
    EXPECT_EQ(frame.payload, "{\"event\":\"started\"}");
}

TEST_F(WebSocketStreamTest, SendToClosedPeerFails) {
    close(fds[1]);
    fds[1] = -1;

    EXPECT_FALSE(WebSocketManager::send_text(server(), "gone"));
}
