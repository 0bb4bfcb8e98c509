#pragma once

#include <string>
#include <functional>
#include <vector>
#include <map>
#include <cstdint>
#include <cstddef>

namespace liverun {

// WebSocket frame opcodes
enum class WSOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT = 0x1,
    BINARY = 0x2,
    CLOSE = 0x8,
    PING = 0x9,
    PONG = 0xA
};

// One decoded (unmasked) frame
struct WSFrame {
    WSOpcode opcode = WSOpcode::TEXT;
    bool fin = true;
    std::string payload;
};

// RFC 6455 server side: handshake and framing over a connected socket
class WebSocketManager {
public:
    // Writes one frame to the peer; false if the peer is gone
    using FrameSender = std::function<bool(WSOpcode opcode, const std::string& payload)>;

    // Check if request is WebSocket upgrade (header names case-insensitive)
    static bool is_websocket_upgrade(const std::map<std::string, std::string>& headers);

    // Sec-WebSocket-Accept value for a client key
    static std::string compute_accept_key(const std::string& sec_key);

    // Full 101 Switching Protocols response
    static std::string create_handshake_response(const std::string& sec_key);

    // Send frames to client. False if the peer is gone.
    static bool send_frame(int client_fd, WSOpcode opcode, const std::string& payload);
    static bool send_text(int client_fd, const std::string& message);
    static bool send_close(int client_fd);

    // Read one frame. False on EOF, I/O error, or a frame larger than
    // max_payload.
    static bool read_frame(int client_fd, WSFrame& frame, size_t max_payload);

    // Read the next complete message, reassembling fragments and answering
    // pings and close frames through reply (direct writes when empty).
    // False once the connection is closed or broken.
    static bool read_message(int client_fd, std::string& message, size_t max_payload,
                             const FrameSender& reply = nullptr);

    static std::vector<uint8_t> create_frame(WSOpcode opcode, const std::string& payload);

private:
    static std::string base64_encode(const unsigned char* data, size_t len);
    static bool write_all(int fd, const uint8_t* data, size_t len);
    static bool read_exact(int fd, uint8_t* data, size_t len);
};

} // namespace liverun
