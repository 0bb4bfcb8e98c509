#include "websocket.h"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sstream>

namespace liverun {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const std::string* find_header(const std::map<std::string, std::string>& headers,
                               const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (lowercase(key) == name) {
            return &value;
        }
    }
    return nullptr;
}

} // namespace

std::string WebSocketManager::base64_encode(const unsigned char* data, size_t len) {
    std::string encoded(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), data,
                                  static_cast<int>(len));
    encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return encoded;
}

bool WebSocketManager::is_websocket_upgrade(const std::map<std::string, std::string>& headers) {
    const std::string* upgrade = find_header(headers, "upgrade");
    const std::string* connection = find_header(headers, "connection");

    if (!upgrade || !connection) {
        return false;
    }

    return lowercase(*upgrade) == "websocket" &&
           lowercase(*connection).find("upgrade") != std::string::npos;
}

std::string WebSocketManager::compute_accept_key(const std::string& sec_key) {
    // WebSocket magic string
    const std::string combined = sec_key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(combined.c_str()), combined.length(), hash);

    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::string WebSocketManager::create_handshake_response(const std::string& sec_key) {
    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n"
             << "Upgrade: websocket\r\n"
             << "Connection: Upgrade\r\n"
             << "Sec-WebSocket-Accept: " << compute_accept_key(sec_key) << "\r\n"
             << "\r\n";

    return response.str();
}

std::vector<uint8_t> WebSocketManager::create_frame(WSOpcode opcode, const std::string& payload) {
    std::vector<uint8_t> frame;

    // First byte: FIN bit + opcode
    frame.push_back(0x80 | static_cast<uint8_t>(opcode));

    // Payload length (server frames are never masked)
    size_t payload_len = payload.size();
    if (payload_len <= 125) {
        frame.push_back(static_cast<uint8_t>(payload_len));
    } else if (payload_len <= 65535) {
        frame.push_back(126);
        frame.push_back((payload_len >> 8) & 0xFF);
        frame.push_back(payload_len & 0xFF);
    } else {
        frame.push_back(127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back((static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF);
        }
    }

    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

bool WebSocketManager::write_all(int fd, const uint8_t* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = send(fd, data + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketManager::read_exact(int fd, uint8_t* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = read(fd, data + total, len - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool WebSocketManager::send_frame(int client_fd, WSOpcode opcode, const std::string& payload) {
    auto frame = create_frame(opcode, payload);
    return write_all(client_fd, frame.data(), frame.size());
}

bool WebSocketManager::send_text(int client_fd, const std::string& message) {
    return send_frame(client_fd, WSOpcode::TEXT, message);
}

bool WebSocketManager::send_close(int client_fd) {
    return send_frame(client_fd, WSOpcode::CLOSE, "");
}

bool WebSocketManager::read_frame(int client_fd, WSFrame& frame, size_t max_payload) {
    uint8_t header[2];
    if (!read_exact(client_fd, header, 2)) {
        return false;
    }

    frame.fin = (header[0] & 0x80) != 0;
    frame.opcode = static_cast<WSOpcode>(header[0] & 0x0F);

    bool masked = (header[1] & 0x80) != 0;
    uint64_t payload_len = header[1] & 0x7F;

    if (payload_len == 126) {
        uint8_t len_bytes[2];
        if (!read_exact(client_fd, len_bytes, 2)) return false;
        payload_len = (static_cast<uint64_t>(len_bytes[0]) << 8) | len_bytes[1];
    } else if (payload_len == 127) {
        uint8_t len_bytes[8];
        if (!read_exact(client_fd, len_bytes, 8)) return false;
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | len_bytes[i];
        }
    }

    if (payload_len > max_payload) {
        return false;
    }

    uint8_t mask[4] = {0};
    if (masked && !read_exact(client_fd, mask, 4)) {
        return false;
    }

    frame.payload.assign(static_cast<size_t>(payload_len), '\0');
    if (payload_len > 0 &&
        !read_exact(client_fd, reinterpret_cast<uint8_t*>(&frame.payload[0]), frame.payload.size())) {
        return false;
    }

    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); i++) {
            frame.payload[i] ^= static_cast<char>(mask[i % 4]);
        }
    }
    return true;
}

bool WebSocketManager::read_message(int client_fd, std::string& message, size_t max_payload,
                                    const FrameSender& reply) {
    auto send = [&](WSOpcode opcode, const std::string& payload) {
        return reply ? reply(opcode, payload) : send_frame(client_fd, opcode, payload);
    };

    message.clear();
    bool in_fragment = false;

    WSFrame frame;
    while (read_frame(client_fd, frame, max_payload)) {
        switch (frame.opcode) {
            case WSOpcode::CLOSE:
                send(WSOpcode::CLOSE, "");
                return false;
            case WSOpcode::PING:
                if (!send(WSOpcode::PONG, frame.payload)) return false;
                continue;
            case WSOpcode::PONG:
                continue;
            case WSOpcode::TEXT:
            case WSOpcode::BINARY:
                message = frame.payload;
                in_fragment = !frame.fin;
                break;
            case WSOpcode::CONTINUATION:
                if (!in_fragment) return false;
                message += frame.payload;
                in_fragment = !frame.fin;
                break;
            default:
                return false;   // Reserved opcode
        }

        if (message.size() > max_payload) {
            return false;
        }
        if (!in_fragment) {
            return true;
        }
    }
    return false;
}

} // namespace liverun
