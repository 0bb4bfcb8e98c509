#include "http_server.h"
#include "websocket.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <json/json.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace liverun {

namespace {

constexpr int CLIENT_SEND_TIMEOUT_SECONDS = 5;
constexpr int STOP_GRACE_SECONDS = 5;

bool send_all(int fd, const std::string& data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

std::string error_body(const std::string& message) {
    Json::Value body;
    body["error"] = message;
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, body);
}

void send_error(int fd, int status_code, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status_code;
    resp.body = error_body(message);
    send_all(fd, HttpServer::build_response(resp));
}

bool is_prefix_route(const std::string& path) {
    return path.size() > 1 && path.back() == '/';
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (key.size() == name.size() &&
            std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            })) {
            return value;
        }
    }
    return "";
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = std::move(handler);
}

void HttpServer::websocket_route(const std::string& path_prefix, WebSocketHandler handler) {
    websocket_routes_[path_prefix] = std::move(handler);
}

int HttpServer::listen() {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("Failed to create socket: ") + std::strerror(errno));
    }

    // Allow reuse
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_) + ": " +
                                 std::strerror(err));
    }

    if (::listen(fd, LISTEN_BACKLOG) < 0) {
        int err = errno;
        close(fd);
        throw std::runtime_error(std::string("Failed to listen: ") + std::strerror(err));
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    server_fd_ = fd;
    running_ = true;
    std::cout << "[Server] Listening on port " << port_ << std::endl;
    return port_;
}

void HttpServer::serve() {
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, reinterpret_cast<struct sockaddr*>(&client_addr),
                                &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_ && (errno == EINTR || errno == ECONNABORTED)) continue;
            break;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        track_client(client_fd);
        try {
            std::thread([this, client_fd, client_ip]() {
                handle_client(client_fd, client_ip);
                release_client(client_fd);
            }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[Server] Cannot spawn connection thread: " << e.what() << std::endl;
            release_client(client_fd);
        }
    }
}

void HttpServer::start() {
    listen();
    serve();
}

void HttpServer::stop() {
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        // shutdown() wakes a thread blocked in accept()
        ::shutdown(fd, SHUT_RDWR);
        close(fd);
    }

    std::unique_lock<std::mutex> lock(clients_mutex_);
    for (int client_fd : clients_) {
        ::shutdown(client_fd, SHUT_RDWR);
    }
    if (!clients_cv_.wait_for(lock, std::chrono::seconds(STOP_GRACE_SECONDS),
                              [this]() { return clients_.empty(); })) {
        std::cerr << "[Server] " << clients_.size() << " connection(s) still open at shutdown"
                  << std::endl;
    }
}

void HttpServer::track_client(int client_fd) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    clients_.insert(client_fd);
}

void HttpServer::release_client(int client_fd) {
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.erase(client_fd);
        close(client_fd);
    }
    clients_cv_.notify_all();
}

bool HttpServer::read_request(int client_fd, std::string& request_data) {
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    size_t expected_size = 0;   // Known once the headers are complete

    while (true) {
        if (expected_size == 0) {
            size_t header_end = request_data.find("\r\n\r\n");
            if (header_end != std::string::npos) {
                HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
                std::string length = head.header("Content-Length");
                size_t content_length = 0;
                if (!length.empty()) {
                    try {
                        content_length = std::stoul(length);
                    } catch (const std::exception&) {
                        send_error(client_fd, 400, "Invalid Content-Length");
                        return false;
                    }
                }
                expected_size = header_end + 4 + content_length;
                if (expected_size > MAX_REQUEST_SIZE) {
                    send_error(client_fd, 413, "Request exceeds size limit");
                    return false;
                }
            }
        }

        if (expected_size != 0 && request_data.size() >= expected_size) {
            return true;
        }
        if (request_data.size() > MAX_REQUEST_SIZE) {
            send_error(client_fd, 413, "Request exceeds size limit");
            return false;
        }

        ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read < 0 && errno == EINTR) continue;
        if (bytes_read <= 0) {
            return false;
        }
        request_data.append(buffer, static_cast<size_t>(bytes_read));
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    if (!read_request(client_fd, request_data)) {
        return;
    }

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    if (req.method == "GET" && WebSocketManager::is_websocket_upgrade(req.headers)) {
        handle_websocket(client_fd, req);
        return;
    }

    send_all(client_fd, build_response(dispatch(req)));
}

const WebSocketHandler* HttpServer::find_websocket_route(const std::string& path) const {
    const WebSocketHandler* best = nullptr;
    size_t best_len = 0;
    for (const auto& [prefix, handler] : websocket_routes_) {
        if (path.compare(0, prefix.size(), prefix) == 0 && prefix.size() >= best_len) {
            best = &handler;
            best_len = prefix.size();
        }
    }
    return best;
}

void HttpServer::handle_websocket(int client_fd, const HttpRequest& req) {
    const WebSocketHandler* handler = find_websocket_route(req.path);
    if (!handler) {
        send_error(client_fd, 404, "Not found");
        return;
    }

    std::string key = req.header("Sec-WebSocket-Key");
    if (key.empty()) {
        send_error(client_fd, 400, "Missing Sec-WebSocket-Key");
        return;
    }

    // A stalled client must not block broadcasts to everyone else for long
    struct timeval tv;
    tv.tv_sec = CLIENT_SEND_TIMEOUT_SECONDS;
    tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (!send_all(client_fd, WebSocketManager::create_handshake_response(key))) {
        return;
    }

    std::cout << "[WebSocket] Client " << client_fd << " (" << req.client_ip
              << ") connected to " << req.path << std::endl;
    try {
        (*handler)(client_fd, req);
    } catch (const std::exception& e) {
        std::cerr << "[WebSocket] Connection " << client_fd << " failed: " << e.what() << std::endl;
    }
    std::cout << "[WebSocket] Client " << client_fd << " disconnected" << std::endl;
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    const HandlerFunc* handler = nullptr;

    auto it = routes_.find(req.method + " " + req.path);
    if (it != routes_.end()) {
        handler = &it->second;
    } else {
        size_t best_len = 0;
        for (const auto& [pattern, candidate] : routes_) {
            size_t space_pos = pattern.find(' ');
            std::string method = pattern.substr(0, space_pos);
            std::string path_pattern = pattern.substr(space_pos + 1);

            if (method == req.method && is_prefix_route(path_pattern) &&
                req.path.compare(0, path_pattern.size(), path_pattern) == 0 &&
                path_pattern.size() > best_len) {
                handler = &candidate;
                best_len = path_pattern.size();
            }
        }
    }

    HttpResponse resp;
    if (!handler) {
        resp.status_code = 404;
        resp.body = error_body("Not found");
        return resp;
    }

    try {
        resp = (*handler)(req);
    } catch (const std::exception& e) {
        std::cerr << "[Server] " << req.method << " " << req.path << " failed: " << e.what() << std::endl;
        resp = HttpResponse();
        resp.status_code = 500;
        resp.body = error_body(e.what());
    }
    return resp;
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);
        size_t question = target.find('?');
        req.path = target.substr(0, question);
        if (question != std::string::npos) {
            req.query = target.substr(question + 1);
        }
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            req.headers[key] = value_start == std::string::npos ? "" : line.substr(value_start);
        }
    }

    return req;
}

std::string HttpServer::reason_phrase(int status_code) {
    switch (status_code) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    out << "HTTP/1.1 " << resp.status_code << " " << reason_phrase(resp.status_code) << "\r\n";

    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    out << resp.body;

    return out.str();
}

} // namespace liverun
