#pragma once

#include "constants.h"
#include <string>
#include <functional>
#include <map>
#include <set>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace liverun {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;           // Without the query string
    std::string query;          // Text after '?', if any
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup; empty if absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Runs a WebSocket connection after the handshake; returns when the client
// goes away. The server closes the socket afterwards.
using WebSocketHandler = std::function<void(int client_fd, const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection
class HttpServer {
public:
    explicit HttpServer(int port = DEFAULT_PORT);
    ~HttpServer();

    // Register route handlers. A path ending in '/' (other than "/" itself)
    // also matches any path below it; exact matches win, then the longest
    // prefix.
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Upgrade GET requests under path_prefix to WebSocket connections
    void websocket_route(const std::string& path_prefix, WebSocketHandler handler);

    // Bind and listen. Returns the bound port (useful with port 0). Throws
    // std::runtime_error on failure.
    int listen();

    // Accept connections until stop() (blocks)
    void serve();

    // listen() then serve()
    void start();

    // Stop accepting, shut down open connections and wait for their
    // threads to finish
    void stop();

    int port() const { return port_; }

    // Route a parsed request to its handler (404 if none, 500 if it throws)
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string reason_phrase(int status_code);

private:
    void handle_client(int client_fd, const std::string& client_ip);
    bool read_request(int client_fd, std::string& request_data);
    void handle_websocket(int client_fd, const HttpRequest& req);
    const WebSocketHandler* find_websocket_route(const std::string& path) const;

    void track_client(int client_fd);
    void release_client(int client_fd);

    int port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;
    std::map<std::string, WebSocketHandler> websocket_routes_;

    std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    std::set<int> clients_;
};

} // namespace liverun
