#include "service_routes.h"
#include "channel_hub.h"
#include "execution_engine.h"
#include "protocol.h"
#include "websocket.h"
#include <json/json.h>

namespace liverun {

namespace {

// Keeps a socket subscribed to a channel for the lifetime of the connection
class ChannelSubscription {
public:
    ChannelSubscription(ChannelHub& hub, std::string channel_id, int client_fd)
        : hub_(hub), channel_id_(std::move(channel_id)), client_fd_(client_fd) {
        hub_.subscribe(channel_id_, client_fd_);
    }
    ~ChannelSubscription() { hub_.unsubscribe(channel_id_, client_fd_); }

    ChannelSubscription(const ChannelSubscription&) = delete;
    ChannelSubscription& operator=(const ChannelSubscription&) = delete;

private:
    ChannelHub& hub_;
    std::string channel_id_;
    int client_fd_;
};

HttpResponse json_response(const Json::Value& body) {
    HttpResponse resp;
    resp.body = to_json_string(body);
    return resp;
}

} // namespace

void install_routes(HttpServer& server, ChannelHub& hub, ExecutionEngine& engine,
                    SubmissionDispatcher& dispatcher) {
    // GET / - Basic info
    server.route("GET", "/", [](const HttpRequest&) {
        Json::Value info;
        info["service"] = "liverun";
        info["status"] = "running";
        info["description"] = "Interactive code execution with live output streaming";
        info["channels"] = std::string(CHANNEL_PATH_PREFIX) + "{channelId}";
        return json_response(info);
    });

    // GET /health - Liveness and load
    server.route("GET", "/health", [&engine](const HttpRequest&) {
        Json::Value health;
        health["status"] = "ok";
        health["activeExecutions"] = static_cast<Json::UInt64>(engine.active_executions());
        return json_response(health);
    });

    // POST /run_code - Start a run, or feed input to one
    server.route("POST", "/run_code", [&dispatcher](const HttpRequest& req) {
        return json_response(dispatcher.handle(req.body));
    });

    // POST /provide_input - Feed one input line
    server.route("POST", "/provide_input", [&dispatcher](const HttpRequest& req) {
        return json_response(dispatcher.handle_input(req.body));
    });

    // WS /channel/{id} - Events for a channel; text frames are submissions
    server.websocket_route(CHANNEL_PATH_PREFIX, [&hub, &dispatcher](int client_fd,
                                                                    const HttpRequest& req) {
        std::string channel_id = req.path.substr(std::string(CHANNEL_PATH_PREFIX).size());
        if (channel_id.empty()) {
            hub.send_to(client_fd, WSOpcode::CLOSE, "");
            return;
        }

        ChannelSubscription subscription(hub, channel_id, client_fd);
        auto reply = [&hub, client_fd](WSOpcode opcode, const std::string& payload) {
            return hub.send_to(client_fd, opcode, payload);
        };

        std::string message;
        while (WebSocketManager::read_message(client_fd, message, MAX_REQUEST_SIZE, reply)) {
            Json::Value response = dispatcher.handle(message, channel_id);
            response["event"] = "response";
            if (!hub.send_to(client_fd, WSOpcode::TEXT, to_json_string(response))) {
                break;
            }
        }
    });
}

} // namespace liverun
