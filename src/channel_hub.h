#pragma once

#include "events.h"
#include "websocket.h"
#include <string>
#include <map>
#include <memory>
#include <set>
#include <mutex>

namespace liverun {

// Fans execution events out to the WebSocket clients subscribed to a
// channel. Writes to each socket are serialized by a per-socket lock, so a
// connection thread must send through send_to() rather than writing
// directly. The subscription table lock is never held during a write, so a
// stalled client only delays publishers to its own channels.
// Sockets are owned by their connection threads; a client whose send fails
// is dropped from its channels but never closed here.
class ChannelHub : public OutputSink {
public:
    void subscribe(const std::string& channel_id, int client_fd);
    void unsubscribe(const std::string& channel_id, int client_fd);

    // OutputSink
    void publish(const std::string& channel_id, const Event& event) override;

    // Send text to every subscriber of a channel; returns how many got it
    size_t broadcast(const std::string& channel_id, const std::string& message);

    // Send one frame to a single client
    bool send_to(int client_fd, WSOpcode opcode, const std::string& payload);

    size_t subscriber_count(const std::string& channel_id) const;
    size_t channel_count() const;

private:
    std::shared_ptr<std::mutex> writer_for(int client_fd);
    void drop_client(const std::string& channel_id, int client_fd);

    mutable std::mutex mutex_;
    std::map<std::string, std::set<int>> subscribers_;  // channel_id -> client fds
    std::map<int, std::shared_ptr<std::mutex>> writers_; // client fd -> write lock
};

} // namespace liverun
