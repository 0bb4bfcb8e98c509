#include "channel_hub.h"
#include <iostream>
#include <vector>

namespace liverun {

void ChannelHub::subscribe(const std::string& channel_id, int client_fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[channel_id].insert(client_fd);
    std::cout << "[Channel] Client " << client_fd << " subscribed to " << channel_id << std::endl;
}

void ChannelHub::unsubscribe(const std::string& channel_id, int client_fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(channel_id);
    if (it != subscribers_.end()) {
        it->second.erase(client_fd);
        if (it->second.empty()) {
            subscribers_.erase(it);
        }
    }

    bool still_subscribed = false;
    for (const auto& [channel, fds] : subscribers_) {
        if (fds.count(client_fd)) {
            still_subscribed = true;
            break;
        }
    }
    if (!still_subscribed) {
        writers_.erase(client_fd);
    }
    std::cout << "[Channel] Client " << client_fd << " unsubscribed from " << channel_id << std::endl;
}

void ChannelHub::publish(const std::string& channel_id, const Event& event) {
    broadcast(channel_id, event.serialize());
}

std::shared_ptr<std::mutex> ChannelHub::writer_for(int client_fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& writer = writers_[client_fd];
    if (!writer) {
        writer = std::make_shared<std::mutex>();
    }
    return writer;
}

void ChannelHub::drop_client(const std::string& channel_id, int client_fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(channel_id);
    if (it == subscribers_.end() || !it->second.erase(client_fd)) {
        return;
    }
    std::cerr << "[Channel] Dropping client " << client_fd << " from " << channel_id
              << ": send failed" << std::endl;
    if (it->second.empty()) {
        subscribers_.erase(it);
    }
}

size_t ChannelHub::broadcast(const std::string& channel_id, const std::string& message) {
    std::vector<std::pair<int, std::shared_ptr<std::mutex>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(channel_id);
        if (it == subscribers_.end()) {
            return 0;
        }
        for (int client_fd : it->second) {
            auto& writer = writers_[client_fd];
            if (!writer) {
                writer = std::make_shared<std::mutex>();
            }
            targets.emplace_back(client_fd, writer);
        }
    }

    size_t delivered = 0;
    for (const auto& [client_fd, writer] : targets) {
        bool sent;
        {
            std::lock_guard<std::mutex> write_lock(*writer);
            sent = WebSocketManager::send_text(client_fd, message);
        }
        if (sent) {
            ++delivered;
        } else {
            drop_client(channel_id, client_fd);
        }
    }
    return delivered;
}

bool ChannelHub::send_to(int client_fd, WSOpcode opcode, const std::string& payload) {
    auto writer = writer_for(client_fd);
    std::lock_guard<std::mutex> write_lock(*writer);
    return WebSocketManager::send_frame(client_fd, opcode, payload);
}

size_t ChannelHub::subscriber_count(const std::string& channel_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(channel_id);
    return it == subscribers_.end() ? 0 : it->second.size();
}

size_t ChannelHub::channel_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace liverun
