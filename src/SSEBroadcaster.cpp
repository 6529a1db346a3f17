#include "SSEBroadcaster.hpp"
#include <vector>

uint64_t SSEBroadcaster::subscribe(Sender sendEvent) {
    std::lock_guard lock(mtx);
    uint64_t id = nextId++;
    clients.emplace(id, std::move(sendEvent));
    return id;
}

void SSEBroadcaster::unsubscribe(uint64_t id) {
    std::lock_guard lock(mtx);
    clients.erase(id);
}

size_t SSEBroadcaster::subscriberCount() const {
    std::lock_guard lock(mtx);
    return clients.size();
}

std::string SSEBroadcaster::formatEvent(const std::string& type, const std::string& data) {
    return "event: " + type + "\ndata: " + data + "\n\n";
}

void SSEBroadcaster::broadcast(const std::string& type, const std::string& data) {
    std::vector<Sender> targets;
    {
        std::lock_guard lock(mtx);
        for (const auto& entry : clients) {
            targets.push_back(entry.second);
        }
    }
    // send outside the lock so a sender may unsubscribe itself
    std::string event = formatEvent(type, data);
    for (auto& client : targets) {
        client(event);
    }
}
