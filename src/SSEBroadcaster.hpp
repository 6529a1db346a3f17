#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

// Fans server-sent events out to every connected client.
class SSEBroadcaster {
public:
    using Sender = std::function<void(const std::string&)>;

    // Returns an id for unsubscribe().
    uint64_t subscribe(Sender sendEvent);
    void unsubscribe(uint64_t id);
    void broadcast(const std::string& type, const std::string& data);
    size_t subscriberCount() const;

    static std::string formatEvent(const std::string& type, const std::string& data);

private:
    std::map<uint64_t, Sender> clients;
    uint64_t nextId = 1;
    mutable std::mutex mtx;
};
