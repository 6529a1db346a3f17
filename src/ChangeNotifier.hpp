#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "ChangeRing.hpp"
#include "PathSanitizer.hpp"

class ChangeNotifier {
public:
    using Listener = std::function<void(const ChangeRecord&)>;

    virtual ~ChangeNotifier() = default;

    // Returns false if watching could not be set up.
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool active() const = 0;
    virtual std::vector<ChangeRecord> recentChanges() const = 0;
    virtual Json::Value recentChangesJson() const = 0;

    // Invoked on the watcher thread after each recorded change.
    virtual void setListener(Listener listener) = 0;
};

// Used when watching is disabled or unavailable.
class NullChangeNotifier : public ChangeNotifier {
public:
    bool start() override { return false; }
    void stop() override {}
    bool active() const override { return false; }
    std::vector<ChangeRecord> recentChanges() const override { return {}; }
    Json::Value recentChangesJson() const override { return Json::Value(Json::arrayValue); }
    void setListener(Listener) override {}
};

// Recursive watcher on top of Linux inotify. One watch per directory under the
// base; directories created later are added as their create events arrive.
class InotifyChangeNotifier : public ChangeNotifier {
public:
    InotifyChangeNotifier(const PathSanitizer& sanitizer, size_t capacity = ChangeRing::kDefaultCapacity);
    ~InotifyChangeNotifier() override;

    bool start() override;
    void stop() override;
    bool active() const override { return running_.load(); }
    std::vector<ChangeRecord> recentChanges() const override { return ring_.snapshot(); }
    Json::Value recentChangesJson() const override { return ring_.toJson(); }
    void setListener(Listener listener) override;

    // Appends a record for an absolute path. Called by the event loop.
    void record(const std::filesystem::path& absolutePath, const std::string& type);

private:
    void addWatchTree(const std::filesystem::path& dir);
    void addWatch(const std::filesystem::path& dir);
    void monitorLoop();
    void handleEvents(const char* buffer, size_t length);

    const PathSanitizer& sanitizer_;
    ChangeRing ring_;
    int inotifyFd_ = -1;
    std::atomic<bool> running_{false};
    std::thread monitorThread_;
    std::unordered_map<int, std::filesystem::path> watchDescriptors_;
    uint32_t pendingMoveCookie_ = 0;
    Listener listener_;
    std::mutex listenerMtx_;
};

// Picks the inotify notifier when enabled and it starts, the no-op one otherwise.
std::unique_ptr<ChangeNotifier> makeChangeNotifier(const PathSanitizer& sanitizer, bool enabled, size_t capacity);
