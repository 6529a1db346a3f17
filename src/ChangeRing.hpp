#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

struct ChangeRecord {
    std::string path;  // relative to the base directory
    std::string type;  // created, modified, deleted, moved
    std::optional<double> time;  // mtime in seconds, unset if the file is gone
};

// Bounded FIFO of the most recent changes. Appends come from the watcher
// thread while tool calls read snapshots.
class ChangeRing {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit ChangeRing(size_t capacity = kDefaultCapacity);

    void push(ChangeRecord record);
    std::vector<ChangeRecord> snapshot() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

    Json::Value toJson() const;

private:
    const size_t capacity_;
    std::deque<ChangeRecord> records_;
    mutable std::mutex mtx_;
};
