#include "ChangeRing.hpp"

ChangeRing::ChangeRing(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void ChangeRing::push(ChangeRecord record) {
    std::lock_guard lock(mtx_);
    records_.push_back(std::move(record));
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

std::vector<ChangeRecord> ChangeRing::snapshot() const {
    std::lock_guard lock(mtx_);
    return std::vector<ChangeRecord>(records_.begin(), records_.end());
}

size_t ChangeRing::size() const {
    std::lock_guard lock(mtx_);
    return records_.size();
}

Json::Value ChangeRing::toJson() const {
    Json::Value changes(Json::arrayValue);
    for (const auto& record : snapshot()) {
        Json::Value change;
        change["path"] = record.path;
        change["type"] = record.type;
        change["time"] = record.time ? Json::Value(*record.time) : Json::Value(Json::nullValue);
        changes.append(change);
    }
    return changes;
}
