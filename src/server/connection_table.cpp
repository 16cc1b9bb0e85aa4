#include "paykit/server/connection_table.hpp"

#include <mutex>

namespace paykit::server {

ConnectionTable::ConnectionTable(const size_t shard_count)
    : shards_(shard_count == 0 ? 1 : shard_count) {}

ConnectionTable::Shard& ConnectionTable::ShardFor(const std::string& connection_id) {
    return shards_[std::hash<std::string>{}(connection_id) % shards_.size()];
}

const ConnectionTable::Shard& ConnectionTable::ShardFor(const std::string& connection_id) const {
    return shards_[std::hash<std::string>{}(connection_id) % shards_.size()];
}

bool ConnectionTable::Insert(ConnectionRecord record, CancelFn cancel) {
    Shard& shard = ShardFor(record.connection_id);
    std::unique_lock lock(shard.mutex);
    std::string key = record.connection_id;
    const auto [it, inserted] = shard.entries.try_emplace(
        std::move(key), Entry{std::move(record), std::move(cancel)});
    if (inserted) {
        size_.fetch_add(1, std::memory_order_acq_rel);
    }
    return inserted;
}

bool ConnectionTable::Remove(const std::string& connection_id) {
    return Extract(connection_id).has_value();
}

std::optional<ConnectionTable::CancelFn> ConnectionTable::Extract(const std::string& connection_id) {
    Shard& shard = ShardFor(connection_id);
    std::unique_lock lock(shard.mutex);
    auto node = shard.entries.extract(connection_id);
    if (node.empty()) {
        return std::nullopt;
    }
    size_.fetch_sub(1, std::memory_order_acq_rel);
    return std::move(node.mapped().cancel);
}

bool ConnectionTable::Update(
    const std::string& connection_id,
    const std::function<void(ConnectionRecord&)>& mutate) {
    Shard& shard = ShardFor(connection_id);
    std::unique_lock lock(shard.mutex);
    const auto it = shard.entries.find(connection_id);
    if (it == shard.entries.end()) {
        return false;
    }
    mutate(it->second.record);
    return true;
}

std::optional<ConnectionRecord> ConnectionTable::Find(const std::string& connection_id) const {
    const Shard& shard = ShardFor(connection_id);
    std::shared_lock lock(shard.mutex);
    const auto it = shard.entries.find(connection_id);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<ConnectionRecord> ConnectionTable::Snapshot() const {
    std::vector<ConnectionRecord> records;
    records.reserve(Size());
    for (const Shard& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        for (const auto& [id, entry] : shard.entries) {
            records.push_back(entry.record);
        }
    }
    return records;
}

size_t ConnectionTable::CancelAll() const {
    std::vector<CancelFn> callbacks;
    for (const Shard& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        for (const auto& [id, entry] : shard.entries) {
            if (entry.cancel) {
                callbacks.push_back(entry.cancel);
            }
        }
    }
    for (const auto& cancel : callbacks) {
        cancel();
    }
    return callbacks.size();
}

void ConnectionTable::Clear() {
    for (Shard& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        size_.fetch_sub(shard.entries.size(), std::memory_order_acq_rel);
        shard.entries.clear();
    }
}

}
