#pragma once

#include "paykit/core/constants.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace paykit::server {

/// Server-side view of one accepted transport connection.
struct ConnectionRecord {
    std::string connection_id;
    std::optional<std::string> session_id;
    bool is_handshake_complete = false;
    std::optional<std::string> peer_public_key_hex;
    std::string remote_address;
    std::chrono::system_clock::time_point connected_at;
};

/**
 * @brief Sharded map of live connections keyed by connection id
 *
 * Each shard has its own reader/writer lock, so inserting or removing one
 * connection never blocks lookups of connections in other shards. No lock is
 * held while a cancel callback runs.
 *
 * A record is removed at most once: whichever of Remove or Extract reaches an
 * entry first takes it, every later call reports it missing.
 */
class ConnectionTable {
public:
    using CancelFn = std::function<void()>;

    explicit ConnectionTable(size_t shard_count = ServerConstants::CONNECTION_TABLE_SHARDS);

    ConnectionTable(const ConnectionTable&) = delete;
    ConnectionTable& operator=(const ConnectionTable&) = delete;

    /// Fails when the id is already present.
    bool Insert(ConnectionRecord record, CancelFn cancel);

    bool Remove(const std::string& connection_id);

    /// Removes the entry and hands back its cancel callback.
    std::optional<CancelFn> Extract(const std::string& connection_id);

    bool Update(const std::string& connection_id, const std::function<void(ConnectionRecord&)>& mutate);

    [[nodiscard]] std::optional<ConnectionRecord> Find(const std::string& connection_id) const;
    [[nodiscard]] std::vector<ConnectionRecord> Snapshot() const;
    [[nodiscard]] size_t Size() const noexcept { return size_.load(std::memory_order_acquire); }

    /// Invokes every cancel callback. Entries stay until their owners remove them.
    size_t CancelAll() const;

    void Clear();

private:
    struct Entry {
        ConnectionRecord record;
        CancelFn cancel;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Entry> entries;
    };

    [[nodiscard]] Shard& ShardFor(const std::string& connection_id);
    [[nodiscard]] const Shard& ShardFor(const std::string& connection_id) const;

    std::vector<Shard> shards_;
    std::atomic<size_t> size_{0};
};

}
