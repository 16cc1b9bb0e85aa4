#pragma once

#include "paykit/configuration/key_cache_config.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"
#include "paykit/crypto/secure_memory_handle.hpp"
#include "paykit/interfaces/i_key_derivation.hpp"
#include "paykit/interfaces/i_key_store.hpp"
#include "paykit/keys/key_pair_record.hpp"
#include "paykit/keys/key_record_codec.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace paykit::keys {

struct CacheStats {
    size_t memory_count = 0;
    std::vector<std::string> keys;
};

/**
 * @brief Two-level cache of device/epoch scoped static key pairs
 *
 * Lookups go memory, then the persistent store, then the derivation primitive.
 * At most `max_cached_epochs` epochs are kept per device; after every insert
 * the lowest epochs beyond that limit are evicted from both layers.
 *
 * Reads take a shared lock. Inserts, evictions and clears are serialized by an
 * exclusive lock. The persisted index is rewritten under that lock after every
 * insert (entry first, then index) and before every removal (index first, then
 * entry), so the index never references a deleted entry.
 */
class KeyDerivationCache {
public:
    /// Validates @p config and loads every entry the persisted index lists.
    /// Unreadable entries are dropped from the index.
    static Result<std::unique_ptr<KeyDerivationCache>, PaykitFailure> Create(
        std::shared_ptr<interfaces::IKeyStore> store,
        std::shared_ptr<interfaces::IKeyDerivation> derivation,
        configuration::KeyCacheConfig config = configuration::KeyCacheConfig::Default());

    KeyDerivationCache(const KeyDerivationCache&) = delete;
    KeyDerivationCache& operator=(const KeyDerivationCache&) = delete;

    Result<Unit, PaykitFailure> SetIdentitySeed(std::span<const uint8_t> seed);
    [[nodiscard]] bool HasIdentity() const;

    Result<KeyPairRecord, PaykitFailure> GetOrDerive(std::string_view device_id, uint32_t epoch);

    [[nodiscard]] Result<std::optional<KeyPairRecord>, PaykitFailure> GetKey(
        std::string_view device_id, uint32_t epoch);
    Result<Unit, PaykitFailure> SetKey(const KeyPairRecord& record);
    Result<Unit, PaykitFailure> ClearKey(std::string_view device_id, uint32_t epoch);
    Result<Unit, PaykitFailure> ClearAllKeys(std::string_view device_id);
    Result<Unit, PaykitFailure> ClearAll();

    [[nodiscard]] std::optional<uint32_t> GetLatestEpoch(std::string_view device_id) const;

    /// Derives and caches latest + 1, or epoch 0 for a device with no keys.
    Result<KeyPairRecord, PaykitFailure> RotateEpoch(std::string_view device_id);

    [[nodiscard]] CacheStats Stats() const;

private:
    KeyDerivationCache(
        std::shared_ptr<interfaces::IKeyStore> store,
        std::shared_ptr<interfaces::IKeyDerivation> derivation,
        configuration::KeyCacheConfig config);

    Result<Unit, PaykitFailure> LoadIndex();
    Result<Unit, PaykitFailure> PersistIndex(const std::set<IndexEntry>& index) const;

    [[nodiscard]] std::optional<KeyPairRecord> FindInMemory(std::string_view device_id, uint32_t epoch) const;
    Result<std::optional<KeyPairRecord>, PaykitFailure> LoadFromStore(std::string_view device_id, uint32_t epoch) const;

    Result<Unit, PaykitFailure> InsertLocked(const KeyPairRecord& record);
    Result<Unit, PaykitFailure> EvictLocked(const std::string& device_id);
    Result<Unit, PaykitFailure> RemoveLocked(const std::string& device_id, const std::vector<uint32_t>& epochs);

    std::shared_ptr<interfaces::IKeyStore> store_;
    std::shared_ptr<interfaces::IKeyDerivation> derivation_;
    configuration::KeyCacheConfig config_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::map<uint32_t, KeyPairRecord>, std::less<>> memory_;
    std::set<IndexEntry> index_;
    crypto::SecureMemoryHandle identity_seed_;
};

}
