#include "paykit/keys/key_derivation_cache.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/core/hex.hpp"
#include "paykit/core/logging.hpp"
#include "paykit/crypto/sodium_interop.hpp"

#include <algorithm>
#include <mutex>

namespace paykit::keys {

namespace {
    const std::string kIndexKey(KeyConstants::CACHE_INDEX_KEY);
}

Result<std::unique_ptr<KeyDerivationCache>, PaykitFailure> KeyDerivationCache::Create(
    std::shared_ptr<interfaces::IKeyStore> store,
    std::shared_ptr<interfaces::IKeyDerivation> derivation,
    const configuration::KeyCacheConfig config) {
    using ResultType = Result<std::unique_ptr<KeyDerivationCache>, PaykitFailure>;

    if (!store || !derivation) {
        return ResultType::Err(PaykitFailure::InvalidInput("Key store and derivation are required"));
    }
    if (auto valid = config.Validate(); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return ResultType::Err(
            PaykitFailure::FromSodiumFailure(init.UnwrapErr(), PaykitFailureType::KeyDerivationFailed));
    }

    std::unique_ptr<KeyDerivationCache> cache(
        new KeyDerivationCache(std::move(store), std::move(derivation), config));
    if (auto loaded = cache->LoadIndex(); loaded.IsErr()) {
        return ResultType::Err(std::move(loaded).UnwrapErr());
    }
    return ResultType::Ok(std::move(cache));
}

KeyDerivationCache::KeyDerivationCache(
    std::shared_ptr<interfaces::IKeyStore> store,
    std::shared_ptr<interfaces::IKeyDerivation> derivation,
    const configuration::KeyCacheConfig config)
    : store_(std::move(store))
    , derivation_(std::move(derivation))
    , config_(config) {}

Result<Unit, PaykitFailure> KeyDerivationCache::LoadIndex() {
    std::unique_lock lock(mutex_);

    auto raw_index = store_->Get(kIndexKey);
    if (raw_index.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(std::move(raw_index).UnwrapErr());
    }
    const auto& index_bytes = raw_index.Unwrap();
    if (!index_bytes.has_value()) {
        return Result<Unit, PaykitFailure>::Ok(unit);
    }

    auto parsed = ParseIndex(*index_bytes);
    if (parsed.IsErr()) {
        PAYKIT_LOG_WARN("Key cache index unreadable, starting empty: {}", parsed.UnwrapErr().message);
        return PersistIndex(index_);
    }

    bool dropped = false;
    for (const auto& [device_id, epoch] : parsed.Unwrap()) {
        auto loaded = LoadFromStore(device_id, epoch);
        if (loaded.IsErr() || !loaded.Unwrap().has_value()) {
            PAYKIT_LOG_WARN("Dropping unreadable key cache entry {}", MakeCacheKey(device_id, epoch));
            dropped = true;
            continue;
        }
        memory_[device_id][epoch] = std::move(*std::move(loaded).Unwrap());
        index_.emplace(device_id, epoch);
    }

    PAYKIT_LOG_DEBUG("Key cache loaded {} entries", index_.size());
    if (dropped) {
        return PersistIndex(index_);
    }
    return Result<Unit, PaykitFailure>::Ok(unit);
}

Result<Unit, PaykitFailure> KeyDerivationCache::PersistIndex(const std::set<IndexEntry>& index) const {
    auto bytes = SerializeIndex(std::vector<IndexEntry>(index.begin(), index.end()));
    if (bytes.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(std::move(bytes).UnwrapErr());
    }
    return store_->Put(kIndexKey, bytes.Unwrap());
}

Result<Unit, PaykitFailure> KeyDerivationCache::SetIdentitySeed(std::span<const uint8_t> seed) {
    if (seed.size() < KeyConstants::MIN_SEED_SIZE) {
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::KeyDerivationFailed(
                "Seed must be at least " + std::to_string(KeyConstants::MIN_SEED_SIZE) + " bytes"));
    }
    auto handle = crypto::SecureMemoryHandle::FromBytes(seed);
    if (handle.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::FromSodiumFailure(handle.UnwrapErr(), PaykitFailureType::KeyDerivationFailed));
    }
    std::unique_lock lock(mutex_);
    identity_seed_ = std::move(handle).Unwrap();
    return Result<Unit, PaykitFailure>::Ok(unit);
}

bool KeyDerivationCache::HasIdentity() const {
    std::shared_lock lock(mutex_);
    return !identity_seed_.IsInvalid();
}

std::optional<KeyPairRecord> KeyDerivationCache::FindInMemory(
    const std::string_view device_id, const uint32_t epoch) const {
    const auto device_it = memory_.find(device_id);
    if (device_it == memory_.end()) {
        return std::nullopt;
    }
    const auto epoch_it = device_it->second.find(epoch);
    if (epoch_it == device_it->second.end()) {
        return std::nullopt;
    }
    return epoch_it->second;
}

Result<std::optional<KeyPairRecord>, PaykitFailure> KeyDerivationCache::LoadFromStore(
    const std::string_view device_id, const uint32_t epoch) const {
    using ResultType = Result<std::optional<KeyPairRecord>, PaykitFailure>;

    auto raw = store_->Get(MakeCacheKey(device_id, epoch));
    if (raw.IsErr()) {
        return ResultType::Err(std::move(raw).UnwrapErr());
    }
    auto& bytes = raw.Unwrap();
    if (!bytes.has_value()) {
        return ResultType::Ok(std::nullopt);
    }
    auto parsed = ParseKeyPair(*bytes);
    crypto::SodiumInterop::SecureWipe(*bytes);
    if (parsed.IsErr()) {
        return ResultType::Err(std::move(parsed).UnwrapErr());
    }
    if (parsed.Unwrap().device_id != device_id || parsed.Unwrap().epoch != epoch) {
        return ResultType::Err(PaykitFailure::StorageFailed(
            "Stored key pair does not match " + MakeCacheKey(device_id, epoch)));
    }
    return ResultType::Ok(std::move(parsed).Unwrap());
}

Result<KeyPairRecord, PaykitFailure> KeyDerivationCache::GetOrDerive(
    const std::string_view device_id, const uint32_t epoch) {

    if (device_id.empty()) {
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::InvalidInput("Device id must not be empty"));
    }

    {
        std::shared_lock lock(mutex_);
        if (auto cached = FindInMemory(device_id, epoch)) {
            return Result<KeyPairRecord, PaykitFailure>::Ok(std::move(*cached));
        }
    }

    std::unique_lock lock(mutex_);
    if (auto cached = FindInMemory(device_id, epoch)) {
        return Result<KeyPairRecord, PaykitFailure>::Ok(std::move(*cached));
    }

    auto stored = LoadFromStore(device_id, epoch);
    if (stored.IsOk() && stored.Unwrap().has_value()) {
        KeyPairRecord record = std::move(*std::move(stored).Unwrap());
        if (auto inserted = InsertLocked(record); inserted.IsErr()) {
            return Result<KeyPairRecord, PaykitFailure>::Err(std::move(inserted).UnwrapErr());
        }
        return Result<KeyPairRecord, PaykitFailure>::Ok(std::move(record));
    }
    if (stored.IsErr()) {
        PAYKIT_LOG_WARN("Ignoring unreadable stored key {}: {}",
                        MakeCacheKey(device_id, epoch), stored.UnwrapErr().message);
    }

    if (identity_seed_.IsInvalid()) {
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::NoIdentity("No identity seed configured"));
    }

    auto derived = identity_seed_.WithReadAccess([&](std::span<const uint8_t> seed) {
        return derivation_->DeriveKeypair(seed, device_id, epoch);
    });
    if (derived.IsErr()) {
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::FromSodiumFailure(derived.UnwrapErr(), PaykitFailureType::KeyDerivationFailed));
    }
    auto record_result = std::move(derived).Unwrap();
    if (record_result.IsErr()) {
        const auto& failure = record_result.UnwrapErr();
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::KeyDerivationFailed(failure.message));
    }
    KeyPairRecord record = std::move(record_result).Unwrap();

    if (auto inserted = InsertLocked(record); inserted.IsErr()) {
        return Result<KeyPairRecord, PaykitFailure>::Err(std::move(inserted).UnwrapErr());
    }
    PAYKIT_LOG_INFO("Derived static key for {} epoch {} ({})",
                    record.device_id, record.epoch, hex::Abbreviate(record.public_key));
    return Result<KeyPairRecord, PaykitFailure>::Ok(std::move(record));
}

Result<std::optional<KeyPairRecord>, PaykitFailure> KeyDerivationCache::GetKey(
    const std::string_view device_id, const uint32_t epoch) {
    {
        std::shared_lock lock(mutex_);
        if (auto cached = FindInMemory(device_id, epoch)) {
            return Result<std::optional<KeyPairRecord>, PaykitFailure>::Ok(std::move(cached));
        }
    }

    std::unique_lock lock(mutex_);
    if (auto cached = FindInMemory(device_id, epoch)) {
        return Result<std::optional<KeyPairRecord>, PaykitFailure>::Ok(std::move(cached));
    }
    auto stored = LoadFromStore(device_id, epoch);
    if (stored.IsErr() || !stored.Unwrap().has_value()) {
        return stored;
    }
    const KeyPairRecord& record = *stored.Unwrap();
    if (auto inserted = InsertLocked(record); inserted.IsErr()) {
        return Result<std::optional<KeyPairRecord>, PaykitFailure>::Err(std::move(inserted).UnwrapErr());
    }
    return stored;
}

Result<Unit, PaykitFailure> KeyDerivationCache::SetKey(const KeyPairRecord& record) {
    if (record.device_id.empty() ||
        record.secret_key.size() != KeyConstants::X25519_KEY_SIZE ||
        record.public_key.size() != KeyConstants::X25519_KEY_SIZE) {
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::InvalidInput("Key pair record is incomplete"));
    }
    std::unique_lock lock(mutex_);
    return InsertLocked(record);
}

Result<Unit, PaykitFailure> KeyDerivationCache::InsertLocked(const KeyPairRecord& record) {
    auto bytes = SerializeKeyPair(record);
    if (bytes.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(std::move(bytes).UnwrapErr());
    }
    const std::string key = record.CacheKey();
    auto put = store_->Put(key, bytes.Unwrap());
    crypto::SodiumInterop::SecureWipe(bytes.Unwrap());
    if (put.IsErr()) {
        return put;
    }

    const IndexEntry entry{record.device_id, record.epoch};
    if (!index_.contains(entry)) {
        std::set<IndexEntry> next = index_;
        next.insert(entry);
        if (auto persisted = PersistIndex(next); persisted.IsErr()) {
            if (auto rollback = store_->Remove(key); rollback.IsErr()) {
                PAYKIT_LOG_WARN("Could not roll back {}: {}", key, rollback.UnwrapErr().message);
            }
            return persisted;
        }
        index_ = std::move(next);
    }

    memory_[record.device_id][record.epoch] = record;
    return EvictLocked(record.device_id);
}

Result<Unit, PaykitFailure> KeyDerivationCache::EvictLocked(const std::string& device_id) {
    const auto device_it = memory_.find(device_id);
    if (device_it == memory_.end()) {
        return Result<Unit, PaykitFailure>::Ok(unit);
    }

    std::vector<uint32_t> epochs;
    epochs.reserve(device_it->second.size());
    for (const auto& [epoch, record] : device_it->second) {
        epochs.push_back(epoch);
    }
    std::sort(epochs.begin(), epochs.end(), std::greater<>());

    const size_t keep = config_.MaxCachedEpochs();
    if (epochs.size() <= keep) {
        return Result<Unit, PaykitFailure>::Ok(unit);
    }
    std::vector<uint32_t> evicted(epochs.begin() + static_cast<std::ptrdiff_t>(keep), epochs.end());
    for (const uint32_t epoch : evicted) {
        PAYKIT_LOG_DEBUG("Evicting key cache entry {}", MakeCacheKey(device_id, epoch));
    }
    return RemoveLocked(device_id, evicted);
}

Result<Unit, PaykitFailure> KeyDerivationCache::RemoveLocked(
    const std::string& device_id, const std::vector<uint32_t>& epochs) {
    if (epochs.empty()) {
        return Result<Unit, PaykitFailure>::Ok(unit);
    }

    std::set<IndexEntry> next = index_;
    for (const uint32_t epoch : epochs) {
        next.erase(IndexEntry{device_id, epoch});
    }
    if (next.size() != index_.size()) {
        if (auto persisted = PersistIndex(next); persisted.IsErr()) {
            return persisted;
        }
        index_ = std::move(next);
    }

    for (const uint32_t epoch : epochs) {
        if (auto removed = store_->Remove(MakeCacheKey(device_id, epoch)); removed.IsErr()) {
            PAYKIT_LOG_WARN("Orphaned key cache entry {}: {}",
                            MakeCacheKey(device_id, epoch), removed.UnwrapErr().message);
        }
        if (const auto device_it = memory_.find(device_id); device_it != memory_.end()) {
            if (const auto epoch_it = device_it->second.find(epoch); epoch_it != device_it->second.end()) {
                crypto::SodiumInterop::SecureWipe(epoch_it->second.secret_key);
                device_it->second.erase(epoch_it);
            }
            if (device_it->second.empty()) {
                memory_.erase(device_it);
            }
        }
    }
    return Result<Unit, PaykitFailure>::Ok(unit);
}

Result<Unit, PaykitFailure> KeyDerivationCache::ClearKey(const std::string_view device_id, const uint32_t epoch) {
    std::unique_lock lock(mutex_);
    return RemoveLocked(std::string(device_id), {epoch});
}

Result<Unit, PaykitFailure> KeyDerivationCache::ClearAllKeys(const std::string_view device_id) {
    std::unique_lock lock(mutex_);
    std::set<uint32_t> epochs;
    for (const auto& [device, epoch] : index_) {
        if (device == device_id) {
            epochs.insert(epoch);
        }
    }
    if (const auto device_it = memory_.find(device_id); device_it != memory_.end()) {
        for (const auto& [epoch, record] : device_it->second) {
            epochs.insert(epoch);
        }
    }
    return RemoveLocked(std::string(device_id), std::vector<uint32_t>(epochs.begin(), epochs.end()));
}

Result<Unit, PaykitFailure> KeyDerivationCache::ClearAll() {
    std::unique_lock lock(mutex_);
    std::map<std::string, std::set<uint32_t>> by_device;
    for (const auto& [device, epoch] : index_) {
        by_device[device].insert(epoch);
    }
    for (const auto& [device, records] : memory_) {
        for (const auto& [epoch, record] : records) {
            by_device[device].insert(epoch);
        }
    }
    for (const auto& [device, epochs] : by_device) {
        auto removed = RemoveLocked(device, std::vector<uint32_t>(epochs.begin(), epochs.end()));
        if (removed.IsErr()) {
            return removed;
        }
    }
    PAYKIT_LOG_INFO("Key cache cleared");
    return Result<Unit, PaykitFailure>::Ok(unit);
}

std::optional<uint32_t> KeyDerivationCache::GetLatestEpoch(const std::string_view device_id) const {
    std::shared_lock lock(mutex_);
    std::optional<uint32_t> latest;
    for (const auto& [device, epoch] : index_) {
        if (device == device_id && (!latest || epoch > *latest)) {
            latest = epoch;
        }
    }
    if (const auto device_it = memory_.find(device_id);
        device_it != memory_.end() && !device_it->second.empty()) {
        const uint32_t highest = device_it->second.rbegin()->first;
        if (!latest || highest > *latest) {
            latest = highest;
        }
    }
    return latest;
}

Result<KeyPairRecord, PaykitFailure> KeyDerivationCache::RotateEpoch(const std::string_view device_id) {
    const std::optional<uint32_t> latest = GetLatestEpoch(device_id);
    const uint32_t next = latest ? *latest + 1 : 0;
    PAYKIT_LOG_INFO("Rotating {} to epoch {}", device_id, next);
    return GetOrDerive(device_id, next);
}

CacheStats KeyDerivationCache::Stats() const {
    std::shared_lock lock(mutex_);
    CacheStats stats;
    for (const auto& [device, records] : memory_) {
        stats.memory_count += records.size();
        for (const auto& [epoch, record] : records) {
            stats.keys.push_back(MakeCacheKey(device, epoch));
        }
    }
    return stats;
}

}
