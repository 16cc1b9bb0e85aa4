#include "paykit/keys/key_record_codec.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/key_cache.pb.h"

#include <algorithm>

namespace paykit::keys {

namespace {
    std::vector<uint8_t> ToBytes(const std::string& s) {
        return {s.begin(), s.end()};
    }
}

Result<std::vector<uint8_t>, PaykitFailure> SerializeKeyPair(const KeyPairRecord& record) {
    CachedKeyPair proto;
    proto.set_secret_key(record.secret_key.data(), record.secret_key.size());
    proto.set_public_key(record.public_key.data(), record.public_key.size());
    proto.set_device_id(record.device_id);
    proto.set_epoch(record.epoch);
    proto.set_created_at_ms(record.created_at_ms);

    std::string out;
    if (!proto.SerializeToString(&out)) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(
            PaykitFailure::StorageFailed("Failed to serialize cached key pair"));
    }
    std::vector<uint8_t> bytes = ToBytes(out);
    std::fill(out.begin(), out.end(), '\0');
    return Result<std::vector<uint8_t>, PaykitFailure>::Ok(std::move(bytes));
}

Result<KeyPairRecord, PaykitFailure> ParseKeyPair(std::span<const uint8_t> bytes) {
    CachedKeyPair proto;
    if (!proto.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::StorageFailed("Cached key pair is corrupt"));
    }
    if (proto.secret_key().size() != KeyConstants::X25519_KEY_SIZE ||
        proto.public_key().size() != KeyConstants::X25519_KEY_SIZE ||
        proto.device_id().empty()) {
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::StorageFailed("Cached key pair has invalid fields"));
    }

    KeyPairRecord record;
    record.secret_key = ToBytes(proto.secret_key());
    record.public_key = ToBytes(proto.public_key());
    record.device_id = proto.device_id();
    record.epoch = proto.epoch();
    record.created_at_ms = proto.created_at_ms();
    return Result<KeyPairRecord, PaykitFailure>::Ok(std::move(record));
}

Result<std::vector<uint8_t>, PaykitFailure> SerializeIndex(const std::vector<IndexEntry>& entries) {
    KeyCacheIndex proto;
    for (const auto& [device_id, epoch] : entries) {
        auto* entry = proto.add_entries();
        entry->set_device_id(device_id);
        entry->set_epoch(epoch);
    }
    std::string out;
    if (!proto.SerializeToString(&out)) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(
            PaykitFailure::StorageFailed("Failed to serialize key cache index"));
    }
    return Result<std::vector<uint8_t>, PaykitFailure>::Ok(ToBytes(out));
}

Result<std::vector<IndexEntry>, PaykitFailure> ParseIndex(std::span<const uint8_t> bytes) {
    KeyCacheIndex proto;
    if (!proto.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<IndexEntry>, PaykitFailure>::Err(
            PaykitFailure::StorageFailed("Key cache index is corrupt"));
    }
    std::vector<IndexEntry> entries;
    entries.reserve(static_cast<size_t>(proto.entries_size()));
    for (const auto& entry : proto.entries()) {
        entries.emplace_back(entry.device_id(), entry.epoch());
    }
    return Result<std::vector<IndexEntry>, PaykitFailure>::Ok(std::move(entries));
}

}
