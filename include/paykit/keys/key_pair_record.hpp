#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace paykit::keys {

/// X25519 static key pair scoped to one (device_id, epoch). Rotation creates a
/// new record under a new epoch; an existing record is never mutated.
struct KeyPairRecord {
    std::vector<uint8_t> secret_key;
    std::vector<uint8_t> public_key;
    std::string device_id;
    uint32_t epoch = 0;
    int64_t created_at_ms = 0;

    [[nodiscard]] std::string PublicKeyHex() const;
    [[nodiscard]] std::string CacheKey() const;
};

/// `noise.key.cache.<device_id>.<epoch>`
[[nodiscard]] std::string MakeCacheKey(std::string_view device_id, uint32_t epoch);

}
