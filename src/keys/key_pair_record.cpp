#include "paykit/keys/key_pair_record.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/core/format.hpp"
#include "paykit/core/hex.hpp"

namespace paykit::keys {

std::string KeyPairRecord::PublicKeyHex() const {
    return hex::Encode(public_key);
}

std::string KeyPairRecord::CacheKey() const {
    return MakeCacheKey(device_id, epoch);
}

std::string MakeCacheKey(const std::string_view device_id, const uint32_t epoch) {
    return compat::format("{}{}.{}", KeyConstants::CACHE_KEY_PREFIX, device_id, epoch);
}

}
