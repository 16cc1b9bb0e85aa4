#pragma once

#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"
#include "paykit/keys/key_pair_record.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace paykit::keys {

using IndexEntry = std::pair<std::string, uint32_t>;

[[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> SerializeKeyPair(const KeyPairRecord& record);
[[nodiscard]] Result<KeyPairRecord, PaykitFailure> ParseKeyPair(std::span<const uint8_t> bytes);

[[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> SerializeIndex(const std::vector<IndexEntry>& entries);
[[nodiscard]] Result<std::vector<IndexEntry>, PaykitFailure> ParseIndex(std::span<const uint8_t> bytes);

}
