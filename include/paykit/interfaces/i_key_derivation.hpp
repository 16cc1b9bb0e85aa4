#pragma once
#include "paykit/core/result.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/keys/key_pair_record.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace paykit::interfaces {
class IKeyDerivation {
public:
    virtual ~IKeyDerivation() = default;
    [[nodiscard]] virtual Result<keys::KeyPairRecord, PaykitFailure> DeriveKeypair(
        std::span<const uint8_t> seed,
        std::string_view device_id,
        uint32_t epoch) = 0;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, PaykitFailure> GenerateSeed() = 0;
};
}
