#pragma once

#include "paykit/interfaces/i_key_derivation.hpp"

namespace paykit::keys {

/**
 * @brief Deterministic seed to X25519 derivation
 *
 * secret = clamp(HKDF-SHA256(ikm = seed, salt = "paykit-noise-x25519-v1",
 *                            info = device_id || epoch as big-endian u32))
 * public = X25519(secret, base point)
 *
 * The same (seed, device_id, epoch) always yields the same pair.
 */
class HkdfKeyDerivation final : public interfaces::IKeyDerivation {
public:
    [[nodiscard]] Result<KeyPairRecord, PaykitFailure> DeriveKeypair(
        std::span<const uint8_t> seed,
        std::string_view device_id,
        uint32_t epoch) override;

    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> GenerateSeed() override;
};

}
