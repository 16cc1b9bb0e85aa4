#pragma once

#include "paykit/core/result.hpp"
#include "paykit/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace paykit::crypto {

/**
 * @brief RFC 5869 HKDF-SHA256 backed by OpenSSL's EVP_KDF
 *
 * Used to turn an identity seed into per-device, per-epoch static keys.
 */
class Hkdf {
public:
    static Result<Unit, PaykitFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, PaykitFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}
