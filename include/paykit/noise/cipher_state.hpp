#pragma once

#include "paykit/core/constants.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace paykit::noise {

/**
 * @brief Noise CipherState over ChaCha20-Poly1305 (IETF)
 *
 * The 96-bit nonce is four zero bytes followed by the 64-bit counter in
 * little-endian order. The counter only advances on success, so a rejected
 * ciphertext leaves the state untouched.
 */
class CipherState {
public:
    CipherState() = default;
    ~CipherState();

    CipherState(CipherState&& other) noexcept;
    CipherState& operator=(CipherState&& other) noexcept;
    CipherState(const CipherState&) = delete;
    CipherState& operator=(const CipherState&) = delete;

    void InitializeKey(std::span<const uint8_t> key);

    [[nodiscard]] bool HasKey() const noexcept { return has_key_; }
    [[nodiscard]] uint64_t Nonce() const noexcept { return nonce_; }

    /// Without a key the plaintext is returned unchanged.
    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> EncryptWithAd(
        std::span<const uint8_t> ad, std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> DecryptWithAd(
        std::span<const uint8_t> ad, std::span<const uint8_t> ciphertext);

    void Clear() noexcept;

private:
    [[nodiscard]] std::array<uint8_t, NoiseConstants::NONCE_LEN> BuildNonce() const noexcept;

    std::array<uint8_t, NoiseConstants::KEY_LEN> key_{};
    bool has_key_ = false;
    uint64_t nonce_ = 0;
};

}
