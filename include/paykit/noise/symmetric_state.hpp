#pragma once

#include "paykit/noise/cipher_state.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace paykit::noise {

/// Noise SymmetricState with SHA-256 as the hash and HMAC-SHA256 HKDF.
class SymmetricState {
public:
    explicit SymmetricState(std::string_view protocol_name);

    void MixHash(std::span<const uint8_t> data);
    void MixKey(std::span<const uint8_t> input_key_material);

    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> EncryptAndHash(std::span<const uint8_t> plaintext);
    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> DecryptAndHash(std::span<const uint8_t> ciphertext);

    /// Returns (initiator-to-responder, responder-to-initiator) cipher states.
    [[nodiscard]] std::pair<CipherState, CipherState> Split();

    [[nodiscard]] std::span<const uint8_t> HandshakeHash() const noexcept { return h_; }
    [[nodiscard]] bool HasKey() const noexcept { return cipher_.HasKey(); }

    ~SymmetricState();
    SymmetricState(SymmetricState&&) noexcept = default;
    SymmetricState& operator=(SymmetricState&&) noexcept = default;
    SymmetricState(const SymmetricState&) = delete;
    SymmetricState& operator=(const SymmetricState&) = delete;

private:
    using Digest = std::array<uint8_t, NoiseConstants::HASH_LEN>;

    static void Hkdf2(const Digest& chaining_key, std::span<const uint8_t> ikm, Digest& out1, Digest& out2);

    Digest ck_{};
    Digest h_{};
    CipherState cipher_;
};

}
