#pragma once

#include "paykit/crypto/secure_memory_handle.hpp"
#include "paykit/noise/symmetric_state.hpp"

#include <optional>

namespace paykit::noise {

enum class HandshakeRole {
    Initiator,
    Responder
};

struct TransportCiphers {
    CipherState send;
    CipherState receive;
};

/**
 * @brief Noise IK handshake
 *
 * <- s
 * ...
 * -> e, es, s, ss
 * <- e, ee, se
 *
 * The initiator knows the responder's static key in advance. After message B
 * both sides call Split to obtain their transport ciphers.
 */
class HandshakeState {
public:
    static Result<HandshakeState, PaykitFailure> InitializeInitiator(
        std::span<const uint8_t> local_static_secret,
        std::span<const uint8_t> local_static_public,
        std::span<const uint8_t> remote_static_public);

    static Result<HandshakeState, PaykitFailure> InitializeResponder(
        std::span<const uint8_t> local_static_secret,
        std::span<const uint8_t> local_static_public);

    /// Initiator: e, es, s, ss followed by the encrypted payload.
    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> WriteMessageA(std::span<const uint8_t> payload);

    /// Responder: consumes message A and returns its decrypted payload.
    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> ReadMessageA(std::span<const uint8_t> message);

    /// Responder: e, ee, se followed by the encrypted payload.
    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> WriteMessageB(std::span<const uint8_t> payload);

    /// Initiator: consumes message B and returns its decrypted payload.
    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> ReadMessageB(std::span<const uint8_t> message);

    /// Valid once both messages have been processed.
    [[nodiscard]] Result<TransportCiphers, PaykitFailure> Split();

    [[nodiscard]] HandshakeRole Role() const noexcept { return role_; }
    [[nodiscard]] const std::vector<uint8_t>& RemoteStaticPublic() const noexcept { return remote_static_; }
    [[nodiscard]] std::span<const uint8_t> HandshakeHash() const noexcept { return symmetric_.HandshakeHash(); }

    HandshakeState(HandshakeState&&) noexcept = default;
    HandshakeState& operator=(HandshakeState&&) noexcept = default;

private:
    HandshakeState(HandshakeRole role, crypto::SecureMemoryHandle local_static, std::vector<uint8_t> local_static_public);

    Result<Unit, PaykitFailure> MixDh(const crypto::SecureMemoryHandle& secret, std::span<const uint8_t> peer_public);
    Result<Unit, PaykitFailure> GenerateEphemeral();

    HandshakeRole role_;
    SymmetricState symmetric_;
    crypto::SecureMemoryHandle local_static_;
    std::vector<uint8_t> local_static_public_;
    crypto::SecureMemoryHandle local_ephemeral_;
    std::vector<uint8_t> local_ephemeral_public_;
    std::vector<uint8_t> remote_static_;
    std::vector<uint8_t> remote_ephemeral_;
    int messages_processed_ = 0;
};

}
