#pragma once

#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"
#include "paykit/crypto/secure_memory_handle.hpp"
#include "paykit/keys/key_pair_record.hpp"
#include "paykit/noise/session.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace paykit::noise {

struct HandshakeOutput {
    std::string session_id;
    std::vector<uint8_t> message;
    /// Responder only: the decrypted payload of the initiator's message.
    std::vector<uint8_t> payload;
};

/**
 * @brief Session registry around the Noise IK handshake
 *
 * Initiator: Initiate -> send message -> Complete(response) -> Ready.
 * Responder: Accept(message) -> Ready, the returned message is sent back.
 *
 * A session is only usable for Encrypt/Decrypt once Ready. Any handshake error
 * moves the session to Closed and drops it; there is no retry.
 *
 * Safe for concurrent use: the registry lock is held only for map lookups and
 * each session serializes its own operations.
 */
class HandshakeEngine {
public:
    static Result<std::unique_ptr<HandshakeEngine>, PaykitFailure> Create(const keys::KeyPairRecord& local_static);

    HandshakeEngine(const HandshakeEngine&) = delete;
    HandshakeEngine& operator=(const HandshakeEngine&) = delete;

    [[nodiscard]] Result<HandshakeOutput, PaykitFailure> Initiate(
        std::span<const uint8_t> server_public_key,
        std::span<const uint8_t> hint = {});

    [[nodiscard]] Result<std::string, PaykitFailure> Complete(
        const std::string& session_id,
        std::span<const uint8_t> response);

    [[nodiscard]] Result<HandshakeOutput, PaykitFailure> Accept(std::span<const uint8_t> first_message);

    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> Encrypt(
        const std::string& session_id,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, PaykitFailure> Decrypt(
        const std::string& session_id,
        std::span<const uint8_t> ciphertext);

    /// Returns false when no such session exists.
    bool RemoveSession(const std::string& session_id);

    [[nodiscard]] std::optional<SessionState> GetSessionState(const std::string& session_id) const;
    [[nodiscard]] std::optional<std::vector<uint8_t>> GetRemoteStaticKey(const std::string& session_id) const;
    [[nodiscard]] size_t SessionCount() const;
    [[nodiscard]] const std::vector<uint8_t>& LocalPublicKey() const noexcept { return local_public_; }

private:
    HandshakeEngine(crypto::SecureMemoryHandle local_secret, std::vector<uint8_t> local_public);

    [[nodiscard]] std::shared_ptr<Session> FindSession(const std::string& session_id) const;
    [[nodiscard]] std::string NewSessionId() const;
    void CloseAndDrop(Session& session);

    crypto::SecureMemoryHandle local_secret_;
    std::vector<uint8_t> local_public_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

}
