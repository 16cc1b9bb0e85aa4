#include "paykit/noise/handshake_engine.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/core/hex.hpp"
#include "paykit/core/logging.hpp"
#include "paykit/crypto/sodium_interop.hpp"

namespace paykit::noise {

std::string_view SessionStateName(const SessionState state) noexcept {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::HandshakeSent: return "HandshakeSent";
        case SessionState::Ready:         return "Ready";
        case SessionState::Closed:        return "Closed";
    }
    return "Unknown";
}

Result<std::unique_ptr<HandshakeEngine>, PaykitFailure> HandshakeEngine::Create(
    const keys::KeyPairRecord& local_static) {
    using ResultType = Result<std::unique_ptr<HandshakeEngine>, PaykitFailure>;

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return ResultType::Err(
            PaykitFailure::FromSodiumFailure(init.UnwrapErr(), PaykitFailureType::HandshakeFailed));
    }
    if (local_static.secret_key.size() != NoiseConstants::DH_LEN ||
        local_static.public_key.size() != NoiseConstants::DH_LEN) {
        return ResultType::Err(PaykitFailure::InvalidInput("Static key pair must be X25519"));
    }
    auto secret = crypto::SecureMemoryHandle::FromBytes(local_static.secret_key);
    if (secret.IsErr()) {
        return ResultType::Err(
            PaykitFailure::FromSodiumFailure(secret.UnwrapErr(), PaykitFailureType::HandshakeFailed));
    }
    return ResultType::Ok(std::unique_ptr<HandshakeEngine>(
        new HandshakeEngine(std::move(secret).Unwrap(), local_static.public_key)));
}

HandshakeEngine::HandshakeEngine(crypto::SecureMemoryHandle local_secret, std::vector<uint8_t> local_public)
    : local_secret_(std::move(local_secret))
    , local_public_(std::move(local_public)) {}

std::string HandshakeEngine::NewSessionId() const {
    const auto bytes = crypto::SodiumInterop::GetRandomBytes(WireConstants::SESSION_ID_BYTES);
    return hex::Encode(bytes);
}

std::shared_ptr<Session> HandshakeEngine::FindSession(const std::string& session_id) const {
    std::lock_guard lock(sessions_mutex_);
    const auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

void HandshakeEngine::CloseAndDrop(Session& session) {
    session.state = SessionState::Closed;
    session.handshake.reset();
    session.send.Clear();
    session.receive.Clear();
    std::lock_guard lock(sessions_mutex_);
    sessions_.erase(session.id);
}

Result<HandshakeOutput, PaykitFailure> HandshakeEngine::Initiate(
    std::span<const uint8_t> server_public_key,
    std::span<const uint8_t> hint) {
    using ResultType = Result<HandshakeOutput, PaykitFailure>;

    if (server_public_key.size() != NoiseConstants::DH_LEN) {
        return ResultType::Err(PaykitFailure::HandshakeFailed("Server public key must be 32 bytes"));
    }
    if (hint.size() > NoiseConstants::MAX_HINT_LEN) {
        return ResultType::Err(PaykitFailure::InvalidInput("Handshake hint exceeds 64 bytes"));
    }

    auto state = local_secret_.WithReadAccess([&](std::span<const uint8_t> secret) {
        return HandshakeState::InitializeInitiator(secret, local_public_, server_public_key);
    });
    if (state.IsErr()) {
        return ResultType::Err(PaykitFailure::HandshakeFailed(state.UnwrapErr().message));
    }
    auto handshake = std::move(state).Unwrap();
    if (handshake.IsErr()) {
        return ResultType::Err(std::move(handshake).UnwrapErr());
    }

    auto session = std::make_shared<Session>();
    session->id = NewSessionId();
    session->role = HandshakeRole::Initiator;
    session->handshake.emplace(std::move(handshake).Unwrap());

    auto message = session->handshake->WriteMessageA(hint);
    if (message.IsErr()) {
        session->state = SessionState::Closed;
        return ResultType::Err(std::move(message).UnwrapErr());
    }
    session->state = SessionState::HandshakeSent;

    {
        std::lock_guard lock(sessions_mutex_);
        sessions_.emplace(session->id, session);
    }
    PAYKIT_LOG_DEBUG("Session {} initiated towards {}", hex::Abbreviate(session->id),
                     hex::Abbreviate(server_public_key));

    HandshakeOutput output;
    output.session_id = session->id;
    output.message = std::move(message).Unwrap();
    return ResultType::Ok(std::move(output));
}

Result<std::string, PaykitFailure> HandshakeEngine::Complete(
    const std::string& session_id,
    std::span<const uint8_t> response) {
    using ResultType = Result<std::string, PaykitFailure>;

    const auto session = FindSession(session_id);
    if (!session) {
        return ResultType::Err(PaykitFailure::HandshakeFailed("Unknown session"));
    }
    std::lock_guard session_lock(session->mutex);
    if (session->state != SessionState::HandshakeSent || !session->handshake) {
        return ResultType::Err(PaykitFailure::HandshakeFailed(
            "Session is " + std::string(SessionStateName(session->state)) + ", expected HandshakeSent"));
    }

    auto payload = session->handshake->ReadMessageB(response);
    if (payload.IsErr()) {
        PAYKIT_LOG_WARN("Handshake with session {} failed: {}", hex::Abbreviate(session_id),
                        payload.UnwrapErr().message);
        CloseAndDrop(*session);
        return ResultType::Err(std::move(payload).UnwrapErr());
    }
    auto ciphers = session->handshake->Split();
    if (ciphers.IsErr()) {
        CloseAndDrop(*session);
        return ResultType::Err(std::move(ciphers).UnwrapErr());
    }

    session->remote_static_public = session->handshake->RemoteStaticPublic();
    session->send = std::move(ciphers.Unwrap().send);
    session->receive = std::move(ciphers.Unwrap().receive);
    session->handshake.reset();
    session->state = SessionState::Ready;
    PAYKIT_LOG_DEBUG("Session {} ready (initiator)", hex::Abbreviate(session_id));
    return ResultType::Ok(session_id);
}

Result<HandshakeOutput, PaykitFailure> HandshakeEngine::Accept(std::span<const uint8_t> first_message) {
    using ResultType = Result<HandshakeOutput, PaykitFailure>;

    auto state = local_secret_.WithReadAccess([&](std::span<const uint8_t> secret) {
        return HandshakeState::InitializeResponder(secret, local_public_);
    });
    if (state.IsErr()) {
        return ResultType::Err(PaykitFailure::HandshakeFailed(state.UnwrapErr().message));
    }
    auto handshake_result = std::move(state).Unwrap();
    if (handshake_result.IsErr()) {
        return ResultType::Err(std::move(handshake_result).UnwrapErr());
    }
    HandshakeState handshake = std::move(handshake_result).Unwrap();

    auto payload = handshake.ReadMessageA(first_message);
    if (payload.IsErr()) {
        return ResultType::Err(std::move(payload).UnwrapErr());
    }
    auto reply = handshake.WriteMessageB({});
    if (reply.IsErr()) {
        return ResultType::Err(std::move(reply).UnwrapErr());
    }
    auto ciphers = handshake.Split();
    if (ciphers.IsErr()) {
        return ResultType::Err(std::move(ciphers).UnwrapErr());
    }

    auto session = std::make_shared<Session>();
    session->id = NewSessionId();
    session->role = HandshakeRole::Responder;
    session->remote_static_public = handshake.RemoteStaticPublic();
    session->send = std::move(ciphers.Unwrap().send);
    session->receive = std::move(ciphers.Unwrap().receive);
    session->state = SessionState::Ready;

    {
        std::lock_guard lock(sessions_mutex_);
        sessions_.emplace(session->id, session);
    }
    PAYKIT_LOG_DEBUG("Session {} ready (responder), peer {}", hex::Abbreviate(session->id),
                     hex::Abbreviate(session->remote_static_public));

    HandshakeOutput output;
    output.session_id = session->id;
    output.message = std::move(reply).Unwrap();
    output.payload = std::move(payload).Unwrap();
    return ResultType::Ok(std::move(output));
}

Result<std::vector<uint8_t>, PaykitFailure> HandshakeEngine::Encrypt(
    const std::string& session_id,
    std::span<const uint8_t> plaintext) {
    using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;

    if (plaintext.size() + NoiseConstants::TAG_LEN > NoiseConstants::MAX_MESSAGE_LEN) {
        return ResultType::Err(PaykitFailure::EncryptionFailed(
            "Plaintext of " + std::to_string(plaintext.size()) + " bytes exceeds the transport limit"));
    }
    const auto session = FindSession(session_id);
    if (!session) {
        return ResultType::Err(PaykitFailure::EncryptionFailed("Unknown session"));
    }
    std::lock_guard session_lock(session->mutex);
    if (session->state != SessionState::Ready) {
        return ResultType::Err(PaykitFailure::EncryptionFailed(
            "Session is " + std::string(SessionStateName(session->state))));
    }
    return session->send.EncryptWithAd({}, plaintext);
}

Result<std::vector<uint8_t>, PaykitFailure> HandshakeEngine::Decrypt(
    const std::string& session_id,
    std::span<const uint8_t> ciphertext) {
    using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;

    if (ciphertext.size() > NoiseConstants::MAX_MESSAGE_LEN) {
        return ResultType::Err(PaykitFailure::DecryptionFailed("Ciphertext exceeds the transport limit"));
    }
    const auto session = FindSession(session_id);
    if (!session) {
        return ResultType::Err(PaykitFailure::DecryptionFailed("Unknown session"));
    }
    std::lock_guard session_lock(session->mutex);
    if (session->state != SessionState::Ready) {
        return ResultType::Err(PaykitFailure::DecryptionFailed(
            "Session is " + std::string(SessionStateName(session->state))));
    }
    return session->receive.DecryptWithAd({}, ciphertext);
}

bool HandshakeEngine::RemoveSession(const std::string& session_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard lock(sessions_mutex_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    std::lock_guard session_lock(session->mutex);
    session->state = SessionState::Closed;
    session->handshake.reset();
    session->send.Clear();
    session->receive.Clear();
    PAYKIT_LOG_DEBUG("Session {} removed", hex::Abbreviate(session_id));
    return true;
}

std::optional<SessionState> HandshakeEngine::GetSessionState(const std::string& session_id) const {
    const auto session = FindSession(session_id);
    if (!session) {
        return std::nullopt;
    }
    std::lock_guard session_lock(session->mutex);
    return session->state;
}

std::optional<std::vector<uint8_t>> HandshakeEngine::GetRemoteStaticKey(const std::string& session_id) const {
    const auto session = FindSession(session_id);
    if (!session) {
        return std::nullopt;
    }
    std::lock_guard session_lock(session->mutex);
    if (session->state != SessionState::Ready) {
        return std::nullopt;
    }
    return session->remote_static_public;
}

size_t HandshakeEngine::SessionCount() const {
    std::lock_guard lock(sessions_mutex_);
    return sessions_.size();
}

}
