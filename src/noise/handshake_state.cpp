#include "paykit/noise/handshake_state.hpp"
#include "paykit/crypto/sodium_interop.hpp"

namespace paykit::noise {

namespace {
    std::span<const uint8_t> AsBytes(const std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    PaykitFailure AsHandshakeFailure(const PaykitFailure& failure) {
        return PaykitFailure::HandshakeFailed(failure.message);
    }

    PaykitFailure AsHandshakeFailure(const SodiumFailure& failure) {
        return PaykitFailure::HandshakeFailed(failure.message);
    }
}

HandshakeState::HandshakeState(
    const HandshakeRole role,
    crypto::SecureMemoryHandle local_static,
    std::vector<uint8_t> local_static_public)
    : role_(role)
    , symmetric_(NoiseConstants::PROTOCOL_NAME)
    , local_static_(std::move(local_static))
    , local_static_public_(std::move(local_static_public)) {
    symmetric_.MixHash(AsBytes(NoiseConstants::PROLOGUE));
}

Result<HandshakeState, PaykitFailure> HandshakeState::InitializeInitiator(
    std::span<const uint8_t> local_static_secret,
    std::span<const uint8_t> local_static_public,
    std::span<const uint8_t> remote_static_public) {

    if (local_static_secret.size() != NoiseConstants::DH_LEN ||
        local_static_public.size() != NoiseConstants::DH_LEN) {
        return Result<HandshakeState, PaykitFailure>::Err(
            PaykitFailure::HandshakeFailed("Local static key must be 32 bytes"));
    }
    if (remote_static_public.size() != NoiseConstants::DH_LEN) {
        return Result<HandshakeState, PaykitFailure>::Err(
            PaykitFailure::HandshakeFailed("Remote static key must be 32 bytes"));
    }
    auto secret = crypto::SecureMemoryHandle::FromBytes(local_static_secret);
    if (secret.IsErr()) {
        return Result<HandshakeState, PaykitFailure>::Err(AsHandshakeFailure(secret.UnwrapErr()));
    }

    HandshakeState state(
        HandshakeRole::Initiator,
        std::move(secret).Unwrap(),
        std::vector<uint8_t>(local_static_public.begin(), local_static_public.end()));
    state.remote_static_.assign(remote_static_public.begin(), remote_static_public.end());
    state.symmetric_.MixHash(state.remote_static_);
    return Result<HandshakeState, PaykitFailure>::Ok(std::move(state));
}

Result<HandshakeState, PaykitFailure> HandshakeState::InitializeResponder(
    std::span<const uint8_t> local_static_secret,
    std::span<const uint8_t> local_static_public) {

    if (local_static_secret.size() != NoiseConstants::DH_LEN ||
        local_static_public.size() != NoiseConstants::DH_LEN) {
        return Result<HandshakeState, PaykitFailure>::Err(
            PaykitFailure::HandshakeFailed("Local static key must be 32 bytes"));
    }
    auto secret = crypto::SecureMemoryHandle::FromBytes(local_static_secret);
    if (secret.IsErr()) {
        return Result<HandshakeState, PaykitFailure>::Err(AsHandshakeFailure(secret.UnwrapErr()));
    }

    HandshakeState state(
        HandshakeRole::Responder,
        std::move(secret).Unwrap(),
        std::vector<uint8_t>(local_static_public.begin(), local_static_public.end()));
    state.symmetric_.MixHash(state.local_static_public_);
    return Result<HandshakeState, PaykitFailure>::Ok(std::move(state));
}

Result<Unit, PaykitFailure> HandshakeState::GenerateEphemeral() {
    auto generated = crypto::SodiumInterop::GenerateX25519KeyPair();
    if (generated.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(AsHandshakeFailure(generated.UnwrapErr()));
    }
    auto [secret, pub] = std::move(generated).Unwrap();
    local_ephemeral_ = std::move(secret);
    local_ephemeral_public_ = std::move(pub);
    return Result<Unit, PaykitFailure>::Ok(unit);
}

Result<Unit, PaykitFailure> HandshakeState::MixDh(
    const crypto::SecureMemoryHandle& secret,
    std::span<const uint8_t> peer_public) {

    std::array<uint8_t, NoiseConstants::DH_LEN> shared{};
    auto dh = secret.WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto::SodiumInterop::ComputeSharedSecret(sk, peer_public, shared);
    });
    if (dh.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(AsHandshakeFailure(dh.UnwrapErr()));
    }
    if (const auto& inner = dh.Unwrap(); inner.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(AsHandshakeFailure(inner.UnwrapErr()));
    }
    symmetric_.MixKey(shared);
    crypto::SodiumInterop::SecureWipe(shared);
    return Result<Unit, PaykitFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, PaykitFailure> HandshakeState::WriteMessageA(std::span<const uint8_t> payload) {
    using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;
    if (role_ != HandshakeRole::Initiator || messages_processed_ != 0) {
        return ResultType::Err(PaykitFailure::HandshakeFailed("Message A written out of order"));
    }

    if (auto e = GenerateEphemeral(); e.IsErr()) {
        return ResultType::Err(std::move(e).UnwrapErr());
    }
    std::vector<uint8_t> message(local_ephemeral_public_);
    symmetric_.MixHash(local_ephemeral_public_);

    if (auto es = MixDh(local_ephemeral_, remote_static_); es.IsErr()) {
        return ResultType::Err(std::move(es).UnwrapErr());
    }

    auto encrypted_static = symmetric_.EncryptAndHash(local_static_public_);
    if (encrypted_static.IsErr()) {
        return ResultType::Err(AsHandshakeFailure(encrypted_static.UnwrapErr()));
    }
    message.insert(message.end(), encrypted_static.Unwrap().begin(), encrypted_static.Unwrap().end());

    if (auto ss = MixDh(local_static_, remote_static_); ss.IsErr()) {
        return ResultType::Err(std::move(ss).UnwrapErr());
    }

    auto encrypted_payload = symmetric_.EncryptAndHash(payload);
    if (encrypted_payload.IsErr()) {
        return ResultType::Err(AsHandshakeFailure(encrypted_payload.UnwrapErr()));
    }
    message.insert(message.end(), encrypted_payload.Unwrap().begin(), encrypted_payload.Unwrap().end());

    ++messages_processed_;
    return ResultType::Ok(std::move(message));
}

Result<std::vector<uint8_t>, PaykitFailure> HandshakeState::ReadMessageA(std::span<const uint8_t> message) {
    using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;
    if (role_ != HandshakeRole::Responder || messages_processed_ != 0) {
        return ResultType::Err(PaykitFailure::HandshakeFailed("Message A read out of order"));
    }
    if (message.size() < NoiseConstants::MIN_INITIATOR_MESSAGE_LEN) {
        return ResultType::Err(PaykitFailure::HandshakeFailed(
            "Handshake message too short: " + std::to_string(message.size()) + " bytes"));
    }

    size_t offset = 0;
    remote_ephemeral_.assign(message.begin(), message.begin() + NoiseConstants::DH_LEN);
    offset += NoiseConstants::DH_LEN;
    symmetric_.MixHash(remote_ephemeral_);

    if (auto es = MixDh(local_static_, remote_ephemeral_); es.IsErr()) {
        return ResultType::Err(std::move(es).UnwrapErr());
    }

    constexpr size_t encrypted_static_len = NoiseConstants::DH_LEN + NoiseConstants::TAG_LEN;
    auto remote_static = symmetric_.DecryptAndHash(message.subspan(offset, encrypted_static_len));
    if (remote_static.IsErr()) {
        return ResultType::Err(PaykitFailure::HandshakeFailed("Cannot decrypt initiator static key"));
    }
    offset += encrypted_static_len;
    remote_static_ = std::move(remote_static).Unwrap();

    if (auto ss = MixDh(local_static_, remote_static_); ss.IsErr()) {
        return ResultType::Err(std::move(ss).UnwrapErr());
    }

    auto payload = symmetric_.DecryptAndHash(message.subspan(offset));
    if (payload.IsErr()) {
        return ResultType::Err(PaykitFailure::HandshakeFailed("Cannot decrypt handshake payload"));
    }

    ++messages_processed_;
    return payload;
}

Result<std::vector<uint8_t>, PaykitFailure> HandshakeState::WriteMessageB(std::span<const uint8_t> payload) {
    using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;
    if (role_ != HandshakeRole::Responder || messages_processed_ != 1) {
        return ResultType::Err(PaykitFailure::HandshakeFailed("Message B written out of order"));
    }

    if (auto e = GenerateEphemeral(); e.IsErr()) {
        return ResultType::Err(std::move(e).UnwrapErr());
    }
    std::vector<uint8_t> message(local_ephemeral_public_);
    symmetric_.MixHash(local_ephemeral_public_);

    if (auto ee = MixDh(local_ephemeral_, remote_ephemeral_); ee.IsErr()) {
        return ResultType::Err(std::move(ee).UnwrapErr());
    }
    if (auto se = MixDh(local_ephemeral_, remote_static_); se.IsErr()) {
        return ResultType::Err(std::move(se).UnwrapErr());
    }

    auto encrypted_payload = symmetric_.EncryptAndHash(payload);
    if (encrypted_payload.IsErr()) {
        return ResultType::Err(AsHandshakeFailure(encrypted_payload.UnwrapErr()));
    }
    message.insert(message.end(), encrypted_payload.Unwrap().begin(), encrypted_payload.Unwrap().end());

    ++messages_processed_;
    return ResultType::Ok(std::move(message));
}

Result<std::vector<uint8_t>, PaykitFailure> HandshakeState::ReadMessageB(std::span<const uint8_t> message) {
    using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;
    if (role_ != HandshakeRole::Initiator || messages_processed_ != 1) {
        return ResultType::Err(PaykitFailure::HandshakeFailed("Message B read out of order"));
    }
    if (message.size() < NoiseConstants::RESPONDER_MESSAGE_LEN) {
        return ResultType::Err(PaykitFailure::HandshakeFailed(
            "Handshake response too short: " + std::to_string(message.size()) + " bytes"));
    }

    remote_ephemeral_.assign(message.begin(), message.begin() + NoiseConstants::DH_LEN);
    symmetric_.MixHash(remote_ephemeral_);

    if (auto ee = MixDh(local_ephemeral_, remote_ephemeral_); ee.IsErr()) {
        return ResultType::Err(std::move(ee).UnwrapErr());
    }
    if (auto se = MixDh(local_static_, remote_ephemeral_); se.IsErr()) {
        return ResultType::Err(std::move(se).UnwrapErr());
    }

    auto payload = symmetric_.DecryptAndHash(message.subspan(NoiseConstants::DH_LEN));
    if (payload.IsErr()) {
        return ResultType::Err(PaykitFailure::HandshakeFailed("Cannot authenticate handshake response"));
    }

    ++messages_processed_;
    return payload;
}

Result<TransportCiphers, PaykitFailure> HandshakeState::Split() {
    if (messages_processed_ != 2) {
        return Result<TransportCiphers, PaykitFailure>::Err(
            PaykitFailure::HandshakeFailed("Handshake not finished"));
    }
    auto [initiator_to_responder, responder_to_initiator] = symmetric_.Split();
    local_ephemeral_.Reset();
    local_static_.Reset();

    TransportCiphers ciphers;
    if (role_ == HandshakeRole::Initiator) {
        ciphers.send = std::move(initiator_to_responder);
        ciphers.receive = std::move(responder_to_initiator);
    } else {
        ciphers.send = std::move(responder_to_initiator);
        ciphers.receive = std::move(initiator_to_responder);
    }
    return Result<TransportCiphers, PaykitFailure>::Ok(std::move(ciphers));
}

}
