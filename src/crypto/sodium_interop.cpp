#include "paykit/crypto/sodium_interop.hpp"
#include "paykit/crypto/secure_memory_handle.hpp"
#include "paykit/core/constants.hpp"

namespace paykit::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("libsodium initialization failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> out(size);
    if (size > 0) {
        randombytes_buf(out.data(), size);
    }
    return out;
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
SodiumInterop::GenerateX25519KeyPair() {
    using ResultType = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>;

    auto handle_result = SecureMemoryHandle::Allocate(KeyConstants::X25519_KEY_SIZE);
    if (handle_result.IsErr()) {
        return ResultType::Err(std::move(handle_result).UnwrapErr());
    }
    SecureMemoryHandle sk_handle = std::move(handle_result).Unwrap();

    std::vector<uint8_t> pk_bytes(KeyConstants::X25519_KEY_SIZE);
    auto derive_result = sk_handle.WithWriteAccess([&pk_bytes](std::span<uint8_t> sk) {
        randombytes_buf(sk.data(), sk.size());
        return crypto_scalarmult_base(pk_bytes.data(), sk.data());
    });
    if (derive_result.IsErr()) {
        return ResultType::Err(std::move(derive_result).UnwrapErr());
    }
    if (derive_result.Unwrap() != 0) {
        return ResultType::Err(
            SodiumFailure::InvalidOperation("Failed to derive ephemeral public key"));
    }

    return ResultType::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::DerivePublicKey(
    std::span<const uint8_t> secret) {
    if (secret.size() != KeyConstants::X25519_KEY_SIZE) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                "X25519 secret must be " + std::to_string(KeyConstants::X25519_KEY_SIZE) + " bytes"));
    }
    std::vector<uint8_t> pk(KeyConstants::X25519_KEY_SIZE);
    if (crypto_scalarmult_base(pk.data(), secret.data()) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("X25519 base point multiplication failed"));
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(pk));
}

Result<Unit, SodiumFailure> SodiumInterop::ComputeSharedSecret(
    std::span<const uint8_t> secret,
    std::span<const uint8_t> peer_public,
    std::span<uint8_t> shared_out) {
    if (secret.size() != KeyConstants::X25519_KEY_SIZE ||
        peer_public.size() != KeyConstants::X25519_KEY_SIZE ||
        shared_out.size() != KeyConstants::X25519_KEY_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("X25519 inputs must be 32 bytes"));
    }
    if (crypto_scalarmult(shared_out.data(), secret.data(), peer_public.data()) != 0) {
        sodium_memzero(shared_out.data(), shared_out.size());
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("X25519 rejected a low-order public key"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

void SodiumInterop::ClampScalar(std::span<uint8_t> scalar) noexcept {
    if (scalar.size() != KeyConstants::X25519_KEY_SIZE) {
        return;
    }
    scalar[0] &= 248;
    scalar[31] &= 127;
    scalar[31] |= 64;
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
