#pragma once

#include "paykit/core/result.hpp"
#include "paykit/core/failures.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace paykit::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium primitives used by the session layer
 *
 * Covers library initialization, secure wiping, constant-time comparison,
 * randomness and the X25519 operations the Noise handshake needs.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Every other call in this class expects it
     * to have succeeded.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without inspecting content.
     */
    static bool ConstantTimeEquals(std::span<const uint8_t> a, std::span<const uint8_t> b);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Generate an X25519 key pair
     *
     * The secret scalar is placed in secure memory, the public key is returned
     * as plain bytes.
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
    GenerateX25519KeyPair();

    /// Base point multiplication. @p secret must be 32 bytes.
    static Result<std::vector<uint8_t>, SodiumFailure> DerivePublicKey(std::span<const uint8_t> secret);

    /**
     * @brief X25519 Diffie-Hellman
     *
     * Fails when the peer point is of low order and the result would be the
     * all-zero value.
     */
    static Result<Unit, SodiumFailure> ComputeSharedSecret(
        std::span<const uint8_t> secret,
        std::span<const uint8_t> peer_public,
        std::span<uint8_t> shared_out);

    /// Clears and sets the bits RFC 7748 requires of an X25519 scalar.
    static void ClampScalar(std::span<uint8_t> scalar) noexcept;

    static void* AllocateSecure(size_t size) noexcept;
    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
};

}
