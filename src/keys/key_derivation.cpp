#include "paykit/keys/key_derivation.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/crypto/hkdf.hpp"
#include "paykit/crypto/sodium_interop.hpp"

#include <chrono>

namespace paykit::keys {

namespace {
    std::vector<uint8_t> BuildInfo(const std::string_view device_id, const uint32_t epoch) {
        std::vector<uint8_t> info(device_id.begin(), device_id.end());
        info.push_back(static_cast<uint8_t>(epoch >> 24));
        info.push_back(static_cast<uint8_t>(epoch >> 16));
        info.push_back(static_cast<uint8_t>(epoch >> 8));
        info.push_back(static_cast<uint8_t>(epoch));
        return info;
    }

    int64_t NowMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

Result<KeyPairRecord, PaykitFailure> HkdfKeyDerivation::DeriveKeypair(
    std::span<const uint8_t> seed,
    const std::string_view device_id,
    const uint32_t epoch) {

    if (seed.size() < KeyConstants::MIN_SEED_SIZE) {
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::KeyDerivationFailed(
                "Seed must be at least " + std::to_string(KeyConstants::MIN_SEED_SIZE) + " bytes"));
    }
    if (device_id.empty()) {
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::KeyDerivationFailed("Device id must not be empty"));
    }
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::FromSodiumFailure(init.UnwrapErr(), PaykitFailureType::KeyDerivationFailed));
    }

    const auto salt = KeyConstants::DERIVATION_SALT;
    const std::vector<uint8_t> info = BuildInfo(device_id, epoch);
    auto secret_result = crypto::Hkdf::DeriveKeyBytes(
        seed,
        KeyConstants::X25519_KEY_SIZE,
        std::span(reinterpret_cast<const uint8_t*>(salt.data()), salt.size()),
        info);
    if (secret_result.IsErr()) {
        return Result<KeyPairRecord, PaykitFailure>::Err(std::move(secret_result).UnwrapErr());
    }

    KeyPairRecord record;
    record.secret_key = std::move(secret_result).Unwrap();
    crypto::SodiumInterop::ClampScalar(record.secret_key);

    auto public_result = crypto::SodiumInterop::DerivePublicKey(record.secret_key);
    if (public_result.IsErr()) {
        crypto::SodiumInterop::SecureWipe(record.secret_key);
        return Result<KeyPairRecord, PaykitFailure>::Err(
            PaykitFailure::FromSodiumFailure(public_result.UnwrapErr(), PaykitFailureType::KeyDerivationFailed));
    }
    record.public_key = std::move(public_result).Unwrap();
    record.device_id = std::string(device_id);
    record.epoch = epoch;
    record.created_at_ms = NowMillis();
    return Result<KeyPairRecord, PaykitFailure>::Ok(std::move(record));
}

Result<std::vector<uint8_t>, PaykitFailure> HkdfKeyDerivation::GenerateSeed() {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(
            PaykitFailure::FromSodiumFailure(init.UnwrapErr(), PaykitFailureType::KeyDerivationFailed));
    }
    return Result<std::vector<uint8_t>, PaykitFailure>::Ok(
        crypto::SodiumInterop::GetRandomBytes(KeyConstants::SEED_SIZE));
}

}
