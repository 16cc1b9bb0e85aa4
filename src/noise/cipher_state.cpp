#include "paykit/noise/cipher_state.hpp"

#include <sodium.h>
#include <algorithm>

namespace paykit::noise {

CipherState::~CipherState() {
    Clear();
}

CipherState::CipherState(CipherState&& other) noexcept
    : key_(other.key_)
    , has_key_(other.has_key_)
    , nonce_(other.nonce_) {
    other.Clear();
}

CipherState& CipherState::operator=(CipherState&& other) noexcept {
    if (this != &other) {
        Clear();
        key_ = other.key_;
        has_key_ = other.has_key_;
        nonce_ = other.nonce_;
        other.Clear();
    }
    return *this;
}

void CipherState::InitializeKey(std::span<const uint8_t> key) {
    std::copy_n(key.begin(), std::min(key.size(), key_.size()), key_.begin());
    has_key_ = true;
    nonce_ = 0;
}

void CipherState::Clear() noexcept {
    sodium_memzero(key_.data(), key_.size());
    has_key_ = false;
    nonce_ = 0;
}

std::array<uint8_t, NoiseConstants::NONCE_LEN> CipherState::BuildNonce() const noexcept {
    std::array<uint8_t, NoiseConstants::NONCE_LEN> nonce{};
    for (size_t i = 0; i < 8; ++i) {
        nonce[4 + i] = static_cast<uint8_t>(nonce_ >> (8 * i));
    }
    return nonce;
}

Result<std::vector<uint8_t>, PaykitFailure> CipherState::EncryptWithAd(
    std::span<const uint8_t> ad, std::span<const uint8_t> plaintext) {
    if (!has_key_) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Ok(
            std::vector<uint8_t>(plaintext.begin(), plaintext.end()));
    }
    if (nonce_ == NoiseConstants::MAX_NONCE) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(
            PaykitFailure::EncryptionFailed("Nonce space exhausted"));
    }

    const auto nonce = BuildNonce();
    std::vector<uint8_t> ciphertext(plaintext.size() + NoiseConstants::TAG_LEN);
    unsigned long long written = 0;
    if (crypto_aead_chacha20poly1305_ietf_encrypt(
            ciphertext.data(), &written,
            plaintext.data(), plaintext.size(),
            ad.data(), ad.size(),
            nullptr, nonce.data(), key_.data()) != 0) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(
            PaykitFailure::EncryptionFailed("AEAD encryption failed"));
    }
    ciphertext.resize(static_cast<size_t>(written));
    ++nonce_;
    return Result<std::vector<uint8_t>, PaykitFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, PaykitFailure> CipherState::DecryptWithAd(
    std::span<const uint8_t> ad, std::span<const uint8_t> ciphertext) {
    if (!has_key_) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Ok(
            std::vector<uint8_t>(ciphertext.begin(), ciphertext.end()));
    }
    if (ciphertext.size() < NoiseConstants::TAG_LEN) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(
            PaykitFailure::DecryptionFailed("Ciphertext shorter than the authentication tag"));
    }
    if (nonce_ == NoiseConstants::MAX_NONCE) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(
            PaykitFailure::DecryptionFailed("Nonce space exhausted"));
    }

    const auto nonce = BuildNonce();
    std::vector<uint8_t> plaintext(ciphertext.size() - NoiseConstants::TAG_LEN);
    unsigned long long written = 0;
    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            plaintext.data(), &written,
            nullptr,
            ciphertext.data(), ciphertext.size(),
            ad.data(), ad.size(),
            nonce.data(), key_.data()) != 0) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(
            PaykitFailure::DecryptionFailed("Authentication tag mismatch"));
    }
    plaintext.resize(static_cast<size_t>(written));
    ++nonce_;
    return Result<std::vector<uint8_t>, PaykitFailure>::Ok(std::move(plaintext));
}

}
