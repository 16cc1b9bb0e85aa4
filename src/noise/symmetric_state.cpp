#include "paykit/noise/symmetric_state.hpp"

#include <sodium.h>
#include <algorithm>

namespace paykit::noise {

namespace {
    void HmacSha256(std::span<const uint8_t> key,
                    std::span<const uint8_t> data_a,
                    std::span<const uint8_t> data_b,
                    uint8_t* out) {
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state, key.data(), key.size());
        crypto_auth_hmacsha256_update(&state, data_a.data(), data_a.size());
        crypto_auth_hmacsha256_update(&state, data_b.data(), data_b.size());
        crypto_auth_hmacsha256_final(&state, out);
        sodium_memzero(&state, sizeof(state));
    }
}

SymmetricState::SymmetricState(const std::string_view protocol_name) {
    if (protocol_name.size() <= NoiseConstants::HASH_LEN) {
        std::copy(protocol_name.begin(), protocol_name.end(), h_.begin());
    } else {
        crypto_hash_sha256(h_.data(),
                           reinterpret_cast<const uint8_t*>(protocol_name.data()),
                           protocol_name.size());
    }
    ck_ = h_;
}

SymmetricState::~SymmetricState() {
    sodium_memzero(ck_.data(), ck_.size());
    sodium_memzero(h_.data(), h_.size());
}

void SymmetricState::MixHash(std::span<const uint8_t> data) {
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    crypto_hash_sha256_update(&state, h_.data(), h_.size());
    crypto_hash_sha256_update(&state, data.data(), data.size());
    crypto_hash_sha256_final(&state, h_.data());
}

void SymmetricState::Hkdf2(const Digest& chaining_key, std::span<const uint8_t> ikm, Digest& out1, Digest& out2) {
    Digest temp_key{};
    HmacSha256(chaining_key, ikm, {}, temp_key.data());

    const uint8_t one = 0x01;
    HmacSha256(temp_key, std::span(&one, 1), {}, out1.data());

    const uint8_t two = 0x02;
    HmacSha256(temp_key, out1, std::span(&two, 1), out2.data());

    sodium_memzero(temp_key.data(), temp_key.size());
}

void SymmetricState::MixKey(std::span<const uint8_t> input_key_material) {
    Digest next_ck{};
    Digest temp_k{};
    Hkdf2(ck_, input_key_material, next_ck, temp_k);
    ck_ = next_ck;
    cipher_.InitializeKey(temp_k);
    sodium_memzero(next_ck.data(), next_ck.size());
    sodium_memzero(temp_k.data(), temp_k.size());
}

Result<std::vector<uint8_t>, PaykitFailure> SymmetricState::EncryptAndHash(std::span<const uint8_t> plaintext) {
    auto ciphertext = cipher_.EncryptWithAd(h_, plaintext);
    if (ciphertext.IsOk()) {
        MixHash(ciphertext.Unwrap());
    }
    return ciphertext;
}

Result<std::vector<uint8_t>, PaykitFailure> SymmetricState::DecryptAndHash(std::span<const uint8_t> ciphertext) {
    auto plaintext = cipher_.DecryptWithAd(h_, ciphertext);
    if (plaintext.IsOk()) {
        MixHash(ciphertext);
    }
    return plaintext;
}

std::pair<CipherState, CipherState> SymmetricState::Split() {
    Digest k1{};
    Digest k2{};
    Hkdf2(ck_, {}, k1, k2);

    CipherState c1;
    CipherState c2;
    c1.InitializeKey(k1);
    c2.InitializeKey(k2);
    sodium_memzero(k1.data(), k1.size());
    sodium_memzero(k2.data(), k2.size());
    return {std::move(c1), std::move(c2)};
}

}
