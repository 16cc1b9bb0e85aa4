#include "paykit/crypto/hkdf.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>

namespace paykit::crypto {

namespace {
    struct KdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const noexcept { EVP_KDF_CTX_free(ctx); }
    };
}

Result<Unit, PaykitFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::KeyDerivationFailed(
                "HKDF output size out of range: " + std::to_string(output.size())));
    }
    if (ikm.empty()) {
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::KeyDerivationFailed("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf) {
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::KeyDerivationFailed("Failed to fetch HKDF algorithm"));
    }
    std::unique_ptr<EVP_KDF_CTX, KdfCtxDeleter> kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::KeyDerivationFailed("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != 1) {
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::KeyDerivationFailed("HKDF key derivation failed"));
    }
    return Result<Unit, PaykitFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, PaykitFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    const size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, PaykitFailure>::Ok(std::move(output));
}

}
