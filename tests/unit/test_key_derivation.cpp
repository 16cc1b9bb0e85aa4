#include <catch2/catch_test_macros.hpp>
#include "paykit/keys/key_derivation.hpp"
#include "paykit/keys/key_pair_record.hpp"
#include "paykit/keys/key_record_codec.hpp"
#include "paykit/crypto/sodium_interop.hpp"
#include "helpers/paykit_fixtures.hpp"
using namespace paykit;
using namespace paykit::keys;
TEST_CASE("HkdfKeyDerivation - Determinism", "[keys][derivation]") {
    HkdfKeyDerivation derivation;
    const auto seed = test_helpers::FixedSeed(0x11);

    auto first = derivation.DeriveKeypair(seed, "dev-1", 0);
    auto second = derivation.DeriveKeypair(seed, "dev-1", 0);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());

    const auto& a = first.Unwrap();
    const auto& b = second.Unwrap();
    REQUIRE(a.secret_key == b.secret_key);
    REQUIRE(a.public_key == b.public_key);
    REQUIRE(a.device_id == "dev-1");
    REQUIRE(a.epoch == 0);

    SECTION("Public key matches the secret") {
        REQUIRE(crypto::SodiumInterop::DerivePublicKey(a.secret_key).Unwrap() == a.public_key);
    }
    SECTION("Secret is clamped") {
        REQUIRE((a.secret_key[0] & 0x07) == 0);
        REQUIRE((a.secret_key[31] & 0xC0) == 0x40);
    }
    SECTION("Epoch, device and seed each change the key") {
        REQUIRE(derivation.DeriveKeypair(seed, "dev-1", 1).Unwrap().public_key != a.public_key);
        REQUIRE(derivation.DeriveKeypair(seed, "dev-2", 0).Unwrap().public_key != a.public_key);
        REQUIRE(derivation.DeriveKeypair(test_helpers::FixedSeed(0x12), "dev-1", 0).Unwrap().public_key !=
                a.public_key);
    }
}
TEST_CASE("HkdfKeyDerivation - Rejects bad input", "[keys][derivation]") {
    HkdfKeyDerivation derivation;
    SECTION("Short seed") {
        const std::vector<uint8_t> seed(16, 0x01);
        auto result = derivation.DeriveKeypair(seed, "dev-1", 0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PaykitFailureType::KeyDerivationFailed);
    }
    SECTION("Empty device id") {
        auto result = derivation.DeriveKeypair(test_helpers::FixedSeed(0x01), "", 0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PaykitFailureType::KeyDerivationFailed);
    }
    SECTION("Generated seeds are random and full length") {
        auto a = derivation.GenerateSeed();
        auto b = derivation.GenerateSeed();
        REQUIRE(a.Unwrap().size() == KeyConstants::SEED_SIZE);
        REQUIRE(a.Unwrap() != b.Unwrap());
    }
}
TEST_CASE("KeyPairRecord - Cache key and persisted form", "[keys][codec]") {
    HkdfKeyDerivation derivation;
    auto record = derivation.DeriveKeypair(test_helpers::FixedSeed(0x21), "phone", 7).Unwrap();

    REQUIRE(record.CacheKey() == "noise.key.cache.phone.7");
    REQUIRE(MakeCacheKey("dev-1", 0) == "noise.key.cache.dev-1.0");
    REQUIRE(record.PublicKeyHex().size() == 64);

    SECTION("Key pair survives serialization") {
        auto bytes = SerializeKeyPair(record);
        REQUIRE(bytes.IsOk());
        auto parsed = ParseKeyPair(bytes.Unwrap());
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().secret_key == record.secret_key);
        REQUIRE(parsed.Unwrap().public_key == record.public_key);
        REQUIRE(parsed.Unwrap().device_id == "phone");
        REQUIRE(parsed.Unwrap().epoch == 7);
    }
    SECTION("Garbage does not parse as a key pair") {
        const std::vector<uint8_t> garbage = {0xff, 0xff, 0xff, 0xff};
        REQUIRE(ParseKeyPair(garbage).IsErr());
    }
    SECTION("Index keeps its entries") {
        const std::vector<IndexEntry> entries = {{"dev-1", 0}, {"dev-1", 4}, {"dev-2", 9}};
        auto bytes = SerializeIndex(entries);
        REQUIRE(ParseIndex(bytes.Unwrap()).Unwrap() == entries);
    }
}
