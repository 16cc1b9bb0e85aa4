#include <catch2/catch_test_macros.hpp>
#include "paykit/crypto/hkdf.hpp"
#include "paykit/core/hex.hpp"
using namespace paykit;
using namespace paykit::crypto;
TEST_CASE("Hkdf - RFC 5869 test case 1", "[hkdf][crypto]") {
    const std::vector<uint8_t> ikm(22, 0x0b);
    const auto salt = *hex::Decode("000102030405060708090a0b0c");
    const auto info = *hex::Decode("f0f1f2f3f4f5f6f7f8f9");

    auto okm = Hkdf::DeriveKeyBytes(ikm, 42, salt, info);
    REQUIRE(okm.IsOk());
    REQUIRE(hex::Encode(okm.Unwrap()) ==
            "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}
TEST_CASE("Hkdf - Argument validation", "[hkdf][crypto]") {
    const std::vector<uint8_t> ikm(32, 0x01);
    SECTION("Empty input key material") {
        auto result = Hkdf::DeriveKeyBytes({}, 32);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PaykitFailureType::KeyDerivationFailed);
    }
    SECTION("Zero and oversized output") {
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, 0).IsErr());
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN + 1).IsErr());
    }
    SECTION("Different info gives different keys") {
        const std::vector<uint8_t> info_a = {'a'};
        const std::vector<uint8_t> info_b = {'b'};
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, 32, {}, info_a).Unwrap() !=
                Hkdf::DeriveKeyBytes(ikm, 32, {}, info_b).Unwrap());
    }
}
