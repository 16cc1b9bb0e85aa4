#include <catch2/catch_test_macros.hpp>
#include "paykit/keys/key_derivation_cache.hpp"
#include "paykit/keys/key_derivation.hpp"
#include "paykit/keys/key_store.hpp"
#include "helpers/paykit_fixtures.hpp"
#include <algorithm>
using namespace paykit;
using namespace paykit::keys;
using test_helpers::FixedSeed;
using test_helpers::MakeSeededCache;
TEST_CASE("KeyDerivationCache - Lookup order", "[keys][cache]") {
    auto store = std::make_shared<MemoryKeyStore>();
    auto cache = MakeSeededCache(0x31, store);

    auto derived = cache->GetOrDerive("dev-1", 0);
    REQUIRE(derived.IsOk());
    REQUIRE(store->Contains("noise.key.cache.dev-1.0"));
    REQUIRE(store->Contains("noise.key.cache.index"));

    SECTION("Second lookup returns the same pair") {
        REQUIRE(cache->GetOrDerive("dev-1", 0).Unwrap().public_key == derived.Unwrap().public_key);
    }
    SECTION("Matches the derivation primitive") {
        HkdfKeyDerivation derivation;
        const auto expected = derivation.DeriveKeypair(FixedSeed(0x31), "dev-1", 0).Unwrap();
        REQUIRE(derived.Unwrap().public_key == expected.public_key);
    }
    SECTION("A new cache over the same store loads persisted entries") {
        auto reloaded = KeyDerivationCache::Create(store, std::make_shared<HkdfKeyDerivation>()).Unwrap();
        REQUIRE_FALSE(reloaded->HasIdentity());
        auto found = reloaded->GetKey("dev-1", 0);
        REQUIRE(found.IsOk());
        REQUIRE(found.Unwrap().has_value());
        REQUIRE(found.Unwrap()->public_key == derived.Unwrap().public_key);
        REQUIRE(reloaded->GetOrDerive("dev-1", 0).IsOk());
    }
}
TEST_CASE("KeyDerivationCache - Missing identity", "[keys][cache]") {
    auto cache = KeyDerivationCache::Create(
        std::make_shared<MemoryKeyStore>(), std::make_shared<HkdfKeyDerivation>()).Unwrap();
    REQUIRE_FALSE(cache->HasIdentity());

    auto result = cache->GetOrDerive("dev-1", 0);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == PaykitFailureType::NoIdentity);

    SECTION("Short seeds are refused") {
        const std::vector<uint8_t> short_seed(8, 0x01);
        REQUIRE(cache->SetIdentitySeed(short_seed).IsErr());
        REQUIRE_FALSE(cache->HasIdentity());
    }
}
TEST_CASE("KeyDerivationCache - Eviction keeps the newest epochs", "[keys][cache][eviction]") {
    auto store = std::make_shared<MemoryKeyStore>();
    auto cache = MakeSeededCache(0x41, store, configuration::KeyCacheConfig::WithMaxCachedEpochs(5));

    for (uint32_t epoch = 0; epoch <= 5; ++epoch) {
        REQUIRE(cache->GetOrDerive("dev-1", epoch).IsOk());
    }

    const auto stats = cache->Stats();
    REQUIRE(stats.memory_count == 5);
    for (uint32_t epoch = 1; epoch <= 5; ++epoch) {
        const auto key = MakeCacheKey("dev-1", epoch);
        REQUIRE(std::find(stats.keys.begin(), stats.keys.end(), key) != stats.keys.end());
        REQUIRE(store->Contains(key));
    }
    REQUIRE(std::find(stats.keys.begin(), stats.keys.end(), "noise.key.cache.dev-1.0") == stats.keys.end());
    REQUIRE_FALSE(store->Contains("noise.key.cache.dev-1.0"));

    SECTION("The persisted index no longer references the evicted epoch") {
        auto reloaded = KeyDerivationCache::Create(store, std::make_shared<HkdfKeyDerivation>()).Unwrap();
        REQUIRE(reloaded->Stats().memory_count == 5);
        REQUIRE(reloaded->GetKey("dev-1", 0).Unwrap() == std::nullopt);
    }
    SECTION("Other devices are unaffected") {
        REQUIRE(cache->GetOrDerive("dev-2", 0).IsOk());
        REQUIRE(cache->Stats().memory_count == 6);
    }
}
TEST_CASE("KeyDerivationCache - Explicit mutators", "[keys][cache]") {
    auto store = std::make_shared<MemoryKeyStore>();
    auto cache = MakeSeededCache(0x51, store);
    REQUIRE(cache->GetOrDerive("dev-1", 0).IsOk());
    REQUIRE(cache->GetOrDerive("dev-1", 1).IsOk());
    REQUIRE(cache->GetOrDerive("dev-2", 3).IsOk());

    SECTION("ClearKey removes one epoch from both layers") {
        REQUIRE(cache->ClearKey("dev-1", 0).IsOk());
        REQUIRE(cache->GetKey("dev-1", 0).Unwrap() == std::nullopt);
        REQUIRE_FALSE(store->Contains("noise.key.cache.dev-1.0"));
        REQUIRE(cache->GetKey("dev-1", 1).Unwrap().has_value());
    }
    SECTION("ClearAllKeys removes one device") {
        REQUIRE(cache->ClearAllKeys("dev-1").IsOk());
        REQUIRE(cache->GetLatestEpoch("dev-1") == std::nullopt);
        REQUIRE(cache->GetLatestEpoch("dev-2") == 3u);
    }
    SECTION("ClearAll empties everything but keeps the identity") {
        REQUIRE(cache->ClearAll().IsOk());
        REQUIRE(cache->Stats().memory_count == 0);
        REQUIRE(store->Size() == 1);
        REQUIRE(cache->HasIdentity());
    }
    SECTION("SetKey stores an externally supplied pair") {
        HkdfKeyDerivation derivation;
        auto record = derivation.DeriveKeypair(FixedSeed(0x99), "imported", 2).Unwrap();
        REQUIRE(cache->SetKey(record).IsOk());
        REQUIRE(cache->GetKey("imported", 2).Unwrap()->public_key == record.public_key);
        REQUIRE(store->Contains("noise.key.cache.imported.2"));
    }
    SECTION("SetKey rejects an incomplete record") {
        KeyPairRecord incomplete;
        incomplete.device_id = "x";
        REQUIRE(cache->SetKey(incomplete).IsErr());
    }
}
TEST_CASE("KeyDerivationCache - Rotation", "[keys][cache][rotation]") {
    auto cache = MakeSeededCache(0x61);

    auto first = cache->RotateEpoch("dev-1");
    REQUIRE(first.Unwrap().epoch == 0);
    auto second = cache->RotateEpoch("dev-1");
    REQUIRE(second.Unwrap().epoch == 1);
    REQUIRE(second.Unwrap().public_key != first.Unwrap().public_key);
    REQUIRE(cache->GetLatestEpoch("dev-1") == 1u);
}
