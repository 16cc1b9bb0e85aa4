#include <catch2/catch_test_macros.hpp>
#include "paykit/keys/key_store.hpp"
#include "paykit/crypto/sodium_interop.hpp"
#include "paykit/core/hex.hpp"
#include <filesystem>
using namespace paykit;
using namespace paykit::keys;
namespace {
std::filesystem::path FreshDirectory() {
    const auto suffix = hex::Encode(crypto::SodiumInterop::GetRandomBytes(6));
    return std::filesystem::temp_directory_path() / ("paykit-store-" + suffix);
}
}
TEST_CASE("MemoryKeyStore - Put, Get, Remove", "[keys][store]") {
    MemoryKeyStore store;
    const std::vector<uint8_t> value = {1, 2, 3};

    REQUIRE(store.Get("missing").Unwrap() == std::nullopt);
    REQUIRE(store.Put("k", value).IsOk());
    REQUIRE(store.Contains("k"));
    REQUIRE(store.Get("k").Unwrap() == value);
    REQUIRE(store.Size() == 1);

    REQUIRE(store.Remove("k").IsOk());
    REQUIRE_FALSE(store.Contains("k"));
    REQUIRE(store.Remove("k").IsOk());
}
TEST_CASE("FileKeyStore - Persists across instances", "[keys][store]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto directory = FreshDirectory();
    const std::vector<uint8_t> value = {9, 8, 7, 6};

    {
        auto store = FileKeyStore::Open(directory);
        REQUIRE(store.IsOk());
        REQUIRE(store.Unwrap()->Put("noise.key.cache.dev-1.0", value).IsOk());
        REQUIRE(store.Unwrap()->Put("noise.key.cache.dev-1.0", value).IsOk());
    }

    auto reopened = FileKeyStore::Open(directory).Unwrap();
    REQUIRE(reopened->Get("noise.key.cache.dev-1.0").Unwrap() == value);
    REQUIRE(reopened->Get("noise.key.cache.dev-1.1").Unwrap() == std::nullopt);

    SECTION("No temporary files are left behind") {
        for (const auto& entry : std::filesystem::directory_iterator(directory)) {
            REQUIRE(entry.path().extension() == ".bin");
        }
    }
    SECTION("Remove deletes the entry and is idempotent") {
        REQUIRE(reopened->Remove("noise.key.cache.dev-1.0").IsOk());
        REQUIRE(reopened->Get("noise.key.cache.dev-1.0").Unwrap() == std::nullopt);
        REQUIRE(reopened->Remove("noise.key.cache.dev-1.0").IsOk());
    }

    std::filesystem::remove_all(directory);
}
