#include <catch2/catch_test_macros.hpp>
#include "helpers/paykit_fixtures.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
using namespace paykit;
using namespace paykit::test_helpers;
TEST_CASE("Concurrent key cache - Same key from every thread", "[concurrency][keys]") {
    auto store = std::make_shared<keys::MemoryKeyStore>();
    auto cache = MakeSeededCache(0x71, store);

    constexpr int kThreads = 8;
    std::mutex seen_mutex;
    std::set<std::vector<uint8_t>> seen;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                auto record = cache->GetOrDerive("shared-device", 0);
                if (record.IsOk()) {
                    std::lock_guard lock(seen_mutex);
                    seen.insert(record.Unwrap().public_key);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(seen.size() == 1);
    REQUIRE(cache->Stats().memory_count == 1);
    REQUIRE(store->Contains("noise.key.cache.shared-device.0"));
}
TEST_CASE("Concurrent key cache - Eviction under parallel inserts", "[concurrency][keys][eviction]") {
    auto store = std::make_shared<keys::MemoryKeyStore>();
    auto cache = MakeSeededCache(0x72, store, configuration::KeyCacheConfig::WithMaxCachedEpochs(3));

    constexpr int kThreads = 4;
    constexpr uint32_t kEpochs = 12;
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            for (uint32_t epoch = 0; epoch < kEpochs; ++epoch) {
                const std::string device = "device-" + std::to_string(t % 2);
                if (cache->GetOrDerive(device, epoch).IsErr()) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(failures.load() == 0);
    for (const std::string device : {"device-0", "device-1"}) {
        REQUIRE(cache->GetLatestEpoch(device) == kEpochs - 1);
        for (uint32_t epoch = 0; epoch < kEpochs - 3; ++epoch) {
            REQUIRE_FALSE(store->Contains(keys::MakeCacheKey(device, epoch)));
        }
        for (uint32_t epoch = kEpochs - 3; epoch < kEpochs; ++epoch) {
            REQUIRE(store->Contains(keys::MakeCacheKey(device, epoch)));
        }
    }
    REQUIRE(cache->Stats().memory_count == 6);
}
