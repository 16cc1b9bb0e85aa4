#include <catch2/catch_test_macros.hpp>
#include "paykit/configuration/client_config.hpp"
#include "paykit/configuration/key_cache_config.hpp"
#include "paykit/configuration/server_config.hpp"
using namespace paykit;
using namespace paykit::configuration;
TEST_CASE("KeyCacheConfig - Validation", "[configuration]") {
    REQUIRE(KeyCacheConfig::Default().MaxCachedEpochs() == KeyConstants::DEFAULT_MAX_CACHED_EPOCHS);
    REQUIRE(KeyCacheConfig::Default().Validate().IsOk());
    REQUIRE(KeyCacheConfig::WithMaxCachedEpochs(1).Validate().IsOk());
    REQUIRE(KeyCacheConfig::WithMaxCachedEpochs(0).Validate().IsErr());
}
TEST_CASE("ClientConfig - Validation", "[configuration]") {
    auto config = ClientConfig::ForDevice("dev-1", 3);
    REQUIRE(config.epoch == 3);
    REQUIRE(config.connect_timeout == TimeoutConstants::DEFAULT_CONNECT_TIMEOUT);
    REQUIRE(config.Validate().IsOk());

    SECTION("Device id is required") {
        REQUIRE(ClientConfig::Default().Validate().UnwrapErr().type == PaykitFailureType::InvalidInput);
    }
    SECTION("Timeouts must be positive") {
        config.io_timeout = std::chrono::milliseconds(0);
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Hint is bounded") {
        config.handshake_hint = std::string(NoiseConstants::MAX_HINT_LEN, 'h');
        REQUIRE(config.Validate().IsOk());
        config.handshake_hint = std::string(NoiseConstants::MAX_HINT_LEN + 1, 'h');
        REQUIRE(config.Validate().IsErr());
    }
}
TEST_CASE("ServerConfig - Validation", "[configuration]") {
    auto config = ServerConfig::ForDevice("payee-device", 0);
    REQUIRE(config.bind_address == ServerConstants::DEFAULT_BIND_ADDRESS);
    REQUIRE(config.max_connections == ServerConstants::DEFAULT_MAX_CONNECTIONS);
    REQUIRE(config.Validate().IsOk());

    SECTION("Device id is required") {
        REQUIRE(ServerConfig::Default().Validate().IsErr());
    }
    SECTION("Limits must be non-zero") {
        config.max_connections = 0;
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Worker pool must be non-empty") {
        config.worker_threads = 0;
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Idle timeout must be positive") {
        config.idle_timeout = std::chrono::milliseconds(-1);
        REQUIRE(config.Validate().IsErr());
    }
    SECTION("Bind address must be set") {
        config.bind_address.clear();
        REQUIRE(config.Validate().IsErr());
    }
}
