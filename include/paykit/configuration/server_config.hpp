#pragma once

#include "paykit/core/constants.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace paykit::configuration {

/// Listener settings. `port` 0 binds an ephemeral port; the chosen port is
/// reported through ConnectionServer::GetStatus. `identity` is the payee key
/// handed to the receipt handler as myPubkey; when empty the server's Noise
/// public key hex is used instead.
struct ServerConfig {
    std::string bind_address{ServerConstants::DEFAULT_BIND_ADDRESS};
    uint16_t port = 0;
    std::string device_id;
    uint32_t epoch = 0;
    std::string identity;
    uint32_t max_connections = ServerConstants::DEFAULT_MAX_CONNECTIONS;
    std::chrono::milliseconds idle_timeout{TimeoutConstants::DEFAULT_IDLE_TIMEOUT};
    uint32_t worker_threads = ServerConstants::DEFAULT_WORKER_THREADS;

    static ServerConfig Default() { return ServerConfig{}; }

    static ServerConfig ForDevice(std::string device, const uint32_t key_epoch) {
        ServerConfig config;
        config.device_id = std::move(device);
        config.epoch = key_epoch;
        return config;
    }

    [[nodiscard]] Result<Unit, PaykitFailure> Validate() const {
        if (device_id.empty()) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::InvalidInput("device_id must not be empty"));
        }
        if (bind_address.empty()) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::InvalidInput("bind_address must not be empty"));
        }
        if (max_connections == 0) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::InvalidInput("max_connections must be at least 1"));
        }
        if (worker_threads == 0) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::InvalidInput("worker_threads must be at least 1"));
        }
        if (idle_timeout.count() <= 0) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::InvalidInput("idle_timeout must be positive"));
        }
        return Result<Unit, PaykitFailure>::Ok(unit);
    }
};

}
