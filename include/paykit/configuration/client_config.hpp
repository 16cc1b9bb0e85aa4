#pragma once

#include "paykit/core/constants.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace paykit::configuration {

/// Settings for one outbound payment session.
///
/// `connect_timeout` bounds the TCP dial. `io_timeout` bounds each later
/// phase separately: the handshake round trip and the request/response
/// exchange. `handshake_hint` is sent encrypted inside the first handshake
/// message and is limited to 64 bytes.
struct ClientConfig {
    std::chrono::milliseconds connect_timeout{TimeoutConstants::DEFAULT_CONNECT_TIMEOUT};
    std::chrono::milliseconds io_timeout{TimeoutConstants::DEFAULT_IO_TIMEOUT};
    std::string device_id;
    uint32_t epoch = 0;
    std::optional<std::string> handshake_hint;

    static ClientConfig Default() { return ClientConfig{}; }

    static ClientConfig ForDevice(std::string device, const uint32_t key_epoch) {
        ClientConfig config;
        config.device_id = std::move(device);
        config.epoch = key_epoch;
        return config;
    }

    [[nodiscard]] Result<Unit, PaykitFailure> Validate() const {
        if (device_id.empty()) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::InvalidInput("device_id must not be empty"));
        }
        if (connect_timeout.count() <= 0 || io_timeout.count() <= 0) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::InvalidInput("timeouts must be positive"));
        }
        if (handshake_hint && handshake_hint->size() > NoiseConstants::MAX_HINT_LEN) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::InvalidInput("handshake hint exceeds 64 bytes"));
        }
        return Result<Unit, PaykitFailure>::Ok(unit);
    }
};

}
