#pragma once

#include "paykit/core/constants.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"

#include <cstdint>

namespace paykit::configuration {

/// Retention settings for the device/epoch key cache.
class KeyCacheConfig {
public:
    static constexpr KeyCacheConfig Default() noexcept {
        return KeyCacheConfig(KeyConstants::DEFAULT_MAX_CACHED_EPOCHS);
    }

    static constexpr KeyCacheConfig WithMaxCachedEpochs(const uint32_t max_cached_epochs) noexcept {
        return KeyCacheConfig(max_cached_epochs);
    }

    [[nodiscard]] constexpr uint32_t MaxCachedEpochs() const noexcept { return max_cached_epochs_; }

    [[nodiscard]] Result<Unit, PaykitFailure> Validate() const {
        if (max_cached_epochs_ == 0) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::InvalidInput("max_cached_epochs must be at least 1"));
        }
        return Result<Unit, PaykitFailure>::Ok(unit);
    }

private:
    explicit constexpr KeyCacheConfig(const uint32_t max_cached_epochs) noexcept
        : max_cached_epochs_(max_cached_epochs) {}

    uint32_t max_cached_epochs_;
};

}
