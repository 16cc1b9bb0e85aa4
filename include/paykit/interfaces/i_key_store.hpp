#pragma once
#include "paykit/core/result.hpp"
#include "paykit/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
namespace paykit::interfaces {
/// Byte-oriented persistent store behind the key cache. Implementations must
/// make Put atomic: a reader sees either the old value or the new one.
class IKeyStore {
public:
    virtual ~IKeyStore() = default;
    [[nodiscard]] virtual Result<Unit, PaykitFailure> Put(
        const std::string& key, std::span<const uint8_t> value) = 0;
    [[nodiscard]] virtual Result<std::optional<std::vector<uint8_t>>, PaykitFailure> Get(
        const std::string& key) const = 0;
    /// Removing an absent key succeeds.
    [[nodiscard]] virtual Result<Unit, PaykitFailure> Remove(const std::string& key) = 0;
};
}
