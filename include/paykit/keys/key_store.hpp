#pragma once

#include "paykit/interfaces/i_key_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace paykit::keys {

/**
 * @brief One file per key under a directory
 *
 * File names are the hex encoding of the key. Writes go to a temporary file in
 * the same directory which is then renamed over the target, so a crash never
 * leaves a half-written entry behind.
 */
class FileKeyStore final : public interfaces::IKeyStore {
public:
    static Result<std::shared_ptr<FileKeyStore>, PaykitFailure> Open(std::filesystem::path directory);

    [[nodiscard]] Result<Unit, PaykitFailure> Put(
        const std::string& key, std::span<const uint8_t> value) override;
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, PaykitFailure> Get(
        const std::string& key) const override;
    [[nodiscard]] Result<Unit, PaykitFailure> Remove(const std::string& key) override;

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept { return directory_; }

private:
    explicit FileKeyStore(std::filesystem::path directory);

    [[nodiscard]] std::filesystem::path PathFor(const std::string& key) const;

    std::filesystem::path directory_;
    mutable std::mutex io_mutex_;
};

class MemoryKeyStore final : public interfaces::IKeyStore {
public:
    [[nodiscard]] Result<Unit, PaykitFailure> Put(
        const std::string& key, std::span<const uint8_t> value) override;
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, PaykitFailure> Get(
        const std::string& key) const override;
    [[nodiscard]] Result<Unit, PaykitFailure> Remove(const std::string& key) override;

    [[nodiscard]] bool Contains(const std::string& key) const;
    [[nodiscard]] size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<uint8_t>> entries_;
};

}
