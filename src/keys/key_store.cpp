#include "paykit/keys/key_store.hpp"
#include "paykit/core/hex.hpp"
#include "paykit/crypto/sodium_interop.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace paykit::keys {

namespace fs = std::filesystem;

Result<std::shared_ptr<FileKeyStore>, PaykitFailure> FileKeyStore::Open(fs::path directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return Result<std::shared_ptr<FileKeyStore>, PaykitFailure>::Err(
            PaykitFailure::StorageFailed(
                "Cannot create key store directory " + directory.string() + ": " + ec.message()));
    }
    return Result<std::shared_ptr<FileKeyStore>, PaykitFailure>::Ok(
        std::shared_ptr<FileKeyStore>(new FileKeyStore(std::move(directory))));
}

FileKeyStore::FileKeyStore(fs::path directory)
    : directory_(std::move(directory)) {}

fs::path FileKeyStore::PathFor(const std::string& key) const {
    return directory_ / (hex::Encode(std::span(reinterpret_cast<const uint8_t*>(key.data()), key.size())) + ".bin");
}

Result<Unit, PaykitFailure> FileKeyStore::Put(const std::string& key, std::span<const uint8_t> value) {
    std::lock_guard lock(io_mutex_);
    const fs::path target = PathFor(key);
    fs::path temp = target;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::StorageFailed("Cannot open " + temp.string() + " for writing"));
        }
        out.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Result<Unit, PaykitFailure>::Err(
                PaykitFailure::StorageFailed("Short write to " + temp.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::StorageFailed("Cannot replace " + target.string() + ": " + ec.message()));
    }
    return Result<Unit, PaykitFailure>::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, PaykitFailure> FileKeyStore::Get(const std::string& key) const {
    using ResultType = Result<std::optional<std::vector<uint8_t>>, PaykitFailure>;
    std::lock_guard lock(io_mutex_);
    const fs::path target = PathFor(key);

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        if (ec) {
            return ResultType::Err(PaykitFailure::StorageFailed(
                "Cannot stat " + target.string() + ": " + ec.message()));
        }
        return ResultType::Ok(std::nullopt);
    }

    std::ifstream in(target, std::ios::binary);
    if (!in) {
        return ResultType::Err(PaykitFailure::StorageFailed("Cannot open " + target.string()));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return ResultType::Ok(std::move(bytes));
}

Result<Unit, PaykitFailure> FileKeyStore::Remove(const std::string& key) {
    std::lock_guard lock(io_mutex_);
    const fs::path target = PathFor(key);
    std::error_code ec;
    fs::remove(target, ec);
    if (ec) {
        return Result<Unit, PaykitFailure>::Err(
            PaykitFailure::StorageFailed("Cannot remove " + target.string() + ": " + ec.message()));
    }
    return Result<Unit, PaykitFailure>::Ok(unit);
}

Result<Unit, PaykitFailure> MemoryKeyStore::Put(const std::string& key, std::span<const uint8_t> value) {
    std::lock_guard lock(mutex_);
    entries_[key] = std::vector<uint8_t>(value.begin(), value.end());
    return Result<Unit, PaykitFailure>::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, PaykitFailure> MemoryKeyStore::Get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Result<std::optional<std::vector<uint8_t>>, PaykitFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<std::vector<uint8_t>>, PaykitFailure>::Ok(it->second);
}

Result<Unit, PaykitFailure> MemoryKeyStore::Remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    if (const auto it = entries_.find(key); it != entries_.end()) {
        crypto::SodiumInterop::SecureWipe(it->second);
        entries_.erase(it);
    }
    return Result<Unit, PaykitFailure>::Ok(unit);
}

bool MemoryKeyStore::Contains(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return entries_.contains(key);
}

size_t MemoryKeyStore::Size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

}
