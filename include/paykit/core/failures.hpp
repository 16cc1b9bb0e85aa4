#pragma once
#include <string>
#include <string_view>
#include <optional>

namespace paykit {

enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

enum class PaykitFailureType {
    NoIdentity,
    KeyDerivationFailed,
    EndpointNotFound,
    InvalidEndpoint,
    ConnectionFailed,
    HandshakeFailed,
    EncryptionFailed,
    DecryptionFailed,
    InvalidResponse,
    Timeout,
    Cancelled,
    ServerError,
    InvalidInput,
    StorageFailed
};

class PaykitFailure {
public:
    PaykitFailureType type;
    std::string message;
    /// Only meaningful for ServerError: the remote or listener error code.
    std::string code;

    PaykitFailure(const PaykitFailureType t, std::string msg, std::string c = {})
        : type(t), message(std::move(msg)), code(std::move(c)) {}

    static PaykitFailure NoIdentity(std::string msg) {
        return {PaykitFailureType::NoIdentity, std::move(msg)};
    }
    static PaykitFailure KeyDerivationFailed(std::string msg) {
        return {PaykitFailureType::KeyDerivationFailed, std::move(msg)};
    }
    static PaykitFailure EndpointNotFound(std::string msg) {
        return {PaykitFailureType::EndpointNotFound, std::move(msg)};
    }
    static PaykitFailure InvalidEndpoint(std::string msg) {
        return {PaykitFailureType::InvalidEndpoint, std::move(msg)};
    }
    static PaykitFailure ConnectionFailed(std::string msg) {
        return {PaykitFailureType::ConnectionFailed, std::move(msg)};
    }
    static PaykitFailure HandshakeFailed(std::string msg) {
        return {PaykitFailureType::HandshakeFailed, std::move(msg)};
    }
    static PaykitFailure EncryptionFailed(std::string msg) {
        return {PaykitFailureType::EncryptionFailed, std::move(msg)};
    }
    static PaykitFailure DecryptionFailed(std::string msg) {
        return {PaykitFailureType::DecryptionFailed, std::move(msg)};
    }
    static PaykitFailure InvalidResponse(std::string msg) {
        return {PaykitFailureType::InvalidResponse, std::move(msg)};
    }
    static PaykitFailure Timeout(std::string msg) {
        return {PaykitFailureType::Timeout, std::move(msg)};
    }
    static PaykitFailure Cancelled(std::string msg) {
        return {PaykitFailureType::Cancelled, std::move(msg)};
    }
    static PaykitFailure ServerError(std::string error_code, std::string msg) {
        return {PaykitFailureType::ServerError, std::move(msg), std::move(error_code)};
    }
    static PaykitFailure InvalidInput(std::string msg) {
        return {PaykitFailureType::InvalidInput, std::move(msg)};
    }
    static PaykitFailure StorageFailed(std::string msg) {
        return {PaykitFailureType::StorageFailed, std::move(msg)};
    }

    static PaykitFailure FromSodiumFailure(const SodiumFailure& sf, PaykitFailureType as) {
        return {as, sf.message};
    }

    [[nodiscard]] std::string ToString() const;
};

[[nodiscard]] std::string_view FailureTypeName(PaykitFailureType type) noexcept;

}
