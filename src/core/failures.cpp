#include "paykit/core/failures.hpp"

namespace paykit {

std::string_view FailureTypeName(const PaykitFailureType type) noexcept {
    switch (type) {
        case PaykitFailureType::NoIdentity:          return "NoIdentity";
        case PaykitFailureType::KeyDerivationFailed: return "KeyDerivationFailed";
        case PaykitFailureType::EndpointNotFound:    return "EndpointNotFound";
        case PaykitFailureType::InvalidEndpoint:     return "InvalidEndpoint";
        case PaykitFailureType::ConnectionFailed:    return "ConnectionFailed";
        case PaykitFailureType::HandshakeFailed:     return "HandshakeFailed";
        case PaykitFailureType::EncryptionFailed:    return "EncryptionFailed";
        case PaykitFailureType::DecryptionFailed:    return "DecryptionFailed";
        case PaykitFailureType::InvalidResponse:     return "InvalidResponse";
        case PaykitFailureType::Timeout:             return "Timeout";
        case PaykitFailureType::Cancelled:           return "Cancelled";
        case PaykitFailureType::ServerError:         return "ServerError";
        case PaykitFailureType::InvalidInput:        return "InvalidInput";
        case PaykitFailureType::StorageFailed:       return "StorageFailed";
    }
    return "Unknown";
}

std::string PaykitFailure::ToString() const {
    std::string out(FailureTypeName(type));
    if (!code.empty()) {
        out += "[" + code + "]";
    }
    out += ": ";
    out += message;
    return out;
}

}
