#include "paykit/discovery/endpoint_info.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/core/format.hpp"
#include "paykit/core/hex.hpp"

#include <nlohmann/json.hpp>

#include <charconv>

namespace paykit::discovery {

namespace {
    Result<std::vector<uint8_t>, PaykitFailure> ParsePublicKeyHex(const std::string_view key_hex) {
        if (key_hex.size() != KeyConstants::X25519_KEY_SIZE * 2) {
            return Result<std::vector<uint8_t>, PaykitFailure>::Err(
                PaykitFailure::InvalidEndpoint("Server public key must be 64 hex characters"));
        }
        auto decoded = hex::Decode(key_hex);
        if (!decoded) {
            return Result<std::vector<uint8_t>, PaykitFailure>::Err(
                PaykitFailure::InvalidEndpoint("Server public key is not valid hex"));
        }
        return Result<std::vector<uint8_t>, PaykitFailure>::Ok(std::move(*decoded));
    }
}

std::string EndpointInfo::ServerPublicKeyHex() const {
    return hex::Encode(server_public_key);
}

std::string EndpointInfo::ConnectionAddress() const {
    if (host.find(':') != std::string::npos) {
        return compat::format("[{}]:{}", host, port);
    }
    return compat::format("{}:{}", host, port);
}

Result<EndpointInfo, PaykitFailure> ParseEndpointString(const std::string_view text) {
    using ResultType = Result<EndpointInfo, PaykitFailure>;

    const size_t key_sep = text.rfind(':');
    if (key_sep == std::string_view::npos) {
        return ResultType::Err(PaykitFailure::InvalidEndpoint("Expected format: host:port:pubkey_hex"));
    }
    const size_t port_sep = text.rfind(':', key_sep == 0 ? 0 : key_sep - 1);
    if (port_sep == std::string_view::npos || port_sep >= key_sep || key_sep == 0) {
        return ResultType::Err(PaykitFailure::InvalidEndpoint("Expected format: host:port:pubkey_hex"));
    }

    std::string_view host = text.substr(0, port_sep);
    const std::string_view port_text = text.substr(port_sep + 1, key_sep - port_sep - 1);
    const std::string_view key_text = text.substr(key_sep + 1);

    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) {
        return ResultType::Err(PaykitFailure::InvalidEndpoint("Missing host"));
    }

    uint32_t port = 0;
    const auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (port_text.empty() || ec != std::errc() || end != port_text.data() + port_text.size() ||
        port == 0 || port > 65535) {
        return ResultType::Err(PaykitFailure::InvalidEndpoint("Invalid port"));
    }

    auto key = ParsePublicKeyHex(key_text);
    if (key.IsErr()) {
        return ResultType::Err(std::move(key).UnwrapErr());
    }

    EndpointInfo endpoint;
    endpoint.host = std::string(host);
    endpoint.port = static_cast<uint16_t>(port);
    endpoint.server_public_key = std::move(key).Unwrap();
    return ResultType::Ok(std::move(endpoint));
}

std::string EncodeEndpointJson(const EndpointInfo& endpoint) {
    nlohmann::json j;
    j["host"] = endpoint.host;
    j["port"] = endpoint.port;
    j["pubkey"] = endpoint.ServerPublicKeyHex();
    if (endpoint.metadata) {
        j["metadata"] = *endpoint.metadata;
    }
    return j.dump();
}

Result<EndpointInfo, PaykitFailure> DecodeEndpointJson(
    const std::string_view json_text,
    std::string recipient_pubkey) {
    using ResultType = Result<EndpointInfo, PaykitFailure>;

    const auto j = nlohmann::json::parse(json_text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return ResultType::Err(PaykitFailure::InvalidEndpoint("Invalid noise endpoint format"));
    }
    const auto host = j.find("host");
    const auto port = j.find("port");
    const auto pubkey = j.find("pubkey");
    if (host == j.end() || !host->is_string() ||
        port == j.end() || !port->is_number_unsigned() ||
        pubkey == j.end() || !pubkey->is_string()) {
        return ResultType::Err(PaykitFailure::InvalidEndpoint("Noise endpoint record is incomplete"));
    }
    const auto port_value = port->get<uint64_t>();
    if (port_value == 0 || port_value > 65535) {
        return ResultType::Err(PaykitFailure::InvalidEndpoint("Invalid port"));
    }
    auto key = ParsePublicKeyHex(pubkey->get<std::string>());
    if (key.IsErr()) {
        return ResultType::Err(std::move(key).UnwrapErr());
    }

    EndpointInfo endpoint;
    endpoint.recipient_pubkey = std::move(recipient_pubkey);
    endpoint.host = host->get<std::string>();
    endpoint.port = static_cast<uint16_t>(port_value);
    endpoint.server_public_key = std::move(key).Unwrap();
    if (const auto metadata = j.find("metadata"); metadata != j.end() && metadata->is_string()) {
        endpoint.metadata = metadata->get<std::string>();
    }
    return ResultType::Ok(std::move(endpoint));
}

}
