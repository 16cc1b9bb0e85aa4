#pragma once

#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paykit::discovery {

/// Where a payee's Noise server listens and which static key it holds.
struct EndpointInfo {
    std::string recipient_pubkey;
    std::string host;
    uint16_t port = 0;
    std::vector<uint8_t> server_public_key;
    std::optional<std::string> metadata;

    [[nodiscard]] std::string ServerPublicKeyHex() const;
    /// `host:port`
    [[nodiscard]] std::string ConnectionAddress() const;
};

/**
 * @brief Parses the manual override format `host:port:pubkey_hex`
 *
 * The key is the last component and the port the one before it, so IPv6
 * hosts (optionally bracketed) are accepted. Fails with InvalidEndpoint on a
 * missing part, a port outside 1..65535 or a key that is not 64 hex digits.
 */
[[nodiscard]] Result<EndpointInfo, PaykitFailure> ParseEndpointString(std::string_view text);

/// Directory record `{host, port, pubkey, metadata?}`.
[[nodiscard]] std::string EncodeEndpointJson(const EndpointInfo& endpoint);
[[nodiscard]] Result<EndpointInfo, PaykitFailure> DecodeEndpointJson(
    std::string_view json_text,
    std::string recipient_pubkey);

}
