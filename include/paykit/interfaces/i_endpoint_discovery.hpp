#pragma once
#include "paykit/core/result.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/discovery/endpoint_info.hpp"
#include <optional>
#include <string_view>
namespace paykit::interfaces {
class IEndpointDiscovery {
public:
    virtual ~IEndpointDiscovery() = default;
    /// Ok(nullopt) when the peer has published no endpoint.
    [[nodiscard]] virtual Result<std::optional<discovery::EndpointInfo>, PaykitFailure> DiscoverEndpoint(
        std::string_view peer_pubkey) = 0;
};
}
