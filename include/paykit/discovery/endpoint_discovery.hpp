#pragma once

#include "paykit/interfaces/i_endpoint_discovery.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace paykit::discovery {

/// In-process directory holding each recipient's endpoint record as JSON.
class StaticEndpointDiscovery final : public interfaces::IEndpointDiscovery {
public:
    void Publish(const std::string& recipient_pubkey, const EndpointInfo& endpoint);
    void PublishRaw(const std::string& recipient_pubkey, std::string json_record);
    bool Remove(const std::string& recipient_pubkey);

    [[nodiscard]] Result<std::optional<EndpointInfo>, PaykitFailure> DiscoverEndpoint(
        std::string_view peer_pubkey) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> records_;
};

/**
 * @brief Chooses the endpoint for a payee
 *
 * PAYKIT_PAYEE_NOISE_ENDPOINT (`host:port:pubkey_hex`) wins when set, then the
 * discovery directory. Neither yielding one is EndpointNotFound.
 */
class EndpointResolver {
public:
    explicit EndpointResolver(std::shared_ptr<interfaces::IEndpointDiscovery> discovery);

    [[nodiscard]] Result<EndpointInfo, PaykitFailure> Resolve(std::string_view peer_pubkey) const;

private:
    std::shared_ptr<interfaces::IEndpointDiscovery> discovery_;
};

}
