#include "paykit/discovery/endpoint_discovery.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/core/hex.hpp"
#include "paykit/core/logging.hpp"

#include <cstdlib>

namespace paykit::discovery {

void StaticEndpointDiscovery::Publish(const std::string& recipient_pubkey, const EndpointInfo& endpoint) {
    PublishRaw(recipient_pubkey, EncodeEndpointJson(endpoint));
}

void StaticEndpointDiscovery::PublishRaw(const std::string& recipient_pubkey, std::string json_record) {
    std::lock_guard lock(mutex_);
    records_[recipient_pubkey] = std::move(json_record);
}

bool StaticEndpointDiscovery::Remove(const std::string& recipient_pubkey) {
    std::lock_guard lock(mutex_);
    return records_.erase(recipient_pubkey) > 0;
}

Result<std::optional<EndpointInfo>, PaykitFailure> StaticEndpointDiscovery::DiscoverEndpoint(
    const std::string_view peer_pubkey) {
    using ResultType = Result<std::optional<EndpointInfo>, PaykitFailure>;

    std::string record;
    {
        std::lock_guard lock(mutex_);
        const auto it = records_.find(peer_pubkey);
        if (it == records_.end()) {
            return ResultType::Ok(std::nullopt);
        }
        record = it->second;
    }
    auto endpoint = DecodeEndpointJson(record, std::string(peer_pubkey));
    if (endpoint.IsErr()) {
        return ResultType::Err(std::move(endpoint).UnwrapErr());
    }
    return ResultType::Ok(std::move(endpoint).Unwrap());
}

EndpointResolver::EndpointResolver(std::shared_ptr<interfaces::IEndpointDiscovery> discovery)
    : discovery_(std::move(discovery)) {}

Result<EndpointInfo, PaykitFailure> EndpointResolver::Resolve(const std::string_view peer_pubkey) const {
    using ResultType = Result<EndpointInfo, PaykitFailure>;

    if (const char* override_value = std::getenv(EnvironmentKeys::PAYEE_NOISE_ENDPOINT);
        override_value != nullptr && *override_value != '\0') {
        auto parsed = ParseEndpointString(override_value);
        if (parsed.IsErr()) {
            return parsed;
        }
        EndpointInfo endpoint = std::move(parsed).Unwrap();
        endpoint.recipient_pubkey = std::string(peer_pubkey);
        PAYKIT_LOG_INFO("Using endpoint override {}", endpoint.ConnectionAddress());
        return ResultType::Ok(std::move(endpoint));
    }

    if (!discovery_) {
        return ResultType::Err(PaykitFailure::EndpointNotFound("No discovery configured"));
    }
    auto discovered = discovery_->DiscoverEndpoint(peer_pubkey);
    if (discovered.IsErr()) {
        return ResultType::Err(std::move(discovered).UnwrapErr());
    }
    auto& endpoint = discovered.Unwrap();
    if (!endpoint) {
        return ResultType::Err(PaykitFailure::EndpointNotFound(
            "No noise endpoint published for " + hex::Abbreviate(peer_pubkey, 12)));
    }
    PAYKIT_LOG_DEBUG("Discovered endpoint {} for {}", endpoint->ConnectionAddress(),
                     hex::Abbreviate(peer_pubkey, 12));
    return ResultType::Ok(std::move(*endpoint));
}

}
