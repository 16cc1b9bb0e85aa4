/**
 * @file payment_roundtrip_example.cpp
 * @brief One payment request over a Noise IK session on the loopback interface
 */

#include "paykit/client/connection_client.hpp"
#include "paykit/discovery/endpoint_discovery.hpp"
#include "paykit/handlers/demo_receipt_handler.hpp"
#include "paykit/keys/key_derivation.hpp"
#include "paykit/keys/key_derivation_cache.hpp"
#include "paykit/keys/key_store.hpp"
#include "paykit/server/connection_server.hpp"

#include <iostream>

using namespace paykit;

namespace {

std::unique_ptr<keys::KeyDerivationCache> MakeCache() {
    auto derivation = std::make_shared<keys::HkdfKeyDerivation>();
    auto cache = keys::KeyDerivationCache::Create(std::make_shared<keys::MemoryKeyStore>(), derivation);
    if (cache.IsErr()) {
        std::cerr << "Key cache: " << cache.UnwrapErr().ToString() << std::endl;
        return nullptr;
    }
    auto owned = std::move(cache).Unwrap();
    auto seed = derivation->GenerateSeed();
    if (seed.IsErr() || owned->SetIdentitySeed(seed.Unwrap()).IsErr()) {
        std::cerr << "Failed to install identity seed" << std::endl;
        return nullptr;
    }
    return owned;
}

}

int main() {
    std::cout << "=== paykit-noise payment round trip ===" << std::endl;

    auto payee_keys = MakeCache();
    auto payer_keys = MakeCache();
    if (!payee_keys || !payer_keys) {
        return 1;
    }

    // 1. Payee starts listening
    auto server_config = configuration::ServerConfig::ForDevice("payee-device", 0);
    server_config.bind_address = "127.0.0.1";
    server_config.identity = "B";

    auto handler = std::make_shared<handlers::DemoReceiptHandler>(
        [](const messages::PaymentMessage& request, std::string_view) {
            std::cout << "   payee received " << request.receipt_id << " for "
                      << request.amount.value_or("?") << " " << request.currency.value_or("") << std::endl;
        });
    auto server_result = server::ConnectionServer::Create(*payee_keys, handler, server_config);
    if (server_result.IsErr()) {
        std::cerr << "Server: " << server_result.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    auto server = std::move(server_result).Unwrap();
    auto status = server->StartServer();
    if (status.IsErr()) {
        std::cerr << "Listen: " << status.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    std::cout << "1. Server on port " << status.Unwrap().port << std::endl;

    // 2. Payee publishes its endpoint
    auto directory = std::make_shared<discovery::StaticEndpointDiscovery>();
    discovery::EndpointInfo endpoint;
    endpoint.recipient_pubkey = "B";
    endpoint.host = "127.0.0.1";
    endpoint.port = status.Unwrap().port;
    endpoint.server_public_key = server->PublicKey();
    directory->Publish("B", endpoint);
    std::cout << "2. Endpoint published" << std::endl;

    // 3. Payer resolves and connects
    auto client_result = client::ConnectionClient::Create(
        *payer_keys, configuration::ClientConfig::ForDevice("dev-1", 0));
    if (client_result.IsErr()) {
        std::cerr << "Client: " << client_result.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    auto client = std::move(client_result).Unwrap();
    const discovery::EndpointResolver resolver(directory);
    if (auto connected = client->ConnectToPeer(resolver, "B"); connected.IsErr()) {
        std::cerr << "Connect: " << connected.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    std::cout << "3. Session " << client->SessionId().value_or("") << " ready" << std::endl;

    // 4. One request, one receipt
    const auto request = messages::PaymentRequest::Create("A", "B", "lightning", "1000", "SAT");
    auto response = client->SendPaymentRequest(request);
    client->Disconnect();
    server->StopServer();

    if (response.IsErr()) {
        std::cerr << "Request: " << response.UnwrapErr().ToString() << std::endl;
        return 1;
    }
    const auto& receipt = response.Unwrap();
    std::cout << "4. success=" << std::boolalpha << receipt.success
              << " receipt=" << receipt.receipt_id.value_or("-")
              << " confirmed_at=" << receipt.confirmed_at.value_or(0) << std::endl;
    return receipt.success ? 0 : 1;
}
