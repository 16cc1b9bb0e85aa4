#pragma once

#include "paykit/configuration/client_config.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"
#include "paykit/discovery/endpoint_discovery.hpp"
#include "paykit/discovery/endpoint_info.hpp"
#include "paykit/keys/key_derivation_cache.hpp"
#include "paykit/messages/payment_message.hpp"
#include "paykit/noise/handshake_engine.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace paykit::client {

/**
 * @brief Initiator side of one payment session
 *
 * Connect dials the endpoint, runs the Noise IK handshake over the raw stream
 * and leaves the session Ready. SendPaymentRequest then performs exactly one
 * framed request/response exchange. Calls are serialized; there is at most one
 * outstanding request.
 *
 * Each phase runs on a private io_context and is bounded by a deadline: the
 * connect timeout for the dial, the io timeout for the handshake and for each
 * exchange. A phase that fails, times out or is cancelled tears down both the
 * socket and the session before returning.
 */
class ConnectionClient {
public:
    static Result<std::unique_ptr<ConnectionClient>, PaykitFailure> Create(
        keys::KeyDerivationCache& key_cache,
        configuration::ClientConfig config);

    ~ConnectionClient();

    ConnectionClient(const ConnectionClient&) = delete;
    ConnectionClient& operator=(const ConnectionClient&) = delete;

    Result<Unit, PaykitFailure> Connect(const discovery::EndpointInfo& endpoint);

    Result<Unit, PaykitFailure> ConnectToPeer(
        const discovery::EndpointResolver& resolver,
        std::string_view peer_pubkey);

    Result<messages::PaymentResponse, PaykitFailure> SendPaymentRequest(
        const messages::PaymentRequest& request);

    /// Sends any message and returns the peer's reply.
    Result<messages::PaymentMessage, PaykitFailure> Exchange(const messages::PaymentMessage& message);

    /// Idempotent.
    void Disconnect();

    /// Aborts the operation currently in flight, which then fails with
    /// Cancelled. May be called from any thread.
    void Cancel();

    [[nodiscard]] bool IsConnected() const noexcept { return connected_.load(std::memory_order_acquire); }
    [[nodiscard]] std::optional<std::string> SessionId() const;
    [[nodiscard]] const configuration::ClientConfig& Config() const noexcept { return config_; }

private:
    ConnectionClient(keys::KeyDerivationCache& key_cache, configuration::ClientConfig config);

    template<typename T, typename Operation>
    Result<T, PaykitFailure> RunWithDeadline(
        Operation operation,
        std::chrono::milliseconds timeout,
        std::string_view phase);

    boost::asio::awaitable<Result<Unit, PaykitFailure>> DialAsync(const discovery::EndpointInfo& endpoint);
    boost::asio::awaitable<Result<std::vector<uint8_t>, PaykitFailure>> HandshakeAsync(
        std::span<const uint8_t> first_message);
    boost::asio::awaitable<Result<std::vector<uint8_t>, PaykitFailure>> ExchangeAsync(
        std::span<const uint8_t> ciphertext);

    void AbortTransport() noexcept;
    void TeardownLocked();

    keys::KeyDerivationCache& key_cache_;
    configuration::ClientConfig config_;

    boost::asio::io_context io_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::ip::tcp::socket socket_;

    std::unique_ptr<noise::HandshakeEngine> engine_;

    std::mutex operation_mutex_;
    mutable std::mutex state_mutex_;
    std::optional<std::string> session_id_;
    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> operation_generation_{0};
};

}
