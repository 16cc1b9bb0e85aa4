#include "paykit/client/connection_client.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/core/format.hpp"
#include "paykit/core/hex.hpp"
#include "paykit/core/logging.hpp"
#include "paykit/crypto/sodium_interop.hpp"
#include "paykit/messages/payment_message_codec.hpp"
#include "paykit/wire/message_framer.hpp"
#include "paykit/wire/transport_error.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>

namespace paykit::client {

namespace asio = boost::asio;
using asio::ip::tcp;
using wire::MessageFramer;

Result<std::unique_ptr<ConnectionClient>, PaykitFailure> ConnectionClient::Create(
    keys::KeyDerivationCache& key_cache,
    configuration::ClientConfig config) {
    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<std::unique_ptr<ConnectionClient>, PaykitFailure>::Err(std::move(valid).UnwrapErr());
    }
    return Result<std::unique_ptr<ConnectionClient>, PaykitFailure>::Ok(
        std::unique_ptr<ConnectionClient>(new ConnectionClient(key_cache, std::move(config))));
}

ConnectionClient::ConnectionClient(keys::KeyDerivationCache& key_cache, configuration::ClientConfig config)
    : key_cache_(key_cache)
    , config_(std::move(config))
    , resolver_(io_)
    , socket_(io_) {}

ConnectionClient::~ConnectionClient() {
    Disconnect();
}

template<typename T, typename Operation>
Result<T, PaykitFailure> ConnectionClient::RunWithDeadline(
    Operation operation,
    const std::chrono::milliseconds timeout,
    const std::string_view phase) {

    std::optional<Result<T, PaykitFailure>> outcome;
    operation_generation_.fetch_add(1, std::memory_order_acq_rel);

    io_.restart();
    asio::co_spawn(
        io_,
        [&outcome, &operation]() -> asio::awaitable<void> {
            outcome.emplace(co_await operation());
        },
        [&outcome, phase](std::exception_ptr ep) {
            if (!ep || outcome) {
                return;
            }
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& ex) {
                outcome.emplace(Result<T, PaykitFailure>::Err(PaykitFailure::ConnectionFailed(
                    compat::format("{} failed: {}", phase, ex.what()))));
            }
        });

    io_.run_for(timeout);
    if (outcome) {
        return std::move(*outcome);
    }

    PAYKIT_LOG_WARN("{} exceeded {} ms, aborting", phase, timeout.count());
    AbortTransport();
    io_.run();
    return Result<T, PaykitFailure>::Err(PaykitFailure::Timeout(compat::format("{} timed out", phase)));
}

asio::awaitable<Result<Unit, PaykitFailure>> ConnectionClient::DialAsync(const discovery::EndpointInfo& endpoint) {
    boost::system::error_code ec;
    const auto endpoints = co_await resolver_.async_resolve(
        endpoint.host, std::to_string(endpoint.port),
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return Result<Unit, PaykitFailure>::Err(wire::MapTransportError(ec, "resolve " + endpoint.host));
    }

    co_await asio::async_connect(socket_, endpoints, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return Result<Unit, PaykitFailure>::Err(wire::MapTransportError(ec, "connect " + endpoint.ConnectionAddress()));
    }

    socket_.set_option(tcp::no_delay(true), ec);
    if (ec) {
        PAYKIT_LOG_DEBUG("TCP_NODELAY not applied: {}", ec.message());
    }
    co_return Result<Unit, PaykitFailure>::Ok(unit);
}

asio::awaitable<Result<std::vector<uint8_t>, PaykitFailure>> ConnectionClient::HandshakeAsync(
    std::span<const uint8_t> first_message) {
    auto sent = co_await MessageFramer::SendRaw(socket_, first_message);
    if (sent.IsErr()) {
        co_return Result<std::vector<uint8_t>, PaykitFailure>::Err(std::move(sent).UnwrapErr());
    }
    co_return co_await MessageFramer::ReceiveRawExact(socket_, NoiseConstants::RESPONDER_MESSAGE_LEN);
}

asio::awaitable<Result<std::vector<uint8_t>, PaykitFailure>> ConnectionClient::ExchangeAsync(
    std::span<const uint8_t> ciphertext) {
    auto sent = co_await MessageFramer::SendFramed(socket_, ciphertext);
    if (sent.IsErr()) {
        co_return Result<std::vector<uint8_t>, PaykitFailure>::Err(std::move(sent).UnwrapErr());
    }
    co_return co_await MessageFramer::ReceiveFramed(socket_);
}

Result<Unit, PaykitFailure> ConnectionClient::Connect(const discovery::EndpointInfo& endpoint) {
    std::lock_guard op_lock(operation_mutex_);

    if (IsConnected()) {
        TeardownLocked();
    }
    if (endpoint.host.empty() || endpoint.port == 0 ||
        endpoint.server_public_key.size() != KeyConstants::X25519_KEY_SIZE) {
        return Result<Unit, PaykitFailure>::Err(PaykitFailure::InvalidEndpoint("Endpoint is incomplete"));
    }

    auto key_pair = key_cache_.GetOrDerive(config_.device_id, config_.epoch);
    if (key_pair.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(std::move(key_pair).UnwrapErr());
    }
    auto engine = noise::HandshakeEngine::Create(key_pair.Unwrap());
    crypto::SodiumInterop::SecureWipe(key_pair.Unwrap().secret_key);
    if (engine.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(std::move(engine).UnwrapErr());
    }
    engine_ = std::move(engine).Unwrap();

    PAYKIT_LOG_INFO("Connecting to {}", endpoint.ConnectionAddress());
    auto dialed = RunWithDeadline<Unit>(
        [this, &endpoint] { return DialAsync(endpoint); },
        config_.connect_timeout,
        "connect");
    if (dialed.IsErr()) {
        TeardownLocked();
        return dialed;
    }

    std::vector<uint8_t> hint;
    if (config_.handshake_hint) {
        hint.assign(config_.handshake_hint->begin(), config_.handshake_hint->end());
    }
    auto initiated = engine_->Initiate(endpoint.server_public_key, hint);
    if (initiated.IsErr()) {
        TeardownLocked();
        return Result<Unit, PaykitFailure>::Err(std::move(initiated).UnwrapErr());
    }
    const noise::HandshakeOutput output = std::move(initiated).Unwrap();
    {
        std::lock_guard lock(state_mutex_);
        session_id_ = output.session_id;
    }

    auto response = RunWithDeadline<std::vector<uint8_t>>(
        [this, &output] { return HandshakeAsync(output.message); },
        config_.io_timeout,
        "handshake");
    if (response.IsErr()) {
        TeardownLocked();
        return Result<Unit, PaykitFailure>::Err(std::move(response).UnwrapErr());
    }

    auto completed = engine_->Complete(output.session_id, response.Unwrap());
    if (completed.IsErr()) {
        TeardownLocked();
        return Result<Unit, PaykitFailure>::Err(std::move(completed).UnwrapErr());
    }

    connected_.store(true, std::memory_order_release);
    PAYKIT_LOG_INFO("Session {} established with {}", hex::Abbreviate(output.session_id),
                    endpoint.ConnectionAddress());
    return Result<Unit, PaykitFailure>::Ok(unit);
}

Result<Unit, PaykitFailure> ConnectionClient::ConnectToPeer(
    const discovery::EndpointResolver& resolver,
    const std::string_view peer_pubkey) {
    auto endpoint = resolver.Resolve(peer_pubkey);
    if (endpoint.IsErr()) {
        return Result<Unit, PaykitFailure>::Err(std::move(endpoint).UnwrapErr());
    }
    return Connect(endpoint.Unwrap());
}

Result<messages::PaymentMessage, PaykitFailure> ConnectionClient::Exchange(const messages::PaymentMessage& message) {
    using ResultType = Result<messages::PaymentMessage, PaykitFailure>;
    std::lock_guard op_lock(operation_mutex_);

    std::string session_id;
    {
        std::lock_guard lock(state_mutex_);
        if (!connected_.load(std::memory_order_acquire) || !session_id_) {
            return ResultType::Err(PaykitFailure::ConnectionFailed("Not connected"));
        }
        session_id = *session_id_;
    }

    auto encoded = messages::PaymentMessageCodec::Encode(message);
    if (encoded.IsErr()) {
        return ResultType::Err(std::move(encoded).UnwrapErr());
    }
    auto ciphertext = engine_->Encrypt(session_id, encoded.Unwrap());
    if (ciphertext.IsErr()) {
        return ResultType::Err(std::move(ciphertext).UnwrapErr());
    }

    auto reply = RunWithDeadline<std::vector<uint8_t>>(
        [this, &ciphertext] { return ExchangeAsync(ciphertext.Unwrap()); },
        config_.io_timeout,
        compat::format("{} exchange", messages::MessageTypeName(message.type)));
    if (reply.IsErr()) {
        TeardownLocked();
        return ResultType::Err(std::move(reply).UnwrapErr());
    }

    auto plaintext = engine_->Decrypt(session_id, reply.Unwrap());
    if (plaintext.IsErr()) {
        return ResultType::Err(std::move(plaintext).UnwrapErr());
    }
    return messages::PaymentMessageCodec::Decode(plaintext.Unwrap());
}

Result<messages::PaymentResponse, PaykitFailure> ConnectionClient::SendPaymentRequest(
    const messages::PaymentRequest& request) {
    using ResultType = Result<messages::PaymentResponse, PaykitFailure>;

    const messages::PaymentMessage message = request.ToMessage(messages::NowSeconds());
    PAYKIT_LOG_INFO("Sending payment request {}", message.receipt_id);

    auto reply = Exchange(message);
    if (reply.IsErr()) {
        return ResultType::Err(std::move(reply).UnwrapErr());
    }
    return messages::ToPaymentResponse(reply.Unwrap(), message.receipt_id);
}

void ConnectionClient::Disconnect() {
    std::lock_guard op_lock(operation_mutex_);
    TeardownLocked();
}

void ConnectionClient::Cancel() {
    const uint64_t generation = operation_generation_.load(std::memory_order_acquire);
    asio::post(io_, [this, generation] {
        if (generation == operation_generation_.load(std::memory_order_acquire)) {
            PAYKIT_LOG_INFO("Client operation cancelled");
            AbortTransport();
        }
    });
}

std::optional<std::string> ConnectionClient::SessionId() const {
    std::lock_guard lock(state_mutex_);
    return session_id_;
}

void ConnectionClient::AbortTransport() noexcept {
    boost::system::error_code ignored;
    resolver_.cancel();
    socket_.cancel(ignored);
    socket_.close(ignored);
}

void ConnectionClient::TeardownLocked() {
    std::optional<std::string> session_id;
    {
        std::lock_guard lock(state_mutex_);
        session_id.swap(session_id_);
    }
    connected_.store(false, std::memory_order_release);

    if (session_id && engine_) {
        engine_->RemoveSession(*session_id);
    }
    if (socket_.is_open()) {
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        PAYKIT_LOG_DEBUG("Client transport closed");
    }
}

}
