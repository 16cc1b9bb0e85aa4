#include "paykit/server/connection_server.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/core/hex.hpp"
#include "paykit/core/logging.hpp"
#include "paykit/crypto/sodium_interop.hpp"
#include "paykit/messages/payment_message_codec.hpp"
#include "paykit/wire/message_framer.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>

namespace paykit::server {

namespace asio = boost::asio;
using asio::ip::tcp;
using wire::MessageFramer;

/// Per-connection state. Touched only from the connection's strand.
struct ConnectionContext {
    ConnectionContext(std::string connection_id, tcp::socket connection_socket,
                      const std::chrono::milliseconds idle)
        : id(std::move(connection_id))
        , executor(connection_socket.get_executor())
        , socket(std::move(connection_socket))
        , idle_timer(executor)
        , idle_timeout(idle) {}

    void Touch() {
        deadline = std::chrono::steady_clock::now() + idle_timeout;
    }

    void Close() {
        if (closed) {
            return;
        }
        closed = true;
        boost::system::error_code ignored;
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
        idle_timer.cancel();
    }

    std::string id;
    asio::any_io_executor executor;
    tcp::socket socket;
    asio::steady_timer idle_timer;
    std::chrono::milliseconds idle_timeout;
    std::chrono::steady_clock::time_point deadline{};
    std::optional<std::string> session_id;
    bool closed = false;
};

namespace {

auto ReportTermination(std::string what) {
    return [what = std::move(what)](std::exception_ptr ep) {
        if (!ep) {
            return;
        }
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& ex) {
            PAYKIT_LOG_ERROR("{} terminated: {}", what, ex.what());
        } catch (...) {
            PAYKIT_LOG_ERROR("{} terminated by an unknown exception", what);
        }
    };
}

}

Result<std::unique_ptr<ConnectionServer>, PaykitFailure> ConnectionServer::Create(
    keys::KeyDerivationCache& key_cache,
    std::shared_ptr<interfaces::IReceiptHandler> handler,
    configuration::ServerConfig config) {
    using ResultType = Result<std::unique_ptr<ConnectionServer>, PaykitFailure>;

    if (auto valid = config.Validate(); valid.IsErr()) {
        return ResultType::Err(std::move(valid).UnwrapErr());
    }
    if (!handler) {
        return ResultType::Err(PaykitFailure::InvalidInput("Receipt handler is required"));
    }

    auto key_pair = key_cache.GetOrDerive(config.device_id, config.epoch);
    if (key_pair.IsErr()) {
        return ResultType::Err(PaykitFailure::ServerError(
            std::string(ErrorCodes::INIT_FAILED), key_pair.UnwrapErr().ToString()));
    }
    auto engine = noise::HandshakeEngine::Create(key_pair.Unwrap());
    crypto::SodiumInterop::SecureWipe(key_pair.Unwrap().secret_key);
    if (engine.IsErr()) {
        return ResultType::Err(PaykitFailure::ServerError(
            std::string(ErrorCodes::INIT_FAILED), engine.UnwrapErr().ToString()));
    }

    return ResultType::Ok(std::unique_ptr<ConnectionServer>(
        new ConnectionServer(std::move(engine).Unwrap(), std::move(handler), std::move(config))));
}

ConnectionServer::ConnectionServer(
    std::unique_ptr<noise::HandshakeEngine> engine,
    std::shared_ptr<interfaces::IReceiptHandler> handler,
    configuration::ServerConfig config)
    : engine_(std::move(engine))
    , handler_(std::move(handler))
    , config_(std::move(config))
    , public_key_hex_(hex::Encode(engine_->LocalPublicKey()))
    , identity_(config_.identity.empty() ? public_key_hex_ : config_.identity) {}

ConnectionServer::~ConnectionServer() {
    StopServer();
}

Result<ServerStatus, PaykitFailure> ConnectionServer::StartServer(const std::optional<uint16_t> port) {
    using ResultType = Result<ServerStatus, PaykitFailure>;
    const std::string listener_failed(ErrorCodes::LISTENER_FAILED);

    std::lock_guard lock(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return ResultType::Err(PaykitFailure::ServerError(listener_failed, "Server is already running"));
    }

    boost::system::error_code ec;
    const auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        return ResultType::Err(PaykitFailure::ServerError(
            listener_failed, "Invalid bind address " + config_.bind_address));
    }
    const tcp::endpoint endpoint(address, port.value_or(config_.port));

    auto io = std::make_unique<asio::io_context>(static_cast<int>(config_.worker_threads));
    auto acceptor = std::make_unique<tcp::acceptor>(asio::make_strand(*io));

    acceptor->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor->listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        PAYKIT_LOG_ERROR("Failed to listen on {}:{}: {}", config_.bind_address, endpoint.port(), ec.message());
        return ResultType::Err(PaykitFailure::ServerError(listener_failed, ec.message()));
    }

    const uint16_t bound_port = acceptor->local_endpoint(ec).port();
    if (ec) {
        return ResultType::Err(PaykitFailure::ServerError(listener_failed, ec.message()));
    }

    io_ = std::move(io);
    acceptor_ = std::move(acceptor);
    port_.store(bound_port, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    work_.emplace(asio::make_work_guard(*io_));

    asio::co_spawn(acceptor_->get_executor(), AcceptLoop(), ReportTermination("Accept loop"));

    workers_.reserve(config_.worker_threads);
    for (uint32_t i = 0; i < config_.worker_threads; ++i) {
        workers_.emplace_back([this] {
            try {
                io_->run();
            } catch (const std::exception& ex) {
                PAYKIT_LOG_ERROR("Server worker stopped: {}", ex.what());
            }
        });
    }

    PAYKIT_LOG_INFO("Noise server listening on {}:{} with key {}",
                    config_.bind_address, bound_port, hex::Abbreviate(public_key_hex_));
    return ResultType::Ok(GetStatus());
}

void ConnectionServer::StopServer() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    PAYKIT_LOG_INFO("Stopping Noise server on port {}", port_.load());

    asio::post(acceptor_->get_executor(), [this] {
        boost::system::error_code ignored;
        acceptor_->close(ignored);
    });
    connections_.CancelAll();

    work_.reset();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    connections_.Clear();
    acceptor_.reset();
    io_.reset();
    port_.store(0, std::memory_order_release);
}

ServerStatus ConnectionServer::GetStatus() const {
    ServerStatus status;
    status.is_running = running_.load(std::memory_order_acquire);
    status.port = port_.load(std::memory_order_acquire);
    status.public_key_hex = public_key_hex_;
    status.active_connections = connections_.Size();
    status.total_connections = total_connections_.load(std::memory_order_acquire);
    return status;
}

bool ConnectionServer::CloseConnection(const std::string& connection_id) {
    auto cancel = connections_.Extract(connection_id);
    if (!cancel) {
        return false;
    }
    if (*cancel) {
        (*cancel)();
    }
    PAYKIT_LOG_INFO("Connection {} closed on request", connection_id);
    return true;
}

std::vector<ConnectionRecord> ConnectionServer::ListConnections() const {
    return connections_.Snapshot();
}

asio::awaitable<void> ConnectionServer::AcceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
        const asio::any_io_executor strand = asio::make_strand(*io_);
        boost::system::error_code ec;
        tcp::socket socket = co_await acceptor_->async_accept(
            strand, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::operation_aborted || !running_.load(std::memory_order_acquire)) {
                break;
            }
            PAYKIT_LOG_WARN("Accept failed: {}", ec.message());
            continue;
        }
        AcceptConnection(std::move(socket));
    }
    PAYKIT_LOG_DEBUG("Accept loop finished");
}

void ConnectionServer::AcceptConnection(tcp::socket socket) {
    boost::system::error_code ec;
    if (!running_.load(std::memory_order_acquire)) {
        socket.close(ec);
        return;
    }
    if (connections_.Size() >= config_.max_connections) {
        PAYKIT_LOG_WARN("Connection limit {} reached, rejecting peer", config_.max_connections);
        socket.close(ec);
        return;
    }

    ConnectionRecord record;
    record.connection_id = hex::Encode(crypto::SodiumInterop::GetRandomBytes(WireConstants::CONNECTION_ID_BYTES));
    record.connected_at = std::chrono::system_clock::now();
    const auto remote = socket.remote_endpoint(ec);
    if (!ec) {
        record.remote_address = remote.address().to_string() + ":" + std::to_string(remote.port());
    }
    socket.set_option(tcp::no_delay(true), ec);

    auto context = std::make_shared<ConnectionContext>(record.connection_id, std::move(socket), config_.idle_timeout);
    auto cancel = [context] {
        asio::post(context->executor, [context] { context->Close(); });
    };
    if (!connections_.Insert(record, cancel)) {
        asio::post(context->executor, [context] { context->Close(); });
        return;
    }
    total_connections_.fetch_add(1, std::memory_order_acq_rel);
    PAYKIT_LOG_INFO("Accepted connection {} from {}", record.connection_id, record.remote_address);

    context->Touch();
    asio::co_spawn(context->executor, ServeConnection(context),
                   ReportTermination("Connection " + context->id));
    asio::co_spawn(context->executor, WatchIdle(context),
                   ReportTermination("Idle watchdog " + context->id));

    if (!running_.load(std::memory_order_acquire)) {
        cancel();
    }
}

asio::awaitable<void> ConnectionServer::ServeConnection(std::shared_ptr<ConnectionContext> context) {
    struct FinishOnExit {
        ConnectionServer& server;
        ConnectionContext& context;
        ~FinishOnExit() { server.FinishConnection(context); }
    } finish_on_exit{*this, *context};

    auto first = co_await MessageFramer::ReceiveRawAtLeast(
        context->socket, NoiseConstants::MIN_INITIATOR_MESSAGE_LEN, NoiseConstants::MAX_MESSAGE_LEN);
    if (first.IsErr()) {
        PAYKIT_LOG_DEBUG("Connection {} ended before the handshake: {}", context->id, first.UnwrapErr().message);
        co_return;
    }
    context->Touch();

    auto accepted = engine_->Accept(first.Unwrap());
    if (accepted.IsErr()) {
        PAYKIT_LOG_WARN("Handshake failed on connection {}: {}", context->id, accepted.UnwrapErr().message);
        co_return;
    }
    const noise::HandshakeOutput output = std::move(accepted).Unwrap();
    context->session_id = output.session_id;

    auto replied = co_await MessageFramer::SendRaw(context->socket, output.message);
    if (replied.IsErr()) {
        PAYKIT_LOG_DEBUG("Connection {} lost during the handshake: {}", context->id, replied.UnwrapErr().message);
        co_return;
    }

    const auto remote_static = engine_->GetRemoteStaticKey(output.session_id);
    const std::string peer_hex = remote_static ? hex::Encode(*remote_static) : std::string{};
    connections_.Update(context->id, [&](ConnectionRecord& record) {
        record.session_id = output.session_id;
        record.is_handshake_complete = true;
        record.peer_public_key_hex = peer_hex;
    });
    PAYKIT_LOG_INFO("Session {} established on connection {} with peer {}",
                    hex::Abbreviate(output.session_id), context->id, hex::Abbreviate(peer_hex));

    while (!context->closed) {
        auto frame = co_await MessageFramer::ReceiveFramed(context->socket);
        if (frame.IsErr()) {
            PAYKIT_LOG_DEBUG("Connection {} read ended: {}", context->id, frame.UnwrapErr().message);
            break;
        }
        context->Touch();

        const auto reply = ProcessFrame(output.session_id, frame.Unwrap(), peer_hex);
        if (!reply) {
            continue;
        }
        auto encoded = messages::PaymentMessageCodec::Encode(*reply);
        if (encoded.IsErr()) {
            PAYKIT_LOG_WARN("Reply on connection {} cannot be encoded: {}", context->id, encoded.UnwrapErr().message);
            encoded = messages::PaymentMessageCodec::Encode(messages::PaymentMessage::MakeError(
                ErrorCodes::PROCESSING_ERROR, "Reply could not be encoded", reply->receipt_id.empty()
                    ? std::nullopt : std::optional<std::string>(reply->receipt_id)));
        }
        if (encoded.IsErr()) {
            break;
        }
        auto ciphertext = engine_->Encrypt(output.session_id, encoded.Unwrap());
        if (ciphertext.IsErr()) {
            PAYKIT_LOG_ERROR("Failed to encrypt reply on connection {}: {}",
                             context->id, ciphertext.UnwrapErr().message);
            break;
        }
        auto sent = co_await MessageFramer::SendFramed(context->socket, ciphertext.Unwrap());
        if (sent.IsErr()) {
            PAYKIT_LOG_DEBUG("Connection {} write failed: {}", context->id, sent.UnwrapErr().message);
            break;
        }
        context->Touch();
    }
}

asio::awaitable<void> ConnectionServer::WatchIdle(std::shared_ptr<ConnectionContext> context) {
    while (!context->closed) {
        context->idle_timer.expires_at(context->deadline);
        boost::system::error_code ec;
        co_await context->idle_timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (context->closed) {
            break;
        }
        if (context->deadline <= std::chrono::steady_clock::now()) {
            PAYKIT_LOG_INFO("Connection {} idle for {} ms, closing", context->id, context->idle_timeout.count());
            context->Close();
            break;
        }
    }
}

std::optional<messages::PaymentMessage> ConnectionServer::ProcessFrame(
    const std::string& session_id,
    std::span<const uint8_t> ciphertext,
    const std::string& peer_public_key_hex) {

    auto plaintext = engine_->Decrypt(session_id, ciphertext);
    if (plaintext.IsErr()) {
        PAYKIT_LOG_WARN("Dropping undecryptable frame on session {}", hex::Abbreviate(session_id));
        return messages::PaymentMessage::MakeError(ErrorCodes::DECRYPTION_FAILED, "Failed to decrypt message");
    }

    auto message = messages::PaymentMessageCodec::Decode(plaintext.Unwrap());
    if (message.IsErr()) {
        return messages::PaymentMessage::MakeError(ErrorCodes::INVALID_MESSAGE, message.UnwrapErr().message);
    }
    const messages::PaymentMessage& request = message.Unwrap();
    PAYKIT_LOG_DEBUG("Received {} on session {}", messages::MessageTypeName(request.type),
                     hex::Abbreviate(session_id));

    auto handled = handler_->HandleMessage(request, peer_public_key_hex, identity_);
    if (handled.IsErr()) {
        PAYKIT_LOG_WARN("Receipt handler failed: {}", handled.UnwrapErr().message);
        std::optional<std::string> receipt_id;
        if (!request.receipt_id.empty()) {
            receipt_id = request.receipt_id;
        }
        return messages::PaymentMessage::MakeError(
            ErrorCodes::PROCESSING_ERROR, handled.UnwrapErr().message, std::move(receipt_id));
    }
    return std::move(handled).Unwrap();
}

void ConnectionServer::FinishConnection(ConnectionContext& context) {
    if (context.session_id) {
        engine_->RemoveSession(*context.session_id);
        context.session_id.reset();
    }
    context.Close();
    if (connections_.Remove(context.id)) {
        PAYKIT_LOG_INFO("Connection {} closed", context.id);
    }
}

}
