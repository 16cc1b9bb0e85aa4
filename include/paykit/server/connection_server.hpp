#pragma once

#include "paykit/configuration/server_config.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"
#include "paykit/interfaces/i_receipt_handler.hpp"
#include "paykit/keys/key_derivation_cache.hpp"
#include "paykit/noise/handshake_engine.hpp"
#include "paykit/server/connection_table.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace paykit::server {

struct ServerStatus {
    bool is_running = false;
    uint16_t port = 0;
    std::string public_key_hex;
    size_t active_connections = 0;
    uint64_t total_connections = 0;
};

struct ConnectionContext;

/**
 * @brief Responder side: accepts and serves many payment sessions at once
 *
 * Every accepted connection is driven by its own coroutine on its own strand.
 * The first read is the raw Noise initiation message, the reply is written raw
 * and from then on the connection carries length-prefixed encrypted
 * PaymentMessages, each dispatched to the receipt handler.
 *
 * Decryption, decoding and handler failures are answered with an encrypted
 * error message and the connection stays open. Transport failures, handshake
 * failures and idle expiry close the connection and remove it from the table.
 */
class ConnectionServer {
public:
    /// Derives the server's static key for (device_id, epoch). A failure to do
    /// so is ServerError{INIT_FAILED}.
    static Result<std::unique_ptr<ConnectionServer>, PaykitFailure> Create(
        keys::KeyDerivationCache& key_cache,
        std::shared_ptr<interfaces::IReceiptHandler> handler,
        configuration::ServerConfig config);

    ~ConnectionServer();

    ConnectionServer(const ConnectionServer&) = delete;
    ConnectionServer& operator=(const ConnectionServer&) = delete;

    /// Binds and starts accepting. @p port overrides the configured port;
    /// 0 picks an ephemeral one. Bind or listen errors are
    /// ServerError{LISTENER_FAILED}.
    Result<ServerStatus, PaykitFailure> StartServer(std::optional<uint16_t> port = std::nullopt);

    /// Closes the listener and every connection and waits for them to finish.
    void StopServer();

    [[nodiscard]] ServerStatus GetStatus() const;

    /// Idempotent. Returns whether the connection was still open.
    bool CloseConnection(const std::string& connection_id);

    [[nodiscard]] std::vector<ConnectionRecord> ListConnections() const;

    [[nodiscard]] const std::string& PublicKeyHex() const noexcept { return public_key_hex_; }
    [[nodiscard]] const std::vector<uint8_t>& PublicKey() const noexcept { return engine_->LocalPublicKey(); }

private:
    ConnectionServer(
        std::unique_ptr<noise::HandshakeEngine> engine,
        std::shared_ptr<interfaces::IReceiptHandler> handler,
        configuration::ServerConfig config);

    boost::asio::awaitable<void> AcceptLoop();
    boost::asio::awaitable<void> ServeConnection(std::shared_ptr<ConnectionContext> context);
    boost::asio::awaitable<void> WatchIdle(std::shared_ptr<ConnectionContext> context);

    /// Decrypts, decodes and dispatches one frame. Returns the reply to send,
    /// if any, still in plaintext form.
    std::optional<messages::PaymentMessage> ProcessFrame(
        const std::string& session_id,
        std::span<const uint8_t> ciphertext,
        const std::string& peer_public_key_hex);

    void AcceptConnection(boost::asio::ip::tcp::socket socket);
    void FinishConnection(ConnectionContext& context);

    std::unique_ptr<noise::HandshakeEngine> engine_;
    std::shared_ptr<interfaces::IReceiptHandler> handler_;
    configuration::ServerConfig config_;
    std::string public_key_hex_;
    std::string identity_;

    ConnectionTable connections_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<boost::asio::io_context> io_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::vector<std::thread> workers_;

    std::atomic<bool> running_{false};
    std::atomic<uint16_t> port_{0};
    std::atomic<uint64_t> total_connections_{0};
};

}
