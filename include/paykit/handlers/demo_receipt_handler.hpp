#pragma once

#include "paykit/interfaces/i_receipt_handler.hpp"

#include <atomic>
#include <functional>
#include <mutex>

namespace paykit::handlers {

/**
 * @brief Confirms every receipt addressed to this payee
 *
 * request_receipt for another payee is answered with WRONG_PAYEE. Accepted
 * requests are echoed back as confirm_receipt stamped with the current time
 * and reported to the optional callback. ping gets pong, confirm_receipt gets
 * ack, ack and error get nothing.
 */
class DemoReceiptHandler final : public interfaces::IReceiptHandler {
public:
    using RequestCallback = std::function<void(const messages::PaymentMessage& request,
                                               std::string_view peer_pubkey)>;

    DemoReceiptHandler() = default;
    explicit DemoReceiptHandler(RequestCallback on_request);

    [[nodiscard]] Result<std::optional<messages::PaymentMessage>, PaykitFailure> HandleMessage(
        const messages::PaymentMessage& message,
        std::string_view peer_pubkey,
        std::string_view my_pubkey) override;

    [[nodiscard]] uint64_t ConfirmedCount() const noexcept { return confirmed_.load(); }

private:
    RequestCallback on_request_;
    std::mutex callback_mutex_;
    std::atomic<uint64_t> confirmed_{0};
};

}
