#include "paykit/handlers/demo_receipt_handler.hpp"
#include "paykit/core/constants.hpp"
#include "paykit/core/hex.hpp"
#include "paykit/core/logging.hpp"

namespace paykit::handlers {

using messages::MessageType;
using messages::PaymentMessage;

DemoReceiptHandler::DemoReceiptHandler(RequestCallback on_request)
    : on_request_(std::move(on_request)) {}

Result<std::optional<PaymentMessage>, PaykitFailure> DemoReceiptHandler::HandleMessage(
    const PaymentMessage& message,
    const std::string_view peer_pubkey,
    const std::string_view my_pubkey) {
    using ResultType = Result<std::optional<PaymentMessage>, PaykitFailure>;

    switch (message.type) {
        case MessageType::RequestReceipt: {
            if (message.payee != my_pubkey) {
                PAYKIT_LOG_WARN("Receipt {} addressed to {}, not to us", message.receipt_id,
                                hex::Abbreviate(message.payee, 12));
                return ResultType::Ok(PaymentMessage::MakeError(
                    ErrorCodes::WRONG_PAYEE, "Payee does not match this receiver", message.receipt_id));
            }
            if (on_request_) {
                std::lock_guard lock(callback_mutex_);
                on_request_(message, peer_pubkey);
            }
            confirmed_.fetch_add(1);
            PAYKIT_LOG_INFO("Confirming receipt {} from {}", message.receipt_id,
                            hex::Abbreviate(peer_pubkey, 12));
            return ResultType::Ok(PaymentMessage::MakeConfirmation(message, messages::NowSeconds()));
        }
        case MessageType::Ping:
            return ResultType::Ok(PaymentMessage::MakePong());
        case MessageType::ConfirmReceipt:
            return ResultType::Ok(PaymentMessage::MakeAck(message.receipt_id));
        case MessageType::Ack:
        case MessageType::Error:
        case MessageType::Pong:
            return ResultType::Ok(std::nullopt);
    }
    return ResultType::Ok(std::nullopt);
}

}
