#pragma once
#include "paykit/core/result.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/messages/payment_message.hpp"
#include <optional>
#include <string_view>
namespace paykit::interfaces {
/// Business logic behind the server. Called concurrently from every
/// connection; implementations synchronize their own state.
class IReceiptHandler {
public:
    virtual ~IReceiptHandler() = default;
    /// Ok(nullopt) means no reply is sent. An Err is reported to the peer as
    /// a PROCESSING_ERROR message.
    [[nodiscard]] virtual Result<std::optional<messages::PaymentMessage>, PaykitFailure> HandleMessage(
        const messages::PaymentMessage& message,
        std::string_view peer_pubkey,
        std::string_view my_pubkey) = 0;
};
}
