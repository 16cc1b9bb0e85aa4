#include "paykit/messages/payment_message.hpp"
#include "paykit/core/format.hpp"
#include "paykit/core/hex.hpp"
#include "paykit/crypto/sodium_interop.hpp"

#include <array>
#include <chrono>

namespace paykit::messages {

namespace {
    struct TypeName {
        MessageType type;
        std::string_view name;
    };

    constexpr std::array<TypeName, 6> kTypeNames{{
        {MessageType::RequestReceipt, "request_receipt"},
        {MessageType::ConfirmReceipt, "confirm_receipt"},
        {MessageType::Error, "error"},
        {MessageType::Ack, "ack"},
        {MessageType::Ping, "ping"},
        {MessageType::Pong, "pong"},
    }};
}

std::string_view MessageTypeName(const MessageType type) noexcept {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<MessageType> ParseMessageType(const std::string_view name) noexcept {
    for (const auto& entry : kTypeNames) {
        if (entry.name == name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

PaymentMessage PaymentMessage::MakeError(
    const std::string_view error_code,
    const std::string_view error_message,
    std::optional<std::string> receipt_id) {
    PaymentMessage msg;
    msg.type = MessageType::Error;
    msg.code = std::string(error_code);
    msg.message = std::string(error_message);
    if (receipt_id) {
        msg.receipt_id = std::move(*receipt_id);
    }
    return msg;
}

PaymentMessage PaymentMessage::MakeAck(std::string receipt_id) {
    PaymentMessage msg;
    msg.type = MessageType::Ack;
    msg.receipt_id = std::move(receipt_id);
    return msg;
}

PaymentMessage PaymentMessage::MakePing() {
    PaymentMessage msg;
    msg.type = MessageType::Ping;
    return msg;
}

PaymentMessage PaymentMessage::MakePong() {
    PaymentMessage msg;
    msg.type = MessageType::Pong;
    return msg;
}

PaymentMessage PaymentMessage::MakeConfirmation(const PaymentMessage& request, const int64_t confirmed_at) {
    PaymentMessage msg = request;
    msg.type = MessageType::ConfirmReceipt;
    msg.confirmed_at = confirmed_at;
    msg.code.reset();
    msg.message.reset();
    return msg;
}

PaymentRequest PaymentRequest::Create(
    std::string payer,
    std::string payee,
    std::string method_id,
    std::optional<std::string> amount,
    std::optional<std::string> currency,
    std::optional<std::string> description,
    std::string receipt_id) {
    PaymentRequest request;
    request.receipt_id = receipt_id.empty() ? GenerateReceiptId() : std::move(receipt_id);
    request.payer = std::move(payer);
    request.payee = std::move(payee);
    request.method_id = std::move(method_id);
    request.amount = std::move(amount);
    request.currency = std::move(currency);
    request.description = std::move(description);
    return request;
}

PaymentMessage PaymentRequest::ToMessage(const int64_t created_at) const {
    PaymentMessage msg;
    msg.type = MessageType::RequestReceipt;
    msg.receipt_id = receipt_id.empty() ? GenerateReceiptId() : receipt_id;
    msg.payer = payer;
    msg.payee = payee;
    msg.method_id = method_id;
    msg.amount = amount;
    msg.currency = currency;
    msg.description = description;
    msg.created_at = created_at;
    return msg;
}

Result<PaymentResponse, PaykitFailure> ToPaymentResponse(
    const PaymentMessage& reply,
    const std::string_view expected_receipt_id) {
    PaymentResponse response;
    switch (reply.type) {
        case MessageType::ConfirmReceipt:
            if (reply.receipt_id != expected_receipt_id) {
                return Result<PaymentResponse, PaykitFailure>::Err(
                    PaykitFailure::InvalidResponse("Receipt ID mismatch"));
            }
            response.success = true;
            response.receipt_id = reply.receipt_id;
            response.confirmed_at = reply.confirmed_at;
            return Result<PaymentResponse, PaykitFailure>::Ok(std::move(response));
        case MessageType::Error:
            response.success = false;
            response.error_code = reply.code.value_or("unknown");
            response.error_message = reply.message.value_or("Unknown error");
            return Result<PaymentResponse, PaykitFailure>::Ok(std::move(response));
        default:
            return Result<PaymentResponse, PaykitFailure>::Err(
                PaykitFailure::InvalidResponse(
                    compat::format("Unexpected message type: {}", MessageTypeName(reply.type))));
    }
}

std::string GenerateReceiptId() {
    auto bytes = crypto::SodiumInterop::GetRandomBytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    const std::string h = hex::Encode(bytes);
    return compat::format("rcpt_{}-{}-{}-{}-{}",
                          h.substr(0, 8), h.substr(8, 4), h.substr(12, 4), h.substr(16, 4), h.substr(20, 12));
}

int64_t NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}
