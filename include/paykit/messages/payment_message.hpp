#pragma once

#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paykit::messages {

enum class MessageType {
    RequestReceipt,
    ConfirmReceipt,
    Error,
    Ack,
    Ping,
    Pong
};

[[nodiscard]] std::string_view MessageTypeName(MessageType type) noexcept;
[[nodiscard]] std::optional<MessageType> ParseMessageType(std::string_view name) noexcept;

/// One application message carried inside an encrypted frame. Which fields are
/// meaningful depends on `type`; see PaymentMessageCodec for the JSON shape.
struct PaymentMessage {
    MessageType type = MessageType::Ping;
    std::string receipt_id;
    std::string payer;
    std::string payee;
    std::string method_id;
    std::optional<std::string> amount;
    std::optional<std::string> currency;
    std::optional<std::string> description;
    int64_t created_at = 0;
    std::optional<int64_t> confirmed_at;
    std::optional<std::string> signature;
    std::optional<std::string> code;
    std::optional<std::string> message;

    static PaymentMessage MakeError(std::string_view error_code, std::string_view error_message,
                                    std::optional<std::string> receipt_id = std::nullopt);
    static PaymentMessage MakeAck(std::string receipt_id);
    static PaymentMessage MakePing();
    static PaymentMessage MakePong();

    /// Confirmation echoing every receipt field of @p request.
    static PaymentMessage MakeConfirmation(const PaymentMessage& request, int64_t confirmed_at);

    bool operator==(const PaymentMessage&) const = default;
};

/// Client-side view of a payment request.
struct PaymentRequest {
    std::string receipt_id;
    std::string payer;
    std::string payee;
    std::string method_id;
    std::optional<std::string> amount;
    std::optional<std::string> currency;
    std::optional<std::string> description;

    /// Fills receipt_id with `rcpt_<uuid>` when left empty.
    static PaymentRequest Create(
        std::string payer,
        std::string payee,
        std::string method_id,
        std::optional<std::string> amount = std::nullopt,
        std::optional<std::string> currency = std::nullopt,
        std::optional<std::string> description = std::nullopt,
        std::string receipt_id = {});

    [[nodiscard]] PaymentMessage ToMessage(int64_t created_at) const;
};

struct PaymentResponse {
    bool success = false;
    std::optional<std::string> receipt_id;
    std::optional<int64_t> confirmed_at;
    std::optional<std::string> error_code;
    std::optional<std::string> error_message;
};

/**
 * @brief Interprets the reply to a request_receipt
 *
 * confirm_receipt with the expected receipt id gives success; error gives a
 * failed response carrying code and message. A mismatched receipt id or any
 * other message type is InvalidResponse.
 */
[[nodiscard]] Result<PaymentResponse, PaykitFailure> ToPaymentResponse(
    const PaymentMessage& reply,
    std::string_view expected_receipt_id);

[[nodiscard]] std::string GenerateReceiptId();

[[nodiscard]] int64_t NowSeconds();

}
