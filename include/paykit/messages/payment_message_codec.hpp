#pragma once

#include "paykit/messages/payment_message.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace paykit::messages {

/**
 * @brief JSON encoding of PaymentMessage
 *
 * request_receipt: {type, receipt_id, payer, payee, method_id, amount?,
 *                   currency?, description?, created_at}
 * confirm_receipt: the request fields plus confirmed_at and signature?
 * error:           {type, receipt_id?, code, message}
 * ack:             {type, receipt_id}
 * ping / pong:     {type}
 *
 * Absent optional fields are omitted. Unknown types fail to decode. A
 * message whose strings are not valid UTF-8 fails to encode with InvalidInput.
 */
class PaymentMessageCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, PaykitFailure> Encode(const PaymentMessage& message);
    [[nodiscard]] static Result<std::string, PaykitFailure> EncodeToString(const PaymentMessage& message);
    [[nodiscard]] static Result<PaymentMessage, PaykitFailure> Decode(std::span<const uint8_t> bytes);

private:
    PaymentMessageCodec() = delete;
};

}
