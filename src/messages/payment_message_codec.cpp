#include "paykit/messages/payment_message_codec.hpp"

#include <nlohmann/json.hpp>

namespace paykit::messages {

using json = nlohmann::json;

namespace {
    void PutOptional(json& j, const char* key, const std::optional<std::string>& value) {
        if (value) {
            j[key] = *value;
        }
    }

    void PutReceiptFields(json& j, const PaymentMessage& message) {
        j["receipt_id"] = message.receipt_id;
        j["payer"] = message.payer;
        j["payee"] = message.payee;
        j["method_id"] = message.method_id;
        PutOptional(j, "amount", message.amount);
        PutOptional(j, "currency", message.currency);
        PutOptional(j, "description", message.description);
        j["created_at"] = message.created_at;
    }

    std::optional<std::string> GetString(const json& j, const char* key) {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    std::optional<int64_t> GetInteger(const json& j, const char* key) {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_number_integer()) {
            return std::nullopt;
        }
        return it->get<int64_t>();
    }

    PaykitFailure MissingField(const char* key) {
        return PaykitFailure::InvalidResponse(std::string("Missing or invalid field: ") + key);
    }

    Result<Unit, PaykitFailure> ReadReceiptFields(const json& j, PaymentMessage& message, const bool strict) {
        auto receipt_id = GetString(j, "receipt_id");
        if (!receipt_id) {
            return Result<Unit, PaykitFailure>::Err(MissingField("receipt_id"));
        }
        message.receipt_id = std::move(*receipt_id);

        for (const auto& [key, target] : {std::pair{"payer", &message.payer},
                                          std::pair{"payee", &message.payee},
                                          std::pair{"method_id", &message.method_id}}) {
            auto value = GetString(j, key);
            if (!value && strict) {
                return Result<Unit, PaykitFailure>::Err(MissingField(key));
            }
            *target = value.value_or("");
        }

        message.amount = GetString(j, "amount");
        message.currency = GetString(j, "currency");
        message.description = GetString(j, "description");

        const auto created_at = GetInteger(j, "created_at");
        if (!created_at && strict) {
            return Result<Unit, PaykitFailure>::Err(MissingField("created_at"));
        }
        message.created_at = created_at.value_or(0);
        return Result<Unit, PaykitFailure>::Ok(unit);
    }
}

Result<std::string, PaykitFailure> PaymentMessageCodec::EncodeToString(const PaymentMessage& message) {
    json j;
    j["type"] = std::string(MessageTypeName(message.type));
    switch (message.type) {
        case MessageType::RequestReceipt:
            PutReceiptFields(j, message);
            break;
        case MessageType::ConfirmReceipt:
            PutReceiptFields(j, message);
            if (message.confirmed_at) {
                j["confirmed_at"] = *message.confirmed_at;
            }
            PutOptional(j, "signature", message.signature);
            break;
        case MessageType::Error:
            if (!message.receipt_id.empty()) {
                j["receipt_id"] = message.receipt_id;
            }
            j["code"] = message.code.value_or("unknown");
            j["message"] = message.message.value_or("");
            break;
        case MessageType::Ack:
            j["receipt_id"] = message.receipt_id;
            break;
        case MessageType::Ping:
        case MessageType::Pong:
            break;
    }
    try {
        return Result<std::string, PaykitFailure>::Ok(j.dump());
    } catch (const json::type_error& ex) {
        return Result<std::string, PaykitFailure>::Err(PaykitFailure::InvalidInput(
            std::string("Cannot encode ") + std::string(MessageTypeName(message.type)) + ": " + ex.what()));
    }
}

Result<std::vector<uint8_t>, PaykitFailure> PaymentMessageCodec::Encode(const PaymentMessage& message) {
    return EncodeToString(message).Map([](const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    });
}

Result<PaymentMessage, PaykitFailure> PaymentMessageCodec::Decode(std::span<const uint8_t> bytes) {
    using ResultType = Result<PaymentMessage, PaykitFailure>;

    const json j = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return ResultType::Err(PaykitFailure::InvalidResponse("Invalid JSON structure"));
    }

    const auto type_name = GetString(j, "type");
    if (!type_name) {
        return ResultType::Err(MissingField("type"));
    }
    const auto type = ParseMessageType(*type_name);
    if (!type) {
        return ResultType::Err(PaykitFailure::InvalidResponse("Unknown message type: " + *type_name));
    }

    PaymentMessage message;
    message.type = *type;
    switch (*type) {
        case MessageType::RequestReceipt:
            if (auto fields = ReadReceiptFields(j, message, true); fields.IsErr()) {
                return ResultType::Err(std::move(fields).UnwrapErr());
            }
            break;
        case MessageType::ConfirmReceipt:
            if (auto fields = ReadReceiptFields(j, message, false); fields.IsErr()) {
                return ResultType::Err(std::move(fields).UnwrapErr());
            }
            message.confirmed_at = GetInteger(j, "confirmed_at");
            message.signature = GetString(j, "signature");
            break;
        case MessageType::Error:
            message.receipt_id = GetString(j, "receipt_id").value_or("");
            message.code = GetString(j, "code").value_or("unknown");
            message.message = GetString(j, "message").value_or("Unknown error");
            break;
        case MessageType::Ack:
            message.receipt_id = GetString(j, "receipt_id").value_or("");
            break;
        case MessageType::Ping:
        case MessageType::Pong:
            break;
    }
    return ResultType::Ok(std::move(message));
}

}
