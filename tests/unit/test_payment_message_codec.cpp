#include <catch2/catch_test_macros.hpp>
#include "paykit/messages/payment_message_codec.hpp"
#include <nlohmann/json.hpp>
#include <string>
using namespace paykit;
using namespace paykit::messages;
namespace {
std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}
PaymentMessage SampleRequest() {
    return PaymentRequest::Create("A", "B", "lightning", "1000", "SAT", "coffee", "rcpt_1").ToMessage(1700000000);
}
}
TEST_CASE("PaymentMessageCodec - JSON shape", "[messages][codec]") {
    SECTION("request_receipt carries every receipt field") {
        const auto j = nlohmann::json::parse(PaymentMessageCodec::EncodeToString(SampleRequest()).Unwrap());
        REQUIRE(j["type"].get<std::string>() == "request_receipt");
        REQUIRE(j["receipt_id"].get<std::string>() == "rcpt_1");
        REQUIRE(j["payer"].get<std::string>() == "A");
        REQUIRE(j["payee"].get<std::string>() == "B");
        REQUIRE(j["method_id"].get<std::string>() == "lightning");
        REQUIRE(j["amount"].get<std::string>() == "1000");
        REQUIRE(j["currency"].get<std::string>() == "SAT");
        REQUIRE(j["description"].get<std::string>() == "coffee");
        REQUIRE(j["created_at"].get<int64_t>() == 1700000000);
    }
    SECTION("Absent optionals are omitted") {
        auto request = PaymentRequest::Create("A", "B", "onchain", std::nullopt, std::nullopt, std::nullopt, "rcpt_2");
        const auto j = nlohmann::json::parse(PaymentMessageCodec::EncodeToString(request.ToMessage(5)).Unwrap());
        REQUIRE_FALSE(j.contains("amount"));
        REQUIRE_FALSE(j.contains("currency"));
        REQUIRE_FALSE(j.contains("description"));
    }
    SECTION("ping carries only its type") {
        const auto j = nlohmann::json::parse(PaymentMessageCodec::EncodeToString(PaymentMessage::MakePing()).Unwrap());
        REQUIRE(j.size() == 1);
        REQUIRE(j["type"].get<std::string>() == "ping");
    }
    SECTION("error carries code and message") {
        const auto error = PaymentMessage::MakeError("WRONG_PAYEE", "Payee does not match", std::string("rcpt_1"));
        const auto j = nlohmann::json::parse(PaymentMessageCodec::EncodeToString(error).Unwrap());
        REQUIRE(j["type"].get<std::string>() == "error");
        REQUIRE(j["code"].get<std::string>() == "WRONG_PAYEE");
        REQUIRE(j["message"].get<std::string>() == "Payee does not match");
        REQUIRE(j["receipt_id"].get<std::string>() == "rcpt_1");
    }
}
TEST_CASE("PaymentMessageCodec - Strings that are not UTF-8", "[messages][codec]") {
    SECTION("Request with a malformed description") {
        auto request = PaymentRequest::Create("A", "B", "lightning", "1000", "SAT", std::string("\xff\xfe"), "rcpt_9");
        auto encoded = PaymentMessageCodec::Encode(request.ToMessage(1));
        REQUIRE(encoded.IsErr());
        REQUIRE(encoded.UnwrapErr().type == PaykitFailureType::InvalidInput);
    }
    SECTION("Error reply with a malformed message") {
        const auto error = PaymentMessage::MakeError("PROCESSING_ERROR", std::string("bad \xc3"));
        REQUIRE(PaymentMessageCodec::EncodeToString(error).IsErr());
    }
    SECTION("Multi-byte UTF-8 is kept") {
        auto request = PaymentRequest::Create("A", "B", "lightning", "5", "EUR", std::string("caf\xc3\xa9"), "rcpt_10");
        auto decoded = PaymentMessageCodec::Decode(PaymentMessageCodec::Encode(request.ToMessage(1)).Unwrap());
        REQUIRE(decoded.Unwrap().description == std::string("caf\xc3\xa9"));
    }
}
TEST_CASE("PaymentMessageCodec - Decoding", "[messages][codec]") {
    SECTION("Encoded messages decode to the same value") {
        const auto request = SampleRequest();
        REQUIRE(PaymentMessageCodec::Decode(PaymentMessageCodec::Encode(request).Unwrap()).Unwrap() == request);

        const auto confirmation = PaymentMessage::MakeConfirmation(request, 1700000042);
        auto decoded = PaymentMessageCodec::Decode(PaymentMessageCodec::Encode(confirmation).Unwrap());
        REQUIRE(decoded.Unwrap().type == MessageType::ConfirmReceipt);
        REQUIRE(decoded.Unwrap().confirmed_at == 1700000042);
    }
    SECTION("Not JSON") {
        auto result = PaymentMessageCodec::Decode(Bytes("not json"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PaykitFailureType::InvalidResponse);
        REQUIRE(result.UnwrapErr().message == "Invalid JSON structure");
    }
    SECTION("JSON that is not an object") {
        REQUIRE(PaymentMessageCodec::Decode(Bytes("[1,2,3]")).UnwrapErr().message == "Invalid JSON structure");
    }
    SECTION("Missing type") {
        REQUIRE(PaymentMessageCodec::Decode(Bytes(R"({"receipt_id":"x"})")).UnwrapErr().message ==
                "Missing or invalid field: type");
    }
    SECTION("Unknown type") {
        REQUIRE(PaymentMessageCodec::Decode(Bytes(R"({"type":"refund"})")).UnwrapErr().message ==
                "Unknown message type: refund");
    }
    SECTION("request_receipt requires its fields") {
        auto result = PaymentMessageCodec::Decode(Bytes(
            R"({"type":"request_receipt","receipt_id":"r","payer":"A","method_id":"m","created_at":1})"));
        REQUIRE(result.UnwrapErr().message == "Missing or invalid field: payee");

        auto wrong_type = PaymentMessageCodec::Decode(Bytes(
            R"({"type":"request_receipt","receipt_id":"r","payer":"A","payee":"B","method_id":"m","created_at":"now"})"));
        REQUIRE(wrong_type.UnwrapErr().message == "Missing or invalid field: created_at");
    }
    SECTION("confirm_receipt tolerates missing receipt details") {
        auto result = PaymentMessageCodec::Decode(Bytes(R"({"type":"confirm_receipt","receipt_id":"r"})"));
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().payer.empty());
        REQUIRE(result.Unwrap().confirmed_at == std::nullopt);
    }
    SECTION("error falls back to defaults") {
        auto result = PaymentMessageCodec::Decode(Bytes(R"({"type":"error"})"));
        REQUIRE(result.Unwrap().code == "unknown");
        REQUIRE(result.Unwrap().message == "Unknown error");
    }
    SECTION("Unknown fields are ignored") {
        REQUIRE(PaymentMessageCodec::Decode(Bytes(R"({"type":"pong","extra":true})")).Unwrap().type ==
                MessageType::Pong);
    }
}
TEST_CASE("PaymentResponse - Interpreting replies", "[messages][response]") {
    const auto request = SampleRequest();

    SECTION("Matching confirmation succeeds") {
        auto response = ToPaymentResponse(PaymentMessage::MakeConfirmation(request, 99), "rcpt_1");
        REQUIRE(response.Unwrap().success);
        REQUIRE(response.Unwrap().receipt_id == "rcpt_1");
        REQUIRE(response.Unwrap().confirmed_at == 99);
    }
    SECTION("Confirmation for another receipt") {
        auto response = ToPaymentResponse(PaymentMessage::MakeConfirmation(request, 99), "rcpt_other");
        REQUIRE(response.UnwrapErr().type == PaykitFailureType::InvalidResponse);
        REQUIRE(response.UnwrapErr().message == "Receipt ID mismatch");
    }
    SECTION("Error reply is a failed response") {
        auto response = ToPaymentResponse(PaymentMessage::MakeError("WRONG_PAYEE", "nope"), "rcpt_1");
        REQUIRE_FALSE(response.Unwrap().success);
        REQUIRE(response.Unwrap().error_code == "WRONG_PAYEE");
        REQUIRE(response.Unwrap().error_message == "nope");
    }
    SECTION("Other message types are unexpected") {
        REQUIRE(ToPaymentResponse(PaymentMessage::MakeAck("rcpt_1"), "rcpt_1").IsErr());
        REQUIRE(ToPaymentResponse(PaymentMessage::MakePong(), "rcpt_1").IsErr());
    }
}
TEST_CASE("PaymentRequest - Receipt identifiers", "[messages][request]") {
    const auto first = PaymentRequest::Create("A", "B", "lightning");
    const auto second = PaymentRequest::Create("A", "B", "lightning");
    REQUIRE(first.receipt_id.rfind("rcpt_", 0) == 0);
    REQUIRE(first.receipt_id.size() == 5 + 36);
    REQUIRE(first.receipt_id != second.receipt_id);
    REQUIRE(PaymentRequest::Create("A", "B", "m", std::nullopt, std::nullopt, std::nullopt, "fixed").receipt_id ==
            "fixed");
}
