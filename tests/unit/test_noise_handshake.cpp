#include <catch2/catch_test_macros.hpp>
#include "paykit/noise/handshake_state.hpp"
#include "paykit/keys/key_derivation.hpp"
#include "helpers/paykit_fixtures.hpp"
#include <string>
using namespace paykit;
using namespace paykit::noise;
namespace {
keys::KeyPairRecord StaticKeys(const uint8_t fill, const std::string& device) {
    keys::HkdfKeyDerivation derivation;
    return derivation.DeriveKeypair(test_helpers::FixedSeed(fill), device, 0).Unwrap();
}
}
TEST_CASE("HandshakeState - IK message exchange", "[noise][handshake]") {
    const auto client = StaticKeys(0x11, "client");
    const auto server = StaticKeys(0x22, "server");

    auto initiator = HandshakeState::InitializeInitiator(client.secret_key, client.public_key, server.public_key);
    auto responder = HandshakeState::InitializeResponder(server.secret_key, server.public_key);
    REQUIRE(initiator.IsOk());
    REQUIRE(responder.IsOk());
    REQUIRE(initiator.Unwrap().Role() == HandshakeRole::Initiator);
    REQUIRE(responder.Unwrap().Role() == HandshakeRole::Responder);

    const std::string hint = "pay-hint";
    const std::vector<uint8_t> hint_bytes(hint.begin(), hint.end());
    auto message_a = initiator.Unwrap().WriteMessageA(hint_bytes);
    REQUIRE(message_a.IsOk());
    REQUIRE(message_a.Unwrap().size() == NoiseConstants::MIN_INITIATOR_MESSAGE_LEN + hint_bytes.size());

    auto payload = responder.Unwrap().ReadMessageA(message_a.Unwrap());
    REQUIRE(payload.IsOk());
    REQUIRE(payload.Unwrap() == hint_bytes);
    REQUIRE(responder.Unwrap().RemoteStaticPublic() == client.public_key);

    auto message_b = responder.Unwrap().WriteMessageB({});
    REQUIRE(message_b.IsOk());
    REQUIRE(message_b.Unwrap().size() == NoiseConstants::RESPONDER_MESSAGE_LEN);
    REQUIRE(initiator.Unwrap().ReadMessageB(message_b.Unwrap()).IsOk());

    SECTION("Both sides agree on the transcript hash") {
        const auto a = initiator.Unwrap().HandshakeHash();
        const auto b = responder.Unwrap().HandshakeHash();
        REQUIRE(std::vector<uint8_t>(a.begin(), a.end()) == std::vector<uint8_t>(b.begin(), b.end()));
    }
    SECTION("Split yields mirrored transport ciphers") {
        auto client_ciphers = initiator.Unwrap().Split();
        auto server_ciphers = responder.Unwrap().Split();
        REQUIRE(client_ciphers.IsOk());
        REQUIRE(server_ciphers.IsOk());

        const std::vector<uint8_t> plaintext = {'h', 'e', 'l', 'l', 'o'};
        auto sealed = client_ciphers.Unwrap().send.EncryptWithAd({}, plaintext);
        REQUIRE(sealed.IsOk());
        auto opened = server_ciphers.Unwrap().receive.DecryptWithAd({}, sealed.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);

        auto reply = server_ciphers.Unwrap().send.EncryptWithAd({}, plaintext);
        REQUIRE(client_ciphers.Unwrap().receive.DecryptWithAd({}, reply.Unwrap()).Unwrap() == plaintext);
    }
}
TEST_CASE("HandshakeState - Rejects mismatched or malformed input", "[noise][handshake]") {
    const auto client = StaticKeys(0x11, "client");
    const auto server = StaticKeys(0x22, "server");
    const auto impostor = StaticKeys(0x33, "server");

    SECTION("Initiator targeting the wrong static key") {
        auto initiator = HandshakeState::InitializeInitiator(
            client.secret_key, client.public_key, impostor.public_key).Unwrap();
        auto responder = HandshakeState::InitializeResponder(server.secret_key, server.public_key).Unwrap();
        auto message_a = initiator.WriteMessageA({});
        auto read = responder.ReadMessageA(message_a.Unwrap());
        REQUIRE(read.IsErr());
        REQUIRE(read.UnwrapErr().type == PaykitFailureType::HandshakeFailed);
    }
    SECTION("Truncated message A") {
        auto responder = HandshakeState::InitializeResponder(server.secret_key, server.public_key).Unwrap();
        const std::vector<uint8_t> truncated(NoiseConstants::MIN_INITIATOR_MESSAGE_LEN - 1, 0x42);
        REQUIRE(responder.ReadMessageA(truncated).IsErr());
    }
    SECTION("Split before the handshake finishes") {
        auto initiator = HandshakeState::InitializeInitiator(
            client.secret_key, client.public_key, server.public_key).Unwrap();
        REQUIRE(initiator.WriteMessageA({}).IsOk());
        REQUIRE(initiator.Split().IsErr());
    }
    SECTION("Message B on the responder is out of order") {
        auto responder = HandshakeState::InitializeResponder(server.secret_key, server.public_key).Unwrap();
        REQUIRE(responder.WriteMessageB({}).IsErr());
    }
}
