#include <catch2/catch_test_macros.hpp>
#include "paykit/noise/handshake_engine.hpp"
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
std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}
struct EnginePair {
    std::unique_ptr<HandshakeEngine> client;
    std::unique_ptr<HandshakeEngine> server;
    std::string client_session;
    std::string server_session;
};
EnginePair Establish() {
    EnginePair pair;
    pair.client = HandshakeEngine::Create(StaticKeys(0x11, "client")).Unwrap();
    pair.server = HandshakeEngine::Create(StaticKeys(0x22, "server")).Unwrap();

    auto initiated = pair.client->Initiate(pair.server->LocalPublicKey());
    REQUIRE(initiated.IsOk());
    pair.client_session = initiated.Unwrap().session_id;

    auto accepted = pair.server->Accept(initiated.Unwrap().message);
    REQUIRE(accepted.IsOk());
    pair.server_session = accepted.Unwrap().session_id;

    REQUIRE(pair.client->Complete(pair.client_session, accepted.Unwrap().message).IsOk());
    return pair;
}
}
TEST_CASE("HandshakeEngine - Session lifecycle", "[noise][engine]") {
    auto engines = Establish();

    REQUIRE(engines.client->GetSessionState(engines.client_session) == SessionState::Ready);
    REQUIRE(engines.server->GetSessionState(engines.server_session) == SessionState::Ready);
    REQUIRE(engines.client_session.size() == WireConstants::SESSION_ID_BYTES * 2);
    REQUIRE(engines.server->GetRemoteStaticKey(engines.server_session) == engines.client->LocalPublicKey());

    SECTION("Messages flow in both directions") {
        auto sealed = engines.client->Encrypt(engines.client_session, Bytes("request"));
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap() != Bytes("request"));
        REQUIRE(engines.server->Decrypt(engines.server_session, sealed.Unwrap()).Unwrap() == Bytes("request"));

        auto reply = engines.server->Encrypt(engines.server_session, Bytes("response"));
        REQUIRE(engines.client->Decrypt(engines.client_session, reply.Unwrap()).Unwrap() == Bytes("response"));
    }
    SECTION("Tampered ciphertext fails but the session stays usable") {
        auto sealed = engines.client->Encrypt(engines.client_session, Bytes("first")).Unwrap();
        auto tampered = sealed;
        tampered.back() ^= 0x01;
        auto rejected = engines.server->Decrypt(engines.server_session, tampered);
        REQUIRE(rejected.IsErr());
        REQUIRE(rejected.UnwrapErr().type == PaykitFailureType::DecryptionFailed);
        REQUIRE(engines.server->GetSessionState(engines.server_session) == SessionState::Ready);
        REQUIRE(engines.server->Decrypt(engines.server_session, sealed).Unwrap() == Bytes("first"));
    }
    SECTION("Unknown or removed sessions cannot be used") {
        auto sealed = engines.client->Encrypt(engines.client_session, Bytes("x")).Unwrap();
        REQUIRE(engines.server->Decrypt("no-such-session", sealed).UnwrapErr().type ==
                PaykitFailureType::DecryptionFailed);

        REQUIRE(engines.server->RemoveSession(engines.server_session));
        REQUIRE_FALSE(engines.server->RemoveSession(engines.server_session));
        REQUIRE(engines.server->Decrypt(engines.server_session, sealed).UnwrapErr().type ==
                PaykitFailureType::DecryptionFailed);
        REQUIRE(engines.server->SessionCount() == 0);
    }
    SECTION("Another established session rejects the ciphertext") {
        auto other = Establish();
        auto sealed = engines.client->Encrypt(engines.client_session, Bytes("for the first session")).Unwrap();

        auto rejected = other.server->Decrypt(other.server_session, sealed);
        REQUIRE(rejected.IsErr());
        REQUIRE(rejected.UnwrapErr().type == PaykitFailureType::DecryptionFailed);
        REQUIRE(other.server->GetSessionState(other.server_session) == SessionState::Ready);

        auto own = other.client->Encrypt(other.client_session, Bytes("for the second session")).Unwrap();
        REQUIRE(other.server->Decrypt(other.server_session, own).Unwrap() == Bytes("for the second session"));
        REQUIRE(engines.server->Decrypt(engines.server_session, sealed).Unwrap() == Bytes("for the first session"));
    }
    SECTION("Sessions on the same engine are isolated") {
        auto second_client = HandshakeEngine::Create(StaticKeys(0x33, "second-client")).Unwrap();
        auto initiated = second_client->Initiate(engines.server->LocalPublicKey()).Unwrap();
        auto accepted = engines.server->Accept(initiated.message).Unwrap();
        REQUIRE(second_client->Complete(initiated.session_id, accepted.message).IsOk());
        REQUIRE(accepted.session_id != engines.server_session);
        REQUIRE(engines.server->SessionCount() == 2);

        auto sealed = engines.client->Encrypt(engines.client_session, Bytes("first peer")).Unwrap();
        REQUIRE(engines.server->Decrypt(accepted.session_id, sealed).UnwrapErr().type ==
                PaykitFailureType::DecryptionFailed);
        REQUIRE(engines.server->GetSessionState(accepted.session_id) == SessionState::Ready);

        auto second_sealed = second_client->Encrypt(initiated.session_id, Bytes("second peer")).Unwrap();
        REQUIRE(engines.server->Decrypt(accepted.session_id, second_sealed).Unwrap() == Bytes("second peer"));
        REQUIRE(engines.server->Decrypt(engines.server_session, sealed).Unwrap() == Bytes("first peer"));
    }
}
TEST_CASE("HandshakeEngine - Initiator state before completion", "[noise][engine]") {
    auto client = HandshakeEngine::Create(StaticKeys(0x11, "client")).Unwrap();
    auto server = HandshakeEngine::Create(StaticKeys(0x22, "server")).Unwrap();

    auto initiated = client->Initiate(server->LocalPublicKey()).Unwrap();
    REQUIRE(client->GetSessionState(initiated.session_id) == SessionState::HandshakeSent);
    REQUIRE(initiated.message.size() == NoiseConstants::MIN_INITIATOR_MESSAGE_LEN);

    auto premature = client->Encrypt(initiated.session_id, Bytes("too early"));
    REQUIRE(premature.IsErr());
    REQUIRE(premature.UnwrapErr().type == PaykitFailureType::EncryptionFailed);

    SECTION("Hint travels inside message A") {
        auto hinted = client->Initiate(server->LocalPublicKey(), Bytes("device-42")).Unwrap();
        auto accepted = server->Accept(hinted.message);
        REQUIRE(accepted.IsOk());
        REQUIRE(accepted.Unwrap().payload == Bytes("device-42"));
    }
    SECTION("Oversized hint is rejected") {
        const std::vector<uint8_t> hint(NoiseConstants::MAX_HINT_LEN + 1, 'h');
        REQUIRE(client->Initiate(server->LocalPublicKey(), hint).UnwrapErr().type ==
                PaykitFailureType::InvalidInput);
    }
}
TEST_CASE("HandshakeEngine - Handshake failures drop the session", "[noise][engine]") {
    auto client = HandshakeEngine::Create(StaticKeys(0x11, "client")).Unwrap();
    auto server = HandshakeEngine::Create(StaticKeys(0x22, "server")).Unwrap();
    auto impostor = HandshakeEngine::Create(StaticKeys(0x33, "impostor")).Unwrap();

    SECTION("Responder cannot read a message for a different key") {
        auto initiated = client->Initiate(impostor->LocalPublicKey()).Unwrap();
        auto accepted = server->Accept(initiated.message);
        REQUIRE(accepted.IsErr());
        REQUIRE(accepted.UnwrapErr().type == PaykitFailureType::HandshakeFailed);
        REQUIRE(server->SessionCount() == 0);
    }
    SECTION("Initiator rejects a corrupted response") {
        auto initiated = client->Initiate(server->LocalPublicKey()).Unwrap();
        auto accepted = server->Accept(initiated.message).Unwrap();
        accepted.message.back() ^= 0x80;

        auto completed = client->Complete(initiated.session_id, accepted.message);
        REQUIRE(completed.IsErr());
        REQUIRE(completed.UnwrapErr().type == PaykitFailureType::HandshakeFailed);
        REQUIRE(client->GetSessionState(initiated.session_id) == std::nullopt);
        REQUIRE(client->SessionCount() == 0);
    }
    SECTION("Server key of the wrong length") {
        const std::vector<uint8_t> short_key(16, 0x01);
        REQUIRE(client->Initiate(short_key).UnwrapErr().type == PaykitFailureType::HandshakeFailed);
    }
    SECTION("Complete on an unknown session") {
        const std::vector<uint8_t> response(NoiseConstants::RESPONDER_MESSAGE_LEN, 0x00);
        REQUIRE(client->Complete("missing", response).IsErr());
    }
}
