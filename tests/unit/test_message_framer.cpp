#include <catch2/catch_test_macros.hpp>
#include "paykit/wire/message_framer.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>
#include <exception>
#include <optional>
using namespace paykit;
using namespace paykit::wire;
namespace {
using Socket = boost::asio::local::stream_protocol::socket;

/// Runs @p body to completion on @p io and returns what it produced.
template<typename T, typename Body>
std::optional<T> RunToCompletion(boost::asio::io_context& io, Body body) {
    std::optional<T> outcome;
    boost::asio::co_spawn(
        io,
        [&outcome, body = std::move(body)]() -> boost::asio::awaitable<void> {
            outcome.emplace(co_await body());
        },
        [](const std::exception_ptr& error) {
            if (error) {
                std::rethrow_exception(error);
            }
        });
    io.restart();
    io.run();
    return outcome;
}
}
TEST_CASE("MessageFramer - Length prefix encoding", "[wire][framer]") {
    const auto prefix = MessageFramer::EncodeLength(0x01020304);
    REQUIRE(prefix == MessageFramer::LengthPrefix{0x01, 0x02, 0x03, 0x04});
    REQUIRE(MessageFramer::DecodeLength(prefix) == 0x01020304u);

    SECTION("Frame carries the payload after a big-endian length") {
        const std::vector<uint8_t> payload = {0xAA, 0xBB, 0xCC};
        auto frame = MessageFramer::EncodeFrame(payload);
        REQUIRE(frame.IsOk());
        REQUIRE(frame.Unwrap() == std::vector<uint8_t>{0x00, 0x00, 0x00, 0x03, 0xAA, 0xBB, 0xCC});
        REQUIRE(MessageFramer::DecodeFrame(frame.Unwrap()).Unwrap() == payload);
    }
    SECTION("Empty frame is legal") {
        auto frame = MessageFramer::EncodeFrame({});
        REQUIRE(frame.Unwrap().size() == WireConstants::LENGTH_PREFIX_SIZE);
        auto decoded = MessageFramer::DecodeFrame(frame.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().empty());
    }
}
TEST_CASE("MessageFramer - Rejects malformed frames", "[wire][framer]") {
    SECTION("Payload over the limit") {
        const std::vector<uint8_t> oversized(NoiseConstants::MAX_MESSAGE_LEN + 1, 0x00);
        REQUIRE(MessageFramer::EncodeFrame(oversized).UnwrapErr().type == PaykitFailureType::InvalidInput);
    }
    SECTION("Declared length over the limit") {
        const std::vector<uint8_t> bytes = {0x00, 0x01, 0x00, 0x00};
        REQUIRE(MessageFramer::DecodeFrame(bytes).IsErr());
    }
    SECTION("Body shorter than declared") {
        const std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x05, 0x01, 0x02};
        REQUIRE(MessageFramer::DecodeFrame(bytes).IsErr());
    }
    SECTION("Trailing bytes") {
        const std::vector<uint8_t> bytes = {0x00, 0x00, 0x00, 0x01, 0x01, 0x02};
        REQUIRE(MessageFramer::DecodeFrame(bytes).IsErr());
    }
    SECTION("Truncated prefix") {
        const std::vector<uint8_t> bytes = {0x00, 0x00};
        REQUIRE(MessageFramer::DecodeFrame(bytes).IsErr());
    }
}
TEST_CASE("MessageFramer - Stream transfer", "[wire][framer][async]") {
    boost::asio::io_context io;
    Socket writer(io);
    Socket reader(io);
    boost::asio::local::connect_pair(writer, reader);

    SECTION("Frames arrive whole and in order") {
        const std::vector<uint8_t> first = {1, 2, 3};
        const std::vector<uint8_t> second;
        auto sent = RunToCompletion<bool>(io, [&]() -> boost::asio::awaitable<bool> {
            auto a = co_await MessageFramer::SendFramed(writer, first);
            auto b = co_await MessageFramer::SendFramed(writer, second);
            co_return a.IsOk() && b.IsOk();
        });
        REQUIRE(sent == true);

        using Received = Result<std::vector<uint8_t>, PaykitFailure>;
        auto one = RunToCompletion<Received>(io, [&]() { return MessageFramer::ReceiveFramed(reader); });
        auto two = RunToCompletion<Received>(io, [&]() { return MessageFramer::ReceiveFramed(reader); });
        REQUIRE(one->Unwrap() == first);
        REQUIRE(two->IsOk());
        REQUIRE(two->Unwrap().empty());
    }
    SECTION("Oversized length prefix is refused without reading the body") {
        const auto prefix = MessageFramer::EncodeLength(NoiseConstants::MAX_MESSAGE_LEN + 1);
        boost::asio::write(writer, boost::asio::buffer(prefix));

        using Received = Result<std::vector<uint8_t>, PaykitFailure>;
        auto received = RunToCompletion<Received>(io, [&]() { return MessageFramer::ReceiveFramed(reader); });
        REQUIRE(received->IsErr());
        REQUIRE(received->UnwrapErr().type == PaykitFailureType::InvalidResponse);
    }
    SECTION("Peer closing mid-frame is a connection failure") {
        const std::vector<uint8_t> partial = {0x00, 0x00, 0x00, 0x08, 0x01};
        boost::asio::write(writer, boost::asio::buffer(partial));
        writer.close();

        using Received = Result<std::vector<uint8_t>, PaykitFailure>;
        auto received = RunToCompletion<Received>(io, [&]() { return MessageFramer::ReceiveFramed(reader); });
        REQUIRE(received->UnwrapErr().type == PaykitFailureType::ConnectionFailed);
    }
    SECTION("Raw reads honour their bounds") {
        const std::vector<uint8_t> handshake(NoiseConstants::RESPONDER_MESSAGE_LEN, 0x5A);
        boost::asio::write(writer, boost::asio::buffer(handshake));

        using Received = Result<std::vector<uint8_t>, PaykitFailure>;
        auto exact = RunToCompletion<Received>(io, [&]() {
            return MessageFramer::ReceiveRawExact(reader, NoiseConstants::RESPONDER_MESSAGE_LEN);
        });
        REQUIRE(exact->Unwrap() == handshake);
    }
}
