#pragma once

#include "paykit/core/constants.hpp"
#include "paykit/core/failures.hpp"
#include "paykit/core/result.hpp"
#include "paykit/wire/transport_error.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace paykit::wire {

/**
 * Frame layout: a 4-byte big-endian length followed by exactly that many
 * bytes. Every application message occupies exactly one frame and an empty
 * frame is legal. Handshake messages are never framed.
 */
class MessageFramer {
public:
    using LengthPrefix = std::array<uint8_t, WireConstants::LENGTH_PREFIX_SIZE>;

    [[nodiscard]] static LengthPrefix EncodeLength(uint32_t length) noexcept {
        return {
            static_cast<uint8_t>(length >> 24),
            static_cast<uint8_t>(length >> 16),
            static_cast<uint8_t>(length >> 8),
            static_cast<uint8_t>(length)
        };
    }

    [[nodiscard]] static uint32_t DecodeLength(const LengthPrefix& prefix) noexcept {
        return (static_cast<uint32_t>(prefix[0]) << 24) |
               (static_cast<uint32_t>(prefix[1]) << 16) |
               (static_cast<uint32_t>(prefix[2]) << 8) |
               static_cast<uint32_t>(prefix[3]);
    }

    [[nodiscard]] static Result<std::vector<uint8_t>, PaykitFailure> EncodeFrame(
        std::span<const uint8_t> payload,
        size_t max_length = NoiseConstants::MAX_MESSAGE_LEN);

    /// Parses one complete frame from @p bytes. Trailing bytes are an error.
    [[nodiscard]] static Result<std::vector<uint8_t>, PaykitFailure> DecodeFrame(
        std::span<const uint8_t> bytes,
        size_t max_length = NoiseConstants::MAX_MESSAGE_LEN);

    template<typename AsyncStream>
    static boost::asio::awaitable<Result<Unit, PaykitFailure>> SendFramed(
        AsyncStream& stream,
        std::span<const uint8_t> data,
        size_t max_length = NoiseConstants::MAX_MESSAGE_LEN) {
        if (data.size() > max_length) {
            co_return Result<Unit, PaykitFailure>::Err(PaykitFailure::InvalidInput(
                "Frame of " + std::to_string(data.size()) + " bytes exceeds the limit"));
        }
        const LengthPrefix prefix = EncodeLength(static_cast<uint32_t>(data.size()));
        const std::array<boost::asio::const_buffer, 2> buffers{
            boost::asio::buffer(prefix),
            boost::asio::buffer(data.data(), data.size())
        };
        boost::system::error_code ec;
        co_await boost::asio::async_write(
            stream, buffers, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return Result<Unit, PaykitFailure>::Err(MapTransportError(ec, "send frame"));
        }
        co_return Result<Unit, PaykitFailure>::Ok(unit);
    }

    template<typename AsyncStream>
    static boost::asio::awaitable<Result<std::vector<uint8_t>, PaykitFailure>> ReceiveFramed(
        AsyncStream& stream,
        size_t max_length = NoiseConstants::MAX_MESSAGE_LEN) {
        using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;

        LengthPrefix prefix{};
        boost::system::error_code ec;
        co_await boost::asio::async_read(
            stream, boost::asio::buffer(prefix),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return ResultType::Err(MapTransportError(ec, "receive frame header"));
        }

        const uint32_t length = DecodeLength(prefix);
        if (length > max_length) {
            co_return ResultType::Err(PaykitFailure::InvalidResponse(
                "Frame length " + std::to_string(length) + " exceeds the limit"));
        }

        std::vector<uint8_t> payload(length);
        if (length > 0) {
            co_await boost::asio::async_read(
                stream, boost::asio::buffer(payload),
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) {
                co_return ResultType::Err(MapTransportError(ec, "receive frame body"));
            }
        }
        co_return ResultType::Ok(std::move(payload));
    }

    /// Writes @p data as-is. Used for handshake messages.
    template<typename AsyncStream>
    static boost::asio::awaitable<Result<Unit, PaykitFailure>> SendRaw(
        AsyncStream& stream,
        std::span<const uint8_t> data) {
        boost::system::error_code ec;
        co_await boost::asio::async_write(
            stream, boost::asio::buffer(data.data(), data.size()),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return Result<Unit, PaykitFailure>::Err(MapTransportError(ec, "send handshake"));
        }
        co_return Result<Unit, PaykitFailure>::Ok(unit);
    }

    /// Reads exactly @p length unframed bytes.
    template<typename AsyncStream>
    static boost::asio::awaitable<Result<std::vector<uint8_t>, PaykitFailure>> ReceiveRawExact(
        AsyncStream& stream,
        size_t length) {
        using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;
        std::vector<uint8_t> data(length);
        boost::system::error_code ec;
        co_await boost::asio::async_read(
            stream, boost::asio::buffer(data),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return ResultType::Err(MapTransportError(ec, "receive handshake"));
        }
        co_return ResultType::Ok(std::move(data));
    }

    /// Reads whatever has arrived once at least @p min_length bytes are in,
    /// never more than @p max_length.
    template<typename AsyncStream>
    static boost::asio::awaitable<Result<std::vector<uint8_t>, PaykitFailure>> ReceiveRawAtLeast(
        AsyncStream& stream,
        size_t min_length,
        size_t max_length) {
        using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;
        std::vector<uint8_t> data(max_length);
        boost::system::error_code ec;
        const size_t received = co_await boost::asio::async_read(
            stream, boost::asio::buffer(data),
            boost::asio::transfer_at_least(min_length),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return ResultType::Err(MapTransportError(ec, "receive handshake"));
        }
        data.resize(received);
        co_return ResultType::Ok(std::move(data));
    }

private:
    MessageFramer() = delete;
};

}
