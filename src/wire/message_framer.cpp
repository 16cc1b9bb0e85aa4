#include "paykit/wire/message_framer.hpp"

#include <algorithm>

namespace paykit::wire {

Result<std::vector<uint8_t>, PaykitFailure> MessageFramer::EncodeFrame(
    std::span<const uint8_t> payload,
    const size_t max_length) {
    if (payload.size() > max_length) {
        return Result<std::vector<uint8_t>, PaykitFailure>::Err(PaykitFailure::InvalidInput(
            "Frame of " + std::to_string(payload.size()) + " bytes exceeds the limit"));
    }
    const LengthPrefix prefix = EncodeLength(static_cast<uint32_t>(payload.size()));
    std::vector<uint8_t> frame;
    frame.reserve(prefix.size() + payload.size());
    frame.insert(frame.end(), prefix.begin(), prefix.end());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return Result<std::vector<uint8_t>, PaykitFailure>::Ok(std::move(frame));
}

Result<std::vector<uint8_t>, PaykitFailure> MessageFramer::DecodeFrame(
    std::span<const uint8_t> bytes,
    const size_t max_length) {
    using ResultType = Result<std::vector<uint8_t>, PaykitFailure>;
    if (bytes.size() < WireConstants::LENGTH_PREFIX_SIZE) {
        return ResultType::Err(PaykitFailure::InvalidResponse("Frame shorter than its length prefix"));
    }
    LengthPrefix prefix{};
    std::copy_n(bytes.begin(), prefix.size(), prefix.begin());
    const uint32_t length = DecodeLength(prefix);
    if (length > max_length) {
        return ResultType::Err(PaykitFailure::InvalidResponse(
            "Frame length " + std::to_string(length) + " exceeds the limit"));
    }
    const auto body = bytes.subspan(WireConstants::LENGTH_PREFIX_SIZE);
    if (body.size() != length) {
        return ResultType::Err(PaykitFailure::InvalidResponse(
            "Frame declares " + std::to_string(length) + " bytes but carries " + std::to_string(body.size())));
    }
    return ResultType::Ok(std::vector<uint8_t>(body.begin(), body.end()));
}

}
