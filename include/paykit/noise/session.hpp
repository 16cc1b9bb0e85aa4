#pragma once

#include "paykit/noise/handshake_state.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace paykit::noise {

enum class SessionState {
    Uninitialized,
    HandshakeSent,
    Ready,
    Closed
};

[[nodiscard]] std::string_view SessionStateName(SessionState state) noexcept;

/// Per-connection Noise state. Owned by HandshakeEngine; every field is
/// guarded by `mutex`.
struct Session {
    std::string id;
    HandshakeRole role = HandshakeRole::Initiator;
    SessionState state = SessionState::Uninitialized;
    std::optional<HandshakeState> handshake;
    CipherState send;
    CipherState receive;
    std::vector<uint8_t> remote_static_public;
    std::mutex mutex;
};

}
