#pragma once

#include "paykit/core/failures.hpp"

#include <boost/system/error_code.hpp>
#include <string_view>

namespace paykit::wire {

/**
 * @brief Maps a transport error onto the failure taxonomy
 *
 * operation_aborted becomes Timeout when @p deadline_expired is set and
 * Cancelled otherwise. Everything else, end of stream included, becomes
 * ConnectionFailed.
 */
[[nodiscard]] PaykitFailure MapTransportError(
    const boost::system::error_code& ec,
    std::string_view phase,
    bool deadline_expired = false);

/// True for errors that mean the peer went away rather than a local fault.
[[nodiscard]] bool IsDisconnect(const boost::system::error_code& ec) noexcept;

}
