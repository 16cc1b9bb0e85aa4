#include "paykit/wire/transport_error.hpp"
#include "paykit/core/format.hpp"

#include <boost/asio/error.hpp>

namespace paykit::wire {

PaykitFailure MapTransportError(
    const boost::system::error_code& ec,
    const std::string_view phase,
    const bool deadline_expired) {
    if (deadline_expired) {
        return PaykitFailure::Timeout(compat::format("{} timed out", phase));
    }
    if (ec == boost::asio::error::operation_aborted) {
        return PaykitFailure::Cancelled(compat::format("{} cancelled", phase));
    }
    if (IsDisconnect(ec)) {
        return PaykitFailure::ConnectionFailed(compat::format("{}: peer closed the connection", phase));
    }
    return PaykitFailure::ConnectionFailed(compat::format("{} failed: {}", phase, ec.message()));
}

bool IsDisconnect(const boost::system::error_code& ec) noexcept {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::connection_aborted ||
           ec == boost::asio::error::broken_pipe ||
           ec == boost::asio::error::not_connected;
}

}
