#pragma once

#include "common/message.hpp"
#include <boost/asio/awaitable.hpp>
#include <expected>

namespace rcp::auth {

// The connection side a provider authenticates through
class AuthSession {
public:
    virtual ~AuthSession() = default;

    // Send an Auth message. Yields true once the session counts it as
    // accepted and false when the server rejected it.
    virtual boost::asio::awaitable<std::expected<bool, ProtocolError>> submit_auth(Message auth) = 0;
};

} // namespace rcp::auth
