#pragma once

#include "common/message.hpp"
#include <boost/json.hpp>
#include <expected>

namespace rcp::client {

// Check that `response` answers `request_id` and unwrap its data.
//
// - not a Response                 -> OTHER
// - request_id names another id    -> OTHER (an absent request_id passes)
// - success == false               -> SERVER_ERROR with the payload message
// - otherwise                      -> payload data, {} when absent
//
// A missing or non-boolean `success` counts as success.
std::expected<boost::json::value, ProtocolError> handle_response(
    const Message& response, const Uuid& request_id);

} // namespace rcp::client
