#ifndef CMCPS_MCP_DISPATCH_HPP
#define CMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler.

#include "protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>

namespace cargo_state {
class CargoState;
}

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
extern const char *const PROTOCOL_VERSION;

// Answer a request. Always returns exactly one response carrying the
// request's id, with either "result" or "error". Never throws.
json handle_request(const json_rpc::Request &request, cargo_state::CargoState &state);

// Acknowledge a notification. Produces nothing.
void handle_notification(const json_rpc::Notification &notification);

// Dispatch a classified message. Returns the response JSON, or a null json
// value for notifications (which require no response).
json dispatch_message(const json_rpc::Message &message, cargo_state::CargoState &state);

} // namespace mcp_dispatch

#endif // CMCPS_MCP_DISPATCH_HPP
