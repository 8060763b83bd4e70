#ifndef CMCPS_JSON_RPC_HPP
#define CMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <variant>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
// Also used for tool execution failures (unknown tool, bad arguments,
// failed preconditions, process could not start).
constexpr int INTERNAL_ERROR = -32603;

// A message that expects exactly one response carrying the same id.
struct Request {
    json id;
    std::string method;
    json params; // null when absent
};

// A one-way message: no id, never answered.
struct Notification {
    std::string method;
    json params; // null when absent
};

using Message = std::variant<Request, Notification>;

// Raised when a parsed JSON value is not a valid JSON-RPC 2.0 message.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Classify a parsed JSON value. A message carrying an "id" member is a
// Request; without one it is a Notification.
// Throws ProtocolError if the value is not an object, "jsonrpc" is not "2.0",
// "method" is not a string, or the id is not a string, number or null.
Message parse_message(const json &message);

// Parse raw text and classify it. Throws json::parse_error or ProtocolError.
Message parse_message_text(const std::string &text);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

} // namespace json_rpc

#endif // CMCPS_JSON_RPC_HPP
