#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "session/cargo_state.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

#include <string>

#ifndef CMCPS_VERSION
#define CMCPS_VERSION "0.1.0"
#endif

namespace mcp_dispatch {

const char *const PROTOCOL_VERSION = "2024-11-05";

// Server info.
static const std::string SERVER_NAME = "cmcps";
static const std::string SERVER_VERSION = CMCPS_VERSION;
static const std::string SERVER_DESCRIPTION =
    "Cargo MCP server: runs cargo operations (check, build, test, bench, clippy, fmt, "
    "add, remove, update, clean, run) on a Rust project and returns their full output.";
static const std::string INSTRUCTIONS =
    "Cargo operations for Rust projects.\n\n"
    "Use set_working_directory to set the project directory first, then run cargo commands.";

// Handle the "initialize" request.
static json handle_initialize(const json &params) {
    (void)params; // We accept any client capabilities.

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;
    result["instructions"] = INSTRUCTIONS;
    return result;
}

static json text_result(const std::string &text) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = false;
    return result;
}

static json tool_error(const json &request_id, const std::string &tool_name, const std::string &cause) {
    debug_log::log("tool " + tool_name + " failed: " + cause);
    return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                           "Tool execution failed: " + cause);
}

// Handle the "tools/call" request.
static json handle_tools_call(const json &request_id, const json &params, cargo_state::CargoState &state) {
    if (!params.is_object()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "Invalid params",
                                               "tools/call params must be an object");
    }
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "Invalid params",
                                               "missing or invalid 'name' (string) in tools/call");
    }

    json arguments = json::object();
    auto arguments_member = params.find("arguments");
    if (arguments_member != params.end() && !arguments_member->is_null()) {
        if (!arguments_member->is_object()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "Invalid params",
                                                   "'arguments' in tools/call must be an object");
        }
        arguments = *arguments_member;
    }

    std::string tool_name = name->get<std::string>();
    const mcp_tools::ToolDefinition *tool = mcp_tools::find_tool(tool_name);
    if (tool == nullptr) {
        return tool_error(request_id, tool_name, "Unknown tool: " + tool_name);
    }

    debug_log::log("tools/call " + tool_name);
    try {
        cargo_requests::ToolRequest request = tool->parse_arguments(arguments);
        return json_rpc::build_response(request_id, text_result(tool_handlers::execute_request(request, state)));
    } catch (const session_store::StorageError &error) {
        return tool_error(request_id, tool_name, std::string("session storage error: ") + error.what());
    } catch (const std::exception &error) {
        // ArgumentError, PreconditionError, ExecutionError and anything else
        // a handler raises become a tool failure carrying the cause.
        return tool_error(request_id, tool_name, error.what());
    }
}

json handle_request(const json_rpc::Request &request, cargo_state::CargoState &state) {
    debug_log::log("request " + request.method + " id=" + request.id.dump());

    if (request.method == "initialize") {
        return json_rpc::build_response(request.id, handle_initialize(request.params));
    }
    if (request.method == "tools/list") {
        return json_rpc::build_response(request.id, mcp_tools::build_tools_list_response());
    }
    if (request.method == "tools/call") {
        return handle_tools_call(request.id, request.params, state);
    }

    return json_rpc::build_error_response(request.id, json_rpc::METHOD_NOT_FOUND,
                                           "Method not found: " + request.method);
}

void handle_notification(const json_rpc::Notification &notification) {
    // "notifications/initialized" is the only notification we expect; acknowledge silently.
    debug_log::log("notification " + notification.method);
}

json dispatch_message(const json_rpc::Message &message, cargo_state::CargoState &state) {
    if (const auto *notification = std::get_if<json_rpc::Notification>(&message)) {
        handle_notification(*notification);
        return nullptr;
    }
    return handle_request(std::get<json_rpc::Request>(message), state);
}

} // namespace mcp_dispatch
