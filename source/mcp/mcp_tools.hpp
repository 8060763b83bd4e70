#ifndef CMCPS_MCP_TOOLS_HPP
#define CMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, listing and lookup of tools.

#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// Validates a tools/call "arguments" object into the tool's request.
// Throws cargo_requests::ArgumentError.
using ArgumentParser = std::function<cargo_requests::ToolRequest(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ArgumentParser parse_arguments;
};

// Register a tool. A second registration under the same name replaces the
// first and keeps its position, so the listing order stays fixed.
void register_tool(const ToolDefinition &definition);

// Build the response payload for tools/list.
json build_tools_list_response();

// The tool registered under this name, or nullptr.
const ToolDefinition *find_tool(const std::string &tool_name);

// Get all registered tool definitions (for testing or introspection).
const std::vector<ToolDefinition> &get_registered_tools();

// Schema fragments shared by the cargo tools.
json toolchain_property();
json cargo_env_property();
json package_property(const std::string &description);

// {"type":"object","properties":...,"required":[...]} with toolchain and
// cargo_env added to the properties.
json cargo_tool_schema(json properties, const std::vector<std::string> &required = {});

} // namespace mcp_tools

#endif // CMCPS_MCP_TOOLS_HPP
