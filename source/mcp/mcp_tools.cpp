#include "mcp/mcp_tools.hpp"

namespace mcp_tools {

// Static tool registry, filled once at startup by tool_handlers::register_all_tools().
static std::vector<ToolDefinition> registered_tools;

void register_tool(const ToolDefinition &definition) {
    for (auto &tool : registered_tools) {
        if (tool.name == definition.name) {
            tool = definition;
            return;
        }
    }
    registered_tools.push_back(definition);
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

const ToolDefinition *find_tool(const std::string &tool_name) {
    for (const auto &tool : registered_tools) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

json toolchain_property() {
    return {
        {"type", "string"},
        {"description", "Optional Rust toolchain to use (e.g. 'stable', 'nightly', '1.70.0'). "
                        "Overrides the session default toolchain."}
    };
}

json cargo_env_property() {
    return {
        {"type", "object"},
        {"description", "Optional environment variables for the cargo command, merged over the "
                        "session environment (e.g. {\"RUSTFLAGS\": \"-D warnings\"})."},
        {"additionalProperties", {{"type", {"string", "number", "boolean", "null"}}}}
    };
}

json package_property(const std::string &description) {
    return {{"type", "string"}, {"description", description}};
}

json cargo_tool_schema(json properties, const std::vector<std::string> &required) {
    if (!properties.is_object()) {
        properties = json::object();
    }
    properties["toolchain"] = toolchain_property();
    properties["cargo_env"] = cargo_env_property();

    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = properties;
    if (!required.empty()) {
        input_schema["required"] = required;
    }
    return input_schema;
}

} // namespace mcp_tools
