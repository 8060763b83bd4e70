#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

static ToolRequest parse_cargo_remove(const json &arguments) {
    CargoRemove request;
    request.dependencies = optional_string_list(arguments, "dependencies");
    if (request.dependencies.empty()) {
        throw ArgumentError("No dependencies specified");
    }
    request.package = optional_string(arguments, "package");
    request.dev = optional_bool(arguments, "dev");
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_remove {

void register_tool() {
    json properties = {
        {"dependencies", {
            {"type", "array"},
            {"items", {{"type", "string"}}},
            {"minItems", 1},
            {"description", "Dependencies to remove."}
        }},
        {"package", mcp_tools::package_property("Optional package to remove the dependencies from (for workspaces).")},
        {"dev", {{"type", "boolean"}, {"description", "Remove from development dependencies."}, {"default", false}}}
    };

    mcp_tools::register_tool({
        "cargo_remove",
        "Remove dependencies from Cargo.toml using cargo remove.",
        mcp_tools::cargo_tool_schema(properties, {"dependencies"}),
        parse_cargo_remove
    });
}

} // namespace tool_cargo_remove
