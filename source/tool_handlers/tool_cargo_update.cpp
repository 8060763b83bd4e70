#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

// Tool handler for "cargo_update". Each listed dependency becomes its own
// "--package <name>" after the flags.

static ToolRequest parse_cargo_update(const json &arguments) {
    CargoUpdate request;
    request.package = optional_string(arguments, "package");
    request.dependencies = optional_string_list(arguments, "dependencies");
    request.dry_run = optional_bool(arguments, "dry_run");
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_update {

void register_tool() {
    json properties = {
        {"package", mcp_tools::package_property("Optional package whose dependencies are updated.")},
        {"dependencies", {
            {"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", "Only update these dependencies."}
        }},
        {"dry_run", {{"type", "boolean"}, {"description", "Show what would be updated without writing Cargo.lock."}, {"default", false}}}
    };

    mcp_tools::register_tool({
        "cargo_update",
        "Update dependencies in Cargo.lock using cargo update.",
        mcp_tools::cargo_tool_schema(properties),
        parse_cargo_update
    });
}

} // namespace tool_cargo_update
