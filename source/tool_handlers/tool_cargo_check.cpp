#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

// Tool handler for "cargo_check": verifies that the project compiles.

static ToolRequest parse_cargo_check(const json &arguments) {
    CargoCheck request;
    request.package = optional_string(arguments, "package");
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_check {

void register_tool() {
    json properties = {
        {"package", mcp_tools::package_property("Optional package name to check (for workspaces).")}
    };

    mcp_tools::register_tool({
        "cargo_check",
        "Run cargo check to verify the code compiles. Requires a working directory "
        "containing Cargo.toml (see set_working_directory).",
        mcp_tools::cargo_tool_schema(properties),
        parse_cargo_check
    });
}

} // namespace tool_cargo_check
