#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

// Tool handler for "cargo_clippy". Lints always run with "-- -D warnings".

static ToolRequest parse_cargo_clippy(const json &arguments) {
    CargoClippy request;
    request.package = optional_string(arguments, "package");
    request.fix = optional_bool(arguments, "fix");
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_clippy {

void register_tool() {
    json properties = {
        {"package", mcp_tools::package_property("Optional package name to lint (for workspaces).")},
        {"fix", {{"type", "boolean"}, {"description", "Apply clippy's suggested fixes automatically."}, {"default", false}}}
    };

    mcp_tools::register_tool({
        "cargo_clippy",
        "Run cargo clippy with warnings denied (-D warnings). Optionally apply fixes.",
        mcp_tools::cargo_tool_schema(properties),
        parse_cargo_clippy
    });
}

} // namespace tool_cargo_clippy
