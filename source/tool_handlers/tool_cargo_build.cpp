#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

static ToolRequest parse_cargo_build(const json &arguments) {
    CargoBuild request;
    request.package = optional_string(arguments, "package");
    request.release = optional_bool(arguments, "release");
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_build {

void register_tool() {
    json properties = {
        {"package", mcp_tools::package_property("Optional package name to build (for workspaces).")},
        {"release", {{"type", "boolean"}, {"description", "Build with optimizations (--release)."}, {"default", false}}}
    };

    mcp_tools::register_tool({
        "cargo_build",
        "Build the project with cargo build, in debug mode or with --release.",
        mcp_tools::cargo_tool_schema(properties),
        parse_cargo_build
    });
}

} // namespace tool_cargo_build
