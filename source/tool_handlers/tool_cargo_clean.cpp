#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

static ToolRequest parse_cargo_clean(const json &arguments) {
    CargoClean request;
    request.package = optional_string(arguments, "package");
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_clean {

void register_tool() {
    json properties = {
        {"package", mcp_tools::package_property("Optional package whose artifacts are removed.")}
    };

    mcp_tools::register_tool({
        "cargo_clean",
        "Remove build artifacts (the target directory) using cargo clean.",
        mcp_tools::cargo_tool_schema(properties),
        parse_cargo_clean
    });
}

} // namespace tool_cargo_clean
