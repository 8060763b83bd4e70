#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

// Tool handler for "cargo_run". "args" go to the binary, after a single "--".

static ToolRequest parse_cargo_run(const json &arguments) {
    CargoRun request;
    request.package = optional_string(arguments, "package");
    request.bin = optional_string(arguments, "bin");
    request.example = optional_string(arguments, "example");
    request.release = optional_bool(arguments, "release");
    request.features = optional_string(arguments, "features");
    request.all_features = optional_bool(arguments, "all_features");
    request.no_default_features = optional_bool(arguments, "no_default_features");
    request.args = optional_string_list(arguments, "args");
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_run {

void register_tool() {
    json properties = {
        {"package", mcp_tools::package_property("Optional package containing the binary (for workspaces).")},
        {"bin", {{"type", "string"}, {"description", "Name of the binary target to run."}}},
        {"example", {{"type", "string"}, {"description", "Name of the example target to run."}}},
        {"release", {{"type", "boolean"}, {"description", "Build and run with optimizations."}, {"default", false}}},
        {"features", {{"type", "string"}, {"description", "Space or comma separated features to enable."}}},
        {"all_features", {{"type", "boolean"}, {"description", "Enable all features."}, {"default", false}}},
        {"no_default_features", {{"type", "boolean"}, {"description", "Disable the default features."}, {"default", false}}},
        {"args", {
            {"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", "Arguments passed to the binary (after --)."}
        }}
    };

    mcp_tools::register_tool({
        "cargo_run",
        "Build and run a binary or example with cargo run. Output of the program is captured "
        "and returned; the call blocks until the program exits.",
        mcp_tools::cargo_tool_schema(properties),
        parse_cargo_run
    });
}

} // namespace tool_cargo_run
