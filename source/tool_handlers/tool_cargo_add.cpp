#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

// Tool handler for "cargo_add". An empty dependency list is rejected here,
// before the session is consulted or any process is spawned.

static ToolRequest parse_cargo_add(const json &arguments) {
    CargoAdd request;
    request.dependencies = optional_string_list(arguments, "dependencies");
    if (request.dependencies.empty()) {
        throw ArgumentError("No dependencies specified");
    }
    request.package = optional_string(arguments, "package");
    request.dev = optional_bool(arguments, "dev");
    request.optional = optional_bool(arguments, "optional");
    request.features = optional_string_list(arguments, "features");
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_add {

void register_tool() {
    json properties = {
        {"dependencies", {
            {"type", "array"},
            {"items", {{"type", "string"}}},
            {"minItems", 1},
            {"description", "Dependencies to add (e.g. ['serde', 'tokio@1.0'])."}
        }},
        {"package", mcp_tools::package_property("Optional package to add the dependencies to (for workspaces).")},
        {"dev", {{"type", "boolean"}, {"description", "Add as development dependencies."}, {"default", false}}},
        {"optional", {{"type", "boolean"}, {"description", "Add as optional dependencies."}, {"default", false}}},
        {"features", {
            {"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", "Features to enable on the added dependencies."}
        }}
    };

    mcp_tools::register_tool({
        "cargo_add",
        "Add dependencies to Cargo.toml using cargo add.",
        mcp_tools::cargo_tool_schema(properties, {"dependencies"}),
        parse_cargo_add
    });
}

} // namespace tool_cargo_add
