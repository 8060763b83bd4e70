#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

// Tool handler for "cargo_bench". A baseline is passed to the bench harness
// after the "--" separator as "--save-baseline <name>".

static ToolRequest parse_cargo_bench(const json &arguments) {
    CargoBench request;
    request.package = optional_string(arguments, "package");
    request.bench_name = optional_string(arguments, "bench_name");
    request.baseline = optional_string(arguments, "baseline");
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_bench {

void register_tool() {
    json properties = {
        {"package", mcp_tools::package_property("Optional package name to benchmark (for workspaces).")},
        {"bench_name", {{"type", "string"}, {"description", "Optional benchmark name filter."}}},
        {"baseline", {{"type", "string"}, {"description", "Save results under this baseline name for later comparison."}}}
    };

    mcp_tools::register_tool({
        "cargo_bench",
        "Run benchmarks with cargo bench, optionally filtered by name and saved as a baseline.",
        mcp_tools::cargo_tool_schema(properties),
        parse_cargo_bench
    });
}

} // namespace tool_cargo_bench
