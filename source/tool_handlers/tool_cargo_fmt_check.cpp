#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

static ToolRequest parse_cargo_fmt_check(const json &arguments) {
    CargoFmtCheck request;
    request.options = cargo_options(arguments);
    return CargoRequest{request};
}

namespace tool_cargo_fmt_check {

void register_tool() {
    mcp_tools::register_tool({
        "cargo_fmt_check",
        "Check formatting with cargo fmt --check without modifying any files.",
        mcp_tools::cargo_tool_schema(json::object()),
        parse_cargo_fmt_check
    });
}

} // namespace tool_cargo_fmt_check
