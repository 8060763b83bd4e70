#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"
#include "session/cargo_state.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

static ToolRequest parse_set_default_toolchain(const json &arguments) {
    SetDefaultToolchain request;
    request.toolchain = optional_string(arguments, "toolchain");
    if (request.toolchain && request.toolchain->empty()) {
        request.toolchain.reset();
    }
    return request;
}

namespace tool_set_default_toolchain {

std::string execute(const SetDefaultToolchain &request, cargo_state::CargoState &state) {
    state.set_default_toolchain(request.toolchain);
    if (request.toolchain) {
        return "Default toolchain set to: " + *request.toolchain;
    }
    return "Default toolchain cleared; cargo will be invoked directly";
}

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"toolchain", {{"type", "string"}, {"description", "Toolchain used when a call does not name one "
                                                           "(e.g. 'stable', 'nightly'). Omit to clear."}}}
    };

    mcp_tools::register_tool({
        "set_default_toolchain",
        "Set or clear the session's default Rust toolchain. Cargo commands then run through "
        "'rustup run <toolchain> cargo' unless a call passes its own toolchain.",
        input_schema,
        parse_set_default_toolchain
    });
}

} // namespace tool_set_default_toolchain
