#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"
#include "session/cargo_state.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

static ToolRequest parse_get_session_info(const json &arguments) {
    (void)arguments;
    return GetSessionInfo{};
}

namespace tool_get_session_info {

std::string execute(const GetSessionInfo &request, cargo_state::CargoState &state) {
    (void)request;
    std::optional<std::filesystem::path> context = state.get_context();
    session_records::CargoSessionData cargo_session = state.get_cargo_session();

    std::string text = "Session: " + state.session_id() + "\n";
    text += "Working directory: " + (context ? context->string() : std::string("(not set)")) + "\n";
    text += "Default toolchain: " + cargo_session.default_toolchain.value_or("(none)") + "\n";
    if (cargo_session.cargo_env.empty()) {
        text += "Cargo environment: (empty)\n";
    } else {
        text += "Cargo environment:\n";
        for (const auto &variable : cargo_session.cargo_env) {
            text += "  " + variable.first + "=" + variable.second + "\n";
        }
    }
    return text;
}

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    mcp_tools::register_tool({
        "get_session_info",
        "Show the session's working directory, default toolchain and cargo environment.",
        input_schema,
        parse_get_session_info
    });
}

} // namespace tool_get_session_info
