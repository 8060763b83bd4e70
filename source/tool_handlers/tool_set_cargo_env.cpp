#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"
#include "session/cargo_state.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace cargo_requests;

// Tool handler for "set_cargo_env". Unlike per-call cargo_env, a null value
// here removes the variable from the session.

static ToolRequest parse_set_cargo_env(const json &arguments) {
    SetCargoEnv request;
    auto environment = arguments.find("cargo_env");
    if (environment == arguments.end() || !environment->is_object()) {
        throw ArgumentError("Missing required argument 'cargo_env' (object)");
    }
    for (auto entry = environment->begin(); entry != environment->end(); ++entry) {
        validate_environment_name(entry.key());
        if (entry.value().is_null()) {
            request.cargo_env[entry.key()] = std::nullopt;
        } else {
            request.cargo_env[entry.key()] = encode_environment_value(entry.key(), entry.value());
        }
    }
    request.replace = optional_bool(arguments, "replace");
    return request;
}

namespace tool_set_cargo_env {

std::string execute(const SetCargoEnv &request, cargo_state::CargoState &state) {
    state.update_cargo_session([&request](session_records::CargoSessionData &data) {
        if (request.replace) {
            data.cargo_env.clear();
        }
        for (const auto &variable : request.cargo_env) {
            if (variable.second) {
                data.cargo_env[variable.first] = *variable.second;
            } else {
                data.cargo_env.erase(variable.first);
            }
        }
    });

    EnvironmentMap session_environment = state.get_cargo_env();
    if (session_environment.empty()) {
        return "Session cargo environment is now empty";
    }
    std::string text = "Session cargo environment:\n";
    for (const auto &variable : session_environment) {
        text += "  " + variable.first + "=" + variable.second + "\n";
    }
    return text;
}

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"cargo_env", {
            {"type", "object"},
            {"description", "Variables applied to every cargo command of the session. A null value removes the variable."},
            {"additionalProperties", {{"type", {"string", "number", "boolean", "null"}}}}
        }},
        {"replace", {{"type", "boolean"}, {"description", "Replace the whole session environment instead of merging."}, {"default", false}}}
    };
    input_schema["required"] = json::array({"cargo_env"});

    mcp_tools::register_tool({
        "set_cargo_env",
        "Set default environment variables for cargo commands in this session. Per-call "
        "cargo_env entries override them.",
        input_schema,
        parse_set_cargo_env
    });
}

} // namespace tool_set_cargo_env
