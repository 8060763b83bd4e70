#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "cargo/cargo_requests.hpp"
#include "session/cargo_state.hpp"
#include "utils/debug_log.hpp"
#include "utils/environment.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;
using namespace cargo_requests;

// Tool handler for "set_working_directory".
// The directory lives in the shared context store, so sibling MCP servers
// of the same session see it too.

static ToolRequest parse_set_working_directory(const json &arguments) {
    SetWorkingDirectory request;
    request.path = required_string(arguments, "path");
    if (request.path.empty()) {
        throw ArgumentError("Invalid argument 'path': must not be empty");
    }
    return request;
}

namespace tool_set_working_directory {

std::string execute(const SetWorkingDirectory &request, cargo_state::CargoState &state) {
    std::filesystem::path expanded_path(environment::expand_tilde(request.path));

    std::error_code error;
    std::filesystem::path canonical_path = std::filesystem::canonical(expanded_path, error);
    if (error) {
        throw ArgumentError("Could not resolve path '" + request.path + "': " + error.message());
    }
    if (!std::filesystem::is_directory(canonical_path, error)) {
        throw ArgumentError("Could not use path '" + request.path + "': " + canonical_path.string() +
                            " is not a directory");
    }

    state.set_working_directory(canonical_path);
    debug_log::log("working directory set to " + canonical_path.string());

    std::string text = "Working directory set to: " + canonical_path.string() + "\n";
    if (std::filesystem::exists(canonical_path / "Cargo.toml", error)) {
        text += "Rust project detected (Cargo.toml found)";
    } else {
        text += "No Cargo.toml found - this doesn't appear to be a Rust project";
    }
    return text;
}

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"path", {{"type", "string"}, {"description", "Directory to use for cargo commands. Absolute, relative to the "
                                                      "server's current directory, or starting with ~."}}}
    };
    input_schema["required"] = json::array({"path"});

    mcp_tools::register_tool({
        "set_working_directory",
        "Set the working directory for cargo operations. The directory is shared with other AI "
        "tools of the same session and persists across restarts. Call this before any cargo tool.",
        input_schema,
        parse_set_working_directory
    });
}

} // namespace tool_set_working_directory
