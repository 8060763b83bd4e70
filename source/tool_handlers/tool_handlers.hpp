#ifndef CMCPS_TOOL_HANDLERS_HPP
#define CMCPS_TOOL_HANDLERS_HPP

// Tool handler registration and execution.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "cargo/cargo_requests.hpp"

#include <string>

namespace cargo_state {
class CargoState;
}

namespace tool_handlers {

// Register all available tool handlers with the MCP tool registry, in the
// fixed order reported by tools/list.
void register_all_tools();

// Execute a validated request and return the text for the caller.
// Throws ArgumentError, PreconditionError, StorageError or ExecutionError;
// a cargo command that runs and fails is not an error (see the report text).
std::string execute_request(const cargo_requests::ToolRequest &request, cargo_state::CargoState &state);

// Resolve toolchain and environment from the session, build the command,
// run it in the project directory and format the report.
std::string run_cargo_request(const cargo_requests::CargoRequest &request, cargo_state::CargoState &state);

} // namespace tool_handlers

#endif // CMCPS_TOOL_HANDLERS_HPP
