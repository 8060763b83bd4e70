#ifndef CMCPS_CARGO_COMMAND_HPP
#define CMCPS_CARGO_COMMAND_HPP

// Command construction: validated cargo request -> command line, environment and directory.
// Pure functions, no I/O.

#include "cargo/cargo_requests.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cargo_command {

using cargo_requests::CargoRequest;
using cargo_requests::EnvironmentMap;

// Everything needed to start one cargo invocation.
struct CommandSpec {
    std::string program;
    std::vector<std::string> arguments;
    // Applied on top of the inherited environment, in order.
    std::vector<std::pair<std::string, std::string>> environment;
    std::string working_directory;
};

// Per-call toolchain, else session default, else none. Empty names count as none.
std::optional<std::string> resolve_toolchain(const std::optional<std::string> &requested,
                                             const std::optional<std::string> &session_default);

// Session entries overlaid by per-call entries of the same name.
EnvironmentMap merge_environment(const EnvironmentMap &session_environment,
                                 const EnvironmentMap &call_environment);

// Cargo arguments for the request, subcommand first, in a fixed order:
// --package, other flags, positional names, then "--" and passthrough tokens.
std::vector<std::string> build_cargo_arguments(const CargoRequest &request);

// Report header name, e.g. "cargo check" or "cargo fmt --check".
std::string operation_name(const CargoRequest &request);

// "cargo <args>" or, with a toolchain, "rustup run <toolchain> cargo <args>".
CommandSpec build_command(const CargoRequest &request,
                          const std::optional<std::string> &toolchain,
                          const EnvironmentMap &environment,
                          const std::string &working_directory);

} // namespace cargo_command

#endif // CMCPS_CARGO_COMMAND_HPP
