#ifndef CMCPS_ENVIRONMENT_HPP
#define CMCPS_ENVIRONMENT_HPP

// Process environment access.
// All runtime configuration of the server comes from environment variables:
//   CARGO_MCP_DEFAULT_TOOLCHAIN  default toolchain seeded into the session at startup
//   CMCPS_DEBUG                  enables debug logging on stderr
//   CMCPS_SESSION_DIR            overrides the directory holding the session files

#include <string>

namespace environment {

// Returns the value of an environment variable, or an empty string if unset.
std::string get_variable(const std::string &name);

// True for "1", "true", "yes" (case-insensitive).
bool is_truthy(const std::string &value);

// Directory of the session JSON files: CMCPS_SESSION_DIR if set,
// otherwise $HOME/.ai-tools/sessions (falling back to ./.ai-tools/sessions).
std::string sessions_directory();

// Expands a leading "~" or "~/" to $HOME. Other paths are returned unchanged.
std::string expand_tilde(const std::string &path);

} // namespace environment

#endif // CMCPS_ENVIRONMENT_HPP
