#ifndef CMCPS_SESSION_RECORDS_HPP
#define CMCPS_SESSION_RECORDS_HPP

// Per-session records persisted by the session stores.

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

namespace session_records {

using json = nlohmann::json;

// Cargo-specific session data (private to this server, cargo-mcp.json).
struct CargoSessionData {
    // Default toolchain for cargo commands (e.g. "stable", "nightly", "1.70.0").
    std::optional<std::string> default_toolchain;
    // Environment variables applied to every cargo command of the session.
    std::map<std::string, std::string> cargo_env;
};

// Context shared with sibling MCP servers (shared-context.json).
struct SharedContextData {
    // Current working directory, canonicalized.
    std::optional<std::string> context_path;
};

bool operator==(const CargoSessionData &left, const CargoSessionData &right);
bool operator==(const SharedContextData &left, const SharedContextData &right);

// Absent optionals and empty maps are omitted on write and tolerated on read.
// A non-object record throws std::invalid_argument; members of the wrong
// type throw json::type_error.
void to_json(json &output, const CargoSessionData &data);
void from_json(const json &input, CargoSessionData &data);
void to_json(json &output, const SharedContextData &data);
void from_json(const json &input, SharedContextData &data);

} // namespace session_records

#endif // CMCPS_SESSION_RECORDS_HPP
