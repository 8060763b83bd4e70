#ifndef CMCPS_CARGO_STATE_HPP
#define CMCPS_CARGO_STATE_HPP

// Session state of the cargo tools: a private store for cargo settings and a
// store shared with sibling MCP servers for the working directory. Both are
// keyed by the same session id and injected at construction.

#include "session/session_records.hpp"
#include "session/session_store.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace cargo_state {

using session_records::CargoSessionData;
using session_records::SharedContextData;

constexpr const char *DEFAULT_SESSION_ID = "default";

// A tool cannot run in the current session (no working directory, no Cargo.toml).
class PreconditionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CargoState {
public:
    CargoState(std::shared_ptr<session_store::StorageBackend> cargo_backend,
               std::shared_ptr<session_store::StorageBackend> shared_backend,
               std::string session_id = DEFAULT_SESSION_ID);

    const std::string &session_id() const { return session_id_; }

    // Touch both stores so unreadable session files fail at startup.
    // Throws session_store::StorageError.
    void initialize();

    // Working directory (shared across MCP servers).
    std::optional<std::filesystem::path> get_context();
    void set_working_directory(const std::filesystem::path &path);

    std::optional<std::string> get_default_toolchain();
    void set_default_toolchain(const std::optional<std::string> &toolchain);

    std::map<std::string, std::string> get_cargo_env();

    CargoSessionData get_cargo_session();
    void update_cargo_session(const std::function<void(CargoSessionData &)> &mutation);

    // The working directory if it is set and contains Cargo.toml.
    // Throws PreconditionError otherwise.
    std::filesystem::path ensure_rust_project();

private:
    session_store::SessionStore<CargoSessionData> cargo_store_;
    session_store::SessionStore<SharedContextData> shared_context_store_;
    std::string session_id_;
};

} // namespace cargo_state

#endif // CMCPS_CARGO_STATE_HPP
