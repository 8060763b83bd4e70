#include "session/cargo_state.hpp"

#include <system_error>
#include <utility>

namespace cargo_state {

CargoState::CargoState(std::shared_ptr<session_store::StorageBackend> cargo_backend,
                       std::shared_ptr<session_store::StorageBackend> shared_backend,
                       std::string session_id)
    : cargo_store_(std::move(cargo_backend)),
      shared_context_store_(std::move(shared_backend)),
      session_id_(std::move(session_id)) {}

void CargoState::initialize() {
    cargo_store_.get_or_create(session_id_);
    shared_context_store_.get_or_create(session_id_);
}

std::optional<std::filesystem::path> CargoState::get_context() {
    SharedContextData shared_data = shared_context_store_.get_or_create(session_id_);
    if (!shared_data.context_path) {
        return std::nullopt;
    }
    return std::filesystem::path(*shared_data.context_path);
}

void CargoState::set_working_directory(const std::filesystem::path &path) {
    shared_context_store_.update(session_id_, [&path](SharedContextData &data) {
        data.context_path = path.string();
    });
}

std::optional<std::string> CargoState::get_default_toolchain() {
    return get_cargo_session().default_toolchain;
}

void CargoState::set_default_toolchain(const std::optional<std::string> &toolchain) {
    update_cargo_session([&toolchain](CargoSessionData &data) {
        data.default_toolchain = toolchain;
    });
}

std::map<std::string, std::string> CargoState::get_cargo_env() {
    return get_cargo_session().cargo_env;
}

CargoSessionData CargoState::get_cargo_session() {
    return cargo_store_.get_or_create(session_id_);
}

void CargoState::update_cargo_session(const std::function<void(CargoSessionData &)> &mutation) {
    cargo_store_.update(session_id_, mutation);
}

std::filesystem::path CargoState::ensure_rust_project() {
    std::optional<std::filesystem::path> context = get_context();
    if (!context) {
        throw PreconditionError("No working directory set. Use set_working_directory first.");
    }

    std::error_code error;
    if (!std::filesystem::exists(*context / "Cargo.toml", error)) {
        throw PreconditionError("Not a Rust project: Cargo.toml not found in " + context->string());
    }
    return *context;
}

} // namespace cargo_state
