#include "tool_handlers/tool_handlers.hpp"
#include "cargo/cargo_command.hpp"
#include "cargo/cargo_executor.hpp"
#include "session/cargo_state.hpp"
#include "utils/debug_log.hpp"

// Forward declarations of individual tool functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function;
// session tools also define execute().

namespace tool_cargo_check { void register_tool(); }
namespace tool_cargo_clippy { void register_tool(); }
namespace tool_cargo_test { void register_tool(); }
namespace tool_cargo_fmt_check { void register_tool(); }
namespace tool_cargo_build { void register_tool(); }
namespace tool_cargo_bench { void register_tool(); }
namespace tool_cargo_add { void register_tool(); }
namespace tool_cargo_remove { void register_tool(); }
namespace tool_cargo_update { void register_tool(); }
namespace tool_cargo_clean { void register_tool(); }
namespace tool_cargo_run { void register_tool(); }

namespace tool_set_working_directory {
    void register_tool();
    std::string execute(const cargo_requests::SetWorkingDirectory &request, cargo_state::CargoState &state);
}
namespace tool_set_default_toolchain {
    void register_tool();
    std::string execute(const cargo_requests::SetDefaultToolchain &request, cargo_state::CargoState &state);
}
namespace tool_set_cargo_env {
    void register_tool();
    std::string execute(const cargo_requests::SetCargoEnv &request, cargo_state::CargoState &state);
}
namespace tool_get_session_info {
    void register_tool();
    std::string execute(const cargo_requests::GetSessionInfo &request, cargo_state::CargoState &state);
}

namespace tool_handlers {

namespace {

struct RequestExecutor {
    cargo_state::CargoState &state;

    std::string operator()(const cargo_requests::CargoRequest &request) const {
        return run_cargo_request(request, state);
    }
    std::string operator()(const cargo_requests::SetWorkingDirectory &request) const {
        return tool_set_working_directory::execute(request, state);
    }
    std::string operator()(const cargo_requests::SetDefaultToolchain &request) const {
        return tool_set_default_toolchain::execute(request, state);
    }
    std::string operator()(const cargo_requests::SetCargoEnv &request) const {
        return tool_set_cargo_env::execute(request, state);
    }
    std::string operator()(const cargo_requests::GetSessionInfo &request) const {
        return tool_get_session_info::execute(request, state);
    }
};

} // namespace

void register_all_tools() {
    tool_cargo_check::register_tool();
    tool_cargo_clippy::register_tool();
    tool_cargo_test::register_tool();
    tool_cargo_fmt_check::register_tool();
    tool_cargo_build::register_tool();
    tool_cargo_bench::register_tool();
    tool_cargo_add::register_tool();
    tool_cargo_remove::register_tool();
    tool_cargo_update::register_tool();
    tool_cargo_clean::register_tool();
    tool_set_working_directory::register_tool();
    tool_cargo_run::register_tool();
    tool_set_default_toolchain::register_tool();
    tool_set_cargo_env::register_tool();
    tool_get_session_info::register_tool();
}

std::string execute_request(const cargo_requests::ToolRequest &request, cargo_state::CargoState &state) {
    return std::visit(RequestExecutor{state}, request);
}

std::string run_cargo_request(const cargo_requests::CargoRequest &request, cargo_state::CargoState &state) {
    std::filesystem::path project_path = state.ensure_rust_project();

    const cargo_requests::CargoOptions &options = cargo_requests::common_options(request);
    std::optional<std::string> toolchain =
        cargo_command::resolve_toolchain(options.toolchain, state.get_default_toolchain());
    cargo_requests::EnvironmentMap environment =
        cargo_command::merge_environment(state.get_cargo_env(), options.cargo_env);

    cargo_command::CommandSpec spec =
        cargo_command::build_command(request, toolchain, environment, project_path.string());
    std::string operation = cargo_command::operation_name(request);
    debug_log::log(operation + " invoked" + (toolchain ? " with toolchain " + *toolchain : std::string()));

    cargo_executor::ExecutionResult result = cargo_executor::execute(spec);
    if (result.status == cargo_executor::ExitStatus::NotStarted) {
        throw cargo_executor::ExecutionError("Failed to start " + spec.program + ": " + result.error_message);
    }
    return cargo_executor::format_report(operation, spec, result);
}

} // namespace tool_handlers
