// CMCPS – Cargo Model Context Protocol Server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr.

#include <iostream>
#include <memory>
#include <string>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <signal.h>

#include "mcp/mcp_stdio.hpp"
#include "session/cargo_state.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/environment.hpp"

#ifndef CMCPS_VERSION
#define CMCPS_VERSION "0.1.0"
#endif

static const char *const USAGE =
    "Usage: cmcps [serve]\n"
    "\n"
    "Cargo MCP server. Speaks JSON-RPC 2.0 (MCP) over stdin/stdout, one message per line.\n"
    "\n"
    "Environment:\n"
    "  CARGO_MCP_DEFAULT_TOOLCHAIN  default toolchain for the session (e.g. nightly)\n"
    "  CMCPS_SESSION_DIR            directory of the session files (default ~/.ai-tools/sessions)\n"
    "  CMCPS_DEBUG                  set to 1 for debug logs on stderr\n";

static void signal_handler(int signal_number) {
    (void)signal_number;
    mcp_stdio::request_shutdown();
}

// No SA_RESTART: a read blocked on stdin must fail with EINTR so serve()
// notices the shutdown request while idle.
static void install_signal_handler(int signal_number) {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(signal_number, &action, nullptr) != 0) {
        mcp_stdio::log_message("Cannot install handler for signal " + std::to_string(signal_number) + ": " +
                               std::strerror(errno));
    }
}

int main(int argc, char **argv) {
    for (int index = 1; index < argc; ++index) {
        std::string argument = argv[index];
        if (argument == "serve") {
            continue;
        }
        if (argument == "--help" || argument == "-h") {
            std::cout << USAGE;
            return 0;
        }
        if (argument == "--version" || argument == "-V") {
            std::cout << "cmcps " << CMCPS_VERSION << std::endl;
            return 0;
        }
        std::cerr << "cmcps: unknown argument '" << argument << "'\n\n" << USAGE;
        return 2;
    }

    std::cerr << "[cmcps] cmcps – Cargo MCP Server " << CMCPS_VERSION << std::endl;

    install_signal_handler(SIGINT);
    install_signal_handler(SIGTERM);

    std::string sessions_directory = environment::sessions_directory();
    cargo_state::CargoState state(
        std::make_shared<session_store::FileStorageBackend>(sessions_directory + "/cargo-mcp.json"),
        std::make_shared<session_store::FileStorageBackend>(sessions_directory + "/shared-context.json"));

    try {
        state.initialize();

        std::string toolchain = environment::get_variable("CARGO_MCP_DEFAULT_TOOLCHAIN");
        if (!toolchain.empty()) {
            mcp_stdio::log_message("Setting default toolchain from CARGO_MCP_DEFAULT_TOOLCHAIN: " + toolchain);
            state.set_default_toolchain(toolchain);
        }
    } catch (const session_store::StorageError &error) {
        mcp_stdio::log_message(std::string("Cannot open session store: ") + error.what());
        return 1;
    }
    debug_log::log("session files in " + sessions_directory);

    tool_handlers::register_all_tools();

    mcp_stdio::log_message("CMCPS Server started. Waiting for MCP messages on stdin.");
    int exit_code = mcp_stdio::serve(std::cin, std::cout, state);
    mcp_stdio::log_message("CMCPS Server shut down.");
    return exit_code;
}
