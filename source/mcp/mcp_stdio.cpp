#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <csignal>
#include <iostream>
#include <string>

namespace mcp_stdio {

static volatile std::sig_atomic_t shutdown_requested = 0;

static bool is_blank(const std::string &line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool read_message(std::istream &input, std::string &line) {
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!is_blank(line)) {
            return true;
        }
    }
    return false;
}

bool write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
    return static_cast<bool>(output);
}

void log_message(const std::string &message) {
    std::cerr << "[cmcps] " << message << std::endl;
}

void request_shutdown() {
    shutdown_requested = 1;
}

int serve(std::istream &input, std::ostream &output, cargo_state::CargoState &state) {
    std::string line;
    while (!shutdown_requested) {
        if (!read_message(input, line)) {
            if (shutdown_requested) {
                // A signal interrupted the blocking read.
                break;
            }
            if (input.bad()) {
                log_message("Failed to read from stdin. Shutting down.");
                return 1;
            }
            debug_log::log("EOF on stdin. Shutting down.");
            return 0;
        }

        json_rpc::Message message;
        try {
            message = json_rpc::parse_message_text(line);
        } catch (const nlohmann::json::parse_error &error) {
            log_message("Failed to parse incoming JSON: " + std::string(error.what()));
            continue;
        } catch (const json_rpc::ProtocolError &error) {
            log_message("Ignoring invalid JSON-RPC message: " + std::string(error.what()));
            continue;
        }

        nlohmann::json response = mcp_dispatch::dispatch_message(message, state);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        if (!write_message(output, response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace))) {
            log_message("Failed to write response to stdout. Shutting down.");
            return 1;
        }
    }

    debug_log::log("Shutdown requested.");
    shutdown_requested = 0;
    return 0;
}

} // namespace mcp_stdio
