#ifndef CMCPS_MCP_STDIO_HPP
#define CMCPS_MCP_STDIO_HPP

// MCP stdio transport: one JSON-RPC message per line on stdin, one response
// per line on stdout. Logs go to stderr.

#include <iosfwd>
#include <string>

namespace cargo_state {
class CargoState;
}

namespace mcp_stdio {

// Read the next non-blank line. Returns false on EOF or stream error.
bool read_message(std::istream &input, std::string &line);

// Write one message followed by a newline and flush.
// Returns false if the stream failed.
bool write_message(std::ostream &output, const std::string &json_string);

// Write a log message to stderr.
void log_message(const std::string &message);

// Ask serve() to stop before reading the next message. Async-signal-safe.
// A blocked read returns when the signal handler is installed without
// SA_RESTART. The request is consumed when serve() returns.
void request_shutdown();

// Main loop: read, classify, dispatch, and for requests only write the
// response. Unparseable lines are logged and skipped. Strictly sequential.
// Returns the process exit code: 0 on EOF or shutdown request, 1 on an I/O
// failure of the streams.
int serve(std::istream &input, std::ostream &output, cargo_state::CargoState &state);

} // namespace mcp_stdio

#endif // CMCPS_MCP_STDIO_HPP
