// Tests for the line-delimited stdio transport loop.

#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "session/cargo_state.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using test_helpers::check;

namespace test_mcp_stdio {

struct ServeResult {
    int exit_code = -1;
    std::vector<json> responses;
};

static ServeResult serve_text(const std::string &input_text) {
    cargo_state::CargoState state(std::make_shared<session_store::MemoryStorageBackend>(),
                                  std::make_shared<session_store::MemoryStorageBackend>());
    std::istringstream input(input_text);
    std::ostringstream output;

    ServeResult result;
    result.exit_code = mcp_stdio::serve(input, output, state);

    std::istringstream lines(output.str());
    std::string line;
    while (std::getline(lines, line)) {
        result.responses.push_back(json::parse(line));
    }
    return result;
}

static bool test_read_message_skips_blank_lines() {
    std::istringstream input("\n   \r\n{\"a\":1}\r\n\n");
    std::string line;
    bool first = mcp_stdio::read_message(input, line);
    std::string first_line = line;
    bool second = mcp_stdio::read_message(input, line);
    return check(first && first_line == "{\"a\":1}" && !second,
                 "read_message skips blank lines and strips the carriage return");
}

static bool test_one_response_per_request() {
    ServeResult result = serve_text(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"id\":\"two\",\"method\":\"tools/list\"}\n");
    return check(result.exit_code == 0 && result.responses.size() == 2 && result.responses[0]["id"] == 1 &&
                     result.responses[1]["id"] == "two" && result.responses[1]["result"].contains("tools"),
                 "One response line per request, in order, none for notifications");
}

static bool test_bad_input_produces_no_output() {
    ServeResult result = serve_text(
        "this is not json\n"
        "{\"jsonrpc\":\"2.0\",\"id\":1\n"
        "[1,2]\n"
        "{\"jsonrpc\":\"1.0\",\"id\":2,\"method\":\"tools/list\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"ping\"}\n");
    return check(result.exit_code == 0 && result.responses.size() == 1 && result.responses[0]["id"] == 3 &&
                     result.responses[0]["error"]["code"] == json_rpc::METHOD_NOT_FOUND,
                 "Unparseable and invalid lines are skipped without a response");
}

static bool test_tool_error_keeps_serving() {
    ServeResult result = serve_text(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"cargo_check\"}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"get_session_info\"}}\n");
    return check(result.responses.size() == 2 && result.responses[0].contains("error") &&
                     result.responses[1].contains("result"),
                 "A failing tool call does not stop the loop");
}

static bool test_empty_input_exits_cleanly() {
    ServeResult result = serve_text("");
    return check(result.exit_code == 0 && result.responses.empty(), "EOF with no input exits with 0");
}

static bool test_write_failure_reported() {
    std::ostringstream output;
    output.setstate(std::ios::badbit);
    return check(!mcp_stdio::write_message(output, "{}"), "write_message reports a failed stream");
}

static bool test_shutdown_request_stops_without_reading() {
    cargo_state::CargoState state(std::make_shared<session_store::MemoryStorageBackend>(),
                                  std::make_shared<session_store::MemoryStorageBackend>());
    std::istringstream input("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}\n");
    std::ostringstream output;

    mcp_stdio::request_shutdown();
    int exit_code = mcp_stdio::serve(input, output, state);
    bool stopped = exit_code == 0 && output.str().empty() && input.tellg() == std::streampos(0);

    ServeResult next = serve_text("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");

    bool all_passed = true;
    all_passed &= check(stopped, "Pending shutdown request stops serve with 0 before reading input");
    all_passed &= check(next.responses.size() == 1, "The shutdown request is consumed when serve returns");
    return all_passed;
}

bool run_all_tests() {
    tool_handlers::register_all_tools();

    bool all_passed = true;
    all_passed &= test_read_message_skips_blank_lines();
    all_passed &= test_one_response_per_request();
    all_passed &= test_bad_input_produces_no_output();
    all_passed &= test_tool_error_keeps_serving();
    all_passed &= test_empty_input_exits_cleanly();
    all_passed &= test_write_failure_reported();
    all_passed &= test_shutdown_request_stops_without_reading();
    return all_passed;
}

} // namespace test_mcp_stdio
