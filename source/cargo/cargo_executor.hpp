#ifndef CMCPS_CARGO_EXECUTOR_HPP
#define CMCPS_CARGO_EXECUTOR_HPP

// Runs a CommandSpec to completion and renders the human-readable report.

#include "cargo/cargo_command.hpp"

#include <stdexcept>
#include <string>

namespace cargo_executor {

using cargo_command::CommandSpec;

// The process could not be started at all.
class ExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ExitStatus {
    Succeeded,
    Failed,      // exited with a non-zero code
    Signaled,    // terminated by a signal
    NotStarted
};

struct ExecutionResult {
    ExitStatus status = ExitStatus::NotStarted;
    int exit_code = -1;
    int signal_number = 0;
    std::string stdout_text; // valid UTF-8
    std::string stderr_text; // valid UTF-8
    std::string error_message; // NotStarted only
};

// Blocks until the process exits. Output is decoded lossily to UTF-8.
ExecutionResult execute(const CommandSpec &spec);

// Quote an argument for display when it contains a space, quote or backslash.
std::string shell_escape(const std::string &argument);

// "program arg1 arg2 ..." with escaped arguments.
std::string format_command_line(const CommandSpec &spec);

// Header, working directory, command line, status marker, then STDOUT and
// STDERR sections (each only if non-empty) or "No output produced".
std::string format_report(const std::string &operation_name, const CommandSpec &spec,
                          const ExecutionResult &result);

} // namespace cargo_executor

#endif // CMCPS_CARGO_EXECUTOR_HPP
