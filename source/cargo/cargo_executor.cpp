#include "cargo/cargo_executor.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

namespace cargo_executor {

static void append_section(std::string &report, const char *title, const std::string &text) {
    report += title;
    report += ":\n";
    report += text;
    if (text.back() != '\n') {
        report += '\n';
    }
    report += '\n';
}

ExecutionResult execute(const CommandSpec &spec) {
    debug_log::log("executing: " + format_command_line(spec) + " in " + spec.working_directory);

    platform::ProcessResult process = platform::run_process(spec.program, spec.arguments,
                                                            spec.environment, spec.working_directory);

    ExecutionResult result;
    if (!process.started) {
        result.status = ExitStatus::NotStarted;
        result.error_message = process.error_message;
        debug_log::log("process not started: " + process.error_message);
        return result;
    }

    result.stdout_text = utf8_sanitize::decode_lossy(process.stdout_bytes);
    result.stderr_text = utf8_sanitize::decode_lossy(process.stderr_bytes);

    if (process.exited) {
        result.exit_code = process.exit_code;
        result.status = (process.exit_code == 0) ? ExitStatus::Succeeded : ExitStatus::Failed;
    } else if (process.signaled) {
        result.status = ExitStatus::Signaled;
        result.signal_number = process.signal_number;
    } else {
        // waitpid failed after a successful start; report it like an unknown exit code.
        result.status = ExitStatus::Failed;
        result.exit_code = -1;
    }

    debug_log::log("process finished, exit code " + std::to_string(result.exit_code));
    return result;
}

std::string shell_escape(const std::string &argument) {
    bool needs_quoting = argument.find_first_of(" \"'\\") != std::string::npos;
    if (!needs_quoting) {
        return argument;
    }

    std::string quoted = "\"";
    for (char character : argument) {
        switch (character) {
        case '"':
            quoted += "\\\"";
            break;
        case '\\':
            quoted += "\\\\";
            break;
        case '\n':
            quoted += "\\n";
            break;
        case '\t':
            quoted += "\\t";
            break;
        default:
            quoted += character;
            break;
        }
    }
    quoted += '"';
    return quoted;
}

std::string format_command_line(const CommandSpec &spec) {
    std::string command_line = spec.program;
    for (const auto &argument : spec.arguments) {
        command_line += ' ';
        command_line += shell_escape(argument);
    }
    return command_line;
}

std::string format_report(const std::string &operation_name, const CommandSpec &spec,
                          const ExecutionResult &result) {
    std::string report = "=== " + operation_name + " ===\n";
    report += "Working directory: " + spec.working_directory + "\n";
    report += "Command: " + format_command_line(spec) + "\n\n";

    switch (result.status) {
    case ExitStatus::Succeeded:
        report += "Command completed successfully\n\n";
        break;
    case ExitStatus::Failed:
        report += "Command failed with exit code: " + std::to_string(result.exit_code) + "\n\n";
        break;
    case ExitStatus::Signaled:
        report += "Command terminated by signal: " + std::to_string(result.signal_number) + "\n\n";
        break;
    case ExitStatus::NotStarted:
        report += "Command could not be started: " + result.error_message + "\n\n";
        break;
    }

    if (!result.stdout_text.empty()) {
        append_section(report, "STDOUT", result.stdout_text);
    }
    if (!result.stderr_text.empty()) {
        append_section(report, "STDERR", result.stderr_text);
    }
    if (result.stdout_text.empty() && result.stderr_text.empty()) {
        report += "No output produced\n";
    }
    return report;
}

} // namespace cargo_executor
