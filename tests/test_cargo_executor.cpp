// Tests for process execution and report formatting.

#include "cargo/cargo_executor.hpp"
#include "test_helpers.hpp"

#include <string>

using cargo_command::CommandSpec;
using cargo_executor::ExecutionResult;
using cargo_executor::ExitStatus;
using test_helpers::check;
using test_helpers::contains;

namespace test_cargo_executor {

static CommandSpec shell_command(const std::string &script, const std::string &working_directory) {
    CommandSpec spec;
    spec.program = "/bin/sh";
    spec.arguments = {"-c", script};
    spec.working_directory = working_directory;
    return spec;
}

static bool test_shell_escape() {
    using cargo_executor::shell_escape;

    bool all_passed = true;
    all_passed &= check(shell_escape("--release") == "--release", "Plain argument is left alone");
    all_passed &= check(shell_escape("my crate") == "\"my crate\"", "Argument with a space is quoted");
    all_passed &= check(shell_escape("say \"hi\"") == "\"say \\\"hi\\\"\"", "Embedded quotes are escaped");
    all_passed &= check(shell_escape("C:\\dir") == "\"C:\\\\dir\"", "Backslashes are escaped");
    return all_passed;
}

static bool test_command_line() {
    CommandSpec spec;
    spec.program = "cargo";
    spec.arguments = {"run", "--", "hello world"};
    return check(cargo_executor::format_command_line(spec) == "cargo run -- \"hello world\"",
                 "Command line joins escaped arguments");
}

static bool test_report_success_without_output() {
    CommandSpec spec;
    spec.program = "cargo";
    spec.arguments = {"check"};
    spec.working_directory = "/work/app";

    ExecutionResult result;
    result.status = ExitStatus::Succeeded;
    result.exit_code = 0;

    std::string report = cargo_executor::format_report("cargo check", spec, result);
    return check(report.rfind("=== cargo check ===\n", 0) == 0 &&
                     contains(report, "Working directory: /work/app\n") &&
                     contains(report, "Command: cargo check\n") &&
                     contains(report, "Command completed successfully") &&
                     contains(report, "No output produced") && !contains(report, "STDOUT"),
                 "Success report without output");
}

static bool test_report_failure_sections() {
    CommandSpec spec;
    spec.program = "cargo";
    spec.arguments = {"test"};
    spec.working_directory = "/work/app";

    ExecutionResult result;
    result.status = ExitStatus::Failed;
    result.exit_code = 101;
    result.stderr_text = "error[E0425]: cannot find value";

    std::string report = cargo_executor::format_report("cargo test", spec, result);
    return check(contains(report, "Command failed with exit code: 101") &&
                     contains(report, "STDERR:\nerror[E0425]: cannot find value") &&
                     !contains(report, "STDOUT") && !contains(report, "No output produced"),
                 "Failure report carries the exit code and only the non-empty section");
}

static bool test_report_signal() {
    CommandSpec spec;
    spec.program = "cargo";

    ExecutionResult result;
    result.status = ExitStatus::Signaled;
    result.signal_number = 9;
    result.stdout_text = "Compiling app\n";

    std::string report = cargo_executor::format_report("cargo build", spec, result);
    return check(contains(report, "Command terminated by signal: 9") && contains(report, "STDOUT:\nCompiling app\n"),
                 "Signal termination is reported with its signal number");
}

static bool test_real_process_failure() {
    test_helpers::TempDirectory directory("cmcps_exec");
    ExecutionResult result =
        cargo_executor::execute(shell_command("echo building; echo broken >&2; exit 101", directory.path().string()));
    return check(result.status == ExitStatus::Failed && result.exit_code == 101 &&
                     result.stdout_text == "building\n" && result.stderr_text == "broken\n",
                 "Non-zero exit captures exit code and both streams");
}

static bool test_runs_in_working_directory() {
    test_helpers::TempDirectory directory("cmcps_exec");
    test_helpers::write_file(directory.path() / "marker.txt", "here");
    ExecutionResult result = cargo_executor::execute(shell_command("cat marker.txt", directory.path().string()));
    return check(result.status == ExitStatus::Succeeded && result.stdout_text == "here",
                 "Process runs in the given working directory");
}

static bool test_environment_overlay() {
    test_helpers::TempDirectory directory("cmcps_exec");
    CommandSpec spec = shell_command("printf '%s' \"$CMCPS_TEST_VALUE\"", directory.path().string());
    spec.environment = {{"CMCPS_TEST_VALUE", "from overlay"}};
    ExecutionResult result = cargo_executor::execute(spec);
    return check(result.stdout_text == "from overlay", "Environment overlay reaches the child");
}

static bool test_missing_program_not_started() {
    test_helpers::TempDirectory directory("cmcps_exec");
    CommandSpec spec;
    spec.program = "cmcps-no-such-program";
    spec.working_directory = directory.path().string();
    ExecutionResult result = cargo_executor::execute(spec);
    return check(result.status == ExitStatus::NotStarted && contains(result.error_message, "cmcps-no-such-program"),
                 "Missing program is reported as not started");
}

static bool test_missing_directory_not_started() {
    ExecutionResult result = cargo_executor::execute(shell_command("true", "/nonexistent/cmcps/directory"));
    return check(result.status == ExitStatus::NotStarted && contains(result.error_message, "working directory"),
                 "Missing working directory is reported as not started");
}

static bool test_invalid_utf8_replaced() {
    test_helpers::TempDirectory directory("cmcps_exec");
    ExecutionResult result = cargo_executor::execute(shell_command("printf 'ok \\377 done'", directory.path().string()));
    return check(result.status == ExitStatus::Succeeded && result.stdout_text == "ok \xEF\xBF\xBD done",
                 "Invalid UTF-8 output is replaced with U+FFFD");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_shell_escape();
    all_passed &= test_command_line();
    all_passed &= test_report_success_without_output();
    all_passed &= test_report_failure_sections();
    all_passed &= test_report_signal();
    all_passed &= test_real_process_failure();
    all_passed &= test_runs_in_working_directory();
    all_passed &= test_environment_overlay();
    all_passed &= test_missing_program_not_started();
    all_passed &= test_missing_directory_not_started();
    all_passed &= test_invalid_utf8_replaced();
    return all_passed;
}

} // namespace test_cargo_executor
