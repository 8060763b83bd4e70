#ifndef CMCPS_PLATFORM_ABI_HPP
#define CMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <utility>
#include <vector>

namespace platform {

// Environment entries applied on top of the inherited environment.
// Later entries override earlier ones with the same name.
using EnvironmentOverlay = std::vector<std::pair<std::string, std::string>>;

// Outcome of running a child process to completion.
struct ProcessResult {
    // False if the process could not be started (fork failure, bad working
    // directory, executable not found). error_message says why.
    bool started = false;
    bool exited = false;          // terminated normally, exit_code is valid
    int exit_code = -1;
    bool signaled = false;        // killed by a signal, signal_number is valid
    int signal_number = 0;
    std::string stdout_bytes;
    std::string stderr_bytes;
    std::string error_message;
};

// Run a program (looked up on PATH when it has no '/') with the given
// arguments, environment overlay and working directory. stdin is /dev/null;
// stdout and stderr are captured separately. Blocks until the child exits.
ProcessResult run_process(const std::string &program,
                          const std::vector<std::string> &arguments,
                          const EnvironmentOverlay &environment,
                          const std::string &working_directory);

// Read the entire contents of a file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Replace a file's contents atomically (write a sibling temp file, then rename).
// Parent directories are created as needed. On failure returns false and
// fills error_message.
bool write_file_atomically(const std::string &file_path, const std::string &contents,
                           std::string &error_message);

} // namespace platform

#endif // CMCPS_PLATFORM_ABI_HPP
