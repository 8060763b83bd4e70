#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

extern char **environ;

namespace platform {

namespace {

// Written by the child to the status pipe when it fails before exec succeeds.
struct StartFailure {
    int stage;
    int error_number;
};

constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;

void close_quietly(int fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
    }
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

bool make_pipe(int fds[2], bool close_on_exec) {
    if (pipe(fds) != 0) {
        return false;
    }
    if (close_on_exec) {
        static_cast<void>(fcntl(fds[0], F_SETFD, FD_CLOEXEC));
        static_cast<void>(fcntl(fds[1], F_SETFD, FD_CLOEXEC));
    }
    return true;
}

// Read whatever is available; closes the fd on EOF or hard error.
void drain_pipe(int fd, bool &is_open, std::string &output) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        ssize_t count = read(fd, buffer, sizeof(buffer));
        if (count > 0) {
            output.append(buffer, static_cast<size_t>(count));
            continue;
        }
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        is_open = false;
        close_quietly(fd);
        return;
    }
}

// Inherited environment with the overlay applied, as "NAME=value" strings.
std::vector<std::string> build_environment_block(const EnvironmentOverlay &overlay) {
    std::map<std::string, std::string> merged;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string text(*entry);
        size_t separator = text.find('=');
        if (separator == std::string::npos) {
            continue;
        }
        merged[text.substr(0, separator)] = text.substr(separator + 1);
    }
    for (const auto &variable : overlay) {
        merged[variable.first] = variable.second;
    }

    std::vector<std::string> block;
    block.reserve(merged.size());
    for (const auto &variable : merged) {
        block.push_back(variable.first + "=" + variable.second);
    }
    return block;
}

std::string describe_start_failure(const StartFailure &failure, const std::string &program,
                                   const std::string &working_directory) {
    if (failure.stage == kStageChdir) {
        return "cannot change to working directory '" + working_directory + "': " +
               std::strerror(failure.error_number);
    }
    return "cannot execute '" + program + "': " + std::strerror(failure.error_number);
}

} // namespace

ProcessResult run_process(const std::string &program,
                          const std::vector<std::string> &arguments,
                          const EnvironmentOverlay &environment,
                          const std::string &working_directory) {
    ProcessResult result;

    // Everything the child needs is prepared before fork.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(program);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers;
    for (auto &argument : argv_strings) {
        argv_pointers.push_back(argument.data());
    }
    argv_pointers.push_back(nullptr);

    std::vector<std::string> environment_strings = build_environment_block(environment);
    std::vector<char *> environment_pointers;
    for (auto &entry : environment_strings) {
        environment_pointers.push_back(entry.data());
    }
    environment_pointers.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (!make_pipe(stdout_pipe, false) || !make_pipe(stderr_pipe, false) || !make_pipe(status_pipe, true)) {
        int saved_errno = errno;
        close_quietly(stdout_pipe[0]);
        close_quietly(stdout_pipe[1]);
        close_quietly(stderr_pipe[0]);
        close_quietly(stderr_pipe[1]);
        close_quietly(status_pipe[0]);
        close_quietly(status_pipe[1]);
        result.error_message = "pipe failed: " + std::string(std::strerror(saved_errno));
        return result;
    }

    pid_t child_pid = fork();
    if (child_pid < 0) {
        int saved_errno = errno;
        for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1],
                       status_pipe[0], status_pipe[1]}) {
            close_quietly(fd);
        }
        result.error_message = "fork failed: " + std::string(std::strerror(saved_errno));
        return result;
    }

    if (child_pid == 0) {
        StartFailure failure{0, 0};

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        close(status_pipe[0]);

        if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
            failure = {kStageChdir, errno};
        } else {
            // execvp resolves the program against PATH from this environment.
            environ = environment_pointers.data();
            execvp(argv_pointers[0], argv_pointers.data());
            failure = {kStageExec, errno};
        }

        ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    close_quietly(stdout_pipe[1]);
    close_quietly(stderr_pipe[1]);
    close_quietly(status_pipe[1]);

    // The status pipe is close-on-exec: EOF with no data means exec succeeded.
    StartFailure failure{0, 0};
    ssize_t status_bytes = 0;
    do {
        status_bytes = read(status_pipe[0], &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);
    close_quietly(status_pipe[0]);

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    bool stdout_open = true;
    bool stderr_open = true;
    while (stdout_open || stderr_open) {
        pollfd descriptors[2];
        nfds_t descriptor_count = 0;
        if (stdout_open) {
            descriptors[descriptor_count].fd = stdout_pipe[0];
            descriptors[descriptor_count].events = POLLIN;
            descriptors[descriptor_count].revents = 0;
            ++descriptor_count;
        }
        if (stderr_open) {
            descriptors[descriptor_count].fd = stderr_pipe[0];
            descriptors[descriptor_count].events = POLLIN;
            descriptors[descriptor_count].revents = 0;
            ++descriptor_count;
        }

        int ready = poll(descriptors, descriptor_count, -1);
        if (ready < 0 && errno != EINTR) {
            break;
        }

        drain_pipe(stdout_pipe[0], stdout_open, result.stdout_bytes);
        drain_pipe(stderr_pipe[0], stderr_open, result.stderr_bytes);
    }
    if (stdout_open) {
        close_quietly(stdout_pipe[0]);
    }
    if (stderr_open) {
        close_quietly(stderr_pipe[0]);
    }

    int wait_status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(child_pid, &wait_status, 0);
    } while (waited < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
        result.started = false;
        result.error_message = describe_start_failure(failure, program, working_directory);
        return result;
    }

    if (waited < 0) {
        result.started = true;
        result.error_message = "waitpid failed: " + std::string(std::strerror(errno));
        return result;
    }

    result.started = true;
    if (WIFEXITED(wait_status)) {
        result.exited = true;
        result.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.signaled = true;
        result.signal_number = WTERMSIG(wait_status);
    }
    return result;
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    if (file_stream.bad()) {
        return false;
    }
    output_contents = string_stream.str();
    return true;
}

bool write_file_atomically(const std::string &file_path, const std::string &contents,
                           std::string &error_message) {
    std::filesystem::path target(file_path);
    std::error_code error;

    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), error);
        if (error) {
            error_message = "cannot create directory '" + target.parent_path().string() + "': " + error.message();
            return false;
        }
    }

    std::filesystem::path temporary = target;
    temporary += ".tmp." + std::to_string(getpid());

    {
        std::ofstream file_stream(temporary, std::ios::binary | std::ios::trunc);
        if (!file_stream.is_open()) {
            error_message = "cannot open '" + temporary.string() + "' for writing";
            return false;
        }
        file_stream << contents;
        file_stream.flush();
        if (!file_stream) {
            error_message = "write to '" + temporary.string() + "' failed";
            file_stream.close();
            std::filesystem::remove(temporary, error);
            return false;
        }
    }

    std::filesystem::rename(temporary, target, error);
    if (error) {
        error_message = "cannot replace '" + target.string() + "': " + error.message();
        std::error_code remove_error;
        std::filesystem::remove(temporary, remove_error);
        return false;
    }
    return true;
}

} // namespace platform
