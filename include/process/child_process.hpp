#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

namespace pgsession {

// Where a child's stdout/stderr go
enum class OutputPolicy {
    INHERIT,    // parent's streams
    FILE,       // ProcessSpec::output_fd
    DISCARD     // /dev/null
};

struct ProcessSpec {
    std::vector<std::string> argv;          // argv[0] is resolved through PATH
    OutputPolicy output = OutputPolicy::INHERIT;
    int output_fd = -1;                     // used with OutputPolicy::FILE, not closed

    [[nodiscard]] std::string command_line() const;
};

struct ExitStatus {
    bool exited = false;        // normal exit (vs. killed by a signal)
    int code = -1;
    int signal = 0;

    [[nodiscard]] bool success() const { return exited && code == 0; }
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] static ExitStatus from_wait_status(int status);
};

/**
 * @brief fork/exec a child process
 *
 * Exec failures (command not found, not executable) are detected
 * synchronously through a close-on-exec pipe.
 *
 * @throws SessionError(PROCESS_START_FAILURE) naming the command
 */
[[nodiscard]] pid_t spawn_process(const ProcessSpec& spec);

// Blocking waitpid, retried on EINTR
[[nodiscard]] ExitStatus wait_process(pid_t pid);

// spawn_process + wait_process
[[nodiscard]] ExitStatus run_command(const ProcessSpec& spec);

} // namespace pgsession
