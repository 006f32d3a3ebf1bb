#include "process/child_process.hpp"
#include "core/error.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

namespace pgsession {

std::string ProcessSpec::command_line() const {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

std::string ExitStatus::describe() const {
    if (exited) return std::format("exit code {}", code);
    return std::format("signal {}", signal);
}

ExitStatus ExitStatus::from_wait_status(int status) {
    ExitStatus st;
    if (WIFEXITED(status)) {
        st.exited = true;
        st.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        st.signal = WTERMSIG(status);
    }
    return st;
}

pid_t spawn_process(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        throw SessionError(ErrorCategory::PROCESS_START_FAILURE, "Cannot start process: empty command");
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        throw SessionError(ErrorCategory::PROCESS_START_FAILURE,
            std::format("Failed to start '{}': pipe: {}", spec.argv[0], strerror(errno)));
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw SessionError(ErrorCategory::PROCESS_START_FAILURE,
            std::format("Failed to start '{}': fork: {}", spec.argv[0], strerror(err)));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        int out_fd = -1;
        if (spec.output == OutputPolicy::DISCARD) {
            out_fd = open("/dev/null", O_WRONLY);
        } else if (spec.output == OutputPolicy::FILE) {
            out_fd = spec.output_fd;
        }
        if (out_fd >= 0) {
            dup2(out_fd, STDOUT_FILENO);
            dup2(out_fd, STDERR_FILENO);
        }

        execvp(argv[0], argv.data());

        const int err = errno;
        ssize_t ignored = write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    ::close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec failed; reap the child before reporting
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        throw SessionError(ErrorCategory::PROCESS_START_FAILURE,
            std::format("Failed to start '{}': {}", spec.argv[0], strerror(child_errno)));
    }

    return pid;
}

ExitStatus wait_process(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return ExitStatus{};
        }
    }
    return ExitStatus::from_wait_status(status);
}

ExitStatus run_command(const ProcessSpec& spec) {
    return wait_process(spawn_process(spec));
}

} // namespace pgsession
