#include "session/workload_runner.hpp"
#include "session/shutdown_signal.hpp"
#include "process/child_process.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <format>
#include <thread>
#include <sys/wait.h>

namespace pgsession {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

} // anonymous namespace

int run_workload(const std::vector<std::string>& command) {
    ProcessSpec spec;
    spec.argv = command;
    spec.output = OutputPolicy::INHERIT;

    if (ShutdownSignal::requested()) {
        utils::log::info(std::format("Workload: not starting '{}', signal {} already received",
            spec.command_line(), ShutdownSignal::signal_number()));
        return 128 + ShutdownSignal::signal_number();
    }

    pid_t pid;
    try {
        pid = spawn_process(spec);
    } catch (const SessionError& e) {
        utils::log::error(e.what());
        return 127;
    }
    utils::log::info(std::format("Workload: started '{}' (pid {})", spec.command_line(), pid));

    bool forwarded = false;
    while (true) {
        int status = 0;
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            const auto result = ExitStatus::from_wait_status(status);
            utils::log::info(std::format("Workload: finished with {}", result.describe()));
            return result.exited ? result.code : 128 + result.signal;
        }
        if (r < 0 && errno != EINTR) {
            utils::log::error(std::format("Workload: waitpid failed: {}", strerror(errno)));
            return 1;
        }

        if (ShutdownSignal::requested() && !forwarded) {
            utils::log::info(std::format("Received signal {}, stopping workload",
                ShutdownSignal::signal_number()));
            ::kill(pid, ShutdownSignal::signal_number());
            forwarded = true;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

} // namespace pgsession
