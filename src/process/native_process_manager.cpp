#include "process/native_process_manager.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

namespace pgsession {

// ============================================================================
// NativeProcessHandle
// ============================================================================

NativeProcessHandle::NativeProcessHandle(pid_t pid, int log_fd, OutputPolicy output,
                                         std::chrono::milliseconds shutdown_timeout)
    : pid_(pid),
      log_fd_(log_fd),
      output_(output),
      shutdown_timeout_(shutdown_timeout) {
    reaper_ = std::jthread([this](std::stop_token) { reap(); });
}

NativeProcessHandle::~NativeProcessHandle() {
    terminate();
    if (reaper_.joinable()) reaper_.join();
}

void NativeProcessHandle::reap() {
    // Wait without reaping so the pid stays valid for kill() until exited_ is set
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0) {
        if (errno != EINTR) break;
    }

    ExitStatus status;
    {
        std::lock_guard lock(mutex_);
        status = wait_process(pid_);
        exited_ = true;
        exit_status_ = status;
    }

    if (log_fd_ >= 0) {
        ::close(log_fd_);
        log_fd_ = -1;
    }
    log_sink_closed_.store(true);

    if (!stop_requested_.load() && !status.success()) {
        exited_unexpectedly_.store(true);
        utils::log::error(std::format("Native: {}: postgres (pid {}) exited with {}",
            error_category_name(ErrorCategory::PROCESS_EXITED_UNEXPECTEDLY), pid_, status.describe()));
    } else {
        utils::log::debug(std::format("Native: postgres (pid {}) exited with {}", pid_, status.describe()));
    }

    exit_cv_.notify_all();
}

bool NativeProcessHandle::send_signal(int sig) {
    std::lock_guard lock(mutex_);
    if (exited_) return false;
    return ::kill(pid_, sig) == 0;
}

bool NativeProcessHandle::exited() const {
    std::lock_guard lock(mutex_);
    return exited_;
}

std::optional<ExitStatus> NativeProcessHandle::exit_status() const {
    std::lock_guard lock(mutex_);
    return exit_status_;
}

bool NativeProcessHandle::wait_for_exit(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return exit_cv_.wait_for(lock, timeout, [this] { return exited_; });
}

void NativeProcessHandle::terminate() {
    if (stop_requested_.exchange(true)) {
        wait_for_exit(shutdown_timeout_ + std::chrono::milliseconds(1000));
        return;
    }

    if (send_signal(SIGINT)) {
        signals_sent_.fetch_add(1);
        utils::log::info(std::format("Native: fast shutdown of postgres (pid {})", pid_));
    }

    if (!wait_for_exit(shutdown_timeout_)) {
        utils::log::warn(std::format("Native: postgres (pid {}) still running after {}ms, killing",
            pid_, shutdown_timeout_.count()));
        send_signal(SIGKILL);
        wait_for_exit(std::chrono::milliseconds(5000));
    }
}

// ============================================================================
// NativeProcessManager
// ============================================================================

NativeProcessManager::NativeProcessManager(NativeOptions options)
    : options_(std::move(options)) {}

bool NativeProcessManager::ensure_initialized(const std::string& data_dir) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (fs::exists(fs::path(data_dir) / INIT_MARKER, ec)) {
        utils::log::debug(std::format("Native: {} already initialized", data_dir));
        return false;
    }

    fs::create_directories(data_dir, ec);
    if (ec) {
        throw SessionError(ErrorCategory::INITIALIZATION_FAILURE,
            std::format("Cannot create data directory {}: {}", data_dir, ec.message()));
    }

    ProcessSpec spec;
    spec.argv = {options_.initdb, "-D", data_dir, "--auth=trust", "--no-locale", "-E", "UTF8"};
    spec.output = options_.verbose ? OutputPolicy::INHERIT : OutputPolicy::DISCARD;

    utils::log::info(std::format("Native: initializing cluster in {}", data_dir));

    ExitStatus status;
    try {
        status = run_command(spec);
    } catch (const SessionError& e) {
        throw SessionError(ErrorCategory::INITIALIZATION_FAILURE,
            std::format("Cluster initialization failed: {} (is PostgreSQL installed?)", e.what()));
    }

    if (!status.success()) {
        throw SessionError(ErrorCategory::INITIALIZATION_FAILURE,
            std::format("Cluster initialization failed: '{}' finished with {}",
                spec.command_line(), status.describe()));
    }
    return true;
}

std::pair<OutputPolicy, int> NativeProcessManager::open_log_sink() const {
    if (options_.verbose) {
        return {OutputPolicy::INHERIT, -1};
    }
    if (options_.log_file.empty()) {
        return {OutputPolicy::DISCARD, -1};
    }

    const int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (options_.log_truncate ? O_TRUNC : O_APPEND);
    const int fd = ::open(options_.log_file.c_str(), flags, 0644);
    if (fd < 0) {
        utils::log::warn(std::format("Native: cannot open log file {}: {}; using parent output",
            options_.log_file, strerror(errno)));
        return {OutputPolicy::INHERIT, -1};
    }
    return {OutputPolicy::FILE, fd};
}

std::unique_ptr<NativeProcessHandle> NativeProcessManager::spawn(const std::string& data_dir, uint16_t port) {
    const auto [output, log_fd] = open_log_sink();

    ProcessSpec spec;
    spec.argv = {options_.postgres, "-D", data_dir, "-p", std::to_string(port)};
    spec.output = output;
    spec.output_fd = log_fd;

    pid_t pid;
    try {
        pid = spawn_process(spec);
    } catch (const SessionError&) {
        if (log_fd >= 0) ::close(log_fd);
        throw;
    }

    utils::log::info(std::format("Native: started postgres (pid {}) on port {}", pid, port));
    return std::make_unique<NativeProcessHandle>(pid, log_fd, output,
        std::chrono::milliseconds(options_.shutdown_timeout_ms));
}

} // namespace pgsession
