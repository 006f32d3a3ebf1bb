#pragma once

#include "process/child_process.hpp"
#include "config/session_config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace pgsession {

/**
 * @brief Live native postgres server process
 *
 * Owns the child pid, the log sink descriptor and the stop flag. A reaper
 * thread waits for the child, closes the log sink when it exits, and
 * reports an exit that nobody asked for.
 */
class NativeProcessHandle {
public:
    NativeProcessHandle(pid_t pid, int log_fd, OutputPolicy output,
                        std::chrono::milliseconds shutdown_timeout);
    ~NativeProcessHandle();

    NativeProcessHandle(const NativeProcessHandle&) = delete;
    NativeProcessHandle& operator=(const NativeProcessHandle&) = delete;

    /**
     * @brief Fast shutdown: SIGINT once, SIGKILL if still alive after the timeout
     *
     * Safe to call repeatedly and concurrently; only the first call signals.
     * Blocks until the process is reaped.
     */
    void terminate();

    [[nodiscard]] pid_t pid() const { return pid_; }
    [[nodiscard]] OutputPolicy output() const { return output_; }
    [[nodiscard]] bool stop_requested() const { return stop_requested_.load(); }
    [[nodiscard]] bool exited() const;
    [[nodiscard]] bool log_sink_closed() const { return log_sink_closed_.load(); }
    [[nodiscard]] bool exited_unexpectedly() const { return exited_unexpectedly_.load(); }
    [[nodiscard]] uint32_t termination_signals_sent() const { return signals_sent_.load(); }
    [[nodiscard]] std::optional<ExitStatus> exit_status() const;

    // Block until the process exits or the timeout passes
    bool wait_for_exit(std::chrono::milliseconds timeout);

private:
    void reap();
    bool send_signal(int sig);

    pid_t pid_;
    int log_fd_;
    OutputPolicy output_;
    std::chrono::milliseconds shutdown_timeout_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> log_sink_closed_{false};
    std::atomic<bool> exited_unexpectedly_{false};
    std::atomic<uint32_t> signals_sent_{0};

    mutable std::mutex mutex_;
    std::condition_variable exit_cv_;
    bool exited_ = false;
    std::optional<ExitStatus> exit_status_;

    std::jthread reaper_;
};

/**
 * @brief Drives the external initdb/postgres commands for native mode
 */
class NativeProcessManager {
public:
    // Present in every initialized data directory
    static constexpr const char* INIT_MARKER = "PG_VERSION";

    explicit NativeProcessManager(NativeOptions options);

    /**
     * @brief Run initdb unless the data directory already carries the marker
     * @return true if initdb ran
     * @throws SessionError(INITIALIZATION_FAILURE)
     */
    bool ensure_initialized(const std::string& data_dir);

    /**
     * @brief Start postgres in the foreground on the given port
     * @throws SessionError(PROCESS_START_FAILURE)
     */
    [[nodiscard]] std::unique_ptr<NativeProcessHandle> spawn(const std::string& data_dir, uint16_t port);

    void terminate(NativeProcessHandle& handle) { handle.terminate(); }

    [[nodiscard]] const NativeOptions& options() const { return options_; }

private:
    // Applies verbose > file > discard; returns the policy and an owned fd
    std::pair<OutputPolicy, int> open_log_sink() const;

    NativeOptions options_;
};

} // namespace pgsession
