#pragma once

#include "supervisor/backend.hpp"
#include "supervisor/mode_detector.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace pgsession {

/**
 * @brief Owns the single Backend Handle of a session
 *
 * start() is single-shot: a fatal failure is rethrown after the partial
 * backend was released, and the other mode is never tried. stop() tears
 * down exactly once no matter how many callers (workload exit, signal,
 * destructor) reach it, concurrently or not.
 */
class BackendSupervisor {
public:
    explicit BackendSupervisor(BackendFactory factory);
    ~BackendSupervisor();

    BackendSupervisor(const BackendSupervisor&) = delete;
    BackendSupervisor& operator=(const BackendSupervisor&) = delete;

    /**
     * @throws SessionError with a fatal category, or std::logic_error when
     *         called twice
     */
    [[nodiscard]] Endpoint start(const SessionConfig& config);

    void stop();

    [[nodiscard]] bool started() const { return started_.load(); }
    [[nodiscard]] bool stopped() const { return teardown_count_.load() > 0; }
    [[nodiscard]] uint32_t teardown_count() const { return teardown_count_.load(); }
    [[nodiscard]] IBackend* backend() const { return backend_.get(); }

    /**
     * @brief Factory for the production backends of a detected mode
     */
    [[nodiscard]] static BackendFactory default_factory(ModeSelection selection,
                                                        SessionOptions options);

private:
    BackendFactory factory_;
    std::unique_ptr<IBackend> backend_;

    std::atomic<bool> started_{false};
    std::once_flag stop_once_;
    std::atomic<uint32_t> teardown_count_{0};
};

} // namespace pgsession
