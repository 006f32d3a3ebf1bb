#pragma once

#include "supervisor/backend.hpp"
#include "process/native_process_manager.hpp"
#include "readiness/readiness_prober.hpp"
#include "db/database_creator.hpp"

#include <memory>

namespace pgsession {

// initdb -> postgres -> readiness -> CREATE DATABASE
class NativeBackend : public IBackend {
public:
    NativeBackend(SessionConfig config,
                  std::shared_ptr<NativeProcessManager> manager,
                  std::shared_ptr<ReadinessProber> prober,
                  std::shared_ptr<IDatabaseCreator> creator);
    ~NativeBackend() override;

    [[nodiscard]] Endpoint start() override;
    void stop() override;
    [[nodiscard]] BackendMode mode() const override { return BackendMode::NATIVE; }

    // Null before start() and after a failed spawn
    [[nodiscard]] NativeProcessHandle* process() const { return process_.get(); }

private:
    SessionConfig config_;
    std::shared_ptr<NativeProcessManager> manager_;
    std::shared_ptr<ReadinessProber> prober_;
    std::shared_ptr<IDatabaseCreator> creator_;
    std::unique_ptr<NativeProcessHandle> process_;
};

} // namespace pgsession
