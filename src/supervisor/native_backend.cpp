#include "supervisor/native_backend.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace pgsession {

NativeBackend::NativeBackend(SessionConfig config,
                             std::shared_ptr<NativeProcessManager> manager,
                             std::shared_ptr<ReadinessProber> prober,
                             std::shared_ptr<IDatabaseCreator> creator)
    : config_(std::move(config)),
      manager_(std::move(manager)),
      prober_(std::move(prober)),
      creator_(std::move(creator)) {}

NativeBackend::~NativeBackend() {
    stop();
}

Endpoint NativeBackend::start() {
    const auto& dir = config_.storage_location();

    manager_->ensure_initialized(dir);
    process_ = manager_->spawn(dir, config_.port());

    if (!prober_->wait_until_ready(config_.port())) {
        manager_->terminate(*process_);
        throw SessionError(ErrorCategory::READINESS_TIMEOUT,
            std::format("postgres did not accept connections on {}:{} after {} attempts",
                config_.host(), config_.port(), prober_->last_attempts()));
    }

    const auto created = creator_->create_database(config_.host(), config_.port(), config_.db_name());
    switch (created.outcome) {
        case CreateOutcome::CREATED:
            utils::log::info(std::format("Native: created database {}", config_.db_name()));
            break;
        case CreateOutcome::ALREADY_EXISTS:
            utils::log::debug(std::format("Native: database {} already exists", config_.db_name()));
            break;
        case CreateOutcome::FAILED:
            utils::log::warn(std::format("Native: could not create database {}: {}",
                config_.db_name(), created.message));
            break;
    }

    return Endpoint{BackendMode::NATIVE, config_.host(), config_.port(),
                    config_.db_name(), config_.storage_location()};
}

void NativeBackend::stop() {
    if (process_) {
        manager_->terminate(*process_);
    }
}

} // namespace pgsession
