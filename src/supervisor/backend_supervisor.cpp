#include "supervisor/backend_supervisor.hpp"
#include "supervisor/embedded_backend.hpp"
#include "supervisor/native_backend.hpp"
#include "db/pq_ping_probe.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace pgsession {

BackendSupervisor::BackendSupervisor(BackendFactory factory)
    : factory_(std::move(factory)) {}

BackendSupervisor::~BackendSupervisor() {
    stop();
}

Endpoint BackendSupervisor::start(const SessionConfig& config) {
    if (started_.exchange(true)) {
        throw std::logic_error("BackendSupervisor::start called twice");
    }

    backend_ = factory_(config);
    utils::log::info(std::format("Supervisor: starting {} backend (db={}, port={})",
        backend_mode_name(config.mode()), config.db_name(), config.port()));

    try {
        auto endpoint = backend_->start();
        utils::log::info(std::format("Supervisor: ready at {}:{}", endpoint.host, endpoint.port));
        return endpoint;
    } catch (const SessionError& e) {
        utils::log::error(std::format("Supervisor: {}: {}", error_category_name(e.category()), e.what()));
        stop();
        throw;
    }
}

void BackendSupervisor::stop() {
    std::call_once(stop_once_, [this] {
        teardown_count_.fetch_add(1);
        if (backend_) {
            utils::log::info("Supervisor: stopping backend");
            backend_->stop();
        }
    });
}

BackendFactory BackendSupervisor::default_factory(ModeSelection selection, SessionOptions options) {
    return [selection = std::move(selection), options = std::move(options)](
               const SessionConfig& config) -> std::unique_ptr<IBackend> {
        if (config.mode() == BackendMode::EMBEDDED) {
            auto library = selection.library;
            if (!library) {
                throw SessionError(ErrorCategory::CONFIG_ERROR,
                    "Embedded mode requested without a loaded engine library");
            }
            EngineStarter starter = [library](const std::string& location) {
                return std::static_pointer_cast<IEmbeddedEngine>(PluginEngine::start(library, location));
            };
            return std::make_unique<EmbeddedBackend>(config, std::move(starter), options.gateway);
        }

        auto prober = std::make_shared<ReadinessProber>(
            std::make_shared<PqPingProbe>(), options.readiness, config.host());
        return std::make_unique<NativeBackend>(config,
            std::make_shared<NativeProcessManager>(options.native),
            std::move(prober),
            std::make_shared<PgDatabaseCreator>());
    };
}

} // namespace pgsession
